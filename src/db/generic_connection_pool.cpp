#include "db/generic_connection_pool.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include <format>
#include <vector>

namespace sqlrunner {

GenericConnectionPool::GenericConnectionPool(
    std::string key,
    const PoolConfig& config,
    std::shared_ptr<IConnectionFactory> factory)
    : factory_(std::move(factory)),
      shared_(std::make_shared<Shared>(std::move(key), config)) {

    utils::log::debug(std::format("ConnectionPool created for '{}' (max={}, idle_timeout={}ms)",
        shared_->key, config.max_connections, config.idle_timeout.count()));
}

GenericConnectionPool::~GenericConnectionPool() {
    drain();
}

std::unique_ptr<PooledConnection> GenericConnectionPool::acquire() {
    auto& s = *shared_;

    if (s.shutdown.load(std::memory_order_acquire)) {
        throw ConnectionError(std::format("Connection pool '{}' is shut down", s.key));
    }

    evict_idle();

    // Acquire semaphore slot (blocks if pool full)
    if (!s.semaphore.try_acquire_for(s.config.acquire_timeout)) {
        s.failed_acquires.fetch_add(1, std::memory_order_relaxed);
        throw ConnectionError(std::format(
            "Timed out after {}ms waiting for a connection from pool '{}'",
            s.config.acquire_timeout.count(), s.key));
    }

    // Re-check shutdown after acquiring semaphore (drain may have run meanwhile)
    if (s.shutdown.load(std::memory_order_acquire)) {
        s.semaphore.release();
        throw ConnectionError(std::format("Connection pool '{}' is shut down", s.key));
    }

    std::unique_ptr<IDbConnection> conn = take_idle();

    if (!conn) {
        try {
            conn = factory_->create();
        } catch (const std::exception&) {
            s.semaphore.release();
            s.failed_acquires.fetch_add(1, std::memory_order_relaxed);
            throw;
        }
        s.total_connections.fetch_add(1, std::memory_order_relaxed);
    }

    s.total_acquires.fetch_add(1, std::memory_order_relaxed);

    // The lease keeps the shared block alive until it is returned
    auto return_fn = [shared = shared_](std::unique_ptr<IDbConnection> c) {
        shared->return_connection(std::move(c));
    };

    return std::make_unique<PooledConnection>(std::move(conn), std::move(return_fn));
}

std::unique_ptr<IDbConnection> GenericConnectionPool::take_idle() {
    auto& s = *shared_;
    std::vector<std::unique_ptr<IDbConnection>> dead;
    std::unique_ptr<IDbConnection> conn;

    {
        std::lock_guard lock(s.mutex);
        // Most recently used first, so older connections age out
        while (!s.idle.empty()) {
            auto candidate = std::move(s.idle.back().conn);
            s.idle.pop_back();
            if (candidate && candidate->is_connected()) {
                conn = std::move(candidate);
                break;
            }
            dead.emplace_back(std::move(candidate));
        }
    }

    for (auto& d : dead) {
        utils::log::warn(std::format(
            "Pool '{}': discarding idle connection closed by the server", s.key));
        if (d) d->close();
        s.total_connections.fetch_sub(1, std::memory_order_relaxed);
        s.dead_discarded.fetch_add(1, std::memory_order_relaxed);
    }

    return conn;
}

size_t GenericConnectionPool::evict_idle() {
    auto& s = *shared_;
    std::vector<std::unique_ptr<IDbConnection>> expired;

    {
        std::lock_guard lock(s.mutex);
        const auto now = std::chrono::steady_clock::now();
        for (auto it = s.idle.begin(); it != s.idle.end();) {
            if (now - it->last_used > s.config.idle_timeout) {
                expired.emplace_back(std::move(it->conn));
                it = s.idle.erase(it);
            } else {
                ++it;
            }
        }
    }

    // Close outside the lock: PQfinish may block on the network
    for (auto& conn : expired) {
        if (conn) conn->close();
        s.total_connections.fetch_sub(1, std::memory_order_relaxed);
    }
    s.idle_evictions.fetch_add(expired.size(), std::memory_order_relaxed);

    if (!expired.empty()) {
        utils::log::debug(std::format("Pool '{}': evicted {} idle connection(s)",
            s.key, expired.size()));
    }
    return expired.size();
}

PoolStats GenericConnectionPool::get_stats() const {
    const auto& s = *shared_;
    std::lock_guard lock(s.mutex);

    PoolStats stats;
    stats.total_connections = s.total_connections.load(std::memory_order_relaxed);
    stats.idle_connections = s.idle.size();
    stats.active_connections = stats.total_connections - stats.idle_connections;
    stats.total_acquires = s.total_acquires.load(std::memory_order_relaxed);
    stats.total_releases = s.total_releases.load(std::memory_order_relaxed);
    stats.failed_acquires = s.failed_acquires.load(std::memory_order_relaxed);
    stats.idle_evictions = s.idle_evictions.load(std::memory_order_relaxed);
    stats.dead_connections_discarded = s.dead_discarded.load(std::memory_order_relaxed);
    return stats;
}

void GenericConnectionPool::drain() {
    auto& s = *shared_;
    if (s.shutdown.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    std::deque<IdleConnection> idle;
    {
        std::lock_guard lock(s.mutex);
        idle.swap(s.idle);
    }

    for (auto& entry : idle) {
        if (entry.conn) {
            entry.conn->close();
            s.total_connections.fetch_sub(1, std::memory_order_relaxed);
        }
    }

    utils::log::info(std::format("ConnectionPool drained for '{}'", s.key));
}

void GenericConnectionPool::Shared::return_connection(std::unique_ptr<IDbConnection> conn) {
    if (!conn) {
        return;
    }

    total_releases.fetch_add(1, std::memory_order_relaxed);

    // Closed pool or broken connection: never park it
    if (shutdown.load(std::memory_order_acquire) || !conn->is_connected()) {
        conn->close();
        total_connections.fetch_sub(1, std::memory_order_relaxed);
        semaphore.release();
        return;
    }

    {
        std::lock_guard lock(mutex);
        idle.push_back(IdleConnection{std::move(conn), std::chrono::steady_clock::now()});
    }

    semaphore.release();
}

} // namespace sqlrunner
