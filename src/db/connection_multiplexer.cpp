#include "db/connection_multiplexer.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "db/generic_connection_pool.hpp"

#include <exception>
#include <format>
#include <future>
#include <iterator>
#include <vector>

namespace sqlrunner {

// ============================================================================
// SessionLease
// ============================================================================

SessionLease::SessionLease(std::shared_ptr<SessionSlot> slot,
                           std::unique_lock<std::mutex> lock, EvictFunc evict)
    : slot_(std::move(slot)), lock_(std::move(lock)), evict_(std::move(evict)) {}

SessionLease::~SessionLease() {
    release();
}

SessionLease& SessionLease::operator=(SessionLease&& other) noexcept {
    if (this != &other) {
        release();
        slot_ = std::move(other.slot_);
        lock_ = std::move(other.lock_);
        evict_ = std::move(other.evict_);
    }
    return *this;
}

void SessionLease::release() {
    if (!slot_ || !lock_.owns_lock()) {
        slot_.reset();
        return;
    }
    if (slot_->conn && !slot_->conn->is_connected() && evict_) {
        evict_(slot_);
    }
    lock_.unlock();
    slot_.reset();
}

const std::string& SessionLease::session_key() const {
    static const std::string empty;
    return slot_ ? slot_->key : empty;
}

// ============================================================================
// ConnectionMultiplexer
// ============================================================================

ConnectionMultiplexer::ConnectionMultiplexer(Options options,
                                             ConnectorBuilder connector_builder,
                                             PoolFactory pool_factory)
    : options_(std::move(options)),
      connector_builder_(std::move(connector_builder)),
      pool_factory_(std::move(pool_factory)) {}

ConnectionMultiplexer::~ConnectionMultiplexer() {
    shutdown();
}

ConnectionMultiplexer::PoolFactory ConnectionMultiplexer::default_pool_factory() {
    return [](const std::string& key, const PoolConfig& config,
              std::shared_ptr<IConnectionFactory> factory) -> std::shared_ptr<IConnectionPool> {
        return std::make_shared<GenericConnectionPool>(key, config, std::move(factory));
    };
}

std::string ConnectionMultiplexer::effective_database(const ConnectionProfile& profile,
                                                      const std::string& database) {
    if (!database.empty()) return database;
    if (!profile.database.empty()) return profile.database;
    return kDefaultDatabase;
}

std::string ConnectionMultiplexer::connection_key(const ConnectionProfile& profile,
                                                  const std::string& database) {
    const std::string db = effective_database(profile, database);
    std::string key;
    key.reserve(profile.id.size() + 1 + db.size());
    key = profile.id;
    key += ':';
    key += db;
    return key;
}

std::string ConnectionMultiplexer::session_key(const std::string& key,
                                               const std::string& session_id) {
    return std::format("{}:session:{}", key, session_id);
}

void ConnectionMultiplexer::start() {
    ensure_running();
    if (started_.exchange(true)) {
        return;
    }
    reaper_ = std::jthread([this](std::stop_token stop) { reaper_loop(stop); });
    utils::log::debug(std::format("Connection multiplexer started (reap every {}ms)",
                                  options_.reap_interval.count()));
}

void ConnectionMultiplexer::shutdown() {
    if (shutdown_.exchange(true)) {
        return;
    }
    if (reaper_.joinable()) {
        reaper_.request_stop();
        reaper_cv_.notify_all();
        reaper_.join();
    }
    close_all();
    utils::log::debug("Connection multiplexer shut down");
}

void ConnectionMultiplexer::ensure_running() const {
    if (shutdown_.load()) {
        throw ConnectionError("Connection multiplexer is shut down");
    }
}

std::shared_ptr<IConnectionFactory> ConnectionMultiplexer::get_connector(
    const ConnectionProfile& profile, const std::string& database, const std::string& key) {

    // Fast path: shared lock (read-only)
    {
        std::shared_lock lock(mutex_);
        auto it = connectors_.find(key);
        if (it != connectors_.end()) {
            return it->second;
        }
    }

    // Slow path: register the build under the lock, run it outside
    std::promise<std::shared_ptr<IConnectionFactory>> promise;
    {
        std::unique_lock lock(mutex_);
        auto it = connectors_.find(key);
        if (it != connectors_.end()) {
            return it->second;
        }
        auto pending = pending_connectors_.find(key);
        if (pending != pending_connectors_.end()) {
            auto future = pending->second;
            lock.unlock();
            return future.get();
        }
        pending_connectors_.emplace(key, promise.get_future().share());
    }

    std::shared_ptr<IConnectionFactory> connector;
    try {
        connector = connector_builder_(profile, effective_database(profile, database));
        if (!connector) {
            throw ConnectionError(std::format("No connector available for '{}'", key));
        }
    } catch (...) {
        {
            std::unique_lock lock(mutex_);
            pending_connectors_.erase(key);
        }
        promise.set_exception(std::current_exception());
        throw;
    }

    {
        std::unique_lock lock(mutex_);
        connectors_.emplace(key, connector);
        pending_connectors_.erase(key);
    }
    promise.set_value(connector);
    utils::log::debug(std::format("Connector created for '{}' -> {}", key, connector->describe()));
    return connector;
}

std::shared_ptr<IConnectionPool> ConnectionMultiplexer::get_pool(
    const ConnectionProfile& profile, const std::string& database, const std::string& key) {

    {
        std::shared_lock lock(mutex_);
        auto it = pools_.find(key);
        if (it != pools_.end()) {
            return it->second;
        }
    }

    auto connector = get_connector(profile, database, key);

    std::unique_lock lock(mutex_);
    auto [it, inserted] = pools_.try_emplace(key, nullptr);
    if (!inserted) {
        return it->second;
    }

    try {
        it->second = pool_factory_(key, options_.pool, std::move(connector));
    } catch (...) {
        pools_.erase(key);
        throw;
    }
    utils::log::info(std::format("Created connection pool '{}' (max {} connections)",
                                 key, options_.pool.max_connections));
    return it->second;
}

PooledLease ConnectionMultiplexer::acquire_pooled(const ConnectionProfile& profile,
                                                  const std::string& database) {
    ensure_running();
    const std::string key = connection_key(profile, database);
    auto pool = get_pool(profile, database, key);
    return pool->acquire();
}

void ConnectionMultiplexer::release(PooledLease lease) {
    if (lease) {
        lease->release();
    }
}

std::shared_ptr<SessionSlot> ConnectionMultiplexer::get_slot(const std::string& skey) {
    {
        std::shared_lock lock(mutex_);
        auto it = sessions_.find(skey);
        if (it != sessions_.end()) {
            return it->second;
        }
    }

    std::unique_lock lock(mutex_);
    auto [it, inserted] = sessions_.try_emplace(skey, nullptr);
    if (inserted) {
        it->second = std::make_shared<SessionSlot>(skey);
    }
    return it->second;
}

SessionLease ConnectionMultiplexer::acquire_session(const ConnectionProfile& profile,
                                                    const std::string& session_id,
                                                    const std::string& database) {
    ensure_running();
    const std::string key = connection_key(profile, database);
    const std::string skey = session_key(key, session_id);

    auto evict = [this](const std::shared_ptr<SessionSlot>& s) { evict_session(s); };

    for (;;) {
        auto slot = get_slot(skey);
        std::unique_lock slot_lock(slot->mutex);

        // Closed or evicted while we waited for it: look the key up again
        if (slot->closed) {
            continue;
        }

        if (slot->conn && !slot->conn->is_connected()) {
            utils::log::warn(std::format("Session '{}' connection is dead, reconnecting", skey));
            evict_session(slot);
            continue;
        }

        if (!slot->conn) {
            try {
                auto connector = get_connector(profile, database, key);
                slot->conn = connector->create();
            } catch (...) {
                evict_session(slot);
                throw;
            }
            utils::log::info(std::format("Opened session '{}'", skey));
        }

        return SessionLease(std::move(slot), std::move(slot_lock), evict);
    }
}

void ConnectionMultiplexer::evict_session(const std::shared_ptr<SessionSlot>& slot) {
    // Caller holds slot->mutex
    if (slot->conn) {
        slot->conn->close();
        slot->conn.reset();
    }
    slot->closed = true;

    std::unique_lock lock(mutex_);
    auto it = sessions_.find(slot->key);
    if (it != sessions_.end() && it->second == slot) {
        sessions_.erase(it);
        utils::log::debug(std::format("Evicted session '{}'", slot->key));
    }
}

void ConnectionMultiplexer::close_slot(const std::shared_ptr<SessionSlot>& slot) {
    std::lock_guard slot_lock(slot->mutex);
    if (slot->closed) {
        return;
    }
    if (slot->conn) {
        slot->conn->close();
        slot->conn.reset();
    }
    slot->closed = true;
}

void ConnectionMultiplexer::close_session(const ConnectionProfile& profile,
                                          const std::string& session_id,
                                          const std::string& database) {
    const std::string skey = session_key(connection_key(profile, database), session_id);
    close_matching(
        [](const std::string&) { return false; },
        [&skey](const std::string& k) { return k == skey; });
}

void ConnectionMultiplexer::close_all_for_key(const std::string& key) {
    const std::string session_prefix = key + ":session:";
    close_matching(
        [&key](const std::string& k) { return k == key; },
        [&session_prefix](const std::string& k) { return k.starts_with(session_prefix); });
}

void ConnectionMultiplexer::close_all_for_profile_id(const std::string& profile_id) {
    const std::string prefix = profile_id + ":";
    const auto pred = [&prefix](const std::string& k) { return k.starts_with(prefix); };
    close_matching(pred, pred);
    utils::log::info(std::format("Closed resources for profile '{}'", profile_id));
}

void ConnectionMultiplexer::close_all() {
    const auto all = [](const std::string&) { return true; };
    close_matching(all, all);
}

void ConnectionMultiplexer::close_matching(const KeyPredicate& pool_pred,
                                           const KeyPredicate& session_pred) {
    std::vector<std::pair<std::string, std::shared_ptr<IConnectionPool>>> pools;
    std::vector<std::shared_ptr<SessionSlot>> slots;
    {
        std::unique_lock lock(mutex_);
        for (auto it = pools_.begin(); it != pools_.end();) {
            if (pool_pred(it->first)) {
                pools.emplace_back(it->first, std::move(it->second));
                it = pools_.erase(it);
            } else {
                ++it;
            }
        }
        for (auto it = connectors_.begin(); it != connectors_.end();) {
            it = pool_pred(it->first) ? connectors_.erase(it) : std::next(it);
        }
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (session_pred(it->first)) {
                slots.push_back(std::move(it->second));
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
    }

    // Outside the registry lock: draining and closing may block
    for (auto& [key, pool] : pools) {
        if (pool) {
            pool->drain();
            utils::log::debug(std::format("Closed pool '{}'", key));
        }
    }
    for (const auto& slot : slots) {
        close_slot(slot);
        utils::log::debug(std::format("Closed session '{}'", slot->key));
    }
}

ConnectionMultiplexer::Stats ConnectionMultiplexer::get_stats() const {
    std::shared_lock lock(mutex_);
    return Stats{
        .total_pools = pools_.size(),
        .total_sessions = sessions_.size(),
        .total_connectors = connectors_.size(),
    };
}

void ConnectionMultiplexer::reaper_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        {
            std::unique_lock lock(reaper_mutex_);
            reaper_cv_.wait_for(lock, stop, options_.reap_interval,
                                [&stop] { return stop.stop_requested(); });
        }
        if (stop.stop_requested()) {
            break;
        }

        std::vector<std::shared_ptr<IConnectionPool>> pools;
        {
            std::shared_lock lock(mutex_);
            pools.reserve(pools_.size());
            for (const auto& [_, pool] : pools_) {
                if (pool) pools.push_back(pool);
            }
        }
        for (const auto& pool : pools) {
            const size_t evicted = pool->evict_idle();
            if (evicted > 0) {
                utils::log::debug(std::format("Pool '{}': closed {} idle connection(s)",
                                              pool->name(), evicted));
            }
        }
    }
}

} // namespace sqlrunner
