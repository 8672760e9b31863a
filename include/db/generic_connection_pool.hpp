#pragma once

#include "db/iconnection_pool.hpp"
#include "db/iconnection_factory.hpp"
#include "db/pooled_connection.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>

namespace sqlrunner {

/**
 * @brief Bounded connection pool for one ConnectionKey
 *
 * Design:
 * - Bounded pool: max_connections enforced via counting_semaphore (C++20)
 * - Lazy: no connection is opened until the first acquire
 * - Idle eviction: connections idle longer than idle_timeout are closed
 *   (on acquire and whenever evict_idle() is called by the reaper)
 * - Dead idle connections (dropped by the server) are logged and replaced;
 *   they never tear the pool down
 * - RAII: PooledConnection auto-returns on destruction
 *
 * Pool state lives in a shared block captured by every lease, so a lease
 * returned after the pool object is gone simply closes its connection.
 */
class GenericConnectionPool : public IConnectionPool {
public:
    /**
     * @brief Construct pool with connection factory
     * @param key ConnectionKey (for logging)
     * @param config Pool configuration
     * @param factory Connection factory
     */
    GenericConnectionPool(
        std::string key,
        const PoolConfig& config,
        std::shared_ptr<IConnectionFactory> factory);

    ~GenericConnectionPool() override;

    GenericConnectionPool(const GenericConnectionPool&) = delete;
    GenericConnectionPool& operator=(const GenericConnectionPool&) = delete;

    std::unique_ptr<PooledConnection> acquire() override;

    size_t evict_idle() override;

    PoolStats get_stats() const override;

    void drain() override;

    const std::string& name() const override { return shared_->key; }

private:
    struct IdleConnection {
        std::unique_ptr<IDbConnection> conn;
        std::chrono::steady_clock::time_point last_used;
    };

    struct Shared {
        Shared(std::string k, const PoolConfig& cfg)
            : key(std::move(k)), config(cfg),
              semaphore(static_cast<std::ptrdiff_t>(cfg.max_connections)) {}

        /**
         * @brief Return connection to pool (called by PooledConnection)
         */
        void return_connection(std::unique_ptr<IDbConnection> conn);

        std::string key;
        PoolConfig config;

        std::deque<IdleConnection> idle;
        mutable std::mutex mutex;

        std::counting_semaphore<> semaphore;

        std::atomic<size_t> total_connections{0};
        std::atomic<size_t> total_acquires{0};
        std::atomic<size_t> total_releases{0};
        std::atomic<size_t> failed_acquires{0};
        std::atomic<size_t> idle_evictions{0};
        std::atomic<size_t> dead_discarded{0};

        std::atomic<bool> shutdown{false};
    };

    /**
     * @brief Pop a live idle connection, discarding dead ones
     */
    std::unique_ptr<IDbConnection> take_idle();

    std::shared_ptr<IConnectionFactory> factory_;
    std::shared_ptr<Shared> shared_;
};

} // namespace sqlrunner
