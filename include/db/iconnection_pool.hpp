#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace sqlrunner {

// Forward declarations
class PooledConnection;

/**
 * @brief Pool configuration
 */
struct PoolConfig {
    size_t max_connections = 10;
    std::chrono::milliseconds idle_timeout{30000};
    std::chrono::milliseconds acquire_timeout{5000};
};

/**
 * @brief Pool statistics for monitoring
 */
struct PoolStats {
    size_t total_connections = 0;
    size_t idle_connections = 0;
    size_t active_connections = 0;
    size_t total_acquires = 0;
    size_t total_releases = 0;
    size_t failed_acquires = 0;
    size_t idle_evictions = 0;
    size_t dead_connections_discarded = 0;
};

/**
 * @brief Abstract connection pool interface
 */
class IConnectionPool {
public:
    virtual ~IConnectionPool() = default;

    /**
     * @brief Borrow a connection (blocks up to the pool's acquire timeout)
     * @return RAII lease, never nullptr
     * @throws ConnectionError on timeout, shutdown or connect failure
     */
    [[nodiscard]] virtual std::unique_ptr<PooledConnection> acquire() = 0;

    /**
     * @brief Close idle connections unused for longer than the idle timeout
     * @return Number of connections closed
     */
    virtual size_t evict_idle() = 0;

    /**
     * @brief Get pool statistics (thread-safe)
     */
    [[nodiscard]] virtual PoolStats get_stats() const = 0;

    /**
     * @brief Shut the pool down: close idle connections, close borrowed ones on return
     *
     * Idempotent.
     */
    virtual void drain() = 0;

    /**
     * @brief ConnectionKey this pool serves
     */
    [[nodiscard]] virtual const std::string& name() const = 0;
};

} // namespace sqlrunner
