#pragma once

#include "db/idb_connection.hpp"
#include <functional>
#include <memory>

namespace sqlrunner {

/**
 * @brief RAII lease over a pooled database connection
 *
 * Automatically returns the connection to its pool on destruction, so a
 * lease is released exactly once on every exit path.
 * Move-only to prevent accidental copying.
 */
class PooledConnection {
public:
    using ReturnFunc = std::function<void(std::unique_ptr<IDbConnection>)>;

    /**
     * @brief Construct pooled connection with return callback
     * @param conn Database connection
     * @param return_fn Function to call on release (returns to pool)
     */
    PooledConnection(std::unique_ptr<IDbConnection> conn, ReturnFunc return_fn);

    /**
     * @brief Destructor - automatically returns connection to pool
     */
    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    /**
     * @brief Return the connection now; later calls are no-ops
     */
    void release();

    /**
     * @brief Access the underlying connection
     */
    IDbConnection* get() const { return conn_.get(); }
    IDbConnection* operator->() const { return conn_.get(); }
    IDbConnection& operator*() const { return *conn_; }

    /**
     * @brief Check if connection is valid
     */
    bool is_valid() const { return conn_ != nullptr && conn_->is_connected(); }

private:
    std::unique_ptr<IDbConnection> conn_;
    ReturnFunc return_fn_;
};

} // namespace sqlrunner
