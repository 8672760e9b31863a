#pragma once

#include "db/idb_connection.hpp"
#include <memory>
#include <string>

namespace sqlrunner {

/**
 * @brief Abstract factory for creating database connections
 *
 * A factory is bound to one ConnectionKey: credentials, TLS material and
 * (optionally) an SSH tunnel are resolved once when it is built.
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @brief Open a new database connection
     * @return Connected connection, never nullptr
     * @throws ConnectionError if the server cannot be reached or rejects us
     */
    [[nodiscard]] virtual std::unique_ptr<IDbConnection> create() = 0;

    /**
     * @brief Human-readable target for logging ("host:port/db")
     */
    [[nodiscard]] virtual std::string describe() const = 0;
};

} // namespace sqlrunner
