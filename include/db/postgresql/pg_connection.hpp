#pragma once

#include "config/config_types.hpp"
#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include "db/tls_material.hpp"
#include <libpq-fe.h>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sqlrunner {

/**
 * @brief libpq keyword/value connection parameters
 *
 * Built once per ConnectionKey and handed to PQconnectdbParams on every
 * connect, so passwords never end up in a conninfo string.
 */
class PgConnectionParams {
public:
    /**
     * @brief Build parameters for a profile
     * @param profile Connection profile
     * @param database Target database (empty = profile default, then "postgres")
     * @param password Password from the secret store, if any
     * @param tls Validated TLS material
     * @param host_override Local tunnel endpoint replacing profile.host (empty = none)
     * @param port_override Local tunnel port replacing profile.port (0 = none)
     */
    [[nodiscard]] static PgConnectionParams from_profile(
        const ConnectionProfile& profile,
        const std::string& database,
        const std::optional<std::string>& password,
        const TlsMaterial& tls,
        const std::string& host_override = "",
        uint16_t port_override = 0);

    void set(const std::string& keyword, std::string value);

    [[nodiscard]] std::optional<std::string> get(const std::string& keyword) const;

    /**
     * @brief NULL-terminated arrays for PQconnectdbParams (valid while *this lives)
     */
    [[nodiscard]] std::vector<const char*> keywords() const;
    [[nodiscard]] std::vector<const char*> values() const;

    /// "host:port/dbname" (no credentials)
    [[nodiscard]] std::string describe() const;

private:
    std::vector<std::pair<std::string, std::string>> entries_;
};

/**
 * @brief PostgreSQL connection implementing IDbConnection
 *
 * Wraps PGconn* and provides database-agnostic interface.
 * All libpq calls are encapsulated here. Server notices are delivered to
 * every active subscriber through a libpq notice receiver.
 */
class PgConnection : public IDbConnection {
public:
    /**
     * @brief Construct from existing PGconn* (takes ownership)
     */
    explicit PgConnection(PGconn* conn);

    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    DbResultSet execute(const std::string& sql) override;
    NoticeSubscription subscribe_notices(NoticeHandler handler) override;
    bool is_connected() const override;
    bool in_transaction() const override;
    void close() override;

private:
    static void notice_receiver(void* arg, const PGresult* res);
    void dispatch_notice(const std::string& message);

    /**
     * @brief Process a SELECT result (PGRES_TUPLES_OK)
     */
    DbResultSet process_tuples_result(PGresult* res);

    /**
     * @brief Process a command result (PGRES_COMMAND_OK)
     */
    DbResultSet process_command_result(PGresult* res);

    std::string last_error() const;

    PGconn* conn_;

    std::mutex notice_mutex_;
    std::map<uint64_t, NoticeHandler> notice_handlers_;
    uint64_t next_handler_id_ = 0;
};

/**
 * @brief PostgreSQL connection factory
 *
 * Creates PgConnection instances using PQconnectdbParams. The tunnel
 * handle (if any) is kept alive for as long as the factory exists.
 */
class PgConnectionFactory : public IConnectionFactory {
public:
    explicit PgConnectionFactory(PgConnectionParams params,
                                 std::shared_ptr<void> tunnel = nullptr);

    std::unique_ptr<IDbConnection> create() override;

    std::string describe() const override { return params_.describe(); }

private:
    PgConnectionParams params_;
    std::shared_ptr<void> tunnel_;
};

/**
 * @brief Parse the leading verb of a command status ("INSERT 0 3" -> "INSERT")
 */
[[nodiscard]] std::string command_tag_verb(const std::string& cmd_status);

} // namespace sqlrunner
