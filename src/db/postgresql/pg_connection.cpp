#include "db/postgresql/pg_connection.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include <format>

namespace sqlrunner {

// ============================================================================
// PgConnectionParams
// ============================================================================

PgConnectionParams PgConnectionParams::from_profile(
    const ConnectionProfile& profile,
    const std::string& database,
    const std::optional<std::string>& password,
    const TlsMaterial& tls,
    const std::string& host_override,
    uint16_t port_override) {

    PgConnectionParams params;
    params.set("host", host_override.empty() ? profile.host : host_override);
    params.set("port", std::to_string(port_override != 0 ? port_override : profile.port));

    std::string dbname = database;
    if (dbname.empty()) dbname = profile.database;
    if (dbname.empty()) dbname = kDefaultDatabase;
    params.set("dbname", dbname);

    if (!profile.username.empty()) params.set("user", profile.username);
    if (password) params.set("password", *password);

    params.set("sslmode", ssl_mode_to_string(profile.ssl_mode));
    if (!tls.cert_path.empty()) params.set("sslcert", tls.cert_path);
    if (!tls.key_path.empty()) params.set("sslkey", tls.key_path);
    if (!tls.root_cert_path.empty()) params.set("sslrootcert", tls.root_cert_path);

    if (profile.connect_timeout_s > 0) {
        params.set("connect_timeout", std::to_string(profile.connect_timeout_s));
    }
    if (!profile.application_name.empty()) {
        params.set("application_name", profile.application_name);
    }

    std::string options = profile.options;
    if (profile.statement_timeout_ms > 0) {
        if (!options.empty()) options += ' ';
        options += std::format("-c statement_timeout={}", profile.statement_timeout_ms);
    }
    if (!options.empty()) params.set("options", options);

    return params;
}

void PgConnectionParams::set(const std::string& keyword, std::string value) {
    for (auto& [k, v] : entries_) {
        if (k == keyword) {
            v = std::move(value);
            return;
        }
    }
    entries_.emplace_back(keyword, std::move(value));
}

std::optional<std::string> PgConnectionParams::get(const std::string& keyword) const {
    for (const auto& [k, v] : entries_) {
        if (k == keyword) return v;
    }
    return std::nullopt;
}

std::vector<const char*> PgConnectionParams::keywords() const {
    std::vector<const char*> out;
    out.reserve(entries_.size() + 1);
    for (const auto& [k, _] : entries_) out.push_back(k.c_str());
    out.push_back(nullptr);
    return out;
}

std::vector<const char*> PgConnectionParams::values() const {
    std::vector<const char*> out;
    out.reserve(entries_.size() + 1);
    for (const auto& [_, v] : entries_) out.push_back(v.c_str());
    out.push_back(nullptr);
    return out;
}

std::string PgConnectionParams::describe() const {
    return std::format("{}:{}/{}",
        get("host").value_or("?"), get("port").value_or("?"), get("dbname").value_or("?"));
}

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {
    if (conn_) {
        PQsetNoticeReceiver(conn_, &PgConnection::notice_receiver, this);
    }
}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const std::string& sql) {
    DbResultSet failed;
    if (!conn_) {
        failed.error_message = "Connection is closed";
        return failed;
    }

    PGresult* res = PQexec(conn_, sql.c_str());

    if (!res) {
        failed.error_message = last_error();
        return failed;
    }

    const ExecStatusType status = PQresultStatus(res);

    if (status == PGRES_TUPLES_OK) {
        auto result = process_tuples_result(res);
        PQclear(res);
        return result;
    }

    if (status == PGRES_COMMAND_OK || status == PGRES_EMPTY_QUERY) {
        auto result = process_command_result(res);
        PQclear(res);
        return result;
    }

    // Error case
    failed.error_message = utils::trim(PQresultErrorMessage(res));
    if (failed.error_message.empty()) failed.error_message = last_error();
    PQclear(res);
    return failed;
}

NoticeSubscription PgConnection::subscribe_notices(NoticeHandler handler) {
    uint64_t id = 0;
    {
        std::lock_guard lock(notice_mutex_);
        id = next_handler_id_++;
        notice_handlers_.emplace(id, std::move(handler));
    }
    return NoticeSubscription([this, id] {
        std::lock_guard lock(notice_mutex_);
        notice_handlers_.erase(id);
    });
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

bool PgConnection::in_transaction() const {
    if (!conn_) return false;
    const PGTransactionStatusType status = PQtransactionStatus(conn_);
    return status == PQTRANS_INTRANS || status == PQTRANS_INERROR;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

void PgConnection::notice_receiver(void* arg, const PGresult* res) {
    auto* self = static_cast<PgConnection*>(arg);
    const char* primary = PQresultErrorField(res, PG_DIAG_MESSAGE_PRIMARY);
    self->dispatch_notice(primary ? std::string(primary)
                                  : utils::trim(PQresultErrorMessage(res)));
}

void PgConnection::dispatch_notice(const std::string& message) {
    std::lock_guard lock(notice_mutex_);
    if (notice_handlers_.empty()) {
        utils::log::debug(std::format("Unhandled server notice: {}", message));
        return;
    }
    for (const auto& [_, handler] : notice_handlers_) {
        handler(message);
    }
}

DbResultSet PgConnection::process_tuples_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = true;
    result.command_tag = command_tag_verb(PQcmdStatus(res));

    const int ncols = PQnfields(res);
    result.fields.reserve(ncols);
    for (int i = 0; i < ncols; i++) {
        result.fields.push_back({PQfname(res, i), static_cast<uint32_t>(PQftype(res, i))});
    }

    const int nrows = PQntuples(res);
    result.rows.reserve(nrows);

    for (int i = 0; i < nrows; i++) {
        Row row;
        row.reserve(ncols);
        for (int j = 0; j < ncols; j++) {
            if (PQgetisnull(res, i, j)) {
                row.emplace_back(std::nullopt);
            } else {
                row.emplace_back(std::string(PQgetvalue(res, i, j),
                                             static_cast<size_t>(PQgetlength(res, i, j))));
            }
        }
        result.rows.push_back(std::move(row));
    }
    result.affected_rows = static_cast<uint64_t>(nrows);

    return result;
}

DbResultSet PgConnection::process_command_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = false;
    result.command_tag = command_tag_verb(PQcmdStatus(res));

    if (const auto affected = utils::try_parse_int<uint64_t>(PQcmdTuples(res))) {
        result.affected_rows = *affected;
    }

    return result;
}

std::string PgConnection::last_error() const {
    if (!conn_) return "Connection is closed";
    return utils::trim(PQerrorMessage(conn_));
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

PgConnectionFactory::PgConnectionFactory(PgConnectionParams params,
                                         std::shared_ptr<void> tunnel)
    : params_(std::move(params)), tunnel_(std::move(tunnel)) {}

std::unique_ptr<IDbConnection> PgConnectionFactory::create() {
    const auto keywords = params_.keywords();
    const auto values = params_.values();

    PGconn* conn = PQconnectdbParams(keywords.data(), values.data(), 0);

    if (!conn) {
        throw ConnectionError("Failed to allocate PGconn");
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        std::string error = utils::trim(PQerrorMessage(conn));
        PQfinish(conn);
        utils::log::error(std::format("Failed to connect to {}: {}", params_.describe(), error));
        throw ConnectionError(std::format("Failed to connect to {}: {}", params_.describe(), error));
    }

    return std::make_unique<PgConnection>(conn);
}

std::string command_tag_verb(const std::string& cmd_status) {
    const auto end = cmd_status.find(' ');
    return cmd_status.substr(0, end);
}

} // namespace sqlrunner
