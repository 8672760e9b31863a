#include "executor/script_executor.hpp"
#include "core/utils.hpp"
#include "db/postgresql/pg_type_map.hpp"
#include "executor/streaming_cursor_reader.hpp"

#include <format>
#include <regex>

namespace sqlrunner {

namespace {

constexpr const char* kTableInfoSavepoint = "sqlrunner_table_info";

std::vector<std::string> type_names(const std::vector<FieldInfo>& fields) {
    std::vector<std::string> names;
    names.reserve(fields.size());
    for (const auto& f : fields) {
        names.push_back(PgTypeMap::oid_to_type_name(f.type_oid));
    }
    return names;
}

std::vector<std::string> column_names(const std::vector<FieldInfo>& fields) {
    std::vector<std::string> names;
    names.reserve(fields.size());
    for (const auto& f : fields) names.push_back(f.name);
    return names;
}

std::string preview(const std::string& sql) {
    constexpr size_t kMax = 100;
    return sql.size() <= kMax ? sql : sql.substr(0, kMax) + "...";
}

} // anonymous namespace

ScriptExecutor::ScriptExecutor(ConnectionMultiplexer& multiplexer,
                               std::shared_ptr<IHistorySink> history,
                               Config config)
    : multiplexer_(multiplexer),
      history_(std::move(history)),
      config_(std::move(config)) {}

ScriptSummary ScriptExecutor::execute(const std::string& script,
                                      const ConnectionProfile& profile,
                                      const std::string& session_id,
                                      const OutcomeCallback& on_outcome,
                                      const ExecuteOptions& options) {
    utils::Timer timer;
    ScriptSummary summary;

    const auto statements = StatementSplitter::split(script);
    summary.statements_total = statements.size();
    if (statements.empty()) {
        return summary;
    }

    auto lease = multiplexer_.acquire_session(profile, session_id, options.database);
    IDbConnection& conn = *lease;

    summary.backend_pid = read_backend_pid(conn);
    if (summary.backend_pid && options.on_backend_pid) {
        options.on_backend_pid(*summary.backend_pid);
    }

    // Notices arrive synchronously on this thread while a statement runs
    std::vector<std::string> notices;
    NoticeSubscription subscription = conn.subscribe_notices(
        [&notices](const std::string& message) { notices.push_back(message); });

    const bool may_stream = options.on_batch && config_.streaming.enabled &&
        statements.size() == 1 &&
        StreamingPolicy::should_stream(statements.front().text,
                                       config_.streaming.max_rows_before_streaming);

    utils::log::debug(std::format("Executing {} statement(s) on session '{}'",
                                  statements.size(), lease.session_key()));

    for (const auto& stmt : statements) {
        utils::log::debug(std::format("Statement {}/{}: {}",
                                      stmt.index + 1, statements.size(), preview(stmt.text)));

        StatementOutcome outcome = may_stream
            ? run_streaming(conn, stmt, notices, summary.backend_pid, options.on_batch)
            : run_statement(conn, stmt, notices, summary.backend_pid);
        notices.clear();

        ++summary.statements_executed;
        const bool failed = std::holds_alternative<ExecutionError>(outcome);

        record_history(outcome, profile);
        if (on_outcome) {
            on_outcome(outcome);
        }

        if (failed) {
            summary.failed = true;
            break;
        }
        ++summary.statements_succeeded;
    }

    summary.elapsed = timer.elapsed_us();
    return summary;
}

std::vector<StatementOutcome> ScriptExecutor::execute(const std::string& script,
                                                      const ConnectionProfile& profile,
                                                      const std::string& session_id,
                                                      const ExecuteOptions& options) {
    std::vector<StatementOutcome> outcomes;
    execute(script, profile, session_id,
            [&outcomes](const StatementOutcome& o) { outcomes.push_back(o); },
            options);
    return outcomes;
}

StatementOutcome ScriptExecutor::run_statement(IDbConnection& conn, const Statement& stmt,
                                               std::vector<std::string>& notices,
                                               const std::optional<int>& backend_pid) {
    utils::Timer timer;
    DbResultSet rs = conn.execute(stmt.text);
    const auto elapsed = timer.elapsed_us();

    if (!rs.success) {
        utils::log::debug(std::format("Statement {} failed: {}", stmt.index + 1, rs.error_message));
        return ExecutionError{
            .message = rs.error_message,
            .statement = stmt.text,
            .statement_index = stmt.index,
            .elapsed = elapsed,
        };
    }

    ExecutionResult result;
    result.statement = stmt.text;
    result.statement_index = stmt.index;
    result.columns = column_names(rs.fields);
    result.column_types = type_names(rs.fields);
    result.row_count = rs.has_rows ? rs.rows.size() : rs.affected_rows;
    result.rows = std::move(rs.rows);
    result.command_tag = rs.command_tag;
    result.elapsed = elapsed;
    result.backend_pid = backend_pid;

    // Read before the lookup below, which may raise notices of its own
    result.notices = notices;
    notices.clear();

    if (config_.infer_table_info && rs.has_rows) {
        result.table_info = infer_table_info(conn, stmt.text);
    }
    return result;
}

StatementOutcome ScriptExecutor::run_streaming(IDbConnection& conn, const Statement& stmt,
                                               std::vector<std::string>& notices,
                                               const std::optional<int>& backend_pid,
                                               const BatchCallback& on_batch) {
    utils::Timer timer;
    ExecutionResult result;
    result.statement = stmt.text;
    result.statement_index = stmt.index;
    result.command_tag = "SELECT";
    result.backend_pid = backend_pid;
    result.streamed = true;

    try {
        auto stream = StreamingCursorReader::stream(conn, stmt.text, config_.streaming.batch_size);
        while (auto batch = stream.next()) {
            if (batch->is_first) {
                result.columns = column_names(batch->fields);
                result.column_types = type_names(batch->fields);
            }
            result.row_count = batch->total_rows_so_far;
            on_batch(*batch);
        }
    } catch (const StatementError& e) {
        return ExecutionError{
            .message = e.what(),
            .statement = stmt.text,
            .statement_index = stmt.index,
            .elapsed = timer.elapsed_us(),
        };
    }

    result.elapsed = timer.elapsed_us();
    result.notices = notices;
    notices.clear();
    utils::log::debug(std::format("Streamed {} row(s) for statement {}",
                                  result.row_count, stmt.index + 1));
    return result;
}

std::optional<int> ScriptExecutor::read_backend_pid(IDbConnection& conn) {
    auto rs = conn.execute("SELECT pg_backend_pid()");
    if (!rs.success || rs.rows.empty() || rs.rows.front().empty() || !rs.rows.front().front()) {
        utils::log::warn(std::format("Failed to get backend PID: {}",
                                     rs.success ? "empty result" : rs.error_message));
        return std::nullopt;
    }
    return utils::try_parse_int<int>(*rs.rows.front().front());
}

std::optional<std::pair<std::string, std::string>>
ScriptExecutor::parse_from_table(const std::string& statement) {
    static const std::regex kFrom(R"re(FROM\s+["']?([a-zA-Z0-9_.]+)["']?)re",
                                  std::regex::icase);
    std::smatch match;
    if (!std::regex_search(statement, match, kFrom)) {
        return std::nullopt;
    }

    const std::string full = match[1].str();
    const auto dot = full.find('.');
    if (dot == std::string::npos) {
        return std::make_pair(std::string("public"), full);
    }
    const auto second_dot = full.find('.', dot + 1);
    return std::make_pair(full.substr(0, dot),
                          full.substr(dot + 1, second_dot == std::string::npos
                                                   ? std::string::npos
                                                   : second_dot - dot - 1));
}

std::optional<TableInfo> ScriptExecutor::infer_table_info(IDbConnection& conn,
                                                          const std::string& statement) {
    auto target = parse_from_table(statement);
    if (!target || target->first.empty() || target->second.empty()) {
        return std::nullopt;
    }
    auto& [schema, table] = *target;

    // Identifiers are restricted to [A-Za-z0-9_] by the regex above
    const std::string sql = std::format(
        "SELECT a.attname "
        "FROM pg_index i "
        "JOIN pg_attribute a ON a.attrelid = i.indrelid AND a.attnum = ANY(i.indkey) "
        "WHERE i.indrelid = '{}.{}'::regclass AND i.indisprimary",
        schema, table);

    // Inside a user transaction a failed lookup must not abort it
    const bool guarded = conn.in_transaction();
    if (guarded && !conn.execute(std::format("SAVEPOINT {}", kTableInfoSavepoint)).success) {
        return std::nullopt;
    }

    auto rs = conn.execute(sql);

    if (guarded) {
        if (!rs.success) {
            auto rolled_back = conn.execute(std::format("ROLLBACK TO SAVEPOINT {}", kTableInfoSavepoint));
            if (!rolled_back.success) {
                utils::log::warn(std::format("ROLLBACK TO SAVEPOINT failed: {}", rolled_back.error_message));
            }
        }
        auto released = conn.execute(std::format("RELEASE SAVEPOINT {}", kTableInfoSavepoint));
        if (!released.success) {
            utils::log::warn(std::format("RELEASE SAVEPOINT failed: {}", released.error_message));
        }
    }

    if (!rs.success) {
        utils::log::debug(std::format("No primary key info for {}.{}: {}",
                                      schema, table, rs.error_message));
        return std::nullopt;
    }

    TableInfo info{.schema = schema, .table = table, .primary_keys = {}};
    for (const auto& row : rs.rows) {
        if (!row.empty() && row.front()) {
            info.primary_keys.push_back(*row.front());
        }
    }
    return info;
}

void ScriptExecutor::record_history(const StatementOutcome& outcome,
                                    const ConnectionProfile& profile) {
    if (!history_) {
        return;
    }

    HistoryEntry entry;
    entry.id = utils::generate_uuid();
    entry.connection_name = profile.display_name();
    entry.timestamp = std::chrono::system_clock::now();

    if (const auto* ok = std::get_if<ExecutionResult>(&outcome)) {
        entry.statement = ok->statement;
        entry.success = true;
        entry.duration = ok->elapsed;
        entry.row_count = ok->row_count;
    } else {
        const auto& err = std::get<ExecutionError>(outcome);
        entry.statement = err.statement;
        entry.success = false;
        entry.duration = err.elapsed;
    }

    try {
        history_->record(entry);
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Failed to record history ({}): {}", history_->name(), e.what()));
    }
}

Result<uint64_t> ScriptExecutor::apply_updates(const std::vector<std::string>& statements,
                                               const ConnectionProfile& profile,
                                               const std::string& session_id,
                                               const std::string& database) {
    if (statements.empty()) {
        return Result<uint64_t>::ok(0);
    }

    std::string batch;
    for (size_t i = 0; i < statements.size(); ++i) {
        if (i > 0) batch += '\n';
        batch += statements[i];
    }

    try {
        auto lease = multiplexer_.acquire_session(profile, session_id, database);
        auto rs = lease->execute(batch);
        if (!rs.success) {
            utils::log::warn(std::format("Saving {} change(s) failed: {}",
                                         statements.size(), rs.error_message));
            return Result<uint64_t>::error(ErrorCategory::STATEMENT_ERROR, rs.error_message);
        }
        utils::log::info(std::format("Saved {} change(s)", statements.size()));
        return Result<uint64_t>::ok(rs.affected_rows);
    } catch (const ConnectionError& e) {
        return Result<uint64_t>::error(ErrorCategory::CONNECTION_ERROR, e.what());
    }
}

} // namespace sqlrunner
