#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "db/connection_multiplexer.hpp"
#include "executor/execution_types.hpp"
#include "history/history_sink.hpp"
#include "parser/statement_splitter.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sqlrunner {

struct ScriptExecutorConfig {
    StreamingSettings streaming;
    bool infer_table_info = true;
};

/**
 * @brief Runs multi-statement scripts on a session connection
 *
 * Flow per script:
 * 1. Split into statements (StatementSplitter)
 * 2. Acquire the (profile, database, session id) session lease
 * 3. Capture the backend pid so the caller can arm cancellation
 * 4. Execute statements in order, emitting one outcome each; the first
 *    failure is reported as ExecutionError and nothing after it runs
 *
 * A failed statement leaves the session open (and any transaction the
 * script opened in its aborted state, as the server left it).
 */
class ScriptExecutor {
public:
    using OutcomeCallback = std::function<void(const StatementOutcome&)>;
    using BatchCallback = std::function<void(const StreamBatch&)>;
    using BackendPidCallback = std::function<void(int)>;

    using Config = ScriptExecutorConfig;

    struct ExecuteOptions {
        std::string database;                   // Empty = profile default
        BackendPidCallback on_backend_pid;
        BatchCallback on_batch;                 // Set to allow cursor streaming
    };

    ScriptExecutor(ConnectionMultiplexer& multiplexer,
                   std::shared_ptr<IHistorySink> history = nullptr,
                   Config config = Config());

    /**
     * @brief Execute a script, reporting each outcome as it happens
     * @throws ConnectionError if the session cannot be acquired
     */
    ScriptSummary execute(const std::string& script,
                          const ConnectionProfile& profile,
                          const std::string& session_id,
                          const OutcomeCallback& on_outcome,
                          const ExecuteOptions& options = ExecuteOptions());

    /**
     * @brief Execute a script and collect the outcomes
     * @throws ConnectionError if the session cannot be acquired
     */
    [[nodiscard]] std::vector<StatementOutcome> execute(const std::string& script,
                                                        const ConnectionProfile& profile,
                                                        const std::string& session_id,
                                                        const ExecuteOptions& options = ExecuteOptions());

    /**
     * @brief Run edited-row statements in one round trip on the session
     * @return Affected rows of the last statement
     */
    [[nodiscard]] Result<uint64_t> apply_updates(const std::vector<std::string>& statements,
                                                 const ConnectionProfile& profile,
                                                 const std::string& session_id,
                                                 const std::string& database = "");

    /**
     * @brief Schema/table named in a statement's FROM clause, if any
     *
     * "FROM app.users" -> ("app", "users"); unqualified names use "public".
     */
    [[nodiscard]] static std::optional<std::pair<std::string, std::string>>
        parse_from_table(const std::string& statement);

private:
    std::optional<int> read_backend_pid(IDbConnection& conn);

    /**
     * @brief Best-effort table + primary key lookup (never throws)
     */
    std::optional<TableInfo> infer_table_info(IDbConnection& conn, const std::string& statement);

    StatementOutcome run_statement(IDbConnection& conn, const Statement& stmt,
                                   std::vector<std::string>& notices,
                                   const std::optional<int>& backend_pid);

    StatementOutcome run_streaming(IDbConnection& conn, const Statement& stmt,
                                   std::vector<std::string>& notices,
                                   const std::optional<int>& backend_pid,
                                   const BatchCallback& on_batch);

    void record_history(const StatementOutcome& outcome, const ConnectionProfile& profile);

    ConnectionMultiplexer& multiplexer_;
    std::shared_ptr<IHistorySink> history_;
    Config config_;
};

} // namespace sqlrunner
