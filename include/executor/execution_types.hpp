#pragma once

#include "db/idb_connection.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sqlrunner {

/**
 * @brief Table a single-table SELECT reads from, for write-back
 */
struct TableInfo {
    std::string schema;
    std::string table;
    std::vector<std::string> primary_keys;
};

/**
 * @brief Outcome of one successful statement
 */
struct ExecutionResult {
    std::string statement;
    size_t statement_index = 0;

    std::vector<std::string> columns;
    std::vector<std::string> column_types;   // Parallel to columns
    std::vector<Row> rows;
    uint64_t row_count = 0;
    std::string command_tag;

    std::vector<std::string> notices;        // Raised while this statement ran
    std::chrono::microseconds elapsed{0};
    std::optional<int> backend_pid;
    std::optional<TableInfo> table_info;

    bool streamed = false;
};

/**
 * @brief Outcome of the statement that stopped the script
 */
struct ExecutionError {
    std::string message;
    std::string statement;
    size_t statement_index = 0;
    std::chrono::microseconds elapsed{0};
};

using StatementOutcome = std::variant<ExecutionResult, ExecutionError>;

/**
 * @brief One FETCH worth of rows from a server-side cursor
 */
struct StreamBatch {
    std::vector<Row> rows;
    std::vector<FieldInfo> fields;
    size_t batch_number = 0;          // 1-based
    bool is_first = false;
    bool is_complete = false;         // Fewer rows than the batch size
    uint64_t total_rows_so_far = 0;
};

/**
 * @brief Totals for one script run
 */
struct ScriptSummary {
    size_t statements_total = 0;      // After splitting
    size_t statements_executed = 0;   // Including the failed one
    size_t statements_succeeded = 0;
    bool failed = false;
    std::optional<int> backend_pid;
    std::chrono::microseconds elapsed{0};
};

} // namespace sqlrunner
