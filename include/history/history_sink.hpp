#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace sqlrunner {

/**
 * @brief One executed statement, as remembered by history
 */
struct HistoryEntry {
    std::string id;
    std::string statement;
    bool success = false;
    std::chrono::microseconds duration{0};
    std::optional<uint64_t> row_count;     // Absent for failed statements
    std::string connection_name;
    std::chrono::system_clock::time_point timestamp;
};

/**
 * @brief Destination for history entries
 *
 * Called from the executing thread after every statement. Implementations
 * must be thread-safe and must not throw for I/O problems (log instead).
 */
class IHistorySink {
public:
    virtual ~IHistorySink() = default;

    virtual void record(const HistoryEntry& entry) = 0;

    /// Human-readable sink name for logging (e.g. "jsonl:/home/me/.sqlrunner/history.jsonl")
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace sqlrunner
