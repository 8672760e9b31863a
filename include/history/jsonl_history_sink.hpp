#pragma once

#include "history/history_sink.hpp"
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

namespace sqlrunner {

/**
 * @brief Appends history entries to a JSONL file, one object per line
 *
 * {"id":"...","query":"...","success":true,"duration_ms":1.25,
 *  "row_count":3,"connection_name":"prod","timestamp":1700000000000}
 */
class JsonlHistorySink : public IHistorySink {
public:
    /**
     * @throws std::runtime_error if the file cannot be opened for appending
     */
    explicit JsonlHistorySink(std::string path);
    ~JsonlHistorySink() override;

    void record(const HistoryEntry& entry) override;
    [[nodiscard]] std::string name() const override { return "jsonl:" + path_; }

    /**
     * @brief Serialize one entry (no trailing newline)
     */
    [[nodiscard]] static std::string to_json_line(const HistoryEntry& entry);

    /**
     * @brief Read back the newest max_entries entries of a history file
     *
     * Malformed lines are skipped with a warning. A missing file yields an
     * empty list.
     * @return Entries, newest first
     */
    [[nodiscard]] static std::vector<HistoryEntry> load(const std::string& path, size_t max_entries);

private:
    std::string path_;
    std::ofstream stream_;
    std::mutex mutex_;
};

} // namespace sqlrunner
