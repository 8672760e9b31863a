#pragma once

#include "history/history_sink.hpp"
#include <deque>
#include <mutex>
#include <vector>

namespace sqlrunner {

/**
 * @brief Bounded, newest-first statement history
 *
 * Once max_entries is reached the oldest entry is dropped. Entries recorded
 * without an id get a generated one.
 */
class InMemoryHistory : public IHistorySink {
public:
    static constexpr size_t kDefaultMaxEntries = 100;

    explicit InMemoryHistory(size_t max_entries = kDefaultMaxEntries);

    void record(const HistoryEntry& entry) override;
    [[nodiscard]] std::string name() const override { return "memory"; }

    /// Newest first
    [[nodiscard]] std::vector<HistoryEntry> entries() const;

    void clear();

    /// @return true if an entry with this id was removed
    bool remove(const std::string& id);

    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t capacity() const { return max_entries_; }

private:
    size_t max_entries_;
    std::deque<HistoryEntry> entries_;
    mutable std::mutex mutex_;
};

} // namespace sqlrunner
