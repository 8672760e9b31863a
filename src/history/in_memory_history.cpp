#include "history/in_memory_history.hpp"
#include "core/utils.hpp"
#include <algorithm>

namespace sqlrunner {

InMemoryHistory::InMemoryHistory(size_t max_entries)
    : max_entries_(std::max<size_t>(max_entries, 1)) {}

void InMemoryHistory::record(const HistoryEntry& entry) {
    HistoryEntry copy = entry;
    if (copy.id.empty()) {
        copy.id = utils::generate_uuid();
    }

    std::lock_guard lock(mutex_);
    entries_.push_front(std::move(copy));
    while (entries_.size() > max_entries_) {
        entries_.pop_back();
    }
}

std::vector<HistoryEntry> InMemoryHistory::entries() const {
    std::lock_guard lock(mutex_);
    return {entries_.begin(), entries_.end()};
}

void InMemoryHistory::clear() {
    std::lock_guard lock(mutex_);
    entries_.clear();
}

bool InMemoryHistory::remove(const std::string& id) {
    std::lock_guard lock(mutex_);
    const auto before = entries_.size();
    std::erase_if(entries_, [&id](const HistoryEntry& e) { return e.id == id; });
    return entries_.size() != before;
}

size_t InMemoryHistory::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

} // namespace sqlrunner
