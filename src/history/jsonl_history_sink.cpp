#include "history/jsonl_history_sink.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <deque>
#include <format>
#include <stdexcept>

namespace sqlrunner {

using json = nlohmann::json;

JsonlHistorySink::JsonlHistorySink(std::string path)
    : path_(std::move(path)) {
    stream_.open(path_, std::ios::app);
    if (!stream_.is_open()) {
        throw std::runtime_error("Failed to open history file: " + path_);
    }
}

JsonlHistorySink::~JsonlHistorySink() {
    if (stream_.is_open()) {
        stream_.flush();
        stream_.close();
    }
}

std::string JsonlHistorySink::to_json_line(const HistoryEntry& entry) {
    json j;
    j["id"] = entry.id;
    j["query"] = entry.statement;
    j["success"] = entry.success;
    j["duration_ms"] = static_cast<double>(entry.duration.count()) / 1000.0;
    if (entry.row_count) {
        j["row_count"] = *entry.row_count;
    }
    if (!entry.connection_name.empty()) {
        j["connection_name"] = entry.connection_name;
    }
    j["timestamp"] = std::chrono::duration_cast<std::chrono::milliseconds>(
        entry.timestamp.time_since_epoch()).count();
    // Scripts read in a non-UTF-8 encoding keep their line; bad bytes become U+FFFD
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

void JsonlHistorySink::record(const HistoryEntry& entry) {
    const std::string line = to_json_line(entry);

    std::lock_guard lock(mutex_);
    stream_ << line << '\n';
    stream_.flush();
    if (!stream_.good()) {
        utils::log::warn(std::format("Failed to append to history file '{}'", path_));
        stream_.clear();
    }
}

std::vector<HistoryEntry> JsonlHistorySink::load(const std::string& path, size_t max_entries) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return {};
    }

    std::deque<HistoryEntry> newest_first;
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (utils::trim(line).empty()) continue;

        try {
            const json j = json::parse(line);
            HistoryEntry e;
            e.id = j.value("id", std::string{});
            e.statement = j.at("query").get<std::string>();
            e.success = j.value("success", false);
            e.duration = std::chrono::microseconds(
                static_cast<int64_t>(j.value("duration_ms", 0.0) * 1000.0));
            if (j.contains("row_count")) {
                e.row_count = j["row_count"].get<uint64_t>();
            }
            e.connection_name = j.value("connection_name", std::string{});
            e.timestamp = std::chrono::system_clock::time_point(
                std::chrono::milliseconds(j.value("timestamp", int64_t{0})));

            newest_first.push_front(std::move(e));
            if (newest_first.size() > max_entries) {
                newest_first.pop_back();
            }
        } catch (const json::exception& ex) {
            utils::log::warn(std::format("{}:{}: skipping malformed history line ({})",
                                         path, line_no, ex.what()));
        }
    }

    return {newest_first.begin(), newest_first.end()};
}

} // namespace sqlrunner
