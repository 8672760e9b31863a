#include <catch2/catch_test_macros.hpp>
#include "history/composite_history_sink.hpp"
#include "history/in_memory_history.hpp"
#include "history/jsonl_history_sink.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

using namespace sqlrunner;

namespace {

HistoryEntry make_entry(const std::string& statement, bool success = true) {
    HistoryEntry e;
    e.statement = statement;
    e.success = success;
    e.duration = std::chrono::microseconds{1500};
    if (success) e.row_count = 3;
    e.connection_name = "prod";
    e.timestamp = std::chrono::system_clock::time_point(std::chrono::milliseconds{1700000000000});
    return e;
}

std::string temp_file(const std::string& name) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove(path);
    return path.string();
}

/// Records into a vector; optionally throws
class RecordingSink : public IHistorySink {
public:
    explicit RecordingSink(bool fail = false) : fail_(fail) {}

    void record(const HistoryEntry& entry) override {
        if (fail_) throw std::runtime_error("disk full");
        entries.push_back(entry);
    }
    std::string name() const override { return fail_ ? "failing" : "recording"; }

    std::vector<HistoryEntry> entries;

private:
    bool fail_;
};

} // namespace

TEST_CASE("InMemoryHistory: newest first", "[history]") {
    InMemoryHistory history;
    history.record(make_entry("SELECT 1"));
    history.record(make_entry("SELECT 2"));

    auto entries = history.entries();
    REQUIRE(entries.size() == 2);
    CHECK(entries[0].statement == "SELECT 2");
    CHECK(entries[1].statement == "SELECT 1");
}

TEST_CASE("InMemoryHistory: bounded capacity drops the oldest", "[history]") {
    InMemoryHistory history(3);
    for (int i = 1; i <= 5; ++i) {
        history.record(make_entry("SELECT " + std::to_string(i)));
    }

    auto entries = history.entries();
    REQUIRE(entries.size() == 3);
    CHECK(entries.front().statement == "SELECT 5");
    CHECK(entries.back().statement == "SELECT 3");
    CHECK(history.capacity() == 3);

    CHECK(InMemoryHistory(0).capacity() == 1);
    CHECK(InMemoryHistory().capacity() == 100);
}

TEST_CASE("InMemoryHistory: ids are assigned and removable", "[history]") {
    InMemoryHistory history;
    history.record(make_entry("SELECT 1"));
    auto kept = make_entry("SELECT 2");
    kept.id = "fixed-id";
    history.record(kept);

    auto entries = history.entries();
    CHECK_FALSE(entries[1].id.empty());
    CHECK(entries[0].id == "fixed-id");

    CHECK(history.remove("fixed-id"));
    CHECK_FALSE(history.remove("fixed-id"));
    CHECK(history.size() == 1);

    history.clear();
    CHECK(history.size() == 0);
}

TEST_CASE("JsonlHistorySink: line format", "[history][jsonl]") {
    auto entry = make_entry("SELECT * FROM users");
    entry.id = "abc";

    auto j = nlohmann::json::parse(JsonlHistorySink::to_json_line(entry));
    CHECK(j["id"] == "abc");
    CHECK(j["query"] == "SELECT * FROM users");
    CHECK(j["success"] == true);
    CHECK(j["duration_ms"].get<double>() == 1.5);
    CHECK(j["row_count"] == 3);
    CHECK(j["connection_name"] == "prod");
    CHECK(j["timestamp"] == 1700000000000);

    auto failed = nlohmann::json::parse(JsonlHistorySink::to_json_line(make_entry("BAD", false)));
    CHECK_FALSE(failed.contains("row_count"));
}

TEST_CASE("JsonlHistorySink: append then load newest first", "[history][jsonl]") {
    const auto path = temp_file("sqlrunner_history_test.jsonl");
    {
        JsonlHistorySink sink(path);
        sink.record(make_entry("SELECT 1"));
        sink.record(make_entry("SELECT 2", false));
        sink.record(make_entry("SELECT 3"));
    }

    auto all = JsonlHistorySink::load(path, 10);
    REQUIRE(all.size() == 3);
    CHECK(all[0].statement == "SELECT 3");
    CHECK(all[1].statement == "SELECT 2");
    CHECK_FALSE(all[1].success);
    CHECK_FALSE(all[1].row_count.has_value());
    CHECK(all[2].row_count == 3u);
    CHECK(all[2].duration == std::chrono::microseconds{1500});
    CHECK(all[2].timestamp == make_entry("x").timestamp);

    auto newest = JsonlHistorySink::load(path, 2);
    REQUIRE(newest.size() == 2);
    CHECK(newest[0].statement == "SELECT 3");
    CHECK(newest[1].statement == "SELECT 2");

    std::filesystem::remove(path);
}

TEST_CASE("JsonlHistorySink: non-UTF-8 statement text is still recorded", "[history][jsonl]") {
    const auto path = temp_file("sqlrunner_history_latin1.jsonl");
    {
        JsonlHistorySink sink(path);
        CHECK_NOTHROW(sink.record(make_entry("SELECT 'caf\xE9';")));
        sink.record(make_entry("SELECT 2"));
    }

    auto entries = JsonlHistorySink::load(path, 10);
    REQUIRE(entries.size() == 2);
    CHECK(entries[1].statement == "SELECT 'caf\xEF\xBF\xBD';");
    CHECK(entries[1].row_count == 3u);

    std::filesystem::remove(path);
}

TEST_CASE("JsonlHistorySink: malformed lines are skipped", "[history][jsonl]") {
    const auto path = temp_file("sqlrunner_history_bad.jsonl");
    {
        std::ofstream out(path);
        out << JsonlHistorySink::to_json_line(make_entry("SELECT 1")) << '\n'
            << "{not json\n"
            << "\n"
            << R"({"id":"no-query"})" << '\n'
            << JsonlHistorySink::to_json_line(make_entry("SELECT 2")) << '\n';
    }

    auto entries = JsonlHistorySink::load(path, 10);
    REQUIRE(entries.size() == 2);
    CHECK(entries[0].statement == "SELECT 2");

    std::filesystem::remove(path);
}

TEST_CASE("JsonlHistorySink: missing file loads empty, unwritable path throws", "[history][jsonl]") {
    CHECK(JsonlHistorySink::load("/nonexistent/dir/history.jsonl", 10).empty());
    CHECK_THROWS_AS(JsonlHistorySink("/nonexistent/dir/history.jsonl"), std::runtime_error);
}

TEST_CASE("CompositeHistorySink: fans out and survives failing sinks", "[history]") {
    auto first = std::make_shared<RecordingSink>();
    auto broken = std::make_shared<RecordingSink>(true);
    auto last = std::make_shared<RecordingSink>();

    CompositeHistorySink composite;
    composite.add(first);
    composite.add(broken);
    composite.add(nullptr);
    composite.add(last);
    CHECK(composite.size() == 3);
    CHECK(composite.name() == "composite[recording,failing,recording]");

    CHECK_NOTHROW(composite.record(make_entry("SELECT 1")));
    CHECK(first->entries.size() == 1);
    CHECK(last->entries.size() == 1);
}
