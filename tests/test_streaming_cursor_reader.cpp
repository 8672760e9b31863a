#include <catch2/catch_test_macros.hpp>
#include "core/error.hpp"
#include "executor/streaming_cursor_reader.hpp"
#include "mocks/mock_db_connection.hpp"

using namespace sqlrunner;
using namespace sqlrunner::testing;

TEST_CASE("StreamingPolicy: plain selects stream", "[streaming]") {
    CHECK(StreamingPolicy::should_stream("SELECT * FROM events"));
    CHECK(StreamingPolicy::should_stream("  select id, payload from events where id > 10;"));
}

TEST_CASE("StreamingPolicy: non-selects and aggregates do not stream", "[streaming]") {
    CHECK_FALSE(StreamingPolicy::should_stream("UPDATE events SET seen = true"));
    CHECK_FALSE(StreamingPolicy::should_stream("WITH x AS (SELECT 1) SELECT * FROM x"));
    CHECK_FALSE(StreamingPolicy::should_stream("SELECT count(*) FROM events"));
    CHECK_FALSE(StreamingPolicy::should_stream("SELECT MAX(id) FROM events"));
    CHECK_FALSE(StreamingPolicy::should_stream("SELECT kind FROM events GROUP BY kind"));
}

TEST_CASE("StreamingPolicy: small limits are fetched in one go", "[streaming]") {
    CHECK_FALSE(StreamingPolicy::should_stream("SELECT * FROM events LIMIT 50"));
    CHECK_FALSE(StreamingPolicy::should_stream("SELECT * FROM events LIMIT 1000"));
    CHECK(StreamingPolicy::should_stream("SELECT * FROM events LIMIT 1001"));
    CHECK(StreamingPolicy::should_stream("SELECT * FROM events LIMIT 50", 10));
    CHECK(StreamingPolicy::should_stream("SELECT * FROM events LIMIT 99999999999999999999999"));
}

TEST_CASE("CursorStream: batches follow the batch size", "[streaming]") {
    auto state = std::make_shared<MockDbState>();
    state->cursor_rows = 450;
    MockDbConnection conn(state);

    auto stream = StreamingCursorReader::stream(conn, "SELECT * FROM events;", 200);

    auto b1 = stream.next();
    REQUIRE(b1);
    CHECK(b1->rows.size() == 200);
    CHECK(b1->batch_number == 1);
    CHECK(b1->is_first);
    CHECK_FALSE(b1->is_complete);
    CHECK(b1->total_rows_so_far == 200);
    REQUIRE(b1->fields.size() == 2);
    CHECK(b1->fields[0].name == "id");

    auto b2 = stream.next();
    REQUIRE(b2);
    CHECK(b2->rows.size() == 200);
    CHECK_FALSE(b2->is_first);
    CHECK_FALSE(b2->is_complete);
    CHECK(b2->total_rows_so_far == 400);

    auto b3 = stream.next();
    REQUIRE(b3);
    CHECK(b3->rows.size() == 50);
    CHECK(b3->is_complete);
    CHECK(b3->total_rows_so_far == 450);
    CHECK(b3->rows.back()[1] == "row450");

    CHECK(stream.exhausted());
    CHECK_FALSE(stream.next());
    CHECK(stream.total_rows() == 450);
}

TEST_CASE("CursorStream: cursor lifecycle on an idle connection", "[streaming]") {
    auto state = std::make_shared<MockDbState>();
    state->cursor_rows = 10;
    MockDbConnection conn(state);

    {
        auto stream = StreamingCursorReader::stream(conn, "SELECT * FROM events;", 200);
        CHECK(conn.in_transaction());
        CHECK(conn.cursor_open());
        while (stream.next()) {}
    }

    auto sql = state->executed();
    REQUIRE(sql.size() == 5);
    CHECK(sql[0] == "BEGIN");
    CHECK(sql[1].starts_with("DECLARE sqlrunner_cursor_"));
    CHECK(sql[1].ends_with("NO SCROLL CURSOR FOR SELECT * FROM events"));
    CHECK(sql[2].starts_with("FETCH FORWARD 200 FROM sqlrunner_cursor_"));
    CHECK(sql[3].starts_with("CLOSE sqlrunner_cursor_"));
    CHECK(sql[4] == "COMMIT");
    CHECK_FALSE(conn.in_transaction());
    CHECK_FALSE(conn.cursor_open());
}

TEST_CASE("CursorStream: exact multiple ends on an empty fetch", "[streaming]") {
    auto state = std::make_shared<MockDbState>();
    state->cursor_rows = 400;
    MockDbConnection conn(state);

    auto stream = StreamingCursorReader::stream(conn, "SELECT * FROM events", 200);
    size_t batches = 0;
    while (auto batch = stream.next()) {
        ++batches;
        CHECK_FALSE(batch->is_complete);
    }
    CHECK(batches == 2);
    CHECK(state->count_containing("FETCH FORWARD") == 3);
    CHECK(state->executed_containing("COMMIT"));
}

TEST_CASE("CursorStream: existing transaction is left to its owner", "[streaming]") {
    auto state = std::make_shared<MockDbState>();
    state->cursor_rows = 5;
    MockDbConnection conn(state);
    REQUIRE(conn.execute("BEGIN").success);

    {
        auto stream = StreamingCursorReader::stream(conn, "SELECT * FROM events", 200);
        while (stream.next()) {}
    }

    CHECK(state->count_containing("BEGIN") == 1);
    CHECK_FALSE(state->executed_containing("COMMIT"));
    CHECK(state->executed_containing("CLOSE sqlrunner_cursor_"));
    CHECK(conn.in_transaction());
}

TEST_CASE("CursorStream: abandoned stream closes its cursor", "[streaming]") {
    auto state = std::make_shared<MockDbState>();
    state->cursor_rows = 1000;
    MockDbConnection conn(state);

    {
        auto stream = StreamingCursorReader::stream(conn, "SELECT * FROM events", 100);
        auto first = stream.next();
        REQUIRE(first);
        CHECK_FALSE(stream.exhausted());
    }

    CHECK(state->count_containing("FETCH FORWARD") == 1);
    CHECK_FALSE(conn.cursor_open());
    CHECK(state->executed().back() == "COMMIT");
}

TEST_CASE("CursorStream: explicit close is idempotent", "[streaming]") {
    auto state = std::make_shared<MockDbState>();
    state->cursor_rows = 1000;
    MockDbConnection conn(state);

    auto stream = StreamingCursorReader::stream(conn, "SELECT * FROM events", 100);
    stream.close();
    stream.close();
    CHECK(stream.exhausted());
    CHECK_FALSE(stream.next());
    CHECK(state->count_containing("CLOSE ") == 1);
    CHECK(state->count_containing("COMMIT") == 1);
}

TEST_CASE("CursorStream: declare failure rolls back and throws", "[streaming]") {
    auto state = std::make_shared<MockDbState>();
    state->fail_markers = {"missing_table"};
    MockDbConnection conn(state);

    CHECK_THROWS_AS(StreamingCursorReader::stream(conn, "SELECT * FROM missing_table", 100),
                    StatementError);
    CHECK(state->executed().back() == "ROLLBACK");
    CHECK_FALSE(conn.in_transaction());
}

TEST_CASE("CursorStream: fetch failure rolls back and throws", "[streaming]") {
    auto state = std::make_shared<MockDbState>();
    state->cursor_rows = 1000;
    MockDbConnection conn(state);

    auto stream = StreamingCursorReader::stream(conn, "SELECT * FROM events", 100);
    REQUIRE(stream.next());

    state->fail_markers = {"FETCH FORWARD"};
    CHECK_THROWS_AS(stream.next(), StatementError);
    CHECK(stream.exhausted());
    CHECK_FALSE(state->executed_containing("CLOSE "));
    CHECK(state->executed().back() == "ROLLBACK");
}

TEST_CASE("CursorStream: cursors get distinct names", "[streaming]") {
    auto state = std::make_shared<MockDbState>();
    MockDbConnection conn(state);

    auto a = StreamingCursorReader::stream(conn, "SELECT 1", 10);
    auto b = StreamingCursorReader::stream(conn, "SELECT 2", 10);
    CHECK(a.cursor_name() != b.cursor_name());
}
