#include <catch2/catch_test_macros.hpp>
#include "parser/statement_splitter.hpp"

using namespace sqlrunner;

TEST_CASE("StatementSplitter: simple statements", "[splitter]") {
    auto stmts = StatementSplitter::split_texts("SELECT 1; SELECT 2;");
    REQUIRE(stmts.size() == 2);
    CHECK(stmts[0] == "SELECT 1;");
    CHECK(stmts[1] == "SELECT 2;");
}

TEST_CASE("StatementSplitter: index and offset", "[splitter]") {
    auto stmts = StatementSplitter::split("  SELECT 1;\n  SELECT 2");
    REQUIRE(stmts.size() == 2);
    CHECK(stmts[0].index == 0);
    CHECK(stmts[0].offset == 2);
    CHECK(stmts[1].index == 1);
    CHECK(stmts[1].offset == 14);
    CHECK(stmts[1].text == "SELECT 2");
}

TEST_CASE("StatementSplitter: semicolon inside single quotes", "[splitter]") {
    auto stmts = StatementSplitter::split_texts("SELECT 'a;b'; SELECT 2;");
    REQUIRE(stmts.size() == 2);
    CHECK(stmts[0] == "SELECT 'a;b';");
}

TEST_CASE("StatementSplitter: escaped single quotes", "[splitter]") {
    auto stmts = StatementSplitter::split_texts("SELECT 'O''Reilly'; SELECT 1;");
    REQUIRE(stmts.size() == 2);
    CHECK(stmts[0] == "SELECT 'O''Reilly';");

    // '' followed by ; must not end the literal early
    stmts = StatementSplitter::split_texts("SELECT ''';'''; SELECT 2");
    REQUIRE(stmts.size() == 2);
    CHECK(stmts[0] == "SELECT ''';''';");
}

TEST_CASE("StatementSplitter: line comments", "[splitter]") {
    auto stmts = StatementSplitter::split_texts("SELECT 1; -- comment with ; inside \n SELECT 2;");
    REQUIRE(stmts.size() == 2);
    CHECK(stmts[0] == "SELECT 1;");
    CHECK(stmts[1].find("SELECT 2;") != std::string::npos);
}

TEST_CASE("StatementSplitter: comment only script", "[splitter]") {
    auto stmts = StatementSplitter::split_texts("-- just a comment");
    REQUIRE(stmts.size() == 1);
    CHECK(stmts[0] == "-- just a comment");
}

TEST_CASE("StatementSplitter: block comments", "[splitter]") {
    auto stmts = StatementSplitter::split_texts("SELECT 1; /* comment with ; \n inside */ SELECT 2;");
    REQUIRE(stmts.size() == 2);
    CHECK(stmts[0] == "SELECT 1;");
    CHECK(stmts[1] == "/* comment with ; \n inside */ SELECT 2;");
}

TEST_CASE("StatementSplitter: block comments do not nest", "[splitter]") {
    auto stmts = StatementSplitter::split_texts("/* a /* b */ SELECT 1; */");
    REQUIRE(stmts.size() == 2);
    CHECK(stmts[0] == "/* a /* b */ SELECT 1;");
    CHECK(stmts[1] == "*/");
}

TEST_CASE("StatementSplitter: dollar-quoted bodies", "[splitter]") {
    auto stmts = StatementSplitter::split_texts(
        "CREATE FUNCTION foo() RETURNS void AS $$ BEGIN; RETURN; END; $$ LANGUAGE plpgsql; SELECT 1;");
    REQUIRE(stmts.size() == 2);
    CHECK(stmts[0].find("$$ BEGIN; RETURN; END; $$") != std::string::npos);
    CHECK(stmts[1] == "SELECT 1;");
}

TEST_CASE("StatementSplitter: tagged dollar quotes", "[splitter]") {
    auto stmts = StatementSplitter::split_texts("SELECT $tag$ ; $tag$; SELECT 2;");
    REQUIRE(stmts.size() == 2);
    CHECK(stmts[0] == "SELECT $tag$ ; $tag$;");

    SECTION("a different tag inside is plain text") {
        stmts = StatementSplitter::split_texts("SELECT $a$ x $x$ ; $x$ y $a$; SELECT 3");
        REQUIRE(stmts.size() == 2);
        CHECK(stmts[0] == "SELECT $a$ x $x$ ; $x$ y $a$;");
        CHECK(stmts[1] == "SELECT 3");
    }

    SECTION("long tags are allowed") {
        stmts = StatementSplitter::split_texts("DO $function_body_tag$ ; $function_body_tag$; SELECT 1;");
        REQUIRE(stmts.size() == 2);
    }
}

TEST_CASE("StatementSplitter: dollar sign parameters are not quotes", "[splitter]") {
    auto stmts = StatementSplitter::split_texts("SELECT $1, $2; SELECT 3;");
    REQUIRE(stmts.size() == 2);
    CHECK(stmts[0] == "SELECT $1, $2;");
}

TEST_CASE("StatementSplitter: empty and whitespace input", "[splitter]") {
    CHECK(StatementSplitter::split("").empty());
    CHECK(StatementSplitter::split("   \n\t  ").empty());
    CHECK(StatementSplitter::split(";;  ;").size() == 3);
}

TEST_CASE("StatementSplitter: missing final semicolon", "[splitter]") {
    auto stmts = StatementSplitter::split_texts("SELECT 1");
    REQUIRE(stmts.size() == 1);
    CHECK(stmts[0] == "SELECT 1");
}

TEST_CASE("StatementSplitter: unterminated constructs become trailing text", "[splitter]") {
    SECTION("single quote") {
        auto stmts = StatementSplitter::split_texts("SELECT 1; SELECT 'oops; SELECT 2;");
        REQUIRE(stmts.size() == 2);
        CHECK(stmts[1] == "SELECT 'oops; SELECT 2;");
    }
    SECTION("dollar quote") {
        auto stmts = StatementSplitter::split_texts("SELECT $$ never closed;");
        REQUIRE(stmts.size() == 1);
        CHECK(stmts[0] == "SELECT $$ never closed;");
    }
    SECTION("block comment") {
        auto stmts = StatementSplitter::split_texts("SELECT 1; /* open ; comment");
        REQUIRE(stmts.size() == 2);
        CHECK(stmts[1] == "/* open ; comment");
    }
}

TEST_CASE("StatementSplitter: mixed script", "[splitter]") {
    const std::string sql = R"(
        -- Start
        SELECT 1;
        /*
           Multi-line comment ;
        */
        SELECT 'text with ;' AS col;
        SELECT $tag$
            nested ; string
        $tag$;
    )";
    auto stmts = StatementSplitter::split(sql);
    REQUIRE(stmts.size() == 3);
    for (size_t i = 0; i < stmts.size(); ++i) {
        CHECK(stmts[i].index == i);
    }
}

TEST_CASE("StatementSplitter: re-splitting a statement yields itself", "[splitter]") {
    const std::string sql =
        "INSERT INTO t VALUES ('a;b', $$x;y$$); /* c; */ UPDATE t SET v = 'it''s'; SELECT 1";
    for (const auto& stmt : StatementSplitter::split_texts(sql)) {
        auto again = StatementSplitter::split_texts(stmt);
        REQUIRE(again.size() == 1);
        CHECK(again[0] == stmt);
    }
}

TEST_CASE("StatementSplitter: joining statements with a space and re-splitting keeps the count", "[splitter]") {
    const std::string sql =
        "-- header ; comment\n"
        "SELECT 'it''s; fine' AS a;\n"
        "CREATE FUNCTION f() RETURNS int AS $body$ SELECT 1; $body$ LANGUAGE sql;\n"
        "DO $$ BEGIN RAISE NOTICE 'x;y'; END $$;\n"
        "/* block ; */ UPDATE t SET v = 1 -- trailing ; note\n"
        ";\n"
        "SELECT 'never closed; SELECT 2;";

    auto first = StatementSplitter::split_texts(sql);
    REQUIRE(first.size() == 5);

    std::string joined;
    for (const auto& text : first) {
        if (!joined.empty()) joined += ' ';
        joined += text;
    }

    auto second = StatementSplitter::split_texts(joined);
    CHECK(second.size() == first.size());
    CHECK(second == first);
}

TEST_CASE("StatementSplitter: match_dollar_tag", "[splitter]") {
    CHECK(StatementSplitter::match_dollar_tag("$$", 0) == 2);
    CHECK(StatementSplitter::match_dollar_tag("x $tag$ y", 2) == 5);
    CHECK(StatementSplitter::match_dollar_tag("$1,", 0) == 0);
    CHECK(StatementSplitter::match_dollar_tag("$a b$", 0) == 0);
    CHECK(StatementSplitter::match_dollar_tag("abc", 0) == 0);
}
