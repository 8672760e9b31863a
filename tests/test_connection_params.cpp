#include <catch2/catch_test_macros.hpp>
#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_type_map.hpp"
#include "security/secret_store.hpp"

#include <cstdlib>
#include <cstring>

using namespace sqlrunner;

namespace {

ConnectionProfile base_profile() {
    ConnectionProfile p;
    p.id = "prod";
    p.host = "db.example.com";
    p.port = 6432;
    p.username = "app";
    p.database = "sales";
    return p;
}

} // namespace

TEST_CASE("PgConnectionParams: keywords from profile", "[pg][params]") {
    auto params = PgConnectionParams::from_profile(base_profile(), "", std::string("s3cret"), {});

    CHECK(params.get("host") == "db.example.com");
    CHECK(params.get("port") == "6432");
    CHECK(params.get("dbname") == "sales");
    CHECK(params.get("user") == "app");
    CHECK(params.get("password") == "s3cret");
    CHECK(params.get("sslmode") == "disable");
    CHECK(params.get("connect_timeout") == "5");
    CHECK(params.get("application_name") == "sqlrunner");
    CHECK_FALSE(params.get("options").has_value());
    CHECK_FALSE(params.get("sslcert").has_value());
}

TEST_CASE("PgConnectionParams: database resolution", "[pg][params]") {
    auto p = base_profile();
    CHECK(PgConnectionParams::from_profile(p, "audit", std::nullopt, {}).get("dbname") == "audit");

    p.database.clear();
    CHECK(PgConnectionParams::from_profile(p, "", std::nullopt, {}).get("dbname") == "postgres");
}

TEST_CASE("PgConnectionParams: no password or user when not configured", "[pg][params]") {
    auto p = base_profile();
    p.username.clear();
    auto params = PgConnectionParams::from_profile(p, "", std::nullopt, {});
    CHECK_FALSE(params.get("user").has_value());
    CHECK_FALSE(params.get("password").has_value());
}

TEST_CASE("PgConnectionParams: statement timeout joins options", "[pg][params]") {
    auto p = base_profile();
    p.statement_timeout_ms = 15000;

    CHECK(PgConnectionParams::from_profile(p, "", std::nullopt, {}).get("options") ==
          "-c statement_timeout=15000");

    p.options = "-c search_path=app";
    CHECK(PgConnectionParams::from_profile(p, "", std::nullopt, {}).get("options") ==
          "-c search_path=app -c statement_timeout=15000");
}

TEST_CASE("PgConnectionParams: TLS material and tunnel endpoint", "[pg][params]") {
    auto p = base_profile();
    p.ssl_mode = SslMode::VERIFY_FULL;
    TlsMaterial tls{.cert_path = "/c.crt", .key_path = "/c.key", .root_cert_path = "/root.crt"};

    auto params = PgConnectionParams::from_profile(p, "", std::nullopt, tls, "127.0.0.1", 40123);
    CHECK(params.get("sslmode") == "verify-full");
    CHECK(params.get("sslcert") == "/c.crt");
    CHECK(params.get("sslkey") == "/c.key");
    CHECK(params.get("sslrootcert") == "/root.crt");
    CHECK(params.get("host") == "127.0.0.1");
    CHECK(params.get("port") == "40123");
    CHECK(params.describe() == "127.0.0.1:40123/sales");
}

TEST_CASE("PgConnectionParams: arrays are null terminated and parallel", "[pg][params]") {
    auto params = PgConnectionParams::from_profile(base_profile(), "", std::string("pw"), {});
    params.set("host", "other");

    auto keys = params.keywords();
    auto vals = params.values();
    REQUIRE(keys.size() == vals.size());
    CHECK(keys.back() == nullptr);
    CHECK(vals.back() == nullptr);
    CHECK(std::strcmp(keys.front(), "host") == 0);
    CHECK(std::strcmp(vals.front(), "other") == 0);
}

TEST_CASE("PgConnectionParams: describe never includes credentials", "[pg][params]") {
    auto params = PgConnectionParams::from_profile(base_profile(), "", std::string("s3cret"), {});
    CHECK(params.describe() == "db.example.com:6432/sales");
}

TEST_CASE("PgConnection: command tag verb", "[pg]") {
    CHECK(command_tag_verb("INSERT 0 3") == "INSERT");
    CHECK(command_tag_verb("SELECT 10") == "SELECT");
    CHECK(command_tag_verb("CREATE TABLE") == "CREATE");
    CHECK(command_tag_verb("BEGIN") == "BEGIN");
    CHECK(command_tag_verb("") == "");
}

TEST_CASE("PgTypeMap: common type names", "[pg][types]") {
    CHECK(PgTypeMap::oid_to_type_name(16) == "bool");
    CHECK(PgTypeMap::oid_to_type_name(20) == "int8");
    CHECK(PgTypeMap::oid_to_type_name(23) == "int4");
    CHECK(PgTypeMap::oid_to_type_name(25) == "text");
    CHECK(PgTypeMap::oid_to_type_name(1043) == "varchar");
    CHECK(PgTypeMap::oid_to_type_name(1184) == "timestamptz");
    CHECK(PgTypeMap::oid_to_type_name(1700) == "numeric");
}

TEST_CASE("PgTypeMap: unknown OIDs fall back to string", "[pg][types]") {
    CHECK(PgTypeMap::oid_to_type_name(0) == "string");
    CHECK(PgTypeMap::oid_to_type_name(3802) == PgTypeMap::kDefaultTypeName);   // jsonb
    CHECK(PgTypeMap::oid_to_type_name(987654) == "string");
}

TEST_CASE("EnvSecretStore: variable naming", "[security]") {
    EnvSecretStore store;
    CHECK(store.variable_name("prod") == "SQLRUNNER_PASSWORD_PROD");
    CHECK(store.variable_name("eu-west.replica") == "SQLRUNNER_PASSWORD_EU_WEST_REPLICA");

    EnvSecretStore custom("MYAPP_");
    CHECK(custom.variable_name("db1") == "MYAPP_DB1");
}

TEST_CASE("EnvSecretStore: lookup and PGPASSWORD fallback", "[security]") {
    EnvSecretStore store;
    ::unsetenv("PGPASSWORD");
    ::unsetenv("SQLRUNNER_PASSWORD_STAGING");

    CHECK_FALSE(store.get_password("staging").has_value());

    ::setenv("PGPASSWORD", "fallback", 1);
    CHECK(store.get_password("staging") == "fallback");

    ::setenv("SQLRUNNER_PASSWORD_STAGING", "specific", 1);
    CHECK(store.get_password("staging") == "specific");

    ::unsetenv("SQLRUNNER_PASSWORD_STAGING");
    ::unsetenv("PGPASSWORD");
}
