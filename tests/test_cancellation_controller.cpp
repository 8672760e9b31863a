#include <catch2/catch_test_macros.hpp>
#include "executor/cancellation_controller.hpp"
#include "mocks/mock_db_connection.hpp"

using namespace sqlrunner;
using namespace sqlrunner::testing;

namespace {

/// Pool wrapper that lets a test look at the pool the multiplexer built
struct PoolCapture {
    std::shared_ptr<IConnectionPool> pool;

    ConnectionMultiplexer::PoolFactory factory() {
        return [this](const std::string& key, const PoolConfig& cfg,
                      std::shared_ptr<IConnectionFactory> f) -> std::shared_ptr<IConnectionPool> {
            pool = ConnectionMultiplexer::default_pool_factory()(key, cfg, std::move(f));
            return pool;
        };
    }
};

struct CancelFixture {
    std::shared_ptr<MockDbState> state = std::make_shared<MockDbState>();
    std::shared_ptr<MockConnectionFactory> factory = std::make_shared<MockConnectionFactory>(state);
    PoolCapture capture;
    ConnectionMultiplexer mux{options(),
        [this](const ConnectionProfile&, const std::string&) -> std::shared_ptr<IConnectionFactory> {
            return factory;
        },
        capture.factory()};
    CancellationController controller{mux};
    ConnectionProfile profile = make_profile();

    static ConnectionMultiplexer::Options options() {
        ConnectionMultiplexer::Options opts;
        opts.pool.max_connections = 1;
        opts.pool.acquire_timeout = std::chrono::milliseconds{50};
        return opts;
    }

    static ConnectionProfile make_profile() {
        ConnectionProfile p;
        p.id = "dev";
        p.database = "app";
        return p;
    }
};

} // namespace

TEST_CASE("CancellationController: cancel signals the backend", "[cancel]") {
    CancelFixture fx;
    fx.state->responses["pg_cancel_backend(4242)"] = MockDbConnection::single_value("pg_cancel_backend", 16, "t");

    auto result = fx.controller.request_cancel(4242, fx.profile);
    REQUIRE(result.is_ok());
    CHECK(result.value());
    CHECK(fx.state->executed_containing("SELECT pg_cancel_backend(4242)"));
}

TEST_CASE("CancellationController: nothing to cancel is not an error", "[cancel]") {
    CancelFixture fx;
    fx.state->responses["pg_cancel_backend"] = MockDbConnection::single_value("pg_cancel_backend", 16, "f");

    auto result = fx.controller.request_cancel(CancellationRequest{.backend_pid = 77, .profile = fx.profile, .database = ""});
    REQUIRE(result.is_ok());
    CHECK_FALSE(result.value());
}

TEST_CASE("CancellationController: terminate uses pg_terminate_backend", "[cancel]") {
    CancelFixture fx;
    fx.state->responses["pg_terminate_backend(99)"] = MockDbConnection::single_value("pg_terminate_backend", 16, "t");

    auto result = fx.controller.request_terminate(99, fx.profile);
    REQUIRE(result.is_ok());
    CHECK(result.value());
    CHECK_FALSE(fx.state->executed_containing("pg_cancel_backend"));
}

TEST_CASE("CancellationController: uses a pooled connection, not the session", "[cancel]") {
    CancelFixture fx;
    auto session = fx.mux.acquire_session(fx.profile, "tab-1");

    // The session lease is held, as it is while a statement runs
    auto result = fx.controller.request_cancel(4242, fx.profile);
    CHECK(result.is_ok());
    CHECK(fx.state->connections_created == 2);
    REQUIRE(fx.capture.pool);
    CHECK(fx.capture.pool->get_stats().active_connections == 0);
}

TEST_CASE("CancellationController: invalid pid is rejected", "[cancel]") {
    CancelFixture fx;
    auto result = fx.controller.request_cancel(0, fx.profile);
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::CANCELLATION_ERROR);
    CHECK(fx.state->connections_created == 0);
}

TEST_CASE("CancellationController: connection failure is reported", "[cancel]") {
    CancelFixture fx;
    fx.factory->fail = true;

    auto result = fx.controller.request_cancel(4242, fx.profile);
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::CANCELLATION_ERROR);
    CHECK(result.error_message().find("Connection refused") != std::string::npos);
}

TEST_CASE("CancellationController: query failure releases the lease", "[cancel]") {
    CancelFixture fx;
    fx.state->fail_markers = {"pg_terminate_backend"};

    auto result = fx.controller.request_terminate(4242, fx.profile);
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::CANCELLATION_ERROR);
    CHECK(result.error_message() == "ERROR:  failure at pg_terminate_backend");

    // Pool of one: a leaked lease would make this time out
    fx.state->fail_markers.clear();
    CHECK(fx.controller.request_terminate(4242, fx.profile).is_ok());
    CHECK(fx.capture.pool->get_stats().total_releases == 2);
}
