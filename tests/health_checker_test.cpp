// ─────────────────────────────────────────────────────────────────────────────
// HealthChecker Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "mcphub/health/health_checker.hpp"
#include "mocks/mock_transport.hpp"
#include "mocks/run_sync.hpp"

#include <asio/co_spawn.hpp>
#include <asio/io_context.hpp>

#include <memory>
#include <optional>

using namespace mcphub;
using namespace mcphub::testing;
using namespace std::chrono_literals;

namespace {

struct HealthFixture {
    asio::io_context io;
    HealthChecker checker;

    explicit HealthFixture(std::chrono::milliseconds interval = 30s)
        : checker(io.get_executor(), HealthCheckConfig{interval, 200ms, 3})
    {}

    /// A Connection over a MockTransport; `connect` runs the handshake
    std::shared_ptr<Connection> connection(const std::string& name, MockTransport** mock_out = nullptr,
                                           bool connect = true) {
        auto transport = std::make_unique<MockTransport>(io.get_executor());
        if (mock_out != nullptr) {
            *mock_out = transport.get();
        }

        ConnectionOptions options;
        options.server_name = name;
        auto conn = std::make_shared<Connection>(std::move(transport), std::move(options));
        if (connect) {
            REQUIRE(run_sync(io, conn->async_connect()).has_value());
        }
        return conn;
    }
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Single probes
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("HealthChecker records a healthy probe with the tool count", "[health]") {
    HealthFixture f;
    MockTransport* mock = nullptr;
    auto conn = f.connection("alpha", &mock);

    auto record = run_sync(f.io, f.checker.check_health("alpha", *conn));
    REQUIRE(record.is_healthy);
    REQUIRE(record.tools_count == 2u);
    REQUIRE(record.last_error.has_value() == false);
    REQUIRE(record.response_time >= 0ms);

    const auto sent = mock->sent_methods();
    REQUIRE(sent[sent.size() - 2] == "ping");
    REQUIRE(sent[sent.size() - 1] == "tools/list");

    REQUIRE(f.checker.is_server_healthy("alpha"));
    REQUIRE(f.checker.get_health_status("alpha")->tools_count == 2u);
}

TEST_CASE("HealthChecker marks inactive connections without sending", "[health]") {
    HealthFixture f;
    MockTransport* mock = nullptr;
    auto conn = f.connection("alpha", &mock, false);

    auto record = run_sync(f.io, f.checker.check_health("alpha", *conn));
    REQUIRE(record.is_healthy == false);
    REQUIRE(record.last_error == "Connection not active");
    REQUIRE(mock->sent().empty());
    REQUIRE(f.checker.is_server_healthy("alpha") == false);
}

TEST_CASE("HealthChecker records a failing ping", "[health]") {
    HealthFixture f;
    MockTransport* mock = nullptr;
    auto conn = f.connection("alpha", &mock);
    mock->set_responder([](const Json& request) -> std::optional<Json> {
        return MockTransport::error_for(request, ErrorCode::InternalError, "backend down");
    });

    auto record = run_sync(f.io, f.checker.check_health("alpha", *conn));
    REQUIRE(record.is_healthy == false);
    REQUIRE(record.last_error == "backend down");
    REQUIRE(record.tools_count.has_value() == false);
}

TEST_CASE("HealthChecker bounds probes by its timeout", "[health]") {
    HealthFixture f;
    MockTransport* mock = nullptr;
    auto conn = f.connection("alpha", &mock);
    mock->set_responder([](const Json&) -> std::optional<Json> { return std::nullopt; });

    auto record = run_sync(f.io, f.checker.check_health("alpha", *conn));
    REQUIRE(record.is_healthy == false);
    REQUIRE(record.last_error->find("timed out") != std::string::npos);
    REQUIRE(record.response_time >= 150ms);
}

TEST_CASE("HealthChecker notifies its listener after each probe", "[health]") {
    HealthFixture f;
    auto conn = f.connection("alpha");

    std::vector<std::pair<std::string, bool>> seen;
    f.checker.set_status_listener([&](const std::string& server, const HealthRecord& record) {
        seen.emplace_back(server, record.is_healthy);
    });

    (void)run_sync(f.io, f.checker.check_health("alpha", *conn));
    REQUIRE(seen.size() == 1);
    REQUIRE(seen[0] == std::make_pair(std::string("alpha"), true));
}

// ═══════════════════════════════════════════════════════════════════════════
// Summary
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("HealthChecker summary is empty before any probe", "[health]") {
    HealthFixture f;
    const auto summary = f.checker.get_overall_health_summary();
    REQUIRE(summary.total_servers == 0);
    REQUIRE(summary.healthy_servers == 0);
    REQUIRE(summary.average_response_time == 0ms);
    REQUIRE(f.checker.get_average_response_time() == 0ms);
    REQUIRE(summary.unhealthy_servers.empty());
}

TEST_CASE("HealthChecker summary partitions healthy and unhealthy servers", "[health]") {
    HealthFixture f;
    auto alpha = f.connection("alpha");
    auto beta = f.connection("beta", nullptr, false);

    (void)run_sync(f.io, f.checker.check_health("alpha", *alpha));
    (void)run_sync(f.io, f.checker.check_health("beta", *beta));

    const auto summary = f.checker.get_overall_health_summary();
    REQUIRE(summary.total_servers == 2);
    REQUIRE(summary.healthy_servers == 1);
    REQUIRE(summary.healthy_servers + summary.unhealthy_servers.size() == summary.total_servers);
    REQUIRE(summary.unhealthy_servers == std::vector<std::string>{"beta"});

    const auto j = summary.to_json();
    REQUIRE(j["totalServers"] == 2);
    REQUIRE(j["unhealthyServers"][0] == "beta");

    // the inactive probe counts as 0 ms in the mean
    const auto alpha_ms = f.checker.get_health_status("alpha")->response_time;
    REQUIRE(f.checker.get_average_response_time() == alpha_ms / 2);
    REQUIRE(summary.average_response_time == f.checker.get_average_response_time());

    const auto record = f.checker.get_health_status("beta")->to_json();
    REQUIRE(record["isHealthy"] == false);
    REQUIRE(record["lastError"] == "Connection not active");
    REQUIRE(record["lastCheck"].get<std::string>().back() == 'Z');
}

// ═══════════════════════════════════════════════════════════════════════════
// Periodic schedules
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("HealthChecker periodic probes start after one interval", "[health][periodic]") {
    HealthFixture f(40ms);
    auto conn = f.connection("alpha");

    f.checker.start_periodic_health_check("alpha", conn);
    REQUIRE(f.checker.has_schedule("alpha"));
    REQUIRE(f.checker.probe_count() == 0);

    run_for(f.io, 150ms);
    REQUIRE(f.checker.probe_count() >= 2);
    REQUIRE(f.checker.is_server_healthy("alpha"));

    f.checker.stop_periodic_health_check("alpha");
    REQUIRE(f.checker.has_schedule("alpha") == false);
}

TEST_CASE("HealthChecker stop prevents any further probe", "[health][periodic]") {
    HealthFixture f(20ms);
    auto conn = f.connection("alpha");

    f.checker.start_periodic_health_check("alpha", conn);
    f.checker.stop_periodic_health_check("alpha");
    run_for(f.io, 100ms);

    REQUIRE(f.checker.probe_count() == 0);
    REQUIRE(f.checker.get_health_status("alpha").has_value() == false);

    // Stopping twice or stopping an unknown server is harmless
    f.checker.stop_periodic_health_check("alpha");
    f.checker.stop_periodic_health_check("nobody");
}

TEST_CASE("HealthChecker restart replaces the previous schedule", "[health][periodic]") {
    HealthFixture f(40ms);
    auto conn = f.connection("alpha");

    f.checker.start_periodic_health_check("alpha", conn);
    f.checker.start_periodic_health_check("alpha", conn);
    run_for(f.io, 60ms);

    // One schedule ticked once; the replaced one never fired
    REQUIRE(f.checker.probe_count() == 1);
    f.checker.dispose();
}

TEST_CASE("HealthChecker dispose stops schedules and clears records", "[health][periodic]") {
    HealthFixture f(20ms);
    auto conn = f.connection("alpha");

    (void)run_sync(f.io, f.checker.check_health("alpha", *conn));
    f.checker.start_periodic_health_check("alpha", conn);
    f.checker.dispose();

    REQUIRE(f.checker.has_schedule("alpha") == false);
    REQUIRE(f.checker.get_all_health_statuses().empty());

    const auto probes = f.checker.probe_count();
    run_for(f.io, 80ms);
    REQUIRE(f.checker.probe_count() == probes);
}

// ═══════════════════════════════════════════════════════════════════════════
// Probes in flight
// ═══════════════════════════════════════════════════════════════════════════

namespace {

/// Connected, but ping never gets an answer
std::shared_ptr<Connection> silent_connection(HealthFixture& f, const std::string& name) {
    MockTransport* mock = nullptr;
    auto conn = f.connection(name, &mock);
    mock->set_responder([](const Json&) -> std::optional<Json> { return std::nullopt; });
    return conn;
}

}  // namespace

TEST_CASE("HealthChecker dispose discards a probe that is in flight", "[health][periodic]") {
    HealthFixture f(20ms);
    auto conn = silent_connection(f, "alpha");

    int notified = 0;
    f.checker.set_status_listener([&](const std::string&, const HealthRecord&) { ++notified; });

    f.checker.start_periodic_health_check("alpha", conn);
    run_for(f.io, 50ms);
    REQUIRE(conn->pending_requests() == 1);

    f.checker.dispose();
    run_sync(f.io, conn->async_disconnect());
    run_for(f.io, 50ms);

    REQUIRE(conn->pending_requests() == 0);
    REQUIRE(f.checker.get_all_health_statuses().empty());
    REQUIRE(f.checker.get_overall_health_summary().total_servers == 0);
    REQUIRE(f.checker.probe_count() == 0);
    REQUIRE(notified == 0);
}

TEST_CASE("HealthChecker stop discards a probe that is in flight", "[health][periodic]") {
    HealthFixture f(20ms);
    auto conn = silent_connection(f, "alpha");

    f.checker.start_periodic_health_check("alpha", conn);
    run_for(f.io, 50ms);
    REQUIRE(conn->pending_requests() == 1);

    f.checker.stop_periodic_health_check("alpha");
    run_for(f.io, 300ms);

    // the ping timed out after the stop and left no record behind
    REQUIRE(conn->pending_requests() == 0);
    REQUIRE(f.checker.get_health_status("alpha").has_value() == false);
}

TEST_CASE("HealthChecker dispose discards a one-off probe that is in flight", "[health]") {
    HealthFixture f;
    auto conn = silent_connection(f, "alpha");

    std::optional<HealthRecord> result;
    asio::co_spawn(f.io, f.checker.check_health("alpha", *conn),
        [&](std::exception_ptr, HealthRecord record) { result = std::move(record); });
    run_for(f.io, 20ms);

    f.checker.dispose();
    run_for(f.io, 300ms);

    // the caller still gets its record, the checker keeps nothing
    REQUIRE(result.has_value());
    REQUIRE(result->is_healthy == false);
    REQUIRE(f.checker.get_all_health_statuses().empty());
}

TEST_CASE("HealthChecker destroyed mid-probe leaves the probe harmless", "[health][periodic]") {
    HealthFixture f;
    auto conn = silent_connection(f, "alpha");

    auto checker = std::make_unique<HealthChecker>(f.io.get_executor(), HealthCheckConfig{20ms, 100ms, 3});
    checker->start_periodic_health_check("alpha", conn);
    run_for(f.io, 50ms);
    REQUIRE(conn->pending_requests() == 1);

    checker.reset();
    run_for(f.io, 200ms);
    REQUIRE(conn->pending_requests() == 0);

    run_sync(f.io, conn->async_disconnect());
}
