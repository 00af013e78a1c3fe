// ─────────────────────────────────────────────────────────────────────────────
// Correlator Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "mcphub/client/correlator.hpp"
#include "mocks/run_sync.hpp"

#include <asio/io_context.hpp>
#include <asio/strand.hpp>

using namespace mcphub;
using namespace mcphub::testing;
using namespace std::chrono_literals;

namespace {

struct CorrelatorFixture {
    asio::io_context io;
    Correlator correlator{asio::make_strand(asio::any_io_executor(io.get_executor()))};
};

}  // namespace

TEST_CASE("Correlator delivers a reply to the matching id", "[correlator]") {
    CorrelatorFixture f;
    auto first = f.correlator.register_request(1, "ping", 5s);
    auto second = f.correlator.register_request(2, "tools/list", 5s);
    REQUIRE(f.correlator.size() == 2);

    REQUIRE(f.correlator.resolve(2, Json{{"tools", Json::array()}}));
    REQUIRE(f.correlator.contains(2) == false);
    REQUIRE(f.correlator.contains(1));

    auto outcome = run_sync(f.io, Correlator::await(second));
    REQUIRE(outcome.has_value());
    REQUIRE((*outcome)["tools"].is_array());

    REQUIRE(f.correlator.resolve(1, Json::object()));
    REQUIRE(run_sync(f.io, Correlator::await(first)).has_value());
}

TEST_CASE("Correlator ignores late and unknown replies", "[correlator]") {
    CorrelatorFixture f;
    auto channel = f.correlator.register_request(1, "ping", 5s);

    REQUIRE(f.correlator.resolve(1, Json::object()));
    REQUIRE(f.correlator.resolve(1, Json{{"late", true}}) == false);
    REQUIRE(f.correlator.resolve(99, Json::object()) == false);

    auto outcome = run_sync(f.io, Correlator::await(channel));
    REQUIRE(outcome.has_value());
    REQUIRE(outcome->contains("late") == false);
}

TEST_CASE("Correlator times out and forgets the id", "[correlator]") {
    CorrelatorFixture f;
    auto channel = f.correlator.register_request(3, "tools/call", 20ms);

    auto outcome = run_sync(f.io, Correlator::await(channel));
    REQUIRE(outcome.has_value() == false);
    REQUIRE(outcome.error().code == ClientErrorCode::Timeout);
    REQUIRE(outcome.error().message.find("'tools/call' (id 3) timed out") != std::string::npos);

    REQUIRE(f.correlator.contains(3) == false);
    REQUIRE(f.correlator.resolve(3, Json::object()) == false);
}

TEST_CASE("Correlator reply cancels the deadline", "[correlator]") {
    CorrelatorFixture f;
    auto channel = f.correlator.register_request(4, "ping", 30ms);
    REQUIRE(f.correlator.resolve(4, Json{{"ok", true}}));

    run_for(f.io, 80ms);

    auto outcome = run_sync(f.io, Correlator::await(channel));
    REQUIRE(outcome.has_value());
    REQUIRE((*outcome)["ok"] == true);
}

TEST_CASE("Correlator without a timeout waits indefinitely", "[correlator]") {
    CorrelatorFixture f;
    auto channel = f.correlator.register_request(5, "ping", 0ms);

    run_for(f.io, 30ms);
    REQUIRE(f.correlator.contains(5));

    REQUIRE(f.correlator.resolve(5, Json::object()));
    REQUIRE(run_sync(f.io, Correlator::await(channel)).has_value());
}

TEST_CASE("Correlator fail_all completes every pending request once", "[correlator]") {
    CorrelatorFixture f;
    auto a = f.correlator.register_request(1, "ping", 5s);
    auto b = f.correlator.register_request(2, "ping", 5s);

    const auto failed = f.correlator.fail_all(ClientError::connection_closed("Connection to 'x' lost: gone"));
    REQUIRE(failed == 2);
    REQUIRE(f.correlator.size() == 0);

    auto first = run_sync(f.io, Correlator::await(a));
    auto second = run_sync(f.io, Correlator::await(b));
    REQUIRE(first.error().code == ClientErrorCode::ConnectionClosed);
    REQUIRE(second.error().message == "Connection to 'x' lost: gone");

    REQUIRE(f.correlator.fail_all(ClientError::connection_closed()) == 0);
}

TEST_CASE("Correlator cancel drops an entry without completing it", "[correlator]") {
    CorrelatorFixture f;
    auto channel = f.correlator.register_request(6, "ping", 20ms);

    REQUIRE(f.correlator.cancel(6));
    REQUIRE(f.correlator.cancel(6) == false);
    REQUIRE(f.correlator.size() == 0);

    run_for(f.io, 60ms);
    REQUIRE(channel->ready() == false);
}
