// ─────────────────────────────────────────────────────────────────────────────
// Stdio Transport Tests
// ─────────────────────────────────────────────────────────────────────────────
// LineBuffer framing plus real child processes driven through `sh -c`.

#include <catch2/catch_test_macros.hpp>

#include "mcphub/transport/stdio_transport.hpp"
#include "mocks/run_sync.hpp"

#include <asio/io_context.hpp>

#include <string>
#include <vector>

using namespace mcphub;
using namespace mcphub::testing;
using namespace std::chrono_literals;

namespace {

StdioTransportConfig shell(const std::string& script) {
    StdioTransportConfig config;
    config.command = "sh";
    config.args = {"-c", script};
    config.server_name = "test";
    return config;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// LineBuffer
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("LineBuffer returns every line of a multi-message chunk", "[stdio][framing]") {
    LineBuffer buffer;
    const auto lines = buffer.append("{\"id\":1}\n{\"id\":2}\n{\"id\":3}\n");

    REQUIRE(lines == std::vector<std::string>{"{\"id\":1}", "{\"id\":2}", "{\"id\":3}"});
    REQUIRE(buffer.pending() == 0);
}

TEST_CASE("LineBuffer reassembles a message split across reads", "[stdio][framing]") {
    LineBuffer buffer;

    REQUIRE(buffer.append("{\"jsonrpc\":\"2.0\",").empty());
    REQUIRE(buffer.append("\"id\":7,\"res").empty());
    REQUIRE(buffer.pending() > 0);

    const auto lines = buffer.append("ult\":{}}\n{\"id\":");
    REQUIRE(lines == std::vector<std::string>{R"({"jsonrpc":"2.0","id":7,"result":{}})"});

    const auto rest = buffer.append("8}\n");
    REQUIRE(rest == std::vector<std::string>{"{\"id\":8}"});
}

TEST_CASE("LineBuffer skips blank lines and strips carriage returns", "[stdio][framing]") {
    LineBuffer buffer;
    const auto lines = buffer.append("\n\r\n{\"id\":1}\r\n   \n");

    REQUIRE(lines == std::vector<std::string>{"{\"id\":1}"});
}

TEST_CASE("LineBuffer discards an over-long partial line", "[stdio][framing]") {
    LineBuffer buffer(16);

    REQUIRE(buffer.append(std::string(32, 'x')).empty());
    REQUIRE(buffer.overflow_count() == 1);
    REQUIRE(buffer.pending() == 0);

    const auto lines = buffer.append("{\"id\":1}\n");
    REQUIRE(lines.size() == 1);
}

// ═══════════════════════════════════════════════════════════════════════════
// StdioTransport
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("StdioTransport round-trips messages through a child process", "[stdio][process]") {
    asio::io_context io;
    StdioTransport transport(io.get_executor(), shell("cat"));

    REQUIRE(run_sync(io, transport.async_start()).has_value());
    REQUIRE(transport.is_running());
    REQUIRE(transport.child_pid() > 0);

    Json message = {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "ping"}};
    REQUIRE(run_sync(io, transport.async_send(message)).has_value());

    auto received = run_sync(io, transport.async_receive());
    REQUIRE(received.has_value());
    REQUIRE(*received == message);

    run_sync(io, transport.async_stop());
    REQUIRE(transport.is_running() == false);
}

TEST_CASE("StdioTransport reassembles output written in pieces", "[stdio][process]") {
    asio::io_context io;
    StdioTransport transport(io.get_executor(), shell(
        R"(printf '{"jsonrpc":"2.0","id":1,'; sleep 0.2; )"
        R"(printf '"result":{"ok":true}}\n{"jsonrpc":"2.0","id":2,"result":{}}\n'; sleep 5)"
    ));

    REQUIRE(run_sync(io, transport.async_start()).has_value());

    auto first = run_sync(io, transport.async_receive());
    REQUIRE(first.has_value());
    REQUIRE((*first)["id"] == 1);
    REQUIRE((*first)["result"]["ok"] == true);

    auto second = run_sync(io, transport.async_receive());
    REQUIRE(second.has_value());
    REQUIRE((*second)["id"] == 2);

    run_sync(io, transport.async_stop());
}

TEST_CASE("StdioTransport drops unparsable lines", "[stdio][process]") {
    asio::io_context io;
    StdioTransport transport(io.get_executor(), shell(
        R"(printf 'starting up...\n{"jsonrpc":"2.0","id":5,"result":{}}\n'; sleep 5)"
    ));

    REQUIRE(run_sync(io, transport.async_start()).has_value());

    auto received = run_sync(io, transport.async_receive());
    REQUIRE(received.has_value());
    REQUIRE((*received)["id"] == 5);

    run_sync(io, transport.async_stop());
}

TEST_CASE("StdioTransport never parses stderr as protocol output", "[stdio][process]") {
    asio::io_context io;
    StdioTransport transport(io.get_executor(), shell(
        R"(printf '{"jsonrpc":"2.0","id":99,"result":{}}\n' >&2; sleep 0.1; )"
        R"(printf '{"jsonrpc":"2.0","id":1,"result":{}}\n'; sleep 5)"
    ));

    REQUIRE(run_sync(io, transport.async_start()).has_value());

    auto received = run_sync(io, transport.async_receive());
    REQUIRE(received.has_value());
    REQUIRE((*received)["id"] == 1);

    run_sync(io, transport.async_stop());
}

TEST_CASE("StdioTransport reports process exit as a link drop", "[stdio][process]") {
    asio::io_context io;
    StdioTransport transport(io.get_executor(), shell("exit 3"));

    std::vector<std::pair<LinkState, std::string>> events;
    transport.on_link_change([&](LinkState state, const std::string& reason) {
        events.emplace_back(state, reason);
    });

    REQUIRE(run_sync(io, transport.async_start()).has_value());

    auto received = run_sync(io, transport.async_receive());
    REQUIRE(received.has_value() == false);

    REQUIRE(transport.is_running() == false);
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].first == LinkState::Down);
    REQUIRE(events[0].second.find("exit code 3") != std::string::npos);
    REQUIRE(transport.exit_code() == 3);

    auto sent = run_sync(io, transport.async_send({{"jsonrpc", "2.0"}, {"method", "ping"}}));
    REQUIRE(sent.has_value() == false);
    REQUIRE(sent.error().category == TransportError::Category::Network);
}

TEST_CASE("StdioTransport passes environment overrides to the child", "[stdio][process]") {
    asio::io_context io;
    auto config = shell(R"(printf '{"jsonrpc":"2.0","id":1,"result":{"value":"%s"}}\n' "$MCPHUB_TEST_VALUE"; sleep 5)");
    config.env["MCPHUB_TEST_VALUE"] = "from-config";
    StdioTransport transport(io.get_executor(), std::move(config));

    REQUIRE(run_sync(io, transport.async_start()).has_value());

    auto received = run_sync(io, transport.async_receive());
    REQUIRE(received.has_value());
    REQUIRE((*received)["result"]["value"] == "from-config");

    run_sync(io, transport.async_stop());
}

TEST_CASE("StdioTransport rejects a second start and an empty command", "[stdio][process]") {
    asio::io_context io;

    StdioTransport empty(io.get_executor(), StdioTransportConfig{});
    REQUIRE(run_sync(io, empty.async_start()).has_value() == false);

    StdioTransport transport(io.get_executor(), shell("sleep 5"));
    REQUIRE(run_sync(io, transport.async_start()).has_value());
    REQUIRE(run_sync(io, transport.async_start()).has_value() == false);
    run_sync(io, transport.async_stop());
}
