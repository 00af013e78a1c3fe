#include <catch2/catch_test_macros.hpp>

#include "mcphub/protocol/json_rpc.hpp"
#include "mcphub/protocol/mcp_types.hpp"

using namespace mcphub;

// ─────────────────────────────────────────────────────────────────────────────
// Envelopes
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("make_request serializes id, method and params", "[protocol]") {
    const auto j = make_request(7, method::ListTools, {{"cursor", "abc"}});

    REQUIRE(j["jsonrpc"] == "2.0");
    REQUIRE(j["id"] == 7);
    REQUIRE(j["method"] == "tools/list");
    REQUIRE(j["params"]["cursor"] == "abc");
    REQUIRE(classify_message(j) == MessageKind::Request);
}

TEST_CASE("make_request omits null params but keeps empty objects", "[protocol]") {
    REQUIRE(make_request(1, method::Ping).contains("params") == false);
    REQUIRE(make_request(1, method::Ping, Json::object())["params"] == Json::object());
}

TEST_CASE("make_notification has no id", "[protocol]") {
    const auto j = make_notification(method::Initialized);

    REQUIRE(j["method"] == "notifications/initialized");
    REQUIRE(j.contains("id") == false);
    REQUIRE(classify_message(j) == MessageKind::Notification);
}

TEST_CASE("Replies echo the server id verbatim", "[protocol]") {
    const auto pong = make_result_reply("srv-1", Json::object());
    REQUIRE(pong["id"] == "srv-1");
    REQUIRE(pong["result"] == Json::object());
    REQUIRE(classify_message(pong) == MessageKind::Response);

    const auto refused = make_error_reply(3, JsonRpcError{ErrorCode::MethodNotFound, "nope", std::nullopt});
    REQUIRE(refused["id"] == 3);
    REQUIRE(refused["error"]["code"] == ErrorCode::MethodNotFound);
    REQUIRE(refused["error"].contains("data") == false);
    REQUIRE(refused.contains("result") == false);
}

TEST_CASE("JsonRpcError parses code, message and data", "[protocol]") {
    const auto error = JsonRpcError::from_json({
        {"code", ErrorCode::InvalidParams},
        {"message", "bad arguments"},
        {"data", {{"field", "path"}}}
    });

    REQUIRE(error.code == ErrorCode::InvalidParams);
    REQUIRE(error.message == "bad arguments");
    REQUIRE(error.data.has_value());
    REQUIRE((*error.data)["field"] == "path");
}

TEST_CASE("JsonRpcError tolerates non-object payloads", "[protocol]") {
    const auto error = JsonRpcError::from_json("something broke");
    REQUIRE(error.code == ErrorCode::InternalError);
    REQUIRE(error.message == "something broke");
}

// ─────────────────────────────────────────────────────────────────────────────
// Classification
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("classify_message distinguishes the four kinds", "[protocol]") {
    REQUIRE(classify_message({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "ping"}}) == MessageKind::Request);
    REQUIRE(classify_message({{"jsonrpc", "2.0"}, {"method", "notifications/progress"}}) == MessageKind::Notification);
    REQUIRE(classify_message({{"jsonrpc", "2.0"}, {"id", 1}, {"result", Json::object()}}) == MessageKind::Response);
    REQUIRE(classify_message({{"jsonrpc", "2.0"}, {"id", nullptr}, {"result", 1}}) == MessageKind::Invalid);
    REQUIRE(classify_message(Json::array()) == MessageKind::Invalid);
}

TEST_CASE("response_id accepts only non-negative integers", "[protocol]") {
    REQUIRE(response_id({{"id", 42}}) == 42u);
    REQUIRE(response_id({{"id", -1}}).has_value() == false);
    REQUIRE(response_id({{"id", "42"}}).has_value() == false);
    REQUIRE(response_id({{"result", 1}}).has_value() == false);
}

// ─────────────────────────────────────────────────────────────────────────────
// MCP payloads
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("InitializeParams carries protocol version and client info", "[protocol][mcp]") {
    InitializeParams params;
    params.client_info = Implementation{"mcphub", "0.1.0"};
    const auto j = params.to_json();

    REQUIRE(j["protocolVersion"] == "2024-11-05");
    REQUIRE(j["capabilities"].contains("tools"));
    REQUIRE(j["clientInfo"]["name"] == "mcphub");
    REQUIRE(j["clientInfo"]["version"] == "0.1.0");
}

TEST_CASE("ListToolsResult reads tools and the next cursor", "[protocol][mcp]") {
    const auto result = ListToolsResult::from_json({
        {"tools", Json::array({
            {{"name", "read_file"}, {"description", "Read a file"},
             {"inputSchema", {{"type", "object"}, {"properties", {{"path", {{"type", "string"}}}}}}}},
            {{"name", "stat"}},
            "not-a-tool"
        })},
        {"nextCursor", "page-2"}
    });

    REQUIRE(result.tools.size() == 2);
    REQUIRE(result.tools[0].name == "read_file");
    REQUIRE(result.tools[0].description == "Read a file");
    REQUIRE(result.tools[1].description.has_value() == false);
    REQUIRE(result.next_cursor == "page-2");
}

TEST_CASE("CallToolParams always sends an arguments object", "[protocol][mcp]") {
    CallToolParams params{"stat", nullptr};
    const auto j = params.to_json();
    REQUIRE(j["name"] == "stat");
    REQUIRE(j["arguments"].is_object());
}

TEST_CASE("InitializeResult reads server info leniently", "[protocol][mcp]") {
    const auto full = InitializeResult::from_json({
        {"protocolVersion", "2024-11-05"},
        {"capabilities", {{"tools", {{"listChanged", true}}}}},
        {"serverInfo", {{"name", "files"}, {"version", "2.1"}}},
        {"instructions", "Paths are absolute"}
    });
    REQUIRE(full.server_info.name == "files");
    REQUIRE(full.advertises_tools());
    REQUIRE(full.instructions == "Paths are absolute");

    const auto sparse = InitializeResult::from_json({{"serverInfo", "not an object"}, {"capabilities", 3}});
    REQUIRE(sparse.protocol_version.empty());
    REQUIRE(sparse.server_info.name.empty());
    REQUIRE(sparse.advertises_tools() == false);
}
