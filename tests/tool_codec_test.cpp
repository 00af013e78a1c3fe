// ─────────────────────────────────────────────────────────────────────────────
// ToolCodec Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "mcphub/tools/tool_codec.hpp"

using namespace mcphub;

namespace {

ToolDescriptor tool(const std::string& server, const std::string& name, Json schema = Json::object()) {
    ToolDescriptor t;
    t.server_name = server;
    t.name = name;
    t.description = "Tool " + name;
    t.input_schema = std::move(schema);
    return t;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Names
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ToolCodec encode joins with an underscore", "[codec]") {
    REQUIRE(ToolCodec::encode("github", "create_issue") == "github_create_issue");
    REQUIRE(ToolCodec::encode("file_server", "read") == "file_server_read");
}

TEST_CASE("ToolCodec heuristic splits at server markers", "[codec]") {
    REQUIRE(ToolCodec::decode_heuristic("a_b_server_read_file") == DecodedToolName{"a_b_server", "read_file"});
    REQUIRE(ToolCodec::decode_heuristic("files_service_stat") == DecodedToolName{"files_service", "stat"});
}

TEST_CASE("ToolCodec heuristic only honours the first marker word", "[codec]") {
    // a leading "server" is skipped, so the "service" marker decides
    REQUIRE(ToolCodec::decode_heuristic("server_x_service_y") == DecodedToolName{"server_x_service", "y"});
    // with no later marker to fall back on, the first word is the server
    REQUIRE(ToolCodec::decode_heuristic("server_x_server_y") == DecodedToolName{"server", "x_server_y"});
    REQUIRE(ToolCodec::decode_heuristic("a_server_b_server_c") == DecodedToolName{"a_server", "b_server_c"});
}

TEST_CASE("ToolCodec heuristic rejects a trailing marker", "[codec]") {
    REQUIRE(ToolCodec::decode_heuristic("files_read_server").has_value() == false);
    REQUIRE(ToolCodec::decode_heuristic("files_read_server_x_service") == DecodedToolName{"files_read_server", "x_service"});
}

TEST_CASE("ToolCodec heuristic falls back to the first word", "[codec]") {
    REQUIRE(ToolCodec::decode_heuristic("github_create_issue") == DecodedToolName{"github", "create_issue"});
    REQUIRE(ToolCodec::decode_heuristic("docs_search") == DecodedToolName{"docs", "search"});
}

TEST_CASE("ToolCodec heuristic rejects unresolvable names", "[codec]") {
    REQUIRE(ToolCodec::decode_heuristic("gh_create_issue").has_value() == false);
    REQUIRE(ToolCodec::decode_heuristic("standalone").has_value() == false);
    REQUIRE(ToolCodec::decode_heuristic("").has_value() == false);
    REQUIRE(ToolCodec::decode_heuristic("files_").has_value() == false);
}

TEST_CASE("ToolCodec decode inverts encode for registered tools", "[codec]") {
    ToolCodec codec;
    const std::vector<ToolDescriptor> tools = {
        tool("gh", "create_issue"),
        tool("file_server", "read_file"),
        tool("my_service_x", "list"),
        tool("alpha", "ping")
    };
    for (const auto& t : tools) {
        REQUIRE(codec.register_tool(t).has_value());
    }

    for (const auto& t : tools) {
        const auto decoded = codec.decode(ToolCodec::encode(t.server_name, t.name));
        REQUIRE(decoded.has_value());
        REQUIRE(decoded->server == t.server_name);
        REQUIRE(decoded->tool == t.name);
    }
}

TEST_CASE("ToolCodec decode prefers the longest registered server", "[codec]") {
    ToolCodec codec;
    codec.register_server("git");
    codec.register_server("git_hub");

    REQUIRE(codec.decode("git_hub_search") == DecodedToolName{"git_hub", "search"});
    REQUIRE(codec.decode("git_log") == DecodedToolName{"git", "log"});
}

TEST_CASE("ToolCodec decode uses the heuristic for unknown servers", "[codec]") {
    ToolCodec codec;
    codec.register_server("alpha");

    REQUIRE(codec.decode("weather_forecast") == DecodedToolName{"weather", "forecast"});
    REQUIRE(codec.decode("xy_z").has_value() == false);
}

TEST_CASE("ToolCodec rejects composite name collisions", "[codec]") {
    ToolCodec codec;
    REQUIRE(codec.register_tool(tool("a_b", "c")).has_value());

    auto clash = codec.register_tool(tool("a", "b_c"));
    REQUIRE(clash.has_value() == false);
    REQUIRE(clash.error().code == ClientErrorCode::InvalidConfig);
    REQUIRE(clash.error().message.find("'a_b_c'") != std::string::npos);

    // Re-registering the same tool is not a collision
    REQUIRE(codec.register_tool(tool("a_b", "c")).has_value());
    REQUIRE(codec.decode("a_b_c") == DecodedToolName{"a_b", "c"});
    REQUIRE(codec.is_registered("a", "b_c") == false);
}

TEST_CASE("ToolCodec unregister_server forgets its tools", "[codec]") {
    ToolCodec codec;
    REQUIRE(codec.register_tool(tool("alpha", "ping")).has_value());
    REQUIRE(codec.register_tool(tool("beta", "ping")).has_value());
    REQUIRE(codec.servers() == std::vector<std::string>{"alpha", "beta"});

    codec.unregister_server("alpha");
    REQUIRE(codec.is_registered("alpha", "ping") == false);
    REQUIRE(codec.is_registered("beta", "ping"));
    REQUIRE(codec.servers() == std::vector<std::string>{"beta"});

    codec.clear();
    REQUIRE(codec.servers().empty());
}

// ═══════════════════════════════════════════════════════════════════════════
// Schemas and definitions
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ToolCodec keeps compatible schemas untouched", "[codec][schema]") {
    const Json schema = {
        {"type", "object"},
        {"properties", {{"path", {{"type", "string"}}}}},
        {"required", {"path"}},
        {"additionalProperties", false}
    };
    REQUIRE(ToolCodec::convert_schema(schema) == schema);
}

TEST_CASE("ToolCodec coerces incompatible schemas", "[codec][schema]") {
    SECTION("missing schema") {
        const auto converted = ToolCodec::convert_schema(Json::object());
        REQUIRE(converted["type"] == "object");
        REQUIRE(converted["properties"] == Json::object());
        REQUIRE(converted["required"] == Json::array());
    }

    SECTION("properties without a type keep their fields") {
        const auto converted = ToolCodec::convert_schema({
            {"properties", {{"q", {{"type", "string"}}}}},
            {"required", {"q"}}
        });
        REQUIRE(converted["type"] == "object");
        REQUIRE(converted["properties"].contains("q"));
        REQUIRE(converted["required"][0] == "q");
    }

    SECTION("non-object schema") {
        const auto converted = ToolCodec::convert_schema("string");
        REQUIRE(converted["properties"] == Json::object());
    }

    SECTION("conversion is idempotent") {
        const auto once = ToolCodec::convert_schema({{"type", "array"}});
        REQUIRE(ToolCodec::convert_schema(once) == once);
    }
}

TEST_CASE("ToolCodec renders function definitions", "[codec]") {
    auto t = tool("github", "create_issue", {{"type", "object"}, {"properties", {{"title", {{"type", "string"}}}}}});
    const auto unified = ToolCodec::to_unified(t);

    REQUIRE(unified["type"] == "function");
    REQUIRE(unified["function"]["name"] == "github_create_issue");
    REQUIRE(unified["function"]["description"] == "Tool create_issue");
    REQUIRE(unified["function"]["parameters"]["properties"].contains("title"));

    t.description.reset();
    REQUIRE(ToolCodec::to_unified(t)["function"]["description"] == "");
}

// ═══════════════════════════════════════════════════════════════════════════
// Calls and results
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("UnifiedToolCall accepts object and string arguments", "[codec]") {
    auto direct = UnifiedToolCall::from_json({{"name", "alpha_ping"}, {"arguments", {{"n", 1}}}});
    REQUIRE(direct.name == "alpha_ping");
    REQUIRE(direct.arguments["n"] == 1);

    auto encoded = UnifiedToolCall::from_json({{"name", "alpha_ping"}, {"arguments", R"({"n":2})"}});
    REQUIRE(encoded.arguments["n"] == 2);

    auto garbage = UnifiedToolCall::from_json({{"name", "alpha_ping"}, {"arguments", "{oops"}});
    REQUIRE(garbage.arguments == Json::object());

    auto missing = UnifiedToolCall::from_json({{"name", "alpha_ping"}});
    REQUIRE(missing.arguments == Json::object());
}

TEST_CASE("ToolCodec result_to_string formats by type", "[codec]") {
    REQUIRE(ToolCodec::result_to_string("plain text") == "plain text");
    REQUIRE(ToolCodec::result_to_string(42) == "42");
    REQUIRE(ToolCodec::result_to_string(true) == "true");
    REQUIRE(ToolCodec::result_to_string(Json{{"a", 1}}) == "{\n  \"a\": 1\n}");
    REQUIRE(ToolCodec::result_to_string(Json::array({1, 2})) == "[\n  1,\n  2\n]");
}

TEST_CASE("ToolCodec groups tools by server", "[codec]") {
    const auto grouped = ToolCodec::group_by_server({
        tool("alpha", "ping"), tool("beta", "ping"), tool("alpha", "echo")
    });

    REQUIRE(grouped.size() == 2);
    REQUIRE(grouped.at("alpha").size() == 2);
    REQUIRE(grouped.at("alpha")[1].name == "echo");
    REQUIRE(grouped.at("beta").size() == 1);
}
