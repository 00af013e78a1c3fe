#ifndef MCPHUB_PROTOCOL_MCP_TYPES_HPP
#define MCPHUB_PROTOCOL_MCP_TYPES_HPP

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace mcphub {

using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// MCP Payloads
// ═══════════════════════════════════════════════════════════════════════════
// Only the slice of MCP the hub speaks: the initialize handshake, tool
// listing and tool calls. Parsers are lenient; a malformed member is dropped
// rather than failing the whole payload.

inline constexpr const char* MCP_PROTOCOL_VERSION = "2024-11-05";

namespace method {
    inline constexpr const char* Initialize = "initialize";
    inline constexpr const char* Initialized = "notifications/initialized";
    inline constexpr const char* Ping = "ping";
    inline constexpr const char* ListTools = "tools/list";
    inline constexpr const char* CallTool = "tools/call";
}

struct Implementation {
    std::string name;
    std::string version;

    [[nodiscard]] Json to_json() const;
    static Implementation from_json(const Json& j);
};

/// The hub consumes tools only, so it advertises an empty tools capability
struct InitializeParams {
    std::string protocol_version = MCP_PROTOCOL_VERSION;
    Implementation client_info;

    [[nodiscard]] Json to_json() const;
};

struct InitializeResult {
    std::string protocol_version;
    Json capabilities = Json::object();
    Implementation server_info;
    std::optional<std::string> instructions;

    [[nodiscard]] bool advertises_tools() const {
        return capabilities.is_object() && capabilities.contains("tools");
    }

    static InitializeResult from_json(const Json& j);
};

struct Tool {
    std::string name;
    std::optional<std::string> description;
    Json input_schema = Json::object();

    static Tool from_json(const Json& j);
};

/// One page of tools/list; a present next_cursor means more pages follow
struct ListToolsResult {
    std::vector<Tool> tools;
    std::optional<std::string> next_cursor;

    static ListToolsResult from_json(const Json& j);
};

struct CallToolParams {
    std::string name;
    Json arguments = Json::object();

    /// A null or missing arguments value is sent as {}
    [[nodiscard]] Json to_json() const;
};

}  // namespace mcphub

#endif  // MCPHUB_PROTOCOL_MCP_TYPES_HPP
