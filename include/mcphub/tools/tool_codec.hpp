#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Tool Codec
// ═══════════════════════════════════════════════════════════════════════════
// Maps (server, tool) pairs to the single flat names the chat orchestrator
// sees ("server_tool") and back again, and renders tool definitions and
// results in the orchestrator's function-calling format.
//
// Decoding consults the registry first: a composite name is split at the
// registered server prefix, preferring the split whose tool is registered,
// then the longest server name. Names that match no registered server fall
// back to the marker heuristic:
//
//   a_b_server_read_file  -> ("a_b_server", "read_file")
//   files_service_stat    -> ("files_service", "stat")
//   github_create_issue   -> ("github", "create_issue")
//   gh_create_issue       -> none (first part too short)

#include "mcphub/client/client_error.hpp"
#include "mcphub/protocol/mcp_types.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace mcphub {

/// A tool as advertised by one server
struct ToolDescriptor {
    std::string name;
    std::optional<std::string> description;
    Json input_schema = Json::object();
    std::string server_name;

    static ToolDescriptor from_tool(const Tool& tool, std::string server) {
        return {tool.name, tool.description, tool.input_schema, std::move(server)};
    }

    [[nodiscard]] Json to_json() const;
};

struct DecodedToolName {
    std::string server;
    std::string tool;

    bool operator==(const DecodedToolName&) const = default;
};

/// A function call as issued by the chat orchestrator
struct UnifiedToolCall {
    std::string name;
    Json arguments = Json::object();

    static UnifiedToolCall from_json(const Json& j);
};

class ToolCodec {
public:
    ToolCodec() = default;

    ToolCodec(const ToolCodec&) = delete;
    ToolCodec& operator=(const ToolCodec&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Pure conversions
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] static std::string encode(std::string_view server, std::string_view tool);

    /// Marker heuristic used when no registered server matches
    [[nodiscard]] static std::optional<DecodedToolName> decode_heuristic(std::string_view composite);

    /// Object schemas with an object "properties" pass through untouched;
    /// anything else is coerced to {type, properties, required}
    [[nodiscard]] static Json convert_schema(const Json& schema);

    /// {type: "function", function: {name, description, parameters}}
    [[nodiscard]] static Json to_unified(const ToolDescriptor& tool);

    [[nodiscard]] static std::string result_to_string(const Json& result);

    [[nodiscard]] static std::map<std::string, std::vector<ToolDescriptor>> group_by_server(
        const std::vector<ToolDescriptor>& tools);

    // ─────────────────────────────────────────────────────────────────────────
    // Registry
    // ─────────────────────────────────────────────────────────────────────────

    /// Make `server` known to decode() even before it advertises any tool
    void register_server(const std::string& server);

    /// Forget a server and all its tools
    void unregister_server(const std::string& server);

    /// Fails with InvalidConfig when the composite name is already taken by
    /// another server's tool
    ClientResult<void> register_tool(const ToolDescriptor& tool);

    [[nodiscard]] std::optional<DecodedToolName> decode(std::string_view composite) const;

    [[nodiscard]] bool is_registered(std::string_view server, std::string_view tool) const;
    [[nodiscard]] std::vector<std::string> servers() const;

    void clear();

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::set<std::string>, std::less<>> registry_;
    std::map<std::string, DecodedToolName, std::less<>> composites_;
};

}  // namespace mcphub
