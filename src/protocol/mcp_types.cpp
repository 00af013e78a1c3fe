#include "mcphub/protocol/mcp_types.hpp"

namespace mcphub {

namespace {

std::optional<std::string> string_member(const Json& j, const char* key) {
    if (j.is_object() == false) {
        return std::nullopt;
    }
    const auto it = j.find(key);
    if (it == j.end() || it->is_string() == false) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

const Json* object_member(const Json& j, const char* key) {
    if (j.is_object() == false) {
        return nullptr;
    }
    const auto it = j.find(key);
    return (it != j.end() && it->is_object()) ? &*it : nullptr;
}

}  // namespace

Json Implementation::to_json() const {
    return {{"name", name}, {"version", version}};
}

Implementation Implementation::from_json(const Json& j) {
    return {string_member(j, "name").value_or(""), string_member(j, "version").value_or("")};
}

Json InitializeParams::to_json() const {
    return {
        {"protocolVersion", protocol_version},
        {"capabilities", {{"tools", Json::object()}}},
        {"clientInfo", client_info.to_json()}
    };
}

InitializeResult InitializeResult::from_json(const Json& j) {
    InitializeResult result;
    result.protocol_version = string_member(j, "protocolVersion").value_or("");
    result.instructions = string_member(j, "instructions");
    if (const Json* capabilities = object_member(j, "capabilities")) {
        result.capabilities = *capabilities;
    }
    if (const Json* info = object_member(j, "serverInfo")) {
        result.server_info = Implementation::from_json(*info);
    }
    return result;
}

Tool Tool::from_json(const Json& j) {
    Tool tool;
    tool.name = string_member(j, "name").value_or("");
    tool.description = string_member(j, "description");
    if (j.is_object() && j.contains("inputSchema")) {
        tool.input_schema = j["inputSchema"];
    }
    return tool;
}

ListToolsResult ListToolsResult::from_json(const Json& j) {
    ListToolsResult result;
    result.next_cursor = string_member(j, "nextCursor");
    if (j.is_object() == false || j.contains("tools") == false || j["tools"].is_array() == false) {
        return result;
    }
    for (const auto& entry : j["tools"]) {
        // Nameless entries cannot be called, so they are not tools
        auto tool = Tool::from_json(entry);
        if (tool.name.empty() == false) {
            result.tools.push_back(std::move(tool));
        }
    }
    return result;
}

Json CallToolParams::to_json() const {
    return {
        {"name", name},
        {"arguments", arguments.is_null() ? Json::object() : arguments}
    };
}

}  // namespace mcphub
