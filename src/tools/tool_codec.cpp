#include "mcphub/tools/tool_codec.hpp"
#include "mcphub/log/logger.hpp"

#include <algorithm>

namespace mcphub {

namespace {

constexpr const char* kCategory = "codec";
constexpr std::size_t kMinImplicitServerLength = 4;

std::vector<std::string> split_parts(std::string_view composite) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    for (;;) {
        const auto pos = composite.find('_', start);
        if (pos == std::string_view::npos) {
            parts.emplace_back(composite.substr(start));
            break;
        }
        parts.emplace_back(composite.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::string join_parts(const std::vector<std::string>& parts, std::size_t first, std::size_t last) {
    std::string out;
    for (std::size_t i = first; i < last; ++i) {
        if (i > first) {
            out += '_';
        }
        out += parts[i];
    }
    return out;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Value types
// ─────────────────────────────────────────────────────────────────────────────

Json ToolDescriptor::to_json() const {
    Json j = {
        {"name", name},
        {"inputSchema", input_schema},
        {"serverName", server_name}
    };
    if (description) {
        j["description"] = *description;
    }
    return j;
}

UnifiedToolCall UnifiedToolCall::from_json(const Json& j) {
    UnifiedToolCall call;
    call.name = j.value("name", "");
    if (j.contains("arguments")) {
        const auto& args = j["arguments"];
        // Orchestrators sometimes ship arguments as a JSON-encoded string
        if (args.is_string()) {
            call.arguments = Json::parse(args.get<std::string>(), nullptr, false);
            if (call.arguments.is_discarded()) {
                call.arguments = Json::object();
            }
        } else if (args.is_null() == false) {
            call.arguments = args;
        }
    }
    return call;
}

// ─────────────────────────────────────────────────────────────────────────────
// Pure conversions
// ─────────────────────────────────────────────────────────────────────────────

std::string ToolCodec::encode(std::string_view server, std::string_view tool) {
    std::string composite;
    composite.reserve(server.size() + 1 + tool.size());
    composite.append(server);
    composite += '_';
    composite.append(tool);
    return composite;
}

std::optional<DecodedToolName> ToolCodec::decode_heuristic(std::string_view composite) {
    const auto parts = split_parts(composite);

    if (parts.size() >= 3) {
        for (const char* marker : {"server", "service"}) {
            // only the first occurrence counts; a leading marker names no server
            const auto it = std::find(parts.begin(), parts.end(), marker);
            if (it == parts.end() || it == parts.begin()) {
                continue;
            }
            const auto index = static_cast<std::size_t>(it - parts.begin());
            if (index + 1 >= parts.size()) {
                return std::nullopt;  // "<x>_server" leaves no tool
            }
            return DecodedToolName{
                join_parts(parts, 0, index + 1),
                join_parts(parts, index + 1, parts.size())
            };
        }
    }

    if (parts.size() >= 2 && parts.front().size() >= kMinImplicitServerLength) {
        auto tool = join_parts(parts, 1, parts.size());
        if (tool.empty() == false) {
            return DecodedToolName{parts.front(), std::move(tool)};
        }
    }
    return std::nullopt;
}

Json ToolCodec::convert_schema(const Json& schema) {
    const bool compatible = schema.is_object()
        && schema.value("type", Json()) == "object"
        && schema.contains("properties")
        && schema["properties"].is_object();
    if (compatible) {
        return schema;
    }

    Json converted = {
        {"type", "object"},
        {"properties", Json::object()},
        {"required", Json::array()}
    };
    if (schema.is_object()) {
        if (schema.contains("properties") && schema["properties"].is_object()) {
            converted["properties"] = schema["properties"];
        }
        if (schema.contains("required") && schema["required"].is_array()) {
            converted["required"] = schema["required"];
        }
    }
    return converted;
}

Json ToolCodec::to_unified(const ToolDescriptor& tool) {
    return {
        {"type", "function"},
        {"function", {
            {"name", encode(tool.server_name, tool.name)},
            {"description", tool.description.value_or("")},
            {"parameters", convert_schema(tool.input_schema)}
        }}
    };
}

std::string ToolCodec::result_to_string(const Json& result) {
    if (result.is_string()) {
        return result.get<std::string>();
    }
    if (result.is_object() || result.is_array()) {
        return result.dump(2);
    }
    return result.dump();
}

std::map<std::string, std::vector<ToolDescriptor>> ToolCodec::group_by_server(
    const std::vector<ToolDescriptor>& tools
) {
    std::map<std::string, std::vector<ToolDescriptor>> grouped;
    for (const auto& tool : tools) {
        grouped[tool.server_name].push_back(tool);
    }
    return grouped;
}

// ─────────────────────────────────────────────────────────────────────────────
// Registry
// ─────────────────────────────────────────────────────────────────────────────

void ToolCodec::register_server(const std::string& server) {
    std::lock_guard lock(mutex_);
    registry_.try_emplace(server);
}

void ToolCodec::unregister_server(const std::string& server) {
    std::lock_guard lock(mutex_);
    registry_.erase(server);
    std::erase_if(composites_, [&](const auto& entry) {
        return entry.second.server == server;
    });
}

ClientResult<void> ToolCodec::register_tool(const ToolDescriptor& tool) {
    auto composite = encode(tool.server_name, tool.name);

    std::lock_guard lock(mutex_);
    const auto it = composites_.find(composite);
    if (it != composites_.end() && it->second.server != tool.server_name) {
        MCPHUB_LOG_WARN(kCategory, "Composite tool name collision", {
            {"name", composite},
            {"server", tool.server_name},
            {"registeredServer", it->second.server}
        });
        return tl::unexpected(ClientError::invalid_config(
            "Tool name '" + composite + "' from server '" + tool.server_name
            + "' collides with a tool of server '" + it->second.server + "'"));
    }

    registry_[tool.server_name].insert(tool.name);
    composites_[std::move(composite)] = DecodedToolName{tool.server_name, tool.name};
    return {};
}

std::optional<DecodedToolName> ToolCodec::decode(std::string_view composite) const {
    {
        std::lock_guard lock(mutex_);

        const auto exact = composites_.find(composite);
        if (exact != composites_.end()) {
            return exact->second;
        }

        std::optional<DecodedToolName> best;
        for (const auto& [server, tools] : registry_) {
            const bool prefixed = composite.size() > server.size() + 1
                && composite.starts_with(server)
                && composite[server.size()] == '_';
            if (prefixed == false) {
                continue;
            }
            if (best.has_value() == false || server.size() > best->server.size()) {
                best = DecodedToolName{server, std::string(composite.substr(server.size() + 1))};
            }
        }
        if (best) {
            return best;
        }
    }

    auto guessed = decode_heuristic(composite);
    if (guessed) {
        MCPHUB_LOG_DEBUG(kCategory, "Decoded tool name heuristically", {
            {"name", std::string(composite)},
            {"server", guessed->server},
            {"tool", guessed->tool}
        });
    }
    return guessed;
}

bool ToolCodec::is_registered(std::string_view server, std::string_view tool) const {
    std::lock_guard lock(mutex_);
    const auto it = registry_.find(server);
    return it != registry_.end() && it->second.contains(std::string(tool));
}

std::vector<std::string> ToolCodec::servers() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> names;
    names.reserve(registry_.size());
    for (const auto& [server, tools] : registry_) {
        names.push_back(server);
    }
    return names;
}

void ToolCodec::clear() {
    std::lock_guard lock(mutex_);
    registry_.clear();
    composites_.clear();
}

}  // namespace mcphub
