#include "mcphub/client/mcp_hub.hpp"
#include "mcphub/log/logger.hpp"

namespace mcphub {

namespace {

constexpr const char* kCategory = "MCP";

}  // namespace

McpHub::McpHub(asio::io_context& io_context, McpHubConfig config)
    : io_context_(io_context)
    , config_(std::move(config))
    , health_(io_context.get_executor(), config_.health_check)
{}

McpHub::~McpHub() {
    health_.dispose();
}

Implementation McpHub::client_info() const {
    return Implementation{config_.client_name, config_.client_version};
}

std::shared_ptr<Connection> McpHub::find_connection(const std::string& name) const {
    std::lock_guard lock(mutex_);
    const auto it = servers_.find(name);
    if (it == servers_.end()) {
        return nullptr;
    }
    return it->second.connection;
}

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<ClientResult<void>> McpHub::initialize() {
    if (disposed_) {
        co_return tl::unexpected(ClientError::connection_error("Hub has been disposed"));
    }
    if (initialized_) {
        co_return ClientResult<void>{};
    }

    if (auto problem = config_.validation_error()) {
        co_return tl::unexpected(ClientError::invalid_config(*problem));
    }

    MCPHUB_LOG_INFO(kCategory, "Initializing MCP hub", {{"servers", config_.servers.size()}});

    for (const auto& descriptor : config_.servers) {
        if (descriptor.enabled == false) {
            MCPHUB_LOG_DEBUG(kCategory, "Skipping disabled server", {{"server", descriptor.name}});
            continue;
        }

        auto connected = co_await connect_server(descriptor);
        if (!connected) {
            co_return tl::unexpected(connected.error());
        }
    }

    initialized_ = true;

    std::size_t connected_servers = 0;
    {
        std::lock_guard lock(mutex_);
        connected_servers = servers_.size();
    }
    MCPHUB_LOG_INFO(kCategory, "MCP hub initialized", {
        {"connectedServers", connected_servers},
        {"tools", list_all_tools().size()}
    });
    co_return ClientResult<void>{};
}

asio::awaitable<ClientResult<void>> McpHub::connect_server(const ServerDescriptor& descriptor) {
    std::shared_ptr<Connection> connection = make_connection(io_context_, descriptor, client_info());

    auto connected = co_await connection->async_connect();
    if (!connected) {
        // The transport may still be retrying in the background
        co_await connection->async_disconnect();
        co_return tl::unexpected(connected.error());
    }

    {
        std::lock_guard lock(mutex_);
        servers_[descriptor.name] = ServerEntry{connection, false};
    }
    codec_.register_server(descriptor.name);

    co_await discover_tools(descriptor.name, *connection);

    if (config_.enable_health_checks) {
        health_.start_periodic_health_check(descriptor.name, connection);
    }
    co_return ClientResult<void>{};
}

asio::awaitable<void> McpHub::discover_tools(const std::string& name, Connection& connection) {
    std::vector<ToolDescriptor> discovered;
    std::optional<std::string> cursor;

    do {
        Json params = Json::object();
        if (cursor) {
            params["cursor"] = *cursor;
        }

        auto page = co_await connection.async_request(method::ListTools, std::move(params));
        if (!page) {
            MCPHUB_LOG_FAILURE(kCategory, "Tool discovery failed", page.error().message, {{"server", name}});
            discovered.clear();
            break;
        }

        auto listed = ListToolsResult::from_json(*page);
        for (const auto& tool : listed.tools) {
            auto descriptor = ToolDescriptor::from_tool(tool, name);
            if (auto registered = codec_.register_tool(descriptor); !registered) {
                MCPHUB_LOG_WARN(kCategory, "Skipping tool", {
                    {"server", name},
                    {"tool", tool.name},
                    {"reason", registered.error().message}
                });
                continue;
            }
            discovered.push_back(std::move(descriptor));
        }
        cursor = listed.next_cursor;
    } while (cursor.has_value());

    MCPHUB_LOG_INFO(kCategory, "Discovered tools", {
        {"server", name},
        {"count", discovered.size()}
    });

    std::lock_guard lock(mutex_);
    tools_[name] = std::move(discovered);
}

asio::awaitable<void> McpHub::drop_server(const std::string& name) {
    health_.stop_periodic_health_check(name);

    std::shared_ptr<Connection> connection;
    {
        std::lock_guard lock(mutex_);
        const auto it = servers_.find(name);
        if (it != servers_.end()) {
            connection = it->second.connection;
            it->second.reconnecting = true;
        }
        tools_.erase(name);
    }
    codec_.unregister_server(name);

    if (connection) {
        co_await connection->async_disconnect();
    }
}

asio::awaitable<ClientResult<void>> McpHub::reconnect_server(std::string name) {
    const ServerDescriptor* descriptor = config_.find_server(name);
    if (descriptor == nullptr) {
        co_return tl::unexpected(ClientError::tool_not_found("Server config not found: " + name));
    }
    if (disposed_) {
        co_return tl::unexpected(ClientError::connection_error("Hub has been disposed"));
    }

    MCPHUB_LOG_INFO(kCategory, "Reconnecting server", {{"server", name}});
    co_await drop_server(name);

    auto connected = co_await connect_server(*descriptor);
    if (!connected) {
        MCPHUB_LOG_FAILURE(kCategory, "Reconnect failed", connected.error().message, {{"server", name}});
        std::lock_guard lock(mutex_);
        const auto it = servers_.find(name);
        if (it != servers_.end()) {
            it->second.reconnecting = false;
        }
        co_return tl::unexpected(connected.error());
    }
    co_return ClientResult<void>{};
}

asio::awaitable<void> McpHub::dispose() {
    if (disposed_) {
        co_return;
    }
    disposed_ = true;

    health_.dispose();

    std::map<std::string, ServerEntry> servers;
    {
        std::lock_guard lock(mutex_);
        servers.swap(servers_);
        tools_.clear();
    }
    codec_.clear();

    for (auto& [name, entry] : servers) {
        co_await entry.connection->async_disconnect();
    }

    initialized_ = false;
    MCPHUB_LOG_INFO(kCategory, "MCP hub disposed", {{"servers", servers.size()}});
}

// ═══════════════════════════════════════════════════════════════════════════
// Tools
// ═══════════════════════════════════════════════════════════════════════════

std::vector<ToolDescriptor> McpHub::list_all_tools() const {
    std::lock_guard lock(mutex_);
    std::vector<ToolDescriptor> all;
    for (const auto& [server, tools] : tools_) {
        all.insert(all.end(), tools.begin(), tools.end());
    }
    return all;
}

std::map<std::string, std::vector<ToolDescriptor>> McpHub::list_tools_by_server() const {
    std::lock_guard lock(mutex_);
    return tools_;
}

std::vector<Json> McpHub::unified_tools() const {
    const auto tools = list_all_tools();

    std::vector<Json> unified;
    unified.reserve(tools.size());
    for (const auto& tool : tools) {
        unified.push_back(ToolCodec::to_unified(tool));
    }

    MCPHUB_LOG_DEBUG(kCategory, "Converted tools to unified format", {{"count", unified.size()}});
    return unified;
}

// ═══════════════════════════════════════════════════════════════════════════
// Tool calls
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<ClientResult<Json>> McpHub::call_tool(std::string server, std::string tool, Json arguments) {
    auto connection = find_connection(server);
    if (!connection) {
        co_return tl::unexpected(ClientError::tool_not_found("Server not found: " + server));
    }
    if (connection->is_active() == false) {
        co_return tl::unexpected(ClientError::connection_error(
            "Server '" + server + "' is not connected"));
    }

    MCPHUB_LOG_DEBUG(kCategory, "Calling tool", {
        {"server", server},
        {"tool", tool}
    });

    CallToolParams params{tool, std::move(arguments)};
    auto reply = co_await connection->async_request(method::CallTool, params.to_json());
    if (!reply) {
        auto error = reply.error();
        if (error.rpc_error) {
            error.message = "Tool call failed: " + error.message;
        }
        MCPHUB_LOG_FAILURE(kCategory, "Tool call failed", error.message, {
            {"server", server},
            {"tool", tool},
            {"code", std::string(to_string(error.code))}
        });
        co_return tl::unexpected(std::move(error));
    }
    co_return std::move(*reply);
}

asio::awaitable<ClientResult<std::string>> McpHub::call_unified_tool(UnifiedToolCall call) {
    const auto decoded = codec_.decode(call.name);
    if (!decoded) {
        co_return tl::unexpected(ClientError::tool_not_found("Cannot resolve tool name: " + call.name));
    }

    auto result = co_await call_tool(decoded->server, decoded->tool, std::move(call.arguments));
    if (!result) {
        co_return tl::unexpected(result.error());
    }
    co_return ToolCodec::result_to_string(*result);
}

asio::awaitable<Json> McpHub::process_tool_call(UnifiedToolCall call) {
    auto result = co_await call_unified_tool(std::move(call));
    if (!result) {
        co_return Json{{"success", false}, {"error", result.error().message}};
    }
    co_return Json{{"success", true}, {"result", *result}};
}

// ═══════════════════════════════════════════════════════════════════════════
// Status / health
// ═══════════════════════════════════════════════════════════════════════════

bool McpHub::is_server_connected(const std::string& name) const {
    auto connection = find_connection(name);
    return connection && connection->is_active();
}

std::optional<ServerState> McpHub::server_state(const std::string& name) const {
    const ServerDescriptor* descriptor = config_.find_server(name);
    if (descriptor == nullptr) {
        return std::nullopt;
    }
    if (disposed_) {
        return ServerState::Disposed;
    }
    if (descriptor->enabled == false) {
        return ServerState::Disabled;
    }

    std::lock_guard lock(mutex_);
    const auto it = servers_.find(name);
    if (it == servers_.end()) {
        return initialized_ ? ServerState::Disconnected : ServerState::Connecting;
    }

    switch (it->second.connection->state()) {
        case ConnectionState::Connected:
            return ServerState::Connected;
        case ConnectionState::Connecting:
            return ServerState::Reconnecting;
        case ConnectionState::Closing:
        case ConnectionState::Disconnected:
            return it->second.reconnecting ? ServerState::Reconnecting : ServerState::Disconnected;
    }
    return ServerState::Disconnected;
}

std::map<std::string, bool> McpHub::server_status() const {
    std::map<std::string, bool> status;
    for (const auto& [name, record] : health_.get_all_health_statuses()) {
        status[name] = record.is_healthy;
    }
    return status;
}

asio::awaitable<ClientResult<HealthRecord>> McpHub::check_server_health(std::string name) {
    auto connection = find_connection(name);
    if (!connection) {
        co_return tl::unexpected(ClientError::tool_not_found("Server not found: " + name));
    }
    co_return co_await health_.check_health(std::move(name), *connection);
}

std::optional<HealthRecord> McpHub::get_server_health(const std::string& name) const {
    return health_.get_health_status(name);
}

std::map<std::string, HealthRecord> McpHub::get_all_server_health() const {
    return health_.get_all_health_statuses();
}

HealthSummary McpHub::get_health_summary() const {
    return health_.get_overall_health_summary();
}

}  // namespace mcphub
