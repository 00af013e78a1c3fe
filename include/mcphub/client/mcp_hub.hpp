#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// McpHub
// ═══════════════════════════════════════════════════════════════════════════
// Owns one Connection per enabled server, the tool cache discovered from
// them, the ToolCodec registry and the HealthChecker.
//
// Usage:
//   asio::io_context io;
//   McpHub hub(io, config);
//   asio::co_spawn(io, [&]() -> asio::awaitable<void> {
//       if (auto ok = co_await hub.initialize(); !ok) { ... }
//       auto result = co_await hub.call_tool("files", "read_file", {{"path", "/tmp/x"}});
//       co_await hub.dispose();
//   }, asio::detached);
//   io.run();
//
// Per-server lifecycle:
//   Disabled | Connecting -> Connected -> {Reconnecting, Disconnected} -> Disposed

#include "mcphub/client/client_error.hpp"
#include "mcphub/client/connection.hpp"
#include "mcphub/config/hub_config.hpp"
#include "mcphub/health/health_checker.hpp"
#include "mcphub/tools/tool_codec.hpp"

#include <asio/awaitable.hpp>
#include <asio/io_context.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcphub {

enum class ServerState {
    Disabled,
    Connecting,
    Connected,
    Reconnecting,
    Disconnected,
    Disposed
};

[[nodiscard]] constexpr std::string_view to_string(ServerState state) noexcept {
    switch (state) {
        case ServerState::Disabled:     return "disabled";
        case ServerState::Connecting:   return "connecting";
        case ServerState::Connected:    return "connected";
        case ServerState::Reconnecting: return "reconnecting";
        case ServerState::Disconnected: return "disconnected";
        case ServerState::Disposed:     return "disposed";
    }
    return "unknown";
}

class McpHub {
public:
    McpHub(asio::io_context& io_context, McpHubConfig config);
    ~McpHub();

    McpHub(const McpHub&) = delete;
    McpHub& operator=(const McpHub&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// Connect every enabled server and discover its tools. The first
    /// connect failure aborts the call; servers connected before it stay up
    /// until dispose(). A discovery failure only leaves that server without
    /// tools.
    [[nodiscard]] asio::awaitable<ClientResult<void>> initialize();

    /// Tear down and recreate one server's connection, then rediscover its
    /// tools. Unknown names fail with ToolNotFound.
    [[nodiscard]] asio::awaitable<ClientResult<void>> reconnect_server(std::string name);

    /// Disconnect everything and clear all caches. Repeat calls are no-ops.
    asio::awaitable<void> dispose();

    [[nodiscard]] bool is_initialized() const noexcept { return initialized_; }

    // ─────────────────────────────────────────────────────────────────────────
    // Tools (cache reads)
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] std::vector<ToolDescriptor> list_all_tools() const;
    [[nodiscard]] std::map<std::string, std::vector<ToolDescriptor>> list_tools_by_server() const;

    /// Every cached tool rendered as a function definition for the chat layer
    [[nodiscard]] std::vector<Json> unified_tools() const;

    // ─────────────────────────────────────────────────────────────────────────
    // Tool calls
    // ─────────────────────────────────────────────────────────────────────────

    /// Returns the "result" member of the tools/call reply
    [[nodiscard]] asio::awaitable<ClientResult<Json>> call_tool(
        std::string server,
        std::string tool,
        Json arguments = Json::object()
    );

    /// Resolve a composite name and return the result rendered as text
    [[nodiscard]] asio::awaitable<ClientResult<std::string>> call_unified_tool(UnifiedToolCall call);

    /// {success: true, result} or {success: false, error}; never fails
    [[nodiscard]] asio::awaitable<Json> process_tool_call(UnifiedToolCall call);

    // ─────────────────────────────────────────────────────────────────────────
    // Status / health
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] bool is_server_connected(const std::string& name) const;

    /// nullopt for names absent from the configuration
    [[nodiscard]] std::optional<ServerState> server_state(const std::string& name) const;

    /// Server name -> healthy according to its latest probe
    [[nodiscard]] std::map<std::string, bool> server_status() const;

    /// Probe one server right away
    [[nodiscard]] asio::awaitable<ClientResult<HealthRecord>> check_server_health(std::string name);

    [[nodiscard]] std::optional<HealthRecord> get_server_health(const std::string& name) const;
    [[nodiscard]] std::map<std::string, HealthRecord> get_all_server_health() const;
    [[nodiscard]] HealthSummary get_health_summary() const;

    [[nodiscard]] const McpHubConfig& config() const noexcept { return config_; }
    [[nodiscard]] HealthChecker& health_checker() noexcept { return health_; }
    [[nodiscard]] const ToolCodec& codec() const noexcept { return codec_; }

private:
    struct ServerEntry {
        std::shared_ptr<Connection> connection;
        bool reconnecting{false};
    };

    asio::awaitable<ClientResult<void>> connect_server(const ServerDescriptor& descriptor);
    asio::awaitable<void> discover_tools(const std::string& name, Connection& connection);
    asio::awaitable<void> drop_server(const std::string& name);

    [[nodiscard]] std::shared_ptr<Connection> find_connection(const std::string& name) const;
    [[nodiscard]] Implementation client_info() const;

    asio::io_context& io_context_;
    McpHubConfig config_;
    ToolCodec codec_;
    HealthChecker health_;

    mutable std::mutex mutex_;
    std::map<std::string, ServerEntry> servers_;
    std::map<std::string, std::vector<ToolDescriptor>> tools_;

    bool initialized_{false};
    bool disposed_{false};
};

}  // namespace mcphub
