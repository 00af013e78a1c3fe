#ifndef MCPHUB_CONFIG_HUB_CONFIG_HPP
#define MCPHUB_CONFIG_HUB_CONFIG_HPP

#include "mcphub/client/client_error.hpp"
#include "mcphub/log/logger.hpp"
#include "mcphub/transport.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace mcphub {

// ─────────────────────────────────────────────────────────────────────────────
// Transport Kind
// ─────────────────────────────────────────────────────────────────────────────

enum class TransportKind {
    Stdio,   // child process, newline-delimited JSON over pipes
    Socket,  // persistent WebSocket
    Http     // stateless POST per message
};

[[nodiscard]] constexpr std::string_view to_string(TransportKind kind) noexcept {
    switch (kind) {
        case TransportKind::Stdio:  return "stdio";
        case TransportKind::Socket: return "websocket";
        case TransportKind::Http:   return "http";
    }
    return "unknown";
}

/// Accepts "stdio", "websocket" / "socket" / "ws" and "http"
[[nodiscard]] std::optional<TransportKind> transport_kind_from_string(std::string_view name);

// ─────────────────────────────────────────────────────────────────────────────
// Server Descriptor
// ─────────────────────────────────────────────────────────────────────────────
// One entry per MCP server. Loaded once and never mutated afterwards; the
// builder helpers are meant for constructing descriptors in code and tests.

struct StdioParams {
    std::string command;
    std::vector<std::string> args;
    std::unordered_map<std::string, std::string> env;  // added to the inherited environment
};

struct EndpointParams {
    std::string host;
    std::uint16_t port{0};
    std::string path{"/"};
    bool secure{false};  // https; http also switches to https on port 443
    HeaderMap headers;   // extra HTTP headers (http transport only)
};

struct ServerDescriptor {
    std::string name;
    TransportKind kind{TransportKind::Stdio};
    StdioParams stdio;
    EndpointParams endpoint;
    bool enabled{true};

    std::chrono::milliseconds request_timeout{30'000};
    std::chrono::milliseconds connect_timeout{10'000};

    // Socket transport only
    std::size_t max_reconnect_attempts{5};
    std::chrono::milliseconds reconnect_base_delay{1'000};

    // ─────────────────────────────────────────────────────────────────────────
    // Factories
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] static ServerDescriptor stdio_server(
        std::string name,
        std::string command,
        std::vector<std::string> args = {}
    );

    [[nodiscard]] static ServerDescriptor socket_server(
        std::string name,
        std::string host,
        std::uint16_t port,
        std::string path = "/"
    );

    [[nodiscard]] static ServerDescriptor http_server(
        std::string name,
        std::string host,
        std::uint16_t port,
        std::string path = "/"
    );

    // ─────────────────────────────────────────────────────────────────────────
    // Builder helpers
    // ─────────────────────────────────────────────────────────────────────────

    ServerDescriptor& with_env(const std::string& key, const std::string& value) {
        stdio.env[key] = value;
        return *this;
    }

    ServerDescriptor& with_header(const std::string& header_name, const std::string& value) {
        endpoint.headers[header_name] = value;
        return *this;
    }

    ServerDescriptor& with_request_timeout(std::chrono::milliseconds timeout) {
        request_timeout = timeout;
        return *this;
    }

    ServerDescriptor& with_connect_timeout(std::chrono::milliseconds timeout) {
        connect_timeout = timeout;
        return *this;
    }

    ServerDescriptor& with_reconnect(std::size_t max_attempts, std::chrono::milliseconds base_delay) {
        max_reconnect_attempts = max_attempts;
        reconnect_base_delay = base_delay;
        return *this;
    }

    ServerDescriptor& with_enabled(bool value) {
        enabled = value;
        return *this;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Validation / derived values
    // ─────────────────────────────────────────────────────────────────────────

    /// First problem found, or nullopt when the descriptor is usable
    [[nodiscard]] std::optional<std::string> validation_error() const;

    [[nodiscard]] bool is_valid() const {
        return !validation_error().has_value();
    }

    /// ws://host:port+path or http(s)://host:port+path; empty for stdio
    [[nodiscard]] std::string endpoint_url() const;

    [[nodiscard]] static ClientResult<ServerDescriptor> from_json(const Json& j);
    [[nodiscard]] Json to_json() const;
};

// ─────────────────────────────────────────────────────────────────────────────
// Health Check Configuration
// ─────────────────────────────────────────────────────────────────────────────

struct HealthCheckConfig {
    std::chrono::milliseconds check_interval{30'000};
    std::chrono::milliseconds timeout{5'000};  // bounds each probe request
    std::size_t max_retries{3};

    static HealthCheckConfig from_json(const Json& j);
};

// ─────────────────────────────────────────────────────────────────────────────
// Hub Configuration
// ─────────────────────────────────────────────────────────────────────────────

struct McpHubConfig {
    std::vector<ServerDescriptor> servers;
    HealthCheckConfig health_check{};

    /// Reported in the initialize handshake and the HTTP User-Agent
    std::string client_name = "mcphub";
    std::string client_version = "0.1.0";

    /// Start periodic health checks after each server connects
    bool enable_health_checks{true};

    /// Backend settings for whoever installs the process-wide logger
    LogOptions logging{};

    McpHubConfig& add_server(ServerDescriptor descriptor) {
        servers.push_back(std::move(descriptor));
        return *this;
    }

    [[nodiscard]] const ServerDescriptor* find_server(std::string_view name) const;

    /// Checks every descriptor and rejects duplicate names
    [[nodiscard]] std::optional<std::string> validation_error() const;

    /// {"servers": [...], "healthCheck": {...}, "logging": {...}, "clientName": ..., "clientVersion": ...}
    [[nodiscard]] static ClientResult<McpHubConfig> from_json(const Json& j);
};

/// {"level": "debug", "console": true, "file": "hub.log", "async": false,
///  "asyncQueueSize": 8192, "pattern": "..."}
[[nodiscard]] ClientResult<LogOptions> log_options_from_json(const Json& j);

/// Read and parse a hub configuration file
[[nodiscard]] ClientResult<McpHubConfig> load_hub_config(const std::string& path);

}  // namespace mcphub

#endif  // MCPHUB_CONFIG_HUB_CONFIG_HPP
