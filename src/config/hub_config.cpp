#include "mcphub/config/hub_config.hpp"
#include "mcphub/transport/http_types.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace mcphub {

namespace {

[[nodiscard]] std::string lowercase(std::string_view text) {
    std::string out(text);
    std::ranges::transform(out, out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

// Server entries come in two shapes: flat ({name, type, command, ...}) or
// with the transport settings nested under "config".
[[nodiscard]] const Json& settings_of(const Json& entry) {
    const bool nested = entry.contains("config") && entry["config"].is_object();
    return nested ? entry["config"] : entry;
}

template <typename T>
[[nodiscard]] std::optional<T> optional_field(const Json& primary, const Json& fallback, const char* key) {
    for (const Json* source : {&primary, &fallback}) {
        if (source->contains(key) && (*source)[key].is_null() == false) {
            return (*source)[key].get<T>();
        }
    }
    return std::nullopt;
}

[[nodiscard]] std::chrono::milliseconds millis(std::int64_t value) {
    return std::chrono::milliseconds{value};
}

}  // namespace

std::optional<TransportKind> transport_kind_from_string(std::string_view name) {
    const std::string key = lowercase(name);
    if (key == "stdio") {
        return TransportKind::Stdio;
    }
    if (key == "websocket" || key == "socket" || key == "ws") {
        return TransportKind::Socket;
    }
    if (key == "http") {
        return TransportKind::Http;
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// ServerDescriptor
// ─────────────────────────────────────────────────────────────────────────────

ServerDescriptor ServerDescriptor::stdio_server(
    std::string name,
    std::string command,
    std::vector<std::string> args
) {
    ServerDescriptor d;
    d.name = std::move(name);
    d.kind = TransportKind::Stdio;
    d.stdio.command = std::move(command);
    d.stdio.args = std::move(args);
    return d;
}

ServerDescriptor ServerDescriptor::socket_server(
    std::string name,
    std::string host,
    std::uint16_t port,
    std::string path
) {
    ServerDescriptor d;
    d.name = std::move(name);
    d.kind = TransportKind::Socket;
    d.endpoint.host = std::move(host);
    d.endpoint.port = port;
    d.endpoint.path = std::move(path);
    return d;
}

ServerDescriptor ServerDescriptor::http_server(
    std::string name,
    std::string host,
    std::uint16_t port,
    std::string path
) {
    ServerDescriptor d = socket_server(std::move(name), std::move(host), port, std::move(path));
    d.kind = TransportKind::Http;
    return d;
}

std::optional<std::string> ServerDescriptor::validation_error() const {
    if (name.empty()) {
        return "Server name must not be empty";
    }
    if (request_timeout.count() <= 0) {
        return "Server '" + name + "': timeout must be positive";
    }

    switch (kind) {
        case TransportKind::Stdio:
            if (stdio.command.empty()) {
                return "Server '" + name + "': stdio transport requires a command";
            }
            return std::nullopt;

        case TransportKind::Socket:
        case TransportKind::Http:
            if (endpoint.host.empty()) {
                return "Server '" + name + "': " + std::string(to_string(kind)) + " transport requires a host";
            }
            if (endpoint.port == 0) {
                return "Server '" + name + "': " + std::string(to_string(kind)) + " transport requires a port";
            }
            if (kind == TransportKind::Socket && endpoint.secure) {
                return "Server '" + name + "': TLS WebSocket endpoints are not supported";
            }
            if (endpoint_url().empty()) {
                return "Server '" + name + "': invalid endpoint address";
            }
            return std::nullopt;
    }
    return std::nullopt;
}

std::string ServerDescriptor::endpoint_url() const {
    std::string_view scheme;
    switch (kind) {
        case TransportKind::Stdio:
            return {};
        case TransportKind::Socket:
            scheme = "ws";
            break;
        case TransportKind::Http:
            scheme = (endpoint.secure || endpoint.port == 443) ? "https" : "http";
            break;
    }

    const auto url = make_endpoint_url(scheme, endpoint.host, endpoint.port, endpoint.path);
    if (url.has_value() == false) {
        return {};
    }
    return url->full();
}

ClientResult<ServerDescriptor> ServerDescriptor::from_json(const Json& j) {
    if (j.is_object() == false) {
        return tl::unexpected(ClientError::invalid_config("Server entry must be an object"));
    }

    try {
        const Json& s = settings_of(j);
        ServerDescriptor d;
        d.name = j.value("name", "");

        const std::string type = j.value("type", s.value("type", "stdio"));
        const auto kind = transport_kind_from_string(type);
        if (kind.has_value() == false) {
            return tl::unexpected(ClientError::invalid_config(
                "Server '" + d.name + "': unknown transport type '" + type + "'"));
        }
        d.kind = *kind;
        d.enabled = j.value("enabled", true);

        if (auto cmd = optional_field<std::string>(s, j, "command")) {
            d.stdio.command = std::move(*cmd);
        }
        if (auto args = optional_field<std::vector<std::string>>(s, j, "args")) {
            d.stdio.args = std::move(*args);
        }
        if (auto env = optional_field<std::unordered_map<std::string, std::string>>(s, j, "env")) {
            d.stdio.env = std::move(*env);
        }

        if (auto host = optional_field<std::string>(s, j, "host")) {
            d.endpoint.host = std::move(*host);
        }
        if (auto port = optional_field<std::uint16_t>(s, j, "port")) {
            d.endpoint.port = *port;
        }
        if (auto path = optional_field<std::string>(s, j, "path")) {
            d.endpoint.path = std::move(*path);
        }
        if (auto secure = optional_field<bool>(s, j, "secure")) {
            d.endpoint.secure = *secure;
        }
        if (auto headers = optional_field<HeaderMap>(s, j, "headers")) {
            d.endpoint.headers = std::move(*headers);
        }

        if (auto timeout = optional_field<std::int64_t>(s, j, "timeout")) {
            d.request_timeout = millis(*timeout);
        }
        if (auto timeout = optional_field<std::int64_t>(s, j, "connectTimeout")) {
            d.connect_timeout = millis(*timeout);
        }
        if (auto attempts = optional_field<std::size_t>(s, j, "maxReconnectAttempts")) {
            d.max_reconnect_attempts = *attempts;
        }
        if (auto delay = optional_field<std::int64_t>(s, j, "reconnectDelay")) {
            d.reconnect_base_delay = millis(*delay);
        }

        if (auto err = d.validation_error()) {
            return tl::unexpected(ClientError::invalid_config(std::move(*err)));
        }
        return d;
    } catch (const Json::exception& e) {
        return tl::unexpected(ClientError::invalid_config(
            "Server '" + j.value("name", std::string{"?"}) + "': " + e.what()));
    }
}

Json ServerDescriptor::to_json() const {
    Json j = {
        {"name", name},
        {"type", std::string(to_string(kind))},
        {"enabled", enabled},
        {"timeout", request_timeout.count()}
    };

    if (kind == TransportKind::Stdio) {
        j["command"] = stdio.command;
        j["args"] = stdio.args;
        if (stdio.env.empty() == false) {
            j["env"] = stdio.env;
        }
        return j;
    }

    j["host"] = endpoint.host;
    j["port"] = endpoint.port;
    j["path"] = endpoint.path;
    j["secure"] = endpoint.secure;
    j["connectTimeout"] = connect_timeout.count();
    if (endpoint.headers.empty() == false) {
        j["headers"] = endpoint.headers;
    }
    if (kind == TransportKind::Socket) {
        j["maxReconnectAttempts"] = max_reconnect_attempts;
        j["reconnectDelay"] = reconnect_base_delay.count();
    }
    return j;
}

// ─────────────────────────────────────────────────────────────────────────────
// HealthCheckConfig
// ─────────────────────────────────────────────────────────────────────────────

HealthCheckConfig HealthCheckConfig::from_json(const Json& j) {
    HealthCheckConfig config;
    if (j.is_object() == false) {
        return config;
    }
    config.check_interval = millis(j.value("checkInterval", config.check_interval.count()));
    config.timeout = millis(j.value("timeout", config.timeout.count()));
    config.max_retries = j.value("maxRetries", config.max_retries);
    return config;
}

// ─────────────────────────────────────────────────────────────────────────────
// Logging
// ─────────────────────────────────────────────────────────────────────────────

ClientResult<LogOptions> log_options_from_json(const Json& j) {
    LogOptions options;
    if (j.is_object() == false) {
        return tl::unexpected(ClientError::invalid_config("'logging' must be an object"));
    }

    try {
        if (j.contains("level")) {
            const auto name = j["level"].get<std::string>();
            const auto level = log_level_from_string(name);
            if (!level) {
                return tl::unexpected(ClientError::invalid_config("Unknown log level: " + name));
            }
            options.level = *level;
        }
        options.console = j.value("console", options.console);
        options.async = j.value("async", options.async);
        options.async_queue_size = j.value("asyncQueueSize", options.async_queue_size);
        if (j.contains("file") && j["file"].is_string()) {
            options.file = j["file"].get<std::string>();
        }
        if (j.contains("pattern") && j["pattern"].is_string()) {
            options.pattern = j["pattern"].get<std::string>();
        }
    } catch (const Json::exception& e) {
        return tl::unexpected(ClientError::invalid_config(std::string("logging: ") + e.what()));
    }
    return options;
}

// ─────────────────────────────────────────────────────────────────────────────
// McpHubConfig
// ─────────────────────────────────────────────────────────────────────────────

const ServerDescriptor* McpHubConfig::find_server(std::string_view name) const {
    const auto it = std::ranges::find_if(servers, [name](const ServerDescriptor& d) {
        return d.name == name;
    });
    return it == servers.end() ? nullptr : &*it;
}

std::optional<std::string> McpHubConfig::validation_error() const {
    std::unordered_set<std::string> seen;
    for (const auto& server : servers) {
        if (auto err = server.validation_error()) {
            return err;
        }
        if (seen.insert(server.name).second == false) {
            return "Duplicate server name '" + server.name + "'";
        }
    }
    if (health_check.check_interval.count() <= 0 || health_check.timeout.count() <= 0) {
        return std::string("Health check interval and timeout must be positive");
    }
    return std::nullopt;
}

ClientResult<McpHubConfig> McpHubConfig::from_json(const Json& j) {
    if (j.is_object() == false) {
        return tl::unexpected(ClientError::invalid_config("Hub configuration must be an object"));
    }

    McpHubConfig config;
    try {
        config.client_name = j.value("clientName", config.client_name);
        config.client_version = j.value("clientVersion", config.client_version);
        config.enable_health_checks = j.value("enableHealthChecks", config.enable_health_checks);
        if (j.contains("healthCheck")) {
            config.health_check = HealthCheckConfig::from_json(j["healthCheck"]);
        }
    } catch (const Json::exception& e) {
        return tl::unexpected(ClientError::invalid_config(e.what()));
    }

    if (j.contains("logging")) {
        auto logging = log_options_from_json(j["logging"]);
        if (!logging) {
            return tl::unexpected(logging.error());
        }
        config.logging = std::move(*logging);
    }

    if (j.contains("servers")) {
        if (j["servers"].is_array() == false) {
            return tl::unexpected(ClientError::invalid_config("'servers' must be an array"));
        }
        for (const auto& entry : j["servers"]) {
            auto descriptor = ServerDescriptor::from_json(entry);
            if (!descriptor) {
                return tl::unexpected(descriptor.error());
            }
            config.servers.push_back(std::move(*descriptor));
        }
    }

    if (auto err = config.validation_error()) {
        return tl::unexpected(ClientError::invalid_config(std::move(*err)));
    }
    return config;
}

ClientResult<McpHubConfig> load_hub_config(const std::string& path) {
    std::ifstream in(path);
    if (in.is_open() == false) {
        return tl::unexpected(ClientError::invalid_config("Cannot open config file: " + path));
    }

    std::stringstream buffer;
    buffer << in.rdbuf();

    Json parsed;
    try {
        parsed = Json::parse(buffer.str());
    } catch (const Json::parse_error& e) {
        return tl::unexpected(ClientError::invalid_config(
            "Invalid JSON in " + path + ": " + e.what()));
    }
    return McpHubConfig::from_json(parsed);
}

}  // namespace mcphub
