// ─────────────────────────────────────────────────────────────────────────────
// mcphub-cli - Multi-server MCP hub tool
// ─────────────────────────────────────────────────────────────────────────────
// Connects to every server of a hub configuration (or a single inline
// server) and lists, calls and health-checks their tools through one
// flat namespace.
//
// Usage:
//   # Hub configuration file
//   mcphub-cli --config servers.json --list-tools
//   mcphub-cli --config servers.json --call files_read_file --tool-args '{"path":"/tmp/x"}'
//
//   # Single inline server
//   mcphub-cli --command "python" --args server.py --list-tools
//   mcphub-cli --ws localhost:8080/mcp --health
//   mcphub-cli --url http://localhost:3000/mcp --unified

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "mcphub/client/mcp_hub.hpp"
#include "mcphub/config/hub_config.hpp"
#include "mcphub/log/logger.hpp"
#include "mcphub/log/spdlog_logger.hpp"
#include "mcphub/transport/http_types.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>

#include <spdlog/common.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace mcphub;

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset   = "\033[0m";
    const char* bold    = "\033[1m";
    const char* dim     = "\033[2m";
    const char* red     = "\033[31m";
    const char* green   = "\033[32m";
    const char* yellow  = "\033[33m";
    const char* cyan    = "\033[36m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Output Helpers
// ═══════════════════════════════════════════════════════════════════════════

void print_error(const std::string& msg) {
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << msg << "\n";
}

void print_success(const std::string& msg) {
    std::cout << color::c(color::green) << "✓ " << color::c(color::reset) << msg << "\n";
}

void print_header(const std::string& title) {
    std::cout << "\n" << color::c(color::bold) << color::c(color::cyan)
              << "═══ " << title << " ═══" << color::c(color::reset) << "\n\n";
}

void print_json(const Json& j) {
    std::cout << j.dump(2) << "\n";
}

// ═══════════════════════════════════════════════════════════════════════════
// Configuration
// ═══════════════════════════════════════════════════════════════════════════

std::optional<ServerDescriptor> endpoint_from_url(
    const std::string& name,
    const std::string& url,
    TransportKind kind
) {
    auto parsed = parse_url(url);
    if (!parsed) {
        return std::nullopt;
    }

    ServerDescriptor descriptor = (kind == TransportKind::Socket)
        ? ServerDescriptor::socket_server(name, parsed->host, parsed->port, parsed->path + parsed->query)
        : ServerDescriptor::http_server(name, parsed->host, parsed->port, parsed->path + parsed->query);
    descriptor.endpoint.secure = parsed->is_secure();
    return descriptor;
}

/// Hub configuration from --config or the single inline server options
ClientResult<McpHubConfig> build_config(const cxxopts::ParseResult& result) {
    if (result.count("config")) {
        return load_hub_config(result["config"].as<std::string>());
    }

    McpHubConfig config;
    const auto name = result["name"].as<std::string>();

    if (result.count("command")) {
        std::vector<std::string> args;
        for (const auto& arg : result["args"].as<std::vector<std::string>>()) {
            if (!arg.empty()) {
                args.push_back(arg);
            }
        }
        config.add_server(ServerDescriptor::stdio_server(name, result["command"].as<std::string>(), args));
    } else if (result.count("ws")) {
        auto url = result["ws"].as<std::string>();
        if (url.find("://") == std::string::npos) {
            url = "ws://" + url;
        }
        auto descriptor = endpoint_from_url(name, url, TransportKind::Socket);
        if (!descriptor) {
            return tl::unexpected(ClientError::invalid_config("Invalid WebSocket address: " + url));
        }
        config.add_server(std::move(*descriptor));
    } else if (result.count("url")) {
        const auto url = result["url"].as<std::string>();
        auto descriptor = endpoint_from_url(name, url, TransportKind::Http);
        if (!descriptor) {
            return tl::unexpected(ClientError::invalid_config("Invalid URL: " + url));
        }
        config.add_server(std::move(*descriptor));
    } else {
        return tl::unexpected(ClientError::invalid_config(
            "Must specify --config, --command, --ws or --url"));
    }

    // One-shot runs have no use for background probes
    config.enable_health_checks = false;
    config.logging.level = LogLevel::Warn;
    return config;
}

/// Logging block of the configuration, with --log-level / --log-file on top
ClientResult<void> configure_logging(LogOptions options, const cxxopts::ParseResult& result) {
    if (result.count("log-level")) {
        const auto name = result["log-level"].as<std::string>();
        const auto level = log_level_from_string(name);
        if (!level) {
            return tl::unexpected(ClientError::invalid_config("Unknown log level: " + name));
        }
        options.level = *level;
    }
    if (result.count("log-file")) {
        options.file = result["log-file"].as<std::string>();
    }

    try {
        set_logger(make_spdlog_logger(options));
    } catch (const spdlog::spdlog_ex& e) {
        return tl::unexpected(ClientError::invalid_config(e.what()));
    }
    return {};
}

// ═══════════════════════════════════════════════════════════════════════════
// Command Handlers
// ═══════════════════════════════════════════════════════════════════════════

int cmd_list_tools(McpHub& hub, bool json_output) {
    const auto by_server = hub.list_tools_by_server();

    if (json_output) {
        Json output = Json::object();
        for (const auto& [server, tools] : by_server) {
            output[server] = Json::array();
            for (const auto& tool : tools) {
                output[server].push_back(tool.to_json());
            }
        }
        print_json(output);
        return 0;
    }

    for (const auto& [server, tools] : by_server) {
        print_header(server);
        if (tools.empty()) {
            std::cout << color::c(color::dim) << "(no tools available)" << color::c(color::reset) << "\n";
            continue;
        }
        for (const auto& tool : tools) {
            std::cout << color::c(color::bold) << color::c(color::yellow)
                      << "• " << ToolCodec::encode(server, tool.name) << color::c(color::reset);
            if (tool.description) {
                std::cout << "\n  " << color::c(color::dim) << *tool.description << color::c(color::reset);
            }
            std::cout << "\n\n";
        }
    }
    return 0;
}

int cmd_unified(McpHub& hub) {
    print_json(Json(hub.unified_tools()));
    return 0;
}

asio::awaitable<int> cmd_call(McpHub& hub, std::string name, std::string raw_args, bool json_output) {
    Json arguments = Json::parse(raw_args, nullptr, false);
    if (arguments.is_discarded() || arguments.is_object() == false) {
        print_error("--tool-args must be a JSON object");
        co_return 1;
    }

    if (json_output) {
        print_json(co_await hub.process_tool_call(UnifiedToolCall{std::move(name), std::move(arguments)}));
        co_return 0;
    }

    auto result = co_await hub.call_unified_tool(UnifiedToolCall{name, std::move(arguments)});
    if (!result) {
        print_error(result.error().message);
        co_return 1;
    }

    print_header("Result: " + name);
    std::cout << *result << "\n";
    co_return 0;
}

asio::awaitable<int> cmd_health(McpHub& hub, bool json_output) {
    int exit_code = 0;
    for (const auto& descriptor : hub.config().servers) {
        if (descriptor.enabled == false) {
            continue;
        }
        auto record = co_await hub.check_server_health(descriptor.name);
        if (!record || record->is_healthy == false) {
            exit_code = 1;
        }
    }

    if (json_output) {
        Json output = Json::object();
        for (const auto& [server, record] : hub.get_all_server_health()) {
            output[server] = record.to_json();
        }
        output["summary"] = hub.get_health_summary().to_json();
        print_json(output);
        co_return exit_code;
    }

    print_header("Health");
    for (const auto& [server, record] : hub.get_all_server_health()) {
        if (record.is_healthy) {
            print_success(server + " (" + std::to_string(record.response_time.count()) + " ms, "
                          + std::to_string(record.tools_count.value_or(0)) + " tools)");
        } else {
            std::cout << color::c(color::red) << "✗ " << color::c(color::reset) << server
                      << color::c(color::dim) << " " << record.last_error.value_or("unhealthy")
                      << color::c(color::reset) << "\n";
        }
    }

    const auto summary = hub.get_health_summary();
    std::cout << "\n" << summary.healthy_servers << "/" << summary.total_servers
              << " healthy, average " << summary.average_response_time.count() << " ms\n";
    co_return exit_code;
}

asio::awaitable<int> run(McpHub& hub, const cxxopts::ParseResult& result) {
    const bool json_output = result.count("json") > 0;

    auto initialized = co_await hub.initialize();
    if (!initialized) {
        print_error(initialized.error().message);
        co_await hub.dispose();
        co_return 1;
    }

    int exit_code = 0;
    if (result.count("call")) {
        exit_code = co_await cmd_call(hub, result["call"].as<std::string>(),
                                      result["tool-args"].as<std::string>(), json_output);
    } else if (result.count("health")) {
        exit_code = co_await cmd_health(hub, json_output);
    } else if (result.count("unified")) {
        exit_code = cmd_unified(hub);
    } else {
        exit_code = cmd_list_tools(hub, json_output);
    }

    co_await hub.dispose();
    co_return exit_code;
}

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("mcphub-cli", "Multi-server MCP hub tool");

    options.add_options()
        // Server selection
        ("config", "Hub configuration file (JSON)", cxxopts::value<std::string>())
        ("c,command", "Server command to execute (stdio transport)", cxxopts::value<std::string>())
        ("a,args", "Arguments for the server command", cxxopts::value<std::vector<std::string>>()->default_value(""))
        ("ws", "WebSocket server address, host:port/path", cxxopts::value<std::string>())
        ("u,url", "MCP server URL (HTTP transport)", cxxopts::value<std::string>())
        ("n,name", "Server name for an inline server", cxxopts::value<std::string>()->default_value("server"))

        // Commands
        ("list-tools", "List tools of every server (default)")
        ("call", "Call a tool by composite name (server_tool)", cxxopts::value<std::string>())
        ("tool-args", "JSON arguments for --call", cxxopts::value<std::string>()->default_value("{}"))
        ("health", "Probe every server and print a health summary")
        ("unified", "Print tools as function definitions")

        // Output options
        ("j,json", "Output results as JSON")
        ("no-color", "Disable colored output")
        ("log-level", "trace, debug, info, warn, error, off", cxxopts::value<std::string>())
        ("log-file", "Also write logs to this file", cxxopts::value<std::string>())
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            std::cout << "Examples:\n\n";
            std::cout << "    mcphub-cli --config servers.json --list-tools\n";
            std::cout << "    mcphub-cli --config servers.json --call files_read_file --tool-args '{\"path\":\"/tmp/x\"}'\n";
            std::cout << "    mcphub-cli -n files -c python -a server.py --unified\n";
            std::cout << "    mcphub-cli --ws localhost:8080/mcp --health\n";
            return 0;
        }

        color::enabled = !result.count("no-color");

        auto config = build_config(result);
        if (!config) {
            print_error(config.error().message);
            return 1;
        }
        if (auto logging = configure_logging(config->logging, result); !logging) {
            print_error(logging.error().message);
            return 1;
        }

        asio::io_context io;
        McpHub hub(io, std::move(*config));

        int exit_code = 1;
        asio::co_spawn(io, run(hub, result), [&exit_code](std::exception_ptr e, int code) {
            if (e) {
                try {
                    std::rethrow_exception(e);
                } catch (const std::exception& ex) {
                    print_error(ex.what());
                }
                return;
            }
            exit_code = code;
        });
        io.run();

        return exit_code;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    }
}
