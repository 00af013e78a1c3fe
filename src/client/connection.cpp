#include "mcphub/client/connection.hpp"
#include "mcphub/log/logger.hpp"
#include "mcphub/protocol/json_rpc.hpp"
#include "mcphub/transport/http_transport.hpp"
#include "mcphub/transport/socket_transport.hpp"
#include "mcphub/transport/stdio_transport.hpp"

#include <asio/bind_executor.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/dispatch.hpp>
#include <asio/use_awaitable.hpp>

namespace mcphub {

namespace {

constexpr const char* kCategory = "MCP";

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════════════

Connection::Connection(std::unique_ptr<IAsyncTransport> transport, ConnectionOptions options)
    : transport_(std::move(transport))
    , options_(std::move(options))
    , strand_(asio::make_strand(transport_->get_executor()))
    , correlator_(strand_)
    , alive_(std::make_shared<bool>(true))
{
    // Link events arrive on the transport's executor; hop onto our strand and
    // drop them once this Connection is gone
    transport_->on_link_change([this, alive = alive_](LinkState link, const std::string& reason) {
        asio::dispatch(strand_, [this, alive, link, reason]() {
            if (*alive) {
                handle_link_change(link, reason);
            }
        });
    });
}

Connection::~Connection() {
    *alive_ = false;
    transport_->on_link_change(nullptr);
    correlator_.fail_all(ClientError::connection_closed(
        "Connection to '" + options_.server_name + "' destroyed"));
}

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<ClientResult<void>> Connection::async_connect() {
    co_await asio::dispatch(asio::bind_executor(strand_, asio::use_awaitable));

    const auto current = state_.load();
    if (current == ConnectionState::Connected) {
        co_return ClientResult<void>{};
    }
    if (current == ConnectionState::Connecting || current == ConnectionState::Closing) {
        co_return tl::unexpected(ClientError::connection_error(
            "Connection to '" + options_.server_name + "' is " + std::string(to_string(current))));
    }

    set_state(ConnectionState::Connecting);
    MCPHUB_LOG_INFO(kCategory, "Connecting to server", {
        {"server", options_.server_name},
        {"transport", std::string(to_string(options_.kind))}
    });

    auto started = co_await transport_->async_start();
    if (!started) {
        set_state(ConnectionState::Disconnected);
        MCPHUB_LOG_FAILURE(kCategory, "Failed to connect to server", started.error().message,
                           {{"server", options_.server_name}});
        co_return tl::unexpected(ClientError::connection_error(
            "Failed to connect to server '" + options_.server_name + "': " + started.error().message));
    }

    if (dispatcher_running_ == false) {
        dispatcher_running_ = true;
        asio::co_spawn(strand_, message_dispatcher(alive_), asio::detached);
    }

    auto handshaken = co_await handshake();
    if (!handshaken) {
        MCPHUB_LOG_FAILURE(kCategory, "Handshake failed", handshaken.error().message,
                           {{"server", options_.server_name}});
        set_state(ConnectionState::Closing);
        co_await transport_->async_stop();
        correlator_.fail_all(ClientError::connection_closed());
        set_state(ConnectionState::Disconnected);
        co_return tl::unexpected(ClientError::connection_error(
            "Handshake with server '" + options_.server_name + "' failed: " + handshaken.error().message));
    }

    set_state(ConnectionState::Connected);
    MCPHUB_LOG_INFO(kCategory, "Connected to server", {{"server", options_.server_name}});
    co_return ClientResult<void>{};
}

asio::awaitable<void> Connection::async_disconnect() {
    co_await asio::dispatch(asio::bind_executor(strand_, asio::use_awaitable));

    const auto current = state_.load();
    if (current == ConnectionState::Closing) {
        co_return;
    }

    set_state(ConnectionState::Closing);
    co_await transport_->async_stop();

    const auto failed = correlator_.fail_all(ClientError::connection_closed(
        "Connection to '" + options_.server_name + "' closed"));
    set_state(ConnectionState::Disconnected);

    if (current != ConnectionState::Disconnected || failed > 0) {
        MCPHUB_LOG_INFO(kCategory, "Disconnected from server", {
            {"server", options_.server_name},
            {"failedRequests", failed}
        });
    }
}

bool Connection::is_active() const {
    return state_.load() == ConnectionState::Connected && transport_->is_running();
}

// ═══════════════════════════════════════════════════════════════════════════
// Requests
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<ClientResult<Json>> Connection::async_request(
    std::string method,
    Json params,
    std::optional<std::chrono::milliseconds> timeout
) {
    co_await asio::dispatch(asio::bind_executor(strand_, asio::use_awaitable));

    const auto current = state_.load();
    const bool can_send = (current == ConnectionState::Connected || current == ConnectionState::Connecting)
        && transport_->is_running();
    if (can_send == false) {
        co_return tl::unexpected(ClientError::connection_error(
            "Server '" + options_.server_name + "' is not connected"));
    }

    const std::uint64_t id = next_id_++;
    const auto deadline = timeout.value_or(options_.request_timeout);
    auto channel = correlator_.register_request(id, method, deadline);

    MCPHUB_LOG_TRACE(kCategory, "Sending request", {
        {"server", options_.server_name},
        {"id", id},
        {"method", method}
    });

    auto sent = co_await transport_->async_send(make_request(id, method, std::move(params)));
    if (!sent) {
        correlator_.cancel(id);
        co_return tl::unexpected(ClientError::from_transport_error(sent.error()));
    }

    // The channel copy keeps it alive even after the entry is erased
    co_return co_await Correlator::await(std::move(channel));
}

asio::awaitable<ClientResult<void>> Connection::async_notify(std::string method, Json params) {
    co_await asio::dispatch(asio::bind_executor(strand_, asio::use_awaitable));

    if (transport_->is_running() == false) {
        co_return tl::unexpected(ClientError::connection_error(
            "Server '" + options_.server_name + "' is not connected"));
    }

    auto sent = co_await transport_->async_send(make_notification(method, std::move(params)));
    if (!sent) {
        co_return tl::unexpected(ClientError::from_transport_error(sent.error()));
    }
    co_return ClientResult<void>{};
}

// ═══════════════════════════════════════════════════════════════════════════
// Internal: Handshake
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<ClientResult<void>> Connection::handshake() {
    if (options_.kind == TransportKind::Http) {
        auto pong = co_await async_request(method::Ping, Json::object());
        if (!pong) {
            co_return tl::unexpected(pong.error());
        }
        co_return ClientResult<void>{};
    }

    InitializeParams params;
    params.client_info = options_.client_info;

    auto reply = co_await async_request(method::Initialize, params.to_json());
    if (!reply) {
        co_return tl::unexpected(reply.error());
    }

    server_info_ = InitializeResult::from_json(*reply);
    MCPHUB_LOG_DEBUG(kCategory, "Server initialized", {
        {"server", options_.server_name},
        {"protocolVersion", server_info_->protocol_version},
        {"serverName", server_info_->server_info.name},
        {"serverVersion", server_info_->server_info.version},
        {"advertisesTools", server_info_->advertises_tools()}
    });

    auto notified = co_await async_notify(method::Initialized);
    if (!notified) {
        co_return tl::unexpected(notified.error());
    }
    co_return ClientResult<void>{};
}

asio::awaitable<void> Connection::rehandshake(std::shared_ptr<bool> alive) {
    auto handshaken = co_await handshake();
    if (*alive == false || state_.load() != ConnectionState::Connecting) {
        co_return;
    }

    if (!handshaken) {
        MCPHUB_LOG_FAILURE(kCategory, "Handshake after reconnect failed", handshaken.error().message,
                           {{"server", options_.server_name}});
        set_state(ConnectionState::Disconnected);
        co_return;
    }

    set_state(ConnectionState::Connected);
    MCPHUB_LOG_INFO(kCategory, "Reconnected to server", {{"server", options_.server_name}});
}

// ═══════════════════════════════════════════════════════════════════════════
// Internal: Link State
// ═══════════════════════════════════════════════════════════════════════════

void Connection::handle_link_change(LinkState link, const std::string& reason) {
    const auto current = state_.load();
    if (current == ConnectionState::Closing) {
        return;
    }

    if (link == LinkState::Down) {
        const auto failed = correlator_.fail_all(ClientError::connection_closed(
            "Connection to '" + options_.server_name + "' lost: " + reason));
        set_state(ConnectionState::Disconnected);
        MCPHUB_LOG_WARN(kCategory, "Connection lost", {
            {"server", options_.server_name},
            {"reason", reason},
            {"failedRequests", failed}
        });
        return;
    }

    // Up: only a self-healing transport re-opens on its own
    if (current == ConnectionState::Disconnected) {
        set_state(ConnectionState::Connecting);
        asio::co_spawn(strand_, rehandshake(alive_), asio::detached);
    }
}

void Connection::set_state(ConnectionState next) {
    const auto previous = state_.exchange(next);
    if (previous != next) {
        MCPHUB_LOG_TRACE(kCategory, "Connection state changed", {
            {"server", options_.server_name},
            {"from", std::string(to_string(previous))},
            {"to", std::string(to_string(next))}
        });
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Internal: Message Dispatcher
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<void> Connection::message_dispatcher(std::shared_ptr<bool> alive) {
    for (;;) {
        auto received = co_await transport_->async_receive();
        if (*alive == false) {
            co_return;
        }
        if (!received) {
            MCPHUB_LOG_DEBUG(kCategory, "Receive loop finished", {
                {"server", options_.server_name},
                {"reason", received.error().message}
            });
            break;
        }

        const Json& message = *received;
        switch (classify_message(message)) {
            case MessageKind::Response: {
                const auto id = response_id(message);
                if (!id) {
                    MCPHUB_LOG_WARN(kCategory, "Ignoring reply with foreign id", {
                        {"server", options_.server_name},
                        {"id", message["id"]}
                    });
                    break;
                }

                Correlator::Outcome outcome;
                if (message.contains("error") && message["error"].is_null() == false) {
                    outcome = tl::unexpected(ClientError::from_rpc_error(
                        JsonRpcError::from_json(message["error"])));
                } else {
                    outcome = message.contains("result") ? message["result"] : Json::object();
                }

                if (correlator_.resolve(*id, std::move(outcome)) == false) {
                    MCPHUB_LOG_DEBUG(kCategory, "Reply for unknown or expired request", {
                        {"server", options_.server_name},
                        {"id", *id}
                    });
                }
                break;
            }

            case MessageKind::Request:
                co_await answer_server_request(message);
                if (*alive == false) {
                    co_return;
                }
                break;

            case MessageKind::Notification:
                MCPHUB_LOG_DEBUG(kCategory, "Server notification", {
                    {"server", options_.server_name},
                    {"method", message.value("method", "")}
                });
                break;

            case MessageKind::Invalid:
                MCPHUB_LOG_WARN(kCategory, "Ignoring malformed message", {
                    {"server", options_.server_name}
                });
                break;
        }
    }
    dispatcher_running_ = false;
}

asio::awaitable<void> Connection::answer_server_request(const Json& request) {
    const std::string requested = request.value("method", "");

    Json reply = (requested == method::Ping)
        ? make_result_reply(request["id"], Json::object())
        : make_error_reply(request["id"], JsonRpcError{
              ErrorCode::MethodNotFound, "Method not supported by client: " + requested, std::nullopt});

    auto sent = co_await transport_->async_send(std::move(reply));
    if (!sent) {
        MCPHUB_LOG_WARN(kCategory, "Failed to answer server request", {
            {"server", options_.server_name},
            {"method", requested},
            {"error", sent.error().message}
        });
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Factory
// ═══════════════════════════════════════════════════════════════════════════

std::unique_ptr<Connection> make_connection(
    asio::io_context& io_context,
    const ServerDescriptor& descriptor,
    const Implementation& client_info
) {
    std::unique_ptr<IAsyncTransport> transport;

    switch (descriptor.kind) {
        case TransportKind::Stdio: {
            StdioTransportConfig config;
            config.command = descriptor.stdio.command;
            config.args = descriptor.stdio.args;
            config.env = descriptor.stdio.env;
            config.server_name = descriptor.name;
            transport = std::make_unique<StdioTransport>(io_context.get_executor(), std::move(config));
            break;
        }

        case TransportKind::Socket: {
            SocketTransportConfig config;
            config.url = descriptor.endpoint_url();
            config.connect_timeout = descriptor.connect_timeout;
            config.max_reconnect_attempts = descriptor.max_reconnect_attempts;
            config.reconnect_base_delay = descriptor.reconnect_base_delay;
            config.server_name = descriptor.name;
            transport = std::make_unique<SocketTransport>(io_context, std::move(config));
            break;
        }

        case TransportKind::Http: {
            HttpTransportConfig config;
            config.url = descriptor.endpoint_url();
            config.headers = descriptor.endpoint.headers;
            config.user_agent = client_info.name + "/" + client_info.version;
            config.connect_timeout = descriptor.connect_timeout;
            config.request_timeout = descriptor.request_timeout;
            config.server_name = descriptor.name;
            transport = std::make_unique<HttpTransport>(io_context.get_executor(), std::move(config));
            break;
        }
    }

    ConnectionOptions options;
    options.server_name = descriptor.name;
    options.kind = descriptor.kind;
    options.client_info = client_info;
    options.request_timeout = descriptor.request_timeout;
    return std::make_unique<Connection>(std::move(transport), std::move(options));
}

}  // namespace mcphub
