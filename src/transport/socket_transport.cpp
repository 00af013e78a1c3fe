#include "mcphub/transport/socket_transport.hpp"
#include "mcphub/log/logger.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>

namespace mcphub {

namespace {

constexpr const char* kCategory = "transport";

TransportError make_error(TransportError::Category cat, const std::string& msg) {
    return TransportError{cat, msg, std::nullopt};
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════════════

SocketTransport::SocketTransport(asio::io_context& io_context, SocketTransportConfig config)
    : config_(std::move(config))
    , io_context_(io_context)
    , connect_timer_(io_context)
    , reconnect_timer_(io_context)
    , backoff_(config_.reconnect_base_delay, config_.max_reconnect_attempts)
{
    client_.clear_access_channels(websocketpp::log::alevel::all);
    client_.clear_error_channels(websocketpp::log::elevel::all);
    client_.set_max_message_size(config_.max_message_size);
    client_.set_open_handshake_timeout(static_cast<long>(config_.connect_timeout.count()));

    websocketpp::lib::error_code ec;
    client_.init_asio(&io_context_, ec);
    if (ec) {
        MCPHUB_LOG_FAILURE(kCategory, "WebSocket client initialization failed", ec.message(),
                           {{"server", config_.server_name}});
    }
}

SocketTransport::~SocketTransport() {
    started_ = false;
    connect_timer_.cancel();
    reconnect_timer_.cancel();
    abandon_attempt();

    if (link_up_) {
        websocketpp::lib::error_code ec;
        client_.close(handle_, websocketpp::close::status::going_away, "client destroyed", ec);
        link_up_ = false;
    }
    if (message_channel_) {
        message_channel_->close();
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// IAsyncTransport Interface
// ═══════════════════════════════════════════════════════════════════════════

asio::any_io_executor SocketTransport::get_executor() {
    return io_context_.get_executor();
}

asio::awaitable<TransportResult<void>> SocketTransport::async_start() {
    if (started_) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Protocol,
            "Transport already running"
        ));
    }

    if (!message_channel_) {
        message_channel_ = std::make_shared<MessageChannel>(
            io_context_.get_executor(), config_.channel_capacity);
    }

    started_ = true;
    backoff_.reset();

    auto signal = std::make_shared<OpenSignal>(io_context_.get_executor(), 1);
    open_signal_ = signal;
    open_connection();

    TransportResult<void> outcome;
    try {
        outcome = co_await signal->async_receive(asio::use_awaitable);
    } catch (const std::system_error& e) {
        outcome = tl::unexpected(make_error(
            TransportError::Category::Network,
            "WebSocket open aborted: " + std::string(e.what())
        ));
    }
    co_return outcome;
}

asio::awaitable<void> SocketTransport::async_stop() {
    const bool was_started = started_;
    started_ = false;

    connect_timer_.cancel();
    reconnect_timer_.cancel();
    reconnect_pending_ = false;

    finish_open_attempt(tl::unexpected(make_error(
        TransportError::Category::Network,
        "Transport stopped"
    )));

    abandon_attempt();
    if (link_up_) {
        websocketpp::lib::error_code ec;
        client_.close(handle_, websocketpp::close::status::normal, "client shutdown", ec);
        if (ec) {
            MCPHUB_LOG_DEBUG(kCategory, "WebSocket close failed", {
                {"server", config_.server_name},
                {"error", ec.message()}
            });
        }
        link_up_ = false;
    }
    ++generation_;

    if (message_channel_) {
        message_channel_->close();
        message_channel_.reset();
    }

    if (was_started) {
        MCPHUB_LOG_INFO(kCategory, "WebSocket transport stopped", {{"server", config_.server_name}});
    }
    co_return;
}

asio::awaitable<TransportResult<void>> SocketTransport::async_send(Json message) {
    if (!link_up_) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Network,
            "WebSocket not connected"
        ));
    }

    websocketpp::lib::error_code ec;
    client_.send(handle_, message.dump(), websocketpp::frame::opcode::text, ec);
    if (ec) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Network,
            "WebSocket send failed: " + ec.message()
        ));
    }
    co_return TransportResult<void>{};
}

asio::awaitable<TransportResult<Json>> SocketTransport::async_receive() {
    auto channel = message_channel_;
    if (!channel) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Network,
            "Transport not running"
        ));
    }

    try {
        auto result = co_await channel->async_receive(asio::use_awaitable);
        co_return result;
    } catch (const std::system_error& e) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Network,
            "Receive failed: " + std::string(e.what())
        ));
    }
}

bool SocketTransport::is_running() const {
    return link_up_;
}

void SocketTransport::on_link_change(LinkListener listener) {
    link_listener_ = std::move(listener);
}

void SocketTransport::on_reconnect_scheduled(ReconnectObserver observer) {
    reconnect_observer_ = std::move(observer);
}

// ═══════════════════════════════════════════════════════════════════════════
// Internal: Connection Attempts
// ═══════════════════════════════════════════════════════════════════════════

void SocketTransport::open_connection() {
    const std::uint64_t generation = ++generation_;

    websocketpp::lib::error_code ec;
    auto con = client_.get_connection(config_.url, ec);
    if (ec) {
        // A malformed URL never heals, so no reconnect is scheduled
        MCPHUB_LOG_FAILURE(kCategory, "Invalid WebSocket endpoint", ec.message(), {
            {"server", config_.server_name},
            {"url", config_.url}
        });
        finish_open_attempt(tl::unexpected(make_error(
            TransportError::Category::Network,
            "Invalid WebSocket endpoint " + config_.url + ": " + ec.message()
        )));
        return;
    }

    con->set_open_handler([this, generation](websocketpp::connection_hdl) {
        handle_open(generation);
    });
    con->set_fail_handler([this, generation](websocketpp::connection_hdl) {
        handle_fail(generation);
    });
    con->set_close_handler([this, generation](websocketpp::connection_hdl) {
        handle_close(generation);
    });
    con->set_message_handler([this, generation](websocketpp::connection_hdl, WsClient::message_ptr msg) {
        handle_message(generation, std::move(msg));
    });

    connection_ = con;
    handle_ = con->get_handle();

    connect_timer_.expires_after(config_.connect_timeout);
    connect_timer_.async_wait([this, generation](const asio::error_code& timer_ec) {
        if (timer_ec || generation != generation_) {
            return;
        }
        const std::string reason = "WebSocket connect timed out after "
            + std::to_string(config_.connect_timeout.count()) + "ms";
        MCPHUB_LOG_WARN(kCategory, reason, {{"server", config_.server_name}});

        abandon_attempt();
        ++generation_;
        finish_open_attempt(tl::unexpected(make_error(TransportError::Category::Network, reason)));
        link_lost(reason);
        schedule_reconnect();
    });

    MCPHUB_LOG_DEBUG(kCategory, "Opening WebSocket", {
        {"server", config_.server_name},
        {"url", config_.url},
        {"attempt", backoff_.attempts() + 1}
    });
    client_.connect(con);
}

void SocketTransport::abandon_attempt() {
    detach_handlers();
    if (!connection_ || link_up_) {
        return;
    }
    // Still dialing or mid-handshake: close the socket so a late TCP connect
    // cannot finish the handshake behind our back
    asio::error_code ec;
    connection_->get_raw_socket().close(ec);
    if (ec) {
        MCPHUB_LOG_DEBUG(kCategory, "Closing abandoned WebSocket attempt failed", {
            {"server", config_.server_name},
            {"error", ec.message()}
        });
    }
    connection_.reset();
}

void SocketTransport::detach_handlers() {
    if (!connection_) {
        return;
    }
    connection_->set_open_handler(nullptr);
    connection_->set_fail_handler(nullptr);
    connection_->set_close_handler(nullptr);
    connection_->set_message_handler(nullptr);
}

void SocketTransport::handle_open(std::uint64_t generation) {
    if (generation != generation_) {
        return;
    }
    connect_timer_.cancel();

    link_up_ = true;
    backoff_.reset();

    MCPHUB_LOG_INFO(kCategory, "WebSocket connected", {
        {"server", config_.server_name},
        {"url", config_.url}
    });

    if (open_signal_) {
        finish_open_attempt(TransportResult<void>{});
    } else {
        notify_link(LinkState::Up, "reconnected");
    }
}

void SocketTransport::handle_fail(std::uint64_t generation) {
    if (generation != generation_) {
        return;
    }
    connect_timer_.cancel();

    const std::string reason = "WebSocket connection failed: " + connection_->get_ec().message();
    MCPHUB_LOG_WARN(kCategory, reason, {
        {"server", config_.server_name},
        {"url", config_.url}
    });

    finish_open_attempt(tl::unexpected(make_error(TransportError::Category::Network, reason)));
    link_lost(reason);
    schedule_reconnect();
}

void SocketTransport::handle_close(std::uint64_t generation) {
    if (generation != generation_) {
        return;
    }

    std::string reason = "WebSocket closed (code "
        + std::to_string(connection_->get_remote_close_code()) + ")";
    const auto& remote_reason = connection_->get_remote_close_reason();
    if (remote_reason.empty() == false) {
        reason += ": " + remote_reason;
    }
    MCPHUB_LOG_WARN(kCategory, reason, {{"server", config_.server_name}});

    link_lost(reason);
    schedule_reconnect();
}

void SocketTransport::handle_message(std::uint64_t generation, WsClient::message_ptr msg) {
    if (generation != generation_ || !msg) {
        return;
    }

    Json message;
    try {
        message = Json::parse(msg->get_payload());
    } catch (const Json::parse_error& e) {
        MCPHUB_LOG_WARN(kCategory, "Dropping unparsable WebSocket frame", {
            {"server", config_.server_name},
            {"error", e.what()}
        });
        return;
    }

    auto channel = message_channel_;
    if (!channel) {
        return;
    }

    // Spawned sends are queued in posting order, so frames stay ordered
    asio::co_spawn(io_context_,
        [channel, message = std::move(message)]() mutable -> asio::awaitable<void> {
            try {
                co_await channel->async_send(
                    asio::error_code{},
                    TransportResult<Json>{std::move(message)},
                    asio::use_awaitable
                );
            } catch (const std::system_error&) {
                // Channel closed by async_stop; the frame has no reader left
            }
        },
        asio::detached);
}

// ═══════════════════════════════════════════════════════════════════════════
// Internal: Link State / Reconnection
// ═══════════════════════════════════════════════════════════════════════════

void SocketTransport::finish_open_attempt(TransportResult<void> outcome) {
    if (!open_signal_) {
        return;
    }
    auto signal = std::move(open_signal_);
    open_signal_.reset();
    signal->try_send(asio::error_code{}, std::move(outcome));
}

void SocketTransport::link_lost(const std::string& reason) {
    if (link_up_ == false) {
        return;
    }
    link_up_ = false;
    notify_link(LinkState::Down, reason);
}

void SocketTransport::schedule_reconnect() {
    if (!started_ || reconnect_pending_) {
        return;
    }

    const auto next = backoff_.next();
    if (!next) {
        MCPHUB_LOG_WARN(kCategory, "Giving up on WebSocket reconnection", {
            {"server", config_.server_name},
            {"attempts", backoff_.attempts()}
        });
        return;
    }

    const auto delay = *next;
    const auto attempt = backoff_.attempts();
    reconnect_pending_ = true;

    MCPHUB_LOG_INFO(kCategory, "Scheduling WebSocket reconnect", {
        {"server", config_.server_name},
        {"attempt", attempt},
        {"maxAttempts", backoff_.max_attempts()},
        {"delayMs", delay.count()}
    });
    if (reconnect_observer_) {
        reconnect_observer_(attempt, delay);
    }

    reconnect_timer_.expires_after(delay);
    reconnect_timer_.async_wait([this](const asio::error_code& ec) {
        if (ec) {
            return;
        }
        reconnect_pending_ = false;
        if (started_) {
            open_connection();
        }
    });
}

void SocketTransport::notify_link(LinkState state, const std::string& reason) {
    if (link_listener_) {
        link_listener_(state, reason);
    }
}

}  // namespace mcphub
