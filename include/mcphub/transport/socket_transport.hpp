#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Socket Transport
// ═══════════════════════════════════════════════════════════════════════════
// Persistent WebSocket (websocketpp on standalone asio), one JSON text frame
// per message. This is the only transport that heals itself:
//
//   open ok        -> LinkState::Up (after a reconnect), attempt counter = 0
//   fail / close   -> LinkState::Down, then reconnect after
//                     base * 2^(attempt-1): 1s, 2s, 4s, 8s, ...
//   attempts spent -> stays down until async_stop()/async_start()
//
// The receive channel survives reconnects, so one async_receive() loop
// serves the whole lifetime of the transport.

#include "mcphub/transport/async_transport.hpp"
#include "mcphub/transport/backoff_policy.hpp"

#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_no_tls_client.hpp>

#include <asio/experimental/channel.hpp>
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace mcphub {

struct SocketTransportConfig {
    /// ws://host:port/path
    std::string url;

    /// Bounds one open attempt (TCP connect + WebSocket handshake)
    std::chrono::milliseconds connect_timeout{10'000};

    /// 0 disables automatic reconnection
    std::size_t max_reconnect_attempts{5};
    std::chrono::milliseconds reconnect_base_delay{1'000};

    /// Server name, used only to label log records
    std::string server_name;

    std::size_t max_message_size{1 << 20};
    std::size_t channel_capacity{64};
};

class SocketTransport : public IAsyncTransport {
public:
    /// Observes each scheduled reconnect: 1-based attempt and its delay
    using ReconnectObserver = std::function<void(std::size_t attempt, std::chrono::milliseconds delay)>;

    /// websocketpp drives its sockets on this io_context
    SocketTransport(asio::io_context& io_context, SocketTransportConfig config);
    ~SocketTransport() override;

    SocketTransport(const SocketTransport&) = delete;
    SocketTransport& operator=(const SocketTransport&) = delete;
    SocketTransport(SocketTransport&&) = delete;
    SocketTransport& operator=(SocketTransport&&) = delete;

    [[nodiscard]] asio::any_io_executor get_executor() override;
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_start() override;
    [[nodiscard]] asio::awaitable<void> async_stop() override;
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_send(Json message) override;
    [[nodiscard]] asio::awaitable<TransportResult<Json>> async_receive() override;
    [[nodiscard]] bool is_running() const override;
    void on_link_change(LinkListener listener) override;

    void on_reconnect_scheduled(ReconnectObserver observer);

    /// Reconnects scheduled since the last successful open
    [[nodiscard]] std::size_t reconnect_attempts() const noexcept { return backoff_.attempts(); }

    /// True while a reconnect timer is armed
    [[nodiscard]] bool reconnect_pending() const noexcept { return reconnect_pending_; }

private:
    using WsClient = websocketpp::client<websocketpp::config::asio_client>;
    using MessageChannel = asio::experimental::channel<
        void(asio::error_code, TransportResult<Json>)
    >;
    using OpenSignal = asio::experimental::channel<
        void(asio::error_code, TransportResult<void>)
    >;

    // Starts one open attempt; its handlers carry the attempt's generation so
    // callbacks from a superseded attempt are ignored
    void open_connection();
    void detach_handlers();
    // Detach the current attempt and close its socket unless it is open
    void abandon_attempt();

    void handle_open(std::uint64_t generation);
    void handle_fail(std::uint64_t generation);
    void handle_close(std::uint64_t generation);
    void handle_message(std::uint64_t generation, WsClient::message_ptr msg);

    void finish_open_attempt(TransportResult<void> outcome);
    void link_lost(const std::string& reason);
    void schedule_reconnect();
    void notify_link(LinkState state, const std::string& reason);

    SocketTransportConfig config_;
    asio::io_context& io_context_;

    WsClient client_;
    websocketpp::connection_hdl handle_;
    WsClient::connection_ptr connection_;
    std::uint64_t generation_{0};

    std::shared_ptr<MessageChannel> message_channel_;
    std::shared_ptr<OpenSignal> open_signal_;  // set while async_start waits
    asio::steady_timer connect_timer_;
    asio::steady_timer reconnect_timer_;

    ReconnectBackoff backoff_;
    bool reconnect_pending_{false};

    bool started_{false};   // between async_start and async_stop
    bool link_up_{false};

    LinkListener link_listener_;
    ReconnectObserver reconnect_observer_;
};

}  // namespace mcphub
