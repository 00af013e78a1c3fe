#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Connection
// ═══════════════════════════════════════════════════════════════════════════
// One live session with one MCP server. Composes exactly one transport
// variant with a Correlator and a private id counter; the variant is picked
// once by make_connection() and nothing above this class switches on it.
//
// Lifecycle:
//   Disconnected -> Connecting -> Connected -> Closing -> Disconnected
//
// async_connect() starts the transport and performs the handshake:
//   stdio / socket : initialize + notifications/initialized
//   http           : a single ping
// A link drop fails every pending request with ConnectionClosed. When a
// socket transport re-opens on its own, the handshake is repeated before the
// connection reports Connected again.

#include "mcphub/client/client_error.hpp"
#include "mcphub/client/correlator.hpp"
#include "mcphub/config/hub_config.hpp"
#include "mcphub/protocol/mcp_types.hpp"
#include "mcphub/transport/async_transport.hpp"

#include <asio/awaitable.hpp>
#include <asio/io_context.hpp>
#include <asio/strand.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mcphub {

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Closing
};

[[nodiscard]] constexpr std::string_view to_string(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting:   return "connecting";
        case ConnectionState::Connected:    return "connected";
        case ConnectionState::Closing:      return "closing";
    }
    return "unknown";
}

struct ConnectionOptions {
    std::string server_name;
    TransportKind kind{TransportKind::Stdio};
    Implementation client_info{"mcphub", "0.1.0"};
    std::chrono::milliseconds request_timeout{30'000};
};

class Connection {
public:
    Connection(std::unique_ptr<IAsyncTransport> transport, ConnectionOptions options);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /// Start the transport and run the handshake. Fails with ConnectionError.
    [[nodiscard]] asio::awaitable<ClientResult<void>> async_connect();

    /// Stop the transport and fail pending requests. Idempotent.
    [[nodiscard]] asio::awaitable<void> async_disconnect();

    /// Send a request and await its correlated reply ("result" member).
    /// `timeout` overrides the configured request timeout for this call.
    [[nodiscard]] asio::awaitable<ClientResult<Json>> async_request(
        std::string method,
        Json params = Json::object(),
        std::optional<std::chrono::milliseconds> timeout = std::nullopt
    );

    /// Fire-and-forget notification
    [[nodiscard]] asio::awaitable<ClientResult<void>> async_notify(
        std::string method,
        Json params = Json::object()
    );

    /// Connected and the transport can carry messages
    [[nodiscard]] bool is_active() const;

    [[nodiscard]] ConnectionState state() const noexcept { return state_.load(); }
    [[nodiscard]] const std::string& server_name() const noexcept { return options_.server_name; }
    [[nodiscard]] TransportKind kind() const noexcept { return options_.kind; }

    /// Result of the last initialize handshake (stdio / socket only)
    [[nodiscard]] const std::optional<InitializeResult>& server_info() const noexcept { return server_info_; }

    [[nodiscard]] std::size_t pending_requests() const noexcept { return correlator_.size(); }
    [[nodiscard]] bool has_pending_request(std::uint64_t id) const { return correlator_.contains(id); }

    /// Id the next request will carry
    [[nodiscard]] std::uint64_t peek_next_id() const noexcept { return next_id_; }

    [[nodiscard]] IAsyncTransport& transport() noexcept { return *transport_; }

private:
    asio::awaitable<ClientResult<void>> handshake();
    asio::awaitable<void> rehandshake(std::shared_ptr<bool> alive);
    asio::awaitable<void> message_dispatcher(std::shared_ptr<bool> alive);
    asio::awaitable<void> answer_server_request(const Json& request);

    void handle_link_change(LinkState state, const std::string& reason);
    void set_state(ConnectionState next);

    std::unique_ptr<IAsyncTransport> transport_;
    ConnectionOptions options_;
    asio::strand<asio::any_io_executor> strand_;
    Correlator correlator_;

    std::uint64_t next_id_{1};
    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
    bool dispatcher_running_{false};
    std::optional<InitializeResult> server_info_;

    std::shared_ptr<bool> alive_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Factory
// ─────────────────────────────────────────────────────────────────────────────
// Picks the transport variant for the descriptor. Socket transports drive
// their sockets on `io_context` directly; the others only use its executor.

[[nodiscard]] std::unique_ptr<Connection> make_connection(
    asio::io_context& io_context,
    const ServerDescriptor& descriptor,
    const Implementation& client_info
);

}  // namespace mcphub
