#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Async Transport Interface
// ═══════════════════════════════════════════════════════════════════════════
// Coroutine-based channel to one MCP server. The set of implementations is
// closed (StdioTransport, SocketTransport, HttpTransport); a Connection owns
// exactly one of them and never needs to know which.
//
// Contract:
// - async_receive() yields messages in arrival order until async_stop() is
//   called or the underlying channel is gone for good.
// - Link changes (process exit, socket drop, socket re-open) are reported
//   through the link listener, always on the transport's executor.

#include "mcphub/transport.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/use_awaitable.hpp>

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace mcphub {

enum class LinkState {
    Up,    // channel (re)established
    Down   // channel lost; in-flight requests will never be answered
};

[[nodiscard]] constexpr std::string_view to_string(LinkState state) noexcept {
    return state == LinkState::Up ? "up" : "down";
}

using LinkListener = std::function<void(LinkState state, const std::string& reason)>;

class IAsyncTransport {
public:
    virtual ~IAsyncTransport() = default;

    /// Get the executor associated with this transport
    [[nodiscard]] virtual asio::any_io_executor get_executor() = 0;

    /// Establish the channel (spawn, connect). Fails with a Network error.
    [[nodiscard]] virtual asio::awaitable<TransportResult<void>> async_start() = 0;

    /// Tear the channel down. Safe to call more than once.
    [[nodiscard]] virtual asio::awaitable<void> async_stop() = 0;

    /// Send one JSON message
    [[nodiscard]] virtual asio::awaitable<TransportResult<void>> async_send(Json message) = 0;

    /// Next incoming message; an error means the receive side is closed
    [[nodiscard]] virtual asio::awaitable<TransportResult<Json>> async_receive() = 0;

    /// True while messages can be sent
    [[nodiscard]] virtual bool is_running() const = 0;

    /// Register the link-state listener (replaces any previous one)
    virtual void on_link_change(LinkListener listener) = 0;
};

}  // namespace mcphub
