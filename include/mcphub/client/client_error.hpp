#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Client Error
// ═══════════════════════════════════════════════════════════════════════════
// Error type shared by Connection, Correlator and McpHub. Health check
// failures never surface here; they are recorded in HealthRecord::last_error.

#include "mcphub/protocol/json_rpc.hpp"
#include "mcphub/transport.hpp"

#include <tl/expected.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace mcphub {

/// Error codes for client operations
enum class ClientErrorCode {
    ConnectionError,   ///< Transport could not be established or was lost
    ConnectionClosed,  ///< Link dropped while the request was pending
    Timeout,           ///< No correlated reply within the deadline
    ProtocolError,     ///< Malformed payload or populated JSON-RPC error
    ToolNotFound,      ///< Unknown server or undecodable composite name
    InvalidConfig      ///< Server descriptor failed validation
};

[[nodiscard]] constexpr std::string_view to_string(ClientErrorCode code) noexcept {
    switch (code) {
        case ClientErrorCode::ConnectionError:  return "ConnectionError";
        case ClientErrorCode::ConnectionClosed: return "ConnectionClosed";
        case ClientErrorCode::Timeout:          return "Timeout";
        case ClientErrorCode::ProtocolError:    return "ProtocolError";
        case ClientErrorCode::ToolNotFound:     return "ToolNotFound";
        case ClientErrorCode::InvalidConfig:    return "InvalidConfig";
    }
    return "Unknown";
}

struct ClientError {
    ClientErrorCode code;
    std::string message;
    std::optional<JsonRpcError> rpc_error;  ///< Error object as the server sent it

    /// ConnectionClosed is a ConnectionError raised for in-flight requests
    [[nodiscard]] bool is_connection_error() const noexcept {
        return code == ClientErrorCode::ConnectionError
            || code == ClientErrorCode::ConnectionClosed;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Factory Methods
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] static ClientError connection_error(std::string msg) {
        return {ClientErrorCode::ConnectionError, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError connection_closed(std::string msg = "Connection closed") {
        return {ClientErrorCode::ConnectionClosed, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError timeout_error() {
        return {ClientErrorCode::Timeout, "Request timed out", std::nullopt};
    }

    [[nodiscard]] static ClientError timeout(std::string msg) {
        return {ClientErrorCode::Timeout, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError protocol_error(std::string msg) {
        return {ClientErrorCode::ProtocolError, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError tool_not_found(std::string msg) {
        return {ClientErrorCode::ToolNotFound, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError invalid_config(std::string msg) {
        return {ClientErrorCode::InvalidConfig, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError from_rpc_error(const JsonRpcError& err) {
        return {ClientErrorCode::ProtocolError, err.message, err};
    }

    [[nodiscard]] static ClientError from_transport_error(const TransportError& err) {
        switch (err.category) {
            case TransportError::Category::Timeout:
                return timeout(err.message);
            case TransportError::Category::Protocol:
                return protocol_error(err.message);
            case TransportError::Category::Network:
                return connection_error(err.message);
        }
        return connection_error(err.message);
    }
};

/// Result type for client operations
template <typename T>
using ClientResult = tl::expected<T, ClientError>;

}  // namespace mcphub
