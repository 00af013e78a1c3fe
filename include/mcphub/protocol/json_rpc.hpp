#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mcphub {

using Json = nlohmann::json;

inline constexpr std::string_view kJsonRpcVersion{"2.0"};

// ─────────────────────────────────────────────────────────────────────────────
// Error object carried in the "error" member of a reply
// ─────────────────────────────────────────────────────────────────────────────

struct JsonRpcError {
    std::int64_t code{};
    std::string message;
    std::optional<Json> data{};

    [[nodiscard]] Json to_json() const;
    static JsonRpcError from_json(const Json& payload);
};

// ─────────────────────────────────────────────────────────────────────────────
// Outgoing envelopes
// ─────────────────────────────────────────────────────────────────────────────
// The hub only ever originates requests and notifications, and answers the
// few requests a server may send back (ping).

/// {"jsonrpc", "id", "method"[, "params"]}; a null params is omitted
[[nodiscard]] Json make_request(std::uint64_t id, std::string_view method, Json params = nullptr);

/// Same as make_request without an id
[[nodiscard]] Json make_notification(std::string_view method, Json params = nullptr);

/// Replies echo the server's id verbatim, whatever its type
[[nodiscard]] Json make_result_reply(const Json& id, Json result);
[[nodiscard]] Json make_error_reply(const Json& id, const JsonRpcError& error);

// Standard JSON-RPC error codes
namespace ErrorCode {
    inline constexpr int ParseError = -32700;
    inline constexpr int InvalidRequest = -32600;
    inline constexpr int MethodNotFound = -32601;
    inline constexpr int InvalidParams = -32602;
    inline constexpr int InternalError = -32603;
}

// ─────────────────────────────────────────────────────────────────────────────
// Incoming message classification
// ─────────────────────────────────────────────────────────────────────────────
// - Request:      has "method" AND a non-null "id"
// - Notification: has "method" but no "id"
// - Response:     has a non-null "id" but no "method"

enum class MessageKind {
    Request,
    Notification,
    Response,
    Invalid
};

[[nodiscard]] MessageKind classify_message(const Json& message);

/// Correlation id of a response. Only non-negative integer ids are ours.
[[nodiscard]] std::optional<std::uint64_t> response_id(const Json& message);

}  // namespace mcphub
