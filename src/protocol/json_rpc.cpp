#include "mcphub/protocol/json_rpc.hpp"

namespace mcphub {

namespace {

Json envelope() {
    return Json{{"jsonrpc", kJsonRpcVersion}};
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Builders
// ─────────────────────────────────────────────────────────────────────────────

Json make_request(std::uint64_t id, std::string_view method, Json params) {
    Json message = make_notification(method, std::move(params));
    message["id"] = id;
    return message;
}

Json make_notification(std::string_view method, Json params) {
    Json message = envelope();
    message["method"] = method;
    if (params.is_null() == false) {
        message["params"] = std::move(params);
    }
    return message;
}

Json make_result_reply(const Json& id, Json result) {
    Json message = envelope();
    message["id"] = id;
    message["result"] = std::move(result);
    return message;
}

Json make_error_reply(const Json& id, const JsonRpcError& error) {
    Json message = envelope();
    message["id"] = id;
    message["error"] = error.to_json();
    return message;
}

// ─────────────────────────────────────────────────────────────────────────────
// Errors
// ─────────────────────────────────────────────────────────────────────────────

Json JsonRpcError::to_json() const {
    Json payload = {{"code", code}, {"message", message}};
    if (data) {
        payload["data"] = *data;
    }
    return payload;
}

// A server that sends a bare string (or anything else) as its error still
// produces a readable message
JsonRpcError JsonRpcError::from_json(const Json& payload) {
    if (payload.is_object() == false) {
        return JsonRpcError{
            ErrorCode::InternalError,
            payload.is_string() ? payload.get<std::string>() : payload.dump(),
            std::nullopt
        };
    }

    JsonRpcError error;
    if (auto it = payload.find("code"); it != payload.end() && it->is_number_integer()) {
        error.code = it->get<std::int64_t>();
    }
    if (auto it = payload.find("message"); it != payload.end() && it->is_string()) {
        error.message = it->get<std::string>();
    }
    if (auto it = payload.find("data"); it != payload.end()) {
        error.data = *it;
    }
    return error;
}

// ─────────────────────────────────────────────────────────────────────────────
// Classification
// ─────────────────────────────────────────────────────────────────────────────

MessageKind classify_message(const Json& message) {
    if (message.is_object() == false) {
        return MessageKind::Invalid;
    }

    const auto id = message.find("id");
    const auto name = message.find("method");
    const bool has_id = id != message.end() && id->is_null() == false;
    const bool has_method = name != message.end() && name->is_string();

    if (has_method) {
        return has_id ? MessageKind::Request : MessageKind::Notification;
    }
    return has_id ? MessageKind::Response : MessageKind::Invalid;
}

std::optional<std::uint64_t> response_id(const Json& message) {
    if (message.is_object() == false) {
        return std::nullopt;
    }
    const auto it = message.find("id");
    if (it == message.end()) {
        return std::nullopt;
    }
    if (it->is_number_unsigned()) {
        return it->get<std::uint64_t>();
    }
    if (it->is_number_integer() && it->get<std::int64_t>() >= 0) {
        return static_cast<std::uint64_t>(it->get<std::int64_t>());
    }
    return std::nullopt;
}

}  // namespace mcphub
