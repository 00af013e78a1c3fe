#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Transport Vocabulary
// ═══════════════════════════════════════════════════════════════════════════
// The JSON value, header map and error shape that every link to a server
// speaks, whichever kind of link it is:
//
//   child process over pipes   mcphub/transport/stdio_transport.hpp
//   WebSocket                  mcphub/transport/socket_transport.hpp
//   HTTP POST per message      mcphub/transport/http_transport.hpp

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <optional>
#include <string>
#include <unordered_map>

namespace mcphub {

using Json = nlohmann::json;
using HeaderMap = std::unordered_map<std::string, std::string>;

/// Why a link failed. status_code is set only for HTTP replies.
struct TransportError {
    enum class Category {
        Network,   // unreachable, closed, I/O failure
        Timeout,   // no answer in time
        Protocol   // the peer answered with something unusable
    };

    Category category{};
    std::string message;
    std::optional<int> status_code{};
};

template <typename T>
using TransportResult = tl::expected<T, TransportError>;

}  // namespace mcphub
