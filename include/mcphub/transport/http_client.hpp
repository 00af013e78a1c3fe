#pragma once

#include "mcphub/transport/http_types.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace mcphub {

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Client Seam
// ─────────────────────────────────────────────────────────────────────────────
// HttpTransport only ever POSTs a JSON-RPC body to one configured endpoint,
// so the client interface is exactly that. A non-2xx reply is still an
// HttpReply; HttpFailure is reserved for requests that got no reply at all.

struct HttpClientSettings {
    std::string url;   // full endpoint, scheme://host:port/path?query
    HeaderMap headers; // sent with every POST
    std::chrono::milliseconds connect_timeout{10'000};
    std::chrono::milliseconds request_timeout{30'000};
    bool verify_tls{true};
};

struct HttpReply {
    int status{0};
    std::string content_type;
    std::string body;

    [[nodiscard]] bool ok() const { return status >= 200 && status < 300; }
    [[nodiscard]] bool rejected() const { return status >= 400 && status < 500; }
};

struct HttpFailure {
    enum class Kind {
        Unreachable,  // DNS, refused, reset
        TimedOut,
        Tls,
        Cancelled
    };

    Kind kind;
    std::string detail;
};

using HttpOutcome = tl::expected<HttpReply, HttpFailure>;

/// Blocking client. HttpTransport calls post_json() from its worker pool, so
/// implementations must tolerate concurrent posts and a concurrent cancel().
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual void configure(HttpClientSettings settings) = 0;

    [[nodiscard]] virtual HttpOutcome post_json(const std::string& body) = 0;

    /// Fail every post that has not started yet with Kind::Cancelled
    virtual void cancel() = 0;

    /// Undo cancel()
    virtual void resume() = 0;
};

/// cpr-backed implementation
[[nodiscard]] std::unique_ptr<IHttpClient> make_http_client();

}  // namespace mcphub
