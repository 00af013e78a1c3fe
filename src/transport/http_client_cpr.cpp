#include "mcphub/transport/http_client.hpp"

#include <cpr/cpr.h>

#include <atomic>
#include <mutex>

namespace mcphub {

namespace {

bool mentions_tls(const std::string& text) {
    for (const char* marker : {"SSL", "ssl", "TLS", "certificate"}) {
        if (text.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

HttpFailure to_failure(const cpr::Error& error) {
    switch (error.code) {
        case cpr::ErrorCode::OPERATION_TIMEDOUT:
            return {HttpFailure::Kind::TimedOut, error.message};
        case cpr::ErrorCode::SSL_CONNECT_ERROR:
            return {HttpFailure::Kind::Tls, error.message};
        default:
            break;
    }
    const auto kind = mentions_tls(error.message) ? HttpFailure::Kind::Tls : HttpFailure::Kind::Unreachable;
    return {kind, error.message};
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// CprHttpClient
// ─────────────────────────────────────────────────────────────────────────────
// One cpr::Post per message. cpr cannot abort a transfer that is already in
// flight; cancel() only stops the ones that have not begun.

class CprHttpClient final : public IHttpClient {
public:
    void configure(HttpClientSettings settings) override {
        cpr::Header headers;
        for (const auto& [name, value] : settings.headers) {
            headers[name] = value;
        }
        headers["Content-Type"] = "application/json";

        std::lock_guard<std::mutex> lock(mutex_);
        settings_ = std::move(settings);
        headers_ = std::move(headers);
    }

    HttpOutcome post_json(const std::string& body) override {
        if (cancelled_.load()) {
            return tl::unexpected(HttpFailure{HttpFailure::Kind::Cancelled, "Request cancelled"});
        }

        HttpClientSettings settings;
        cpr::Header headers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            settings = settings_;
            headers = headers_;
        }

        const auto response = cpr::Post(
            cpr::Url{settings.url},
            headers,
            cpr::Body{body},
            cpr::ConnectTimeout{settings.connect_timeout},
            cpr::Timeout{settings.request_timeout},
            cpr::VerifySsl{settings.verify_tls}
        );

        if (response.error.code != cpr::ErrorCode::OK) {
            return tl::unexpected(to_failure(response.error));
        }

        HttpReply reply;
        reply.status = static_cast<int>(response.status_code);
        reply.body = response.text;
        if (const auto it = response.header.find("Content-Type"); it != response.header.end()) {
            reply.content_type = it->second;
        }
        return reply;
    }

    void cancel() override { cancelled_.store(true); }
    void resume() override { cancelled_.store(false); }

private:
    std::mutex mutex_;
    HttpClientSettings settings_;
    cpr::Header headers_;
    std::atomic<bool> cancelled_{false};
};

std::unique_ptr<IHttpClient> make_http_client() {
    return std::make_unique<CprHttpClient>();
}

}  // namespace mcphub
