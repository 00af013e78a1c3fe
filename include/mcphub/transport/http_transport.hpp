#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Http Transport
// ═══════════════════════════════════════════════════════════════════════════
// Stateless MCP transport: every outgoing message is one POST of its JSON
// body to a fixed endpoint, and the response body is the reply.
//
// - async_start() only validates the endpoint; the Connection performs the
//   liveness probe
// - replies are pushed into the same receive channel the other transports
//   use, so correlation works identically
// - a reply without an id is attributed to the request that produced it
// - non-2xx statuses fail the send with "HTTP <status>: <body>"
//   (4xx = Protocol, everything else = Network)
// - there is no background reconnection

#include "mcphub/transport/async_transport.hpp"
#include "mcphub/transport/http_client.hpp"

#include <asio/experimental/channel.hpp>
#include <asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace mcphub {

struct HttpTransportConfig {
    /// Full endpoint, e.g. "http://localhost:8080/mcp"
    std::string url;

    /// Extra headers sent with every request
    HeaderMap headers;

    std::string user_agent{"mcphub/0.1.0"};

    std::chrono::milliseconds connect_timeout{10'000};
    std::chrono::milliseconds request_timeout{30'000};
    bool verify_ssl{true};

    /// Server name, used only to label log records
    std::string server_name;

    /// Threads running the blocking HTTP calls
    std::size_t worker_threads{2};
    std::size_t channel_capacity{64};
};

class HttpTransport : public IAsyncTransport {
public:
    /// Uses the default (cpr) HTTP client
    HttpTransport(asio::any_io_executor executor, HttpTransportConfig config);

    /// Custom HTTP client, for tests or alternative backends
    HttpTransport(
        asio::any_io_executor executor,
        HttpTransportConfig config,
        std::unique_ptr<IHttpClient> client
    );

    ~HttpTransport() override;

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;
    HttpTransport(HttpTransport&&) = delete;
    HttpTransport& operator=(HttpTransport&&) = delete;

    [[nodiscard]] asio::any_io_executor get_executor() override;
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_start() override;
    [[nodiscard]] asio::awaitable<void> async_stop() override;
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_send(Json message) override;
    [[nodiscard]] asio::awaitable<TransportResult<Json>> async_receive() override;
    [[nodiscard]] bool is_running() const override;
    void on_link_change(LinkListener listener) override;

    /// Normalized endpoint URL (valid after async_start)
    [[nodiscard]] const std::string& endpoint() const noexcept { return endpoint_; }

private:
    using MessageChannel = asio::experimental::channel<
        void(asio::error_code, TransportResult<Json>)
    >;

    asio::awaitable<void> deliver(Json reply);

    HttpTransportConfig config_;
    asio::any_io_executor executor_;
    std::unique_ptr<IHttpClient> client_;
    asio::thread_pool pool_;

    std::string endpoint_;
    std::shared_ptr<MessageChannel> message_channel_;
    std::atomic<bool> running_{false};

    LinkListener link_listener_;
};

}  // namespace mcphub
