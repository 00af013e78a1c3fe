#include "mcphub/transport/http_transport.hpp"
#include "mcphub/log/logger.hpp"

#include <asio/co_spawn.hpp>

namespace mcphub {

namespace {

constexpr const char* kCategory = "transport";
constexpr const char* kJsonContentType = "application/json";

TransportError make_error(TransportError::Category cat, const std::string& msg) {
    return TransportError{cat, msg, std::nullopt};
}

TransportError from_failure(const HttpFailure& failure) {
    switch (failure.kind) {
        case HttpFailure::Kind::TimedOut:
            return make_error(TransportError::Category::Timeout, "HTTP request timed out: " + failure.detail);
        case HttpFailure::Kind::Cancelled:
            return make_error(TransportError::Category::Network, "HTTP request cancelled");
        case HttpFailure::Kind::Tls:
            return make_error(TransportError::Category::Network, "TLS error: " + failure.detail);
        case HttpFailure::Kind::Unreachable:
            break;
    }
    return make_error(TransportError::Category::Network, "HTTP request failed: " + failure.detail);
}

// 4xx means the server understood and refused; anything else may be transient
TransportError from_status(const HttpReply& reply) {
    TransportError error;
    error.category = reply.rejected() ? TransportError::Category::Protocol : TransportError::Category::Network;
    error.message = "HTTP " + std::to_string(reply.status) + ": " + reply.body;
    error.status_code = reply.status;
    return error;
}

// Give a reply the id of the request that produced it. A bare payload (no
// result/error member) is treated as the result itself.
Json correlate_reply(Json reply, const Json& request_id) {
    if (reply.is_object() == false) {
        return Json{{"jsonrpc", "2.0"}, {"id", request_id}, {"result", std::move(reply)}};
    }
    if (reply.contains("id") && reply["id"].is_null() == false) {
        return reply;
    }
    const bool is_envelope = reply.contains("result") || reply.contains("error");
    if (is_envelope == false) {
        return Json{{"jsonrpc", "2.0"}, {"id", request_id}, {"result", std::move(reply)}};
    }
    reply["id"] = request_id;
    if (reply.contains("jsonrpc") == false) {
        reply["jsonrpc"] = "2.0";
    }
    return reply;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════════════

HttpTransport::HttpTransport(asio::any_io_executor executor, HttpTransportConfig config)
    : HttpTransport(std::move(executor), std::move(config), make_http_client())
{}

HttpTransport::HttpTransport(
    asio::any_io_executor executor,
    HttpTransportConfig config,
    std::unique_ptr<IHttpClient> client
)
    : config_(std::move(config))
    , executor_(std::move(executor))
    , client_(std::move(client))
    , pool_(config_.worker_threads == 0 ? 1 : config_.worker_threads)
{}

HttpTransport::~HttpTransport() {
    running_ = false;
    client_->cancel();
    if (message_channel_) {
        message_channel_->close();
    }
    pool_.join();
}

// ═══════════════════════════════════════════════════════════════════════════
// IAsyncTransport Interface
// ═══════════════════════════════════════════════════════════════════════════

asio::any_io_executor HttpTransport::get_executor() {
    return executor_;
}

asio::awaitable<TransportResult<void>> HttpTransport::async_start() {
    if (running_) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Protocol,
            "Transport already running"
        ));
    }

    const auto url = parse_url(config_.url);
    const bool is_http = url.has_value() && (url->scheme == "http" || url->scheme == "https");
    if (is_http == false) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Network,
            "Invalid HTTP endpoint: " + config_.url
        ));
    }

    endpoint_ = url->full();

    HttpClientSettings settings;
    settings.url = endpoint_;
    settings.headers = config_.headers;
    settings.headers["Accept"] = kJsonContentType;
    settings.headers["User-Agent"] = config_.user_agent;
    settings.connect_timeout = config_.connect_timeout;
    settings.request_timeout = config_.request_timeout;
    settings.verify_tls = config_.verify_ssl;

    client_->resume();
    client_->configure(std::move(settings));

    message_channel_ = std::make_shared<MessageChannel>(executor_, config_.channel_capacity);
    running_ = true;

    MCPHUB_LOG_INFO(kCategory, "HTTP transport ready", {
        {"server", config_.server_name},
        {"url", endpoint_}
    });
    co_return TransportResult<void>{};
}

asio::awaitable<void> HttpTransport::async_stop() {
    const bool was_running = running_.exchange(false);
    client_->cancel();
    if (message_channel_) {
        message_channel_->close();
    }
    if (was_running) {
        MCPHUB_LOG_INFO(kCategory, "HTTP transport stopped", {{"server", config_.server_name}});
    }
    co_return;
}

asio::awaitable<TransportResult<void>> HttpTransport::async_send(Json message) {
    if (!running_) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Network,
            "Transport not running"
        ));
    }

    const Json request_id = message.contains("id") ? message["id"] : Json(nullptr);
    const bool expects_reply = (request_id.is_null() == false);

    // The blocking call runs on the pool; completion resumes on our executor
    IHttpClient* client = client_.get();
    auto outcome = co_await asio::co_spawn(
        pool_.get_executor(),
        [client, body = message.dump()]() -> asio::awaitable<HttpOutcome> {
            co_return client->post_json(body);
        },
        asio::use_awaitable
    );

    if (!outcome) {
        auto error = from_failure(outcome.error());
        MCPHUB_LOG_WARN(kCategory, "HTTP request failed", {
            {"server", config_.server_name},
            {"error", error.message}
        });
        co_return tl::unexpected(std::move(error));
    }

    if (outcome->ok() == false) {
        auto error = from_status(*outcome);
        MCPHUB_LOG_WARN(kCategory, "HTTP request rejected", {
            {"server", config_.server_name},
            {"status", outcome->status}
        });
        co_return tl::unexpected(std::move(error));
    }

    if (expects_reply == false) {
        co_return TransportResult<void>{};
    }

    Json reply = Json::object();
    if (outcome->body.empty() == false) {
        try {
            reply = Json::parse(outcome->body);
        } catch (const Json::parse_error& e) {
            co_return tl::unexpected(make_error(
                TransportError::Category::Protocol,
                "Invalid JSON in HTTP response: " + std::string(e.what())
            ));
        }
    }

    if (reply.is_array()) {
        for (auto& element : reply) {
            co_await deliver(correlate_reply(std::move(element), request_id));
        }
    } else {
        co_await deliver(correlate_reply(std::move(reply), request_id));
    }
    co_return TransportResult<void>{};
}

asio::awaitable<TransportResult<Json>> HttpTransport::async_receive() {
    auto channel = message_channel_;
    if (!channel || channel->is_open() == false) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Network,
            "Transport not running"
        ));
    }

    try {
        auto result = co_await channel->async_receive(asio::use_awaitable);
        co_return result;
    } catch (const std::system_error& e) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Network,
            "Receive failed: " + std::string(e.what())
        ));
    }
}

bool HttpTransport::is_running() const {
    return running_;
}

void HttpTransport::on_link_change(LinkListener listener) {
    link_listener_ = std::move(listener);
}

asio::awaitable<void> HttpTransport::deliver(Json reply) {
    auto channel = message_channel_;
    if (!channel) {
        co_return;
    }
    try {
        co_await channel->async_send(
            asio::error_code{},
            TransportResult<Json>{std::move(reply)},
            asio::use_awaitable
        );
    } catch (const std::system_error&) {
        MCPHUB_LOG_DEBUG(kCategory, "Dropped HTTP reply after stop", {{"server", config_.server_name}});
    }
}

}  // namespace mcphub
