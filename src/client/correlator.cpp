#include "mcphub/client/correlator.hpp"
#include "mcphub/log/logger.hpp"

#include <asio/bind_executor.hpp>
#include <asio/use_awaitable.hpp>

namespace mcphub {

Correlator::Correlator(asio::strand<asio::any_io_executor> strand)
    : strand_(std::move(strand))
    , alive_(std::make_shared<bool>(true))
{}

Correlator::~Correlator() {
    *alive_ = false;
    fail_all(ClientError::connection_closed());
}

std::shared_ptr<Correlator::Channel> Correlator::register_request(
    std::uint64_t id,
    std::string method,
    std::chrono::milliseconds timeout
) {
    auto pending = std::make_unique<PendingRequest>();
    pending->method = std::move(method);
    pending->channel = std::make_shared<Channel>(strand_, 1);
    pending->deadline = std::make_unique<asio::steady_timer>(strand_);

    if (timeout.count() > 0) {
        pending->deadline->expires_after(timeout);
        pending->deadline->async_wait(asio::bind_executor(strand_,
            [this, id, alive = alive_](asio::error_code ec) {
                if (*alive == false || ec) {
                    return;  // Correlator gone, or reply/closure won the race
                }
                expire(id);
            }
        ));
    }

    auto channel = pending->channel;
    pending_[id] = std::move(pending);
    return channel;
}

bool Correlator::resolve(std::uint64_t id, Outcome outcome) {
    const auto it = pending_.find(id);
    if (it == pending_.end()) {
        return false;
    }

    auto pending = std::move(it->second);
    pending_.erase(it);

    pending->deadline->cancel();
    pending->channel->try_send(asio::error_code{}, std::move(outcome));
    return true;
}

bool Correlator::cancel(std::uint64_t id) {
    const auto it = pending_.find(id);
    if (it == pending_.end()) {
        return false;
    }
    it->second->deadline->cancel();
    pending_.erase(it);
    return true;
}

std::size_t Correlator::fail_all(const ClientError& error) {
    auto drained = std::move(pending_);
    pending_.clear();

    for (auto& [id, pending] : drained) {
        pending->deadline->cancel();
        pending->channel->try_send(asio::error_code{}, Outcome{tl::unexpect, error});
    }

    if (drained.empty() == false) {
        MCPHUB_LOG_DEBUG("MCP", "Failed pending requests", {
            {"count", drained.size()},
            {"reason", error.message}
        });
    }
    return drained.size();
}

bool Correlator::contains(std::uint64_t id) const {
    return pending_.contains(id);
}

asio::awaitable<Correlator::Outcome> Correlator::await(std::shared_ptr<Channel> channel) {
    try {
        auto outcome = co_await channel->async_receive(asio::use_awaitable);
        co_return outcome;
    } catch (const std::system_error& e) {
        co_return tl::unexpected(ClientError::connection_closed(
            "Request abandoned: " + std::string(e.what())));
    }
}

void Correlator::expire(std::uint64_t id) {
    const auto it = pending_.find(id);
    if (it == pending_.end()) {
        return;
    }

    auto pending = std::move(it->second);
    pending_.erase(it);

    const auto message = "Request '" + pending->method + "' (id " + std::to_string(id) + ") timed out";
    MCPHUB_LOG_WARN("MCP", "Request timed out", {
        {"id", id},
        {"method", pending->method}
    });
    pending->channel->try_send(asio::error_code{}, Outcome{tl::unexpect, ClientError::timeout(message)});
}

}  // namespace mcphub
