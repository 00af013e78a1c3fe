#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Correlator
// ═══════════════════════════════════════════════════════════════════════════
// Pending-request table of one Connection: id -> {single-fire channel,
// deadline timer}. Exactly one of {reply, timeout, closure} completes an
// entry, and whichever fires first erases it on the spot, so the id is gone
// from the table as soon as its outcome is decided.
//
// Not thread-safe: every member must be called from the owning strand. The
// deadline handlers are bound to that strand.

#include "mcphub/client/client_error.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/experimental/channel.hpp>
#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

namespace mcphub {

class Correlator {
public:
    using Outcome = ClientResult<Json>;
    using Channel = asio::experimental::channel<void(asio::error_code, Outcome)>;

    explicit Correlator(asio::strand<asio::any_io_executor> strand);
    ~Correlator();

    Correlator(const Correlator&) = delete;
    Correlator& operator=(const Correlator&) = delete;

    /// Register a pending request. A non-positive timeout means no deadline.
    /// The returned channel receives exactly one Outcome.
    [[nodiscard]] std::shared_ptr<Channel> register_request(
        std::uint64_t id,
        std::string method,
        std::chrono::milliseconds timeout
    );

    /// Complete with a reply. False when the id is unknown (late or foreign).
    bool resolve(std::uint64_t id, Outcome outcome);

    /// Drop an entry without completing it (send failed before it went out)
    bool cancel(std::uint64_t id);

    /// Complete every entry with `error`; returns how many were failed
    std::size_t fail_all(const ClientError& error);

    [[nodiscard]] bool contains(std::uint64_t id) const;
    [[nodiscard]] std::size_t size() const noexcept { return pending_.size(); }

    /// Wait for the single outcome delivered to `channel`
    [[nodiscard]] static asio::awaitable<Outcome> await(std::shared_ptr<Channel> channel);

private:
    struct PendingRequest {
        std::string method;
        std::shared_ptr<Channel> channel;
        std::unique_ptr<asio::steady_timer> deadline;
    };

    void expire(std::uint64_t id);

    asio::strand<asio::any_io_executor> strand_;
    std::unordered_map<std::uint64_t, std::unique_ptr<PendingRequest>> pending_;

    // Cleared by the destructor; deadline handlers check it before touching
    // the table
    std::shared_ptr<bool> alive_;
};

}  // namespace mcphub
