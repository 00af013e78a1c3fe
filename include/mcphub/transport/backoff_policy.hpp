#ifndef MCPHUB_TRANSPORT_BACKOFF_POLICY_HPP
#define MCPHUB_TRANSPORT_BACKOFF_POLICY_HPP

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <optional>

namespace mcphub {

// ─────────────────────────────────────────────────────────────────────────────
// ReconnectBackoff
// ─────────────────────────────────────────────────────────────────────────────
// Attempt budget and delays for a transport that re-dials after its link
// drops. Attempt n (1-based) waits base * 2^(n-1), capped at `cap`:
// 1s, 2s, 4s, 8s, 16s for the default 1s base and five attempts.
//
// Usage:
//   while (auto delay = backoff.next()) {
//       timer.expires_after(*delay);
//       ...
//   }
//   // budget spent; backoff.reset() once a connection succeeds

class ReconnectBackoff {
public:
    ReconnectBackoff(
        std::chrono::milliseconds base,
        std::size_t max_attempts,
        std::chrono::milliseconds cap = std::chrono::minutes{5}
    )
        : base_(base)
        , cap_(cap)
        , max_attempts_(max_attempts)
    {}

    /// Delay before the next attempt, or nullopt once the budget is spent
    std::optional<std::chrono::milliseconds> next() {
        if (attempts_ >= max_attempts_) {
            return std::nullopt;
        }
        ++attempts_;
        return delay_for(attempts_);
    }

    void reset() noexcept { attempts_ = 0; }

    /// Attempts handed out since the last reset()
    [[nodiscard]] std::size_t attempts() const noexcept { return attempts_; }
    [[nodiscard]] std::size_t max_attempts() const noexcept { return max_attempts_; }
    [[nodiscard]] bool exhausted() const noexcept { return attempts_ >= max_attempts_; }

    [[nodiscard]] std::chrono::milliseconds delay_for(std::size_t attempt) const {
        auto delay = base_;
        for (std::size_t i = 1; i < attempt && delay < cap_; ++i) {
            delay *= 2;
        }
        return std::min(delay, cap_);
    }

private:
    std::chrono::milliseconds base_;
    std::chrono::milliseconds cap_;
    std::size_t max_attempts_;
    std::size_t attempts_{0};
};

}  // namespace mcphub

#endif  // MCPHUB_TRANSPORT_BACKOFF_POLICY_HPP
