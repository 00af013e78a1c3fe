#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Health Checker
// ═══════════════════════════════════════════════════════════════════════════
// Probes servers with ping + tools/list and keeps the latest HealthRecord per
// server. Probes never fail: every problem ends up in the record.
//
// Periodic schedules run as coroutines on the checker's executor. Each
// schedule owns its timer and a stopped flag; stopping a schedule cancels
// the timer and the loop exits at its next resumption. A probe already in
// flight when its schedule stops, or when dispose() runs, finishes without
// storing a record or notifying the listener.

#include "mcphub/client/connection.hpp"
#include "mcphub/config/hub_config.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/steady_timer.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcphub {

struct HealthRecord {
    bool is_healthy{false};
    std::chrono::system_clock::time_point last_check{};
    std::chrono::milliseconds response_time{0};
    std::optional<std::string> last_error;
    std::optional<std::size_t> tools_count;

    [[nodiscard]] Json to_json() const;
};

struct HealthSummary {
    std::size_t total_servers{0};
    std::size_t healthy_servers{0};
    std::chrono::milliseconds average_response_time{0};
    std::vector<std::string> unhealthy_servers;

    [[nodiscard]] Json to_json() const;
};

/// Invoked after every probe with the server name and its fresh record
using HealthStatusListener = std::function<void(const std::string&, const HealthRecord&)>;

class HealthChecker {
public:
    HealthChecker(asio::any_io_executor executor, HealthCheckConfig config = {});
    ~HealthChecker();

    HealthChecker(const HealthChecker&) = delete;
    HealthChecker& operator=(const HealthChecker&) = delete;

    /// Probe once and store the record. Never fails.
    asio::awaitable<HealthRecord> check_health(std::string server, Connection& connection);

    /// Replace any existing schedule for `server` and probe every
    /// check_interval. The first probe runs one interval after the call.
    void start_periodic_health_check(std::string server, std::shared_ptr<Connection> connection);

    /// Safe to call when no schedule exists
    void stop_periodic_health_check(const std::string& server);

    [[nodiscard]] std::optional<HealthRecord> get_health_status(const std::string& server) const;
    [[nodiscard]] std::map<std::string, HealthRecord> get_all_health_statuses() const;

    /// False for servers never probed
    [[nodiscard]] bool is_server_healthy(const std::string& server) const;

    /// Mean response time over all records, 0 when there are none
    [[nodiscard]] std::chrono::milliseconds get_average_response_time() const;

    [[nodiscard]] HealthSummary get_overall_health_summary() const;

    [[nodiscard]] bool has_schedule(const std::string& server) const;
    [[nodiscard]] std::size_t probe_count() const;

    void set_status_listener(HealthStatusListener listener);

    /// Stop every schedule and forget all records
    void dispose();

    [[nodiscard]] const HealthCheckConfig& config() const noexcept { return config_; }

private:
    struct Schedule {
        explicit Schedule(asio::any_io_executor executor) : timer(std::move(executor)) {}

        asio::steady_timer timer;
        bool stopped{false};
    };

    asio::awaitable<void> run_schedule(
        std::string server,
        std::shared_ptr<Connection> connection,
        std::shared_ptr<Schedule> schedule,
        std::shared_ptr<bool> alive
    );

    /// ping + tools/list; touches no checker state so it may outlive the checker
    static asio::awaitable<HealthRecord> probe(
        std::string server,
        Connection& connection,
        std::chrono::milliseconds timeout
    );

    [[nodiscard]] std::uint64_t current_epoch() const;

    /// Dropped when dispose() ran since `epoch` was read
    void store(const std::string& server, const HealthRecord& record, std::uint64_t epoch);

    asio::any_io_executor executor_;
    HealthCheckConfig config_;

    mutable std::mutex mutex_;
    std::map<std::string, HealthRecord> records_;
    std::map<std::string, std::shared_ptr<Schedule>> schedules_;
    HealthStatusListener listener_;
    std::size_t probes_{0};
    std::uint64_t epoch_{0};

    std::shared_ptr<bool> alive_;
};

}  // namespace mcphub
