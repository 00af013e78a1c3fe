#include "mcphub/health/health_checker.hpp"
#include "mcphub/log/logger.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/redirect_error.hpp>
#include <asio/use_awaitable.hpp>

#include <ctime>
#include <iomanip>
#include <sstream>

namespace mcphub {

namespace {

constexpr const char* kCategory = "health";

std::string iso_timestamp(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf{};
    gmtime_r(&t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Records
// ─────────────────────────────────────────────────────────────────────────────

Json HealthRecord::to_json() const {
    Json j = {
        {"isHealthy", is_healthy},
        {"lastCheck", iso_timestamp(last_check)},
        {"responseTime", response_time.count()}
    };
    if (last_error) {
        j["lastError"] = *last_error;
    }
    if (tools_count) {
        j["toolsCount"] = *tools_count;
    }
    return j;
}

Json HealthSummary::to_json() const {
    return {
        {"totalServers", total_servers},
        {"healthyServers", healthy_servers},
        {"averageResponseTime", average_response_time.count()},
        {"unhealthyServers", unhealthy_servers}
    };
}

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

HealthChecker::HealthChecker(asio::any_io_executor executor, HealthCheckConfig config)
    : executor_(std::move(executor))
    , config_(config)
    , alive_(std::make_shared<bool>(true))
{}

HealthChecker::~HealthChecker() {
    *alive_ = false;
    dispose();
}

// ─────────────────────────────────────────────────────────────────────────────
// Probing
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<HealthRecord> HealthChecker::check_health(std::string server, Connection& connection) {
    auto alive = alive_;
    const auto epoch = current_epoch();

    auto record = co_await probe(server, connection, config_.timeout);
    if (*alive) {
        store(server, record, epoch);
    }
    co_return record;
}

asio::awaitable<HealthRecord> HealthChecker::probe(
    std::string server,
    Connection& connection,
    std::chrono::milliseconds timeout
) {
    HealthRecord record;
    record.last_check = std::chrono::system_clock::now();

    if (connection.is_active() == false) {
        record.last_error = "Connection not active";
        co_return record;
    }

    const auto started = std::chrono::steady_clock::now();

    auto pong = co_await connection.async_request(method::Ping, Json::object(), timeout);
    if (pong) {
        auto listed = co_await connection.async_request(method::ListTools, Json::object(), timeout);
        if (listed) {
            record.is_healthy = true;
            if (listed->contains("tools") && (*listed)["tools"].is_array()) {
                record.tools_count = (*listed)["tools"].size();
            } else {
                record.tools_count = 0;
            }
        } else {
            record.last_error = listed.error().message;
        }
    } else {
        record.last_error = pong.error().message;
    }

    record.response_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (record.is_healthy) {
        MCPHUB_LOG_DEBUG(kCategory, "Health check passed", {
            {"server", server},
            {"responseTime", record.response_time.count()},
            {"toolsCount", *record.tools_count}
        });
    } else {
        MCPHUB_LOG_WARN(kCategory, "Health check failed", {
            {"server", server},
            {"error", *record.last_error}
        });
    }
    co_return record;
}

std::uint64_t HealthChecker::current_epoch() const {
    std::lock_guard lock(mutex_);
    return epoch_;
}

void HealthChecker::store(const std::string& server, const HealthRecord& record, std::uint64_t epoch) {
    HealthStatusListener listener;
    {
        std::lock_guard lock(mutex_);
        // dispose() ran while the probe was in flight
        if (epoch != epoch_) {
            return;
        }
        records_[server] = record;
        ++probes_;
        listener = listener_;
    }
    if (listener) {
        listener(server, record);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Schedules
// ─────────────────────────────────────────────────────────────────────────────

void HealthChecker::start_periodic_health_check(std::string server, std::shared_ptr<Connection> connection) {
    stop_periodic_health_check(server);

    auto schedule = std::make_shared<Schedule>(executor_);
    {
        std::lock_guard lock(mutex_);
        schedules_[server] = schedule;
    }

    MCPHUB_LOG_DEBUG(kCategory, "Started periodic health check", {
        {"server", server},
        {"interval", config_.check_interval.count()}
    });

    asio::co_spawn(executor_,
        run_schedule(std::move(server), std::move(connection), std::move(schedule), alive_),
        asio::detached);
}

void HealthChecker::stop_periodic_health_check(const std::string& server) {
    std::shared_ptr<Schedule> schedule;
    {
        std::lock_guard lock(mutex_);
        const auto it = schedules_.find(server);
        if (it == schedules_.end()) {
            return;
        }
        schedule = std::move(it->second);
        schedules_.erase(it);
    }

    schedule->stopped = true;
    schedule->timer.cancel();
    MCPHUB_LOG_DEBUG(kCategory, "Stopped periodic health check", {{"server", server}});
}

asio::awaitable<void> HealthChecker::run_schedule(
    std::string server,
    std::shared_ptr<Connection> connection,
    std::shared_ptr<Schedule> schedule,
    std::shared_ptr<bool> alive
) {
    if (*alive == false) {
        co_return;
    }
    const auto interval = config_.check_interval;
    const auto timeout = config_.timeout;
    for (;;) {
        schedule->timer.expires_after(interval);

        asio::error_code ec;
        co_await schedule->timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        if (*alive == false || schedule->stopped || ec) {
            co_return;
        }

        const auto epoch = current_epoch();
        auto record = co_await probe(server, *connection, timeout);

        // stop, dispose or destruction while the probe was in flight
        if (*alive == false || schedule->stopped) {
            co_return;
        }
        store(server, record, epoch);
    }
}

bool HealthChecker::has_schedule(const std::string& server) const {
    std::lock_guard lock(mutex_);
    return schedules_.contains(server);
}

std::size_t HealthChecker::probe_count() const {
    std::lock_guard lock(mutex_);
    return probes_;
}

// ─────────────────────────────────────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────────────────────────────────────

std::optional<HealthRecord> HealthChecker::get_health_status(const std::string& server) const {
    std::lock_guard lock(mutex_);
    const auto it = records_.find(server);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<std::string, HealthRecord> HealthChecker::get_all_health_statuses() const {
    std::lock_guard lock(mutex_);
    return records_;
}

bool HealthChecker::is_server_healthy(const std::string& server) const {
    std::lock_guard lock(mutex_);
    const auto it = records_.find(server);
    return it != records_.end() && it->second.is_healthy;
}

std::chrono::milliseconds HealthChecker::get_average_response_time() const {
    std::lock_guard lock(mutex_);
    if (records_.empty()) {
        return std::chrono::milliseconds{0};
    }

    std::chrono::milliseconds total{0};
    for (const auto& [name, record] : records_) {
        total += record.response_time;
    }
    return total / static_cast<std::int64_t>(records_.size());
}

HealthSummary HealthChecker::get_overall_health_summary() const {
    HealthSummary summary;
    summary.average_response_time = get_average_response_time();

    std::lock_guard lock(mutex_);
    summary.total_servers = records_.size();
    for (const auto& [name, record] : records_) {
        if (record.is_healthy) {
            ++summary.healthy_servers;
        } else {
            summary.unhealthy_servers.push_back(name);
        }
    }
    return summary;
}

void HealthChecker::set_status_listener(HealthStatusListener listener) {
    std::lock_guard lock(mutex_);
    listener_ = std::move(listener);
}

void HealthChecker::dispose() {
    std::map<std::string, std::shared_ptr<Schedule>> schedules;
    {
        std::lock_guard lock(mutex_);
        schedules.swap(schedules_);
        records_.clear();
        ++epoch_;
    }

    for (auto& [name, schedule] : schedules) {
        schedule->stopped = true;
        schedule->timer.cancel();
    }
}

}  // namespace mcphub
