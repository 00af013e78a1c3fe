#pragma once

#include "mcphub/log/logger.hpp"

#include <spdlog/common.h>
#include <spdlog/logger.h>

#include <memory>
#include <string>
#include <vector>

namespace mcphub {

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger
// ─────────────────────────────────────────────────────────────────────────────
// ILogger backend that forwards every record, with its source location, to a
// spdlog logger. A record naming a server is written as
//
//   [transport][alpha] Server process exited {"pid":4242} error="exit code 3"
//
// with "server" lifted out of the details.

class SpdlogLogger final : public ILogger {
public:
    SpdlogLogger(std::shared_ptr<spdlog::logger> logger, LogLevel min_level);

    SpdlogLogger(const SpdlogLogger&) = delete;
    SpdlogLogger& operator=(const SpdlogLogger&) = delete;

    void log(const LogRecord& record) override;
    [[nodiscard]] bool should_log(LogLevel level) const noexcept override;

    void set_level(LogLevel level) noexcept;
    void flush();

    [[nodiscard]] spdlog::logger& backend() const noexcept { return *logger_; }

    [[nodiscard]] static spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;
    [[nodiscard]] static std::string render(const LogRecord& record);

private:
    std::shared_ptr<spdlog::logger> logger_;
    LogLevel min_level_;
};

/// Build a backend from options. `extra_sinks` are attached next to the
/// console and file sinks the options ask for. Throws spdlog::spdlog_ex when
/// the log file cannot be opened.
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_logger(
    const LogOptions& options,
    std::vector<spdlog::sink_ptr> extra_sinks = {}
);

}  // namespace mcphub
