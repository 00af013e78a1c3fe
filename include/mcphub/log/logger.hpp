#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace mcphub {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,
    Debug = 1,
    Info  = 2,
    Warn  = 3,
    Error = 4,
    Fatal = 5,
    Off   = 6
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

/// "debug", "WARN", "warning", "critical", ... Returns nullopt for unknown names.
[[nodiscard]] std::optional<LogLevel> log_level_from_string(std::string_view name) noexcept;

[[nodiscard]] constexpr bool level_enabled(LogLevel level, LogLevel threshold) noexcept {
    return threshold != LogLevel::Off
        && static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(threshold);
}

// ─────────────────────────────────────────────────────────────────────────────
// Log Options
// ─────────────────────────────────────────────────────────────────────────────
// Backend settings, read from the "logging" block of a hub configuration.

struct LogOptions {
    LogLevel level{LogLevel::Info};
    bool console{true};                // colored stderr
    std::optional<std::string> file;   // appended, never rotated
    bool async{false};                 // hand records to a background thread
    std::size_t async_queue_size{8192};
    std::optional<std::string> pattern;
};

// ─────────────────────────────────────────────────────────────────────────────
// Log Record
// ─────────────────────────────────────────────────────────────────────────────
// Category is the subsystem: "MCP" (connections and the hub), "transport",
// "health" or "codec". Details hold the server name, request id, pid, ...

struct LogRecord {
    LogLevel level;
    std::string category;
    std::string message;
    nlohmann::json details;
    std::optional<std::string> error;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(
        LogLevel lvl,
        std::string cat,
        std::string msg,
        nlohmann::json extra = nlohmann::json::object(),
        std::optional<std::string> err = std::nullopt,
        std::source_location loc = std::source_location::current()
    )
        : level(lvl)
        , category(std::move(cat))
        , message(std::move(msg))
        , details(std::move(extra))
        , error(std::move(err))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}

    /// Server named in the details, when there is one
    [[nodiscard]] std::optional<std::string> server() const {
        if (details.is_object() && details.contains("server") && details["server"].is_string()) {
            return details["server"].get<std::string>();
        }
        return std::nullopt;
    }

    /// Details as compact JSON; empty when there are none
    [[nodiscard]] std::string details_text() const {
        const bool empty = details.is_object() ? details.empty() : details.is_null();
        if (empty) {
            return {};
        }
        return details.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger
// ─────────────────────────────────────────────────────────────────────────────

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    /// Checked by the macros before any argument is evaluated
    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    /// Build a record at the call site and hand it to log()
    void emit(LogLevel level,
              std::string_view category,
              std::string_view message,
              nlohmann::json details = nlohmann::json::object(),
              std::optional<std::string> cause = std::nullopt,
              std::source_location loc = std::source_location::current()) {
        if (should_log(level)) {
            log(LogRecord(level, std::string(category), std::string(message),
                          std::move(details), std::move(cause), loc));
        }
    }

    /// Error record carrying the failure cause
    void emit_failure(std::string_view category,
                      std::string_view message,
                      std::string_view cause,
                      nlohmann::json details = nlohmann::json::object(),
                      std::source_location loc = std::source_location::current()) {
        emit(LogLevel::Error, category, message, std::move(details), std::string(cause), loc);
    }
};

/// Default backend until set_logger() installs one
class NullLogger final : public ILogger {
public:
    void log(const LogRecord&) override {}

    [[nodiscard]] bool should_log(LogLevel) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] ILogger& get_logger() noexcept;

/// Takes ownership; nullptr restores the NullLogger
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

// MCPHUB_LOG_INFO("MCP", "Connected", {{"server", name}})
// MCPHUB_LOG_FAILURE("MCP", "Tool call failed", error.message, {{"tool", name}})

#define MCPHUB_LOG_AT(level, category, ...) \
    do { auto& mcphub_logger_ = ::mcphub::get_logger(); \
         if (mcphub_logger_.should_log(level)) \
             mcphub_logger_.emit(level, category, __VA_ARGS__); } while (false)

#define MCPHUB_LOG_TRACE(category, ...) MCPHUB_LOG_AT(::mcphub::LogLevel::Trace, category, __VA_ARGS__)
#define MCPHUB_LOG_DEBUG(category, ...) MCPHUB_LOG_AT(::mcphub::LogLevel::Debug, category, __VA_ARGS__)
#define MCPHUB_LOG_INFO(category, ...)  MCPHUB_LOG_AT(::mcphub::LogLevel::Info, category, __VA_ARGS__)
#define MCPHUB_LOG_WARN(category, ...)  MCPHUB_LOG_AT(::mcphub::LogLevel::Warn, category, __VA_ARGS__)
#define MCPHUB_LOG_ERROR(category, ...) MCPHUB_LOG_AT(::mcphub::LogLevel::Error, category, __VA_ARGS__)
#define MCPHUB_LOG_FATAL(category, ...) MCPHUB_LOG_AT(::mcphub::LogLevel::Fatal, category, __VA_ARGS__)

#define MCPHUB_LOG_FAILURE(category, msg, ...) \
    do { auto& mcphub_logger_ = ::mcphub::get_logger(); \
         if (mcphub_logger_.should_log(::mcphub::LogLevel::Error)) \
             mcphub_logger_.emit_failure(category, msg, __VA_ARGS__); } while (false)

}  // namespace mcphub
