#include "mcphub/log/spdlog_logger.hpp"

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <mutex>

namespace mcphub {

namespace {

constexpr const char* kDefaultPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v";

// Loggers are never registered, but spdlog still wants distinct names
std::string next_logger_name() {
    static std::atomic<unsigned> counter{0};
    return "mcphub_" + std::to_string(counter.fetch_add(1, std::memory_order_relaxed));
}

std::shared_ptr<spdlog::details::thread_pool> shared_thread_pool(std::size_t queue_size) {
    static std::once_flag once;
    static std::shared_ptr<spdlog::details::thread_pool> pool;
    std::call_once(once, [queue_size]() {
        pool = std::make_shared<spdlog::details::thread_pool>(queue_size, 1);
    });
    return pool;
}

}  // namespace

spdlog::level::level_enum SpdlogLogger::to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info:  return spdlog::level::info;
        case LogLevel::Warn:  return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Fatal: return spdlog::level::critical;
        case LogLevel::Off:   return spdlog::level::off;
    }
    return spdlog::level::info;
}

SpdlogLogger::SpdlogLogger(std::shared_ptr<spdlog::logger> logger, LogLevel min_level)
    : logger_(std::move(logger))
    , min_level_(min_level)
{
    logger_->set_level(to_spdlog_level(min_level));
}

std::string SpdlogLogger::render(const LogRecord& record) {
    std::string text = "[" + record.category + "]";

    auto details = record.details;
    if (const auto server = record.server()) {
        text += "[" + *server + "]";
        details.erase("server");
    }
    text += " " + record.message;

    const bool has_details = details.is_object() ? !details.empty() : !details.is_null();
    if (has_details) {
        text += " " + details.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    if (record.error) {
        text += " error=\"" + *record.error + "\"";
    }
    return text;
}

void SpdlogLogger::log(const LogRecord& record) {
    if (!should_log(record.level)) {
        return;
    }

    const spdlog::source_loc where{
        record.location.file_name(),
        static_cast<int>(record.location.line()),
        record.location.function_name()
    };
    logger_->log(where, to_spdlog_level(record.level), "{}", render(record));
}

bool SpdlogLogger::should_log(LogLevel level) const noexcept {
    return level_enabled(level, min_level_);
}

void SpdlogLogger::set_level(LogLevel level) noexcept {
    min_level_ = level;
    logger_->set_level(to_spdlog_level(level));
}

void SpdlogLogger::flush() {
    logger_->flush();
}

// ─────────────────────────────────────────────────────────────────────────────
// Factory
// ─────────────────────────────────────────────────────────────────────────────

std::unique_ptr<SpdlogLogger> make_spdlog_logger(
    const LogOptions& options,
    std::vector<spdlog::sink_ptr> extra_sinks
) {
    std::vector<spdlog::sink_ptr> sinks = std::move(extra_sinks);
    if (options.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }
    if (options.file) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(*options.file));
    }

    std::shared_ptr<spdlog::logger> logger;
    if (options.async) {
        logger = std::make_shared<spdlog::async_logger>(
            next_logger_name(),
            sinks.begin(),
            sinks.end(),
            shared_thread_pool(options.async_queue_size),
            spdlog::async_overflow_policy::block
        );
    } else {
        logger = std::make_shared<spdlog::logger>(next_logger_name(), sinks.begin(), sinks.end());
    }
    logger->set_pattern(options.pattern.value_or(kDefaultPattern));

    return std::make_unique<SpdlogLogger>(std::move(logger), options.level);
}

}  // namespace mcphub
