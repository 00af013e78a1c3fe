#include "mcphub/log/logger.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <mutex>
#include <utility>

namespace mcphub {

namespace {

constexpr std::array<std::pair<std::string_view, LogLevel>, 9> kLevelNames = {{
    {"trace", LogLevel::Trace},
    {"debug", LogLevel::Debug},
    {"info", LogLevel::Info},
    {"warn", LogLevel::Warn},
    {"warning", LogLevel::Warn},
    {"error", LogLevel::Error},
    {"fatal", LogLevel::Fatal},
    {"critical", LogLevel::Fatal},
    {"off", LogLevel::Off},
}};

struct GlobalLogger {
    std::mutex mutex;
    std::unique_ptr<ILogger> instance = std::make_unique<NullLogger>();
};

GlobalLogger& global_logger() {
    static GlobalLogger global;
    return global;
}

}  // namespace

std::optional<LogLevel> log_level_from_string(std::string_view name) noexcept {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const auto it = std::find_if(kLevelNames.begin(), kLevelNames.end(),
                                 [&lower](const auto& entry) { return entry.first == lower; });
    if (it == kLevelNames.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger
// ─────────────────────────────────────────────────────────────────────────────
// The previous backend is destroyed on replacement; callers holding a raw
// pointer to it must not use it afterwards.

ILogger& get_logger() noexcept {
    auto& global = global_logger();
    std::lock_guard<std::mutex> lock(global.mutex);
    return *global.instance;
}

void set_logger(std::unique_ptr<ILogger> logger) noexcept {
    auto& global = global_logger();
    std::lock_guard<std::mutex> lock(global.mutex);
    if (logger) {
        global.instance = std::move(logger);
    } else {
        global.instance = std::make_unique<NullLogger>();
    }
}

}  // namespace mcphub
