#include <catch2/catch_test_macros.hpp>

#include "mcphub/log/logger.hpp"

#include <string_view>
#include <vector>

using namespace mcphub;

namespace {

class RecordingLogger final : public ILogger {
public:
    explicit RecordingLogger(LogLevel threshold = LogLevel::Trace) : threshold_(threshold) {}

    void log(const LogRecord& record) override { records.push_back(record); }

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return level_enabled(level, threshold_);
    }

    std::vector<LogRecord> records;

private:
    LogLevel threshold_;
};

// Installs a RecordingLogger for one test and restores the NullLogger after
struct GlobalCapture {
    RecordingLogger* logger;

    explicit GlobalCapture(LogLevel threshold = LogLevel::Trace) {
        auto owned = std::make_unique<RecordingLogger>(threshold);
        logger = owned.get();
        set_logger(std::move(owned));
    }

    ~GlobalCapture() { set_logger(nullptr); }
};

}  // namespace

TEST_CASE("log_level_from_string accepts common spellings", "[log]") {
    REQUIRE(log_level_from_string("debug") == LogLevel::Debug);
    REQUIRE(log_level_from_string("WARN") == LogLevel::Warn);
    REQUIRE(log_level_from_string("warning") == LogLevel::Warn);
    REQUIRE(log_level_from_string("critical") == LogLevel::Fatal);
    REQUIRE(log_level_from_string("Off") == LogLevel::Off);
    REQUIRE(log_level_from_string("loud").has_value() == false);
    REQUIRE(log_level_from_string("").has_value() == false);
}

TEST_CASE("level_enabled honours the threshold and Off", "[log]") {
    REQUIRE(level_enabled(LogLevel::Warn, LogLevel::Info));
    REQUIRE(level_enabled(LogLevel::Info, LogLevel::Info));
    REQUIRE(level_enabled(LogLevel::Debug, LogLevel::Info) == false);
    REQUIRE(level_enabled(LogLevel::Fatal, LogLevel::Off) == false);
}

TEST_CASE("LogRecord exposes the server and the remaining details", "[log]") {
    LogRecord connected(LogLevel::Info, "MCP", "Connected", {{"server", "alpha"}, {"tools", 3}});
    REQUIRE(connected.server() == "alpha");
    REQUIRE(connected.details_text() == R"({"server":"alpha","tools":3})");

    LogRecord bare(LogLevel::Info, "codec", "Registry cleared");
    REQUIRE(bare.server().has_value() == false);
    REQUIRE(bare.details_text().empty());

    LogRecord odd(LogLevel::Info, "MCP", "x", {{"server", 7}});
    REQUIRE(odd.server().has_value() == false);
}

TEST_CASE("emit filters below the threshold and records the call site", "[log]") {
    RecordingLogger logger(LogLevel::Warn);

    logger.emit(LogLevel::Info, "health", "filtered");
    logger.emit(LogLevel::Warn, "health", "Health check failed", {{"server", "beta"}});

    REQUIRE(logger.records.size() == 1);
    const auto& record = logger.records[0];
    REQUIRE(record.category == "health");
    REQUIRE(record.server() == "beta");
    REQUIRE(std::string_view(record.location.file_name()).find("logger_test") != std::string_view::npos);
}

TEST_CASE("emit_failure carries the cause at error level", "[log]") {
    RecordingLogger logger;
    logger.emit_failure("MCP", "Tool call failed", "HTTP 500: boom", {{"tool", "x"}});

    REQUIRE(logger.records.size() == 1);
    REQUIRE(logger.records[0].level == LogLevel::Error);
    REQUIRE(logger.records[0].error == "HTTP 500: boom");
    REQUIRE(logger.records[0].details["tool"] == "x");
}

TEST_CASE("Global logger defaults to a silent backend", "[log]") {
    set_logger(nullptr);
    REQUIRE(get_logger().should_log(LogLevel::Fatal) == false);
}

TEST_CASE("Macros route through the global logger", "[log]") {
    GlobalCapture capture(LogLevel::Debug);

    MCPHUB_LOG_TRACE("MCP", "trace");
    MCPHUB_LOG_DEBUG("MCP", "debug");
    MCPHUB_LOG_INFO("health", "info", {{"server", "alpha"}});
    MCPHUB_LOG_WARN("codec", "warn");
    MCPHUB_LOG_ERROR("MCP", "error");
    MCPHUB_LOG_FAILURE("transport", "failure", "cause", {{"code", 1}});
    MCPHUB_LOG_FAILURE("transport", "failure without details", "cause");

    const auto& records = capture.logger->records;
    REQUIRE(records.size() == 6);
    REQUIRE(records[0].level == LogLevel::Debug);
    REQUIRE(records[1].server() == "alpha");
    REQUIRE(records[2].category == "codec");
    REQUIRE(records[4].error == "cause");
    REQUIRE(records[4].details["code"] == 1);
    REQUIRE(records[5].details_text().empty());
}

TEST_CASE("Macros skip argument evaluation when filtered", "[log]") {
    GlobalCapture capture(LogLevel::Error);

    int evaluated = 0;
    auto details = [&evaluated]() {
        ++evaluated;
        return nlohmann::json{{"n", evaluated}};
    };
    MCPHUB_LOG_DEBUG("MCP", "quiet", details());
    MCPHUB_LOG_ERROR("MCP", "loud", details());

    REQUIRE(evaluated == 1);
    REQUIRE(capture.logger->records.size() == 1);
}
