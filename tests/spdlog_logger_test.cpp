// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "billguard/log/spdlog_logger.hpp"
#include "billguard/log/logger.hpp"

#include <spdlog/sinks/ostream_sink.h>

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace billguard;

namespace {

struct CapturingLogger {
    std::ostringstream out;
    std::unique_ptr<SpdlogLogger> logger;

    explicit CapturingLogger(LogLevel level = LogLevel::Trace) {
        std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::ostream_sink_mt>(out)};
        logger = std::make_unique<SpdlogLogger>(std::move(sinks), level);
    }

    std::string text() {
        logger->flush();
        return out.str();
    }
};

std::string read_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Levels
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SpdlogLogger can be created with console sink", "[log][spdlog]") {
    auto logger = make_spdlog_console_logger(LogLevel::Debug);
    REQUIRE(logger != nullptr);

    REQUIRE(logger->should_log(LogLevel::Debug));
    REQUIRE(logger->should_log(LogLevel::Info));
    REQUIRE_FALSE(logger->should_log(LogLevel::Trace));
}

TEST_CASE("SpdlogLogger can change log level", "[log][spdlog]") {
    auto logger = make_spdlog_console_logger(LogLevel::Info);
    REQUIRE_FALSE(logger->should_log(LogLevel::Debug));

    logger->set_level(LogLevel::Debug);
    REQUIRE(logger->should_log(LogLevel::Debug));
    REQUIRE(logger->get_spdlog_logger()->level() == spdlog::level::debug);
}

TEST_CASE("SpdlogLogger maps levels both ways", "[log][spdlog]") {
    for (const auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warn,
                             LogLevel::Error, LogLevel::Fatal, LogLevel::Off}) {
        REQUIRE(SpdlogLogger::from_spdlog_level(SpdlogLogger::to_spdlog_level(level)) == level);
    }
}

TEST_CASE("SpdlogLogger rejects a null spdlog logger", "[log][spdlog]") {
    REQUIRE_THROWS_AS(SpdlogLogger(std::shared_ptr<spdlog::logger>{}), std::invalid_argument);
}

// ═══════════════════════════════════════════════════════════════════════════
// Output
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SpdlogLogger prefixes the component", "[log][spdlog]") {
    CapturingLogger capture;

    capture.logger->warn("circuit:database", "Circuit OPEN after 5 failures");
    capture.logger->info("", "no component");

    const auto text = capture.text();
    REQUIRE(text.find("[circuit:database] Circuit OPEN after 5 failures") != std::string::npos);
    REQUIRE(text.find("[warning]") != std::string::npos);
    REQUIRE(text.find("] no component") != std::string::npos);
}

TEST_CASE("SpdlogLogger drops records below its level", "[log][spdlog]") {
    CapturingLogger capture(LogLevel::Warn);

    capture.logger->debug("sync", "This should not appear");
    capture.logger->info_fmt("sync", "{}", "This should not appear");
    capture.logger->warn("sync", "This should appear");
    capture.logger->error_fmt("sync", "Event {} failed", "evt_1");

    const auto text = capture.text();
    REQUIRE(text.find("This should not appear") == std::string::npos);
    REQUIRE(text.find("This should appear") != std::string::npos);
    REQUIRE(text.find("Event evt_1 failed") != std::string::npos);
}

TEST_CASE("Console and file logger writes to the file", "[log][spdlog][file]") {
    const auto path = std::filesystem::temp_directory_path() / "billguard_spdlog_test.log";
    std::filesystem::remove(path);

    {
        auto logger = make_spdlog_console_file_logger(path.string(), LogLevel::Info);
        logger->info("webhook", "Test message to file");
        logger->debug("webhook", "Filtered message");
        logger->flush();
    }

    REQUIRE(std::filesystem::exists(path));
    const auto content = read_file(path);
    REQUIRE(content.find("[webhook] Test message to file") != std::string::npos);
    REQUIRE(content.find("Filtered message") == std::string::npos);

    std::filesystem::remove(path);
}

TEST_CASE("SpdlogLogger async console logger works", "[log][spdlog][async]") {
    auto logger = make_spdlog_async_console_logger(LogLevel::Info);
    REQUIRE(logger != nullptr);
    REQUIRE(logger->should_log(LogLevel::Info));
    REQUIRE_FALSE(logger->should_log(LogLevel::Debug));

    for (int i = 0; i < 10; ++i) {
        logger->info_fmt("async", "Async message {}", i);
    }
    logger->flush();
}

TEST_CASE("SpdlogLogger can be set as global logger", "[log][spdlog][integration]") {
    std::ostringstream out;
    std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::ostream_sink_mt>(out)};
    auto logger = std::make_unique<SpdlogLogger>(std::move(sinks), LogLevel::Info);
    auto* raw = logger.get();
    set_logger(std::move(logger));

    get_logger().info("test", "Global logger test");
    raw->flush();

    REQUIRE(out.str().find("Global logger test") != std::string::npos);

    set_logger(nullptr);
}
