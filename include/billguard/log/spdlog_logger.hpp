#pragma once

#include "billguard/log/logger.hpp"

#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace billguard {

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger
// ─────────────────────────────────────────────────────────────────────────────
// Production backend for the webhook service. The record's component is
// rendered as "[component]" in front of the message so a single sink can
// carry breaker transitions and webhook processing side by side.

class SpdlogLogger final : public ILogger {
public:
    /// Console sink (stdout, colored)
    explicit SpdlogLogger(LogLevel min_level = LogLevel::Info);

    /// Wrap an existing spdlog logger; throws std::invalid_argument on null
    explicit SpdlogLogger(std::shared_ptr<spdlog::logger> logger);

    /// Arbitrary sink set (console + file, test sinks, ...)
    SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel min_level = LogLevel::Info);

    ~SpdlogLogger() override = default;

    SpdlogLogger(const SpdlogLogger&) = delete;
    SpdlogLogger& operator=(const SpdlogLogger&) = delete;

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override;

    [[nodiscard]] std::shared_ptr<spdlog::logger> get_spdlog_logger() const noexcept {
        return logger_;
    }

    void set_level(LogLevel level) noexcept;

    void flush();

    [[nodiscard]] static spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept;

    /// Pattern applied to every logger built here
    static constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [t%t] %v";

private:
    std::shared_ptr<spdlog::logger> logger_;
    LogLevel min_level_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Factories
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_console_logger(
    LogLevel min_level = LogLevel::Info
);

/// Console plus a size-rotated file (filename, filename.1, ...)
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_console_file_logger(
    const std::string& filename,
    LogLevel min_level = LogLevel::Info,
    std::size_t max_file_bytes = 10 * 1024 * 1024,
    std::size_t max_files = 5
);

/// Non-blocking console logger backed by spdlog's shared thread pool
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_async_console_logger(
    LogLevel min_level = LogLevel::Info,
    std::size_t queue_size = 8192
);

}  // namespace billguard
