#include "billguard/log/spdlog_logger.hpp"

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <format>
#include <mutex>
#include <stdexcept>
#include <string_view>

namespace billguard {

namespace {

// Loggers built here stay out of spdlog's registry; the suffix only keeps
// their names apart in spdlog's own error messages.
std::string instance_name(std::string_view role) {
    static std::atomic<std::uint64_t> next{0};
    return std::format("billguard.{}#{}", role, next.fetch_add(1, std::memory_order_relaxed));
}

void apply_service_defaults(spdlog::logger& logger, LogLevel min_level) {
    logger.set_level(SpdlogLogger::to_spdlog_level(min_level));
    logger.set_pattern(SpdlogLogger::kPattern);
    // Error records must reach the sink before a failing delivery is answered
    logger.flush_on(spdlog::level::err);
}

std::shared_ptr<spdlog::logger> require_logger(std::shared_ptr<spdlog::logger> logger) {
    if (!logger) {
        throw std::invalid_argument("SpdlogLogger: logger cannot be null");
    }
    return logger;
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

LogLevel SpdlogLogger::from_spdlog_level(spdlog::level::level_enum level) noexcept {
    switch (level) {
        case spdlog::level::trace:    return LogLevel::Trace;
        case spdlog::level::debug:    return LogLevel::Debug;
        case spdlog::level::info:     return LogLevel::Info;
        case spdlog::level::warn:     return LogLevel::Warn;
        case spdlog::level::err:      return LogLevel::Error;
        case spdlog::level::critical: return LogLevel::Fatal;
        case spdlog::level::off:      return LogLevel::Off;
        default:                      return LogLevel::Info;
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

SpdlogLogger::SpdlogLogger(LogLevel min_level)
    : SpdlogLogger(std::vector<spdlog::sink_ptr>{std::make_shared<spdlog::sinks::stdout_color_sink_mt>()}, min_level)
{}

SpdlogLogger::SpdlogLogger(std::shared_ptr<spdlog::logger> logger)
    : logger_(require_logger(std::move(logger)))
    , min_level_(from_spdlog_level(logger_->level()))
{}

SpdlogLogger::SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel min_level)
    : logger_(std::make_shared<spdlog::logger>(instance_name("service"), sinks.begin(), sinks.end()))
    , min_level_(min_level)
{
    apply_service_defaults(*logger_, min_level);
}

// ─────────────────────────────────────────────────────────────────────────────
// ILogger
// ─────────────────────────────────────────────────────────────────────────────

void SpdlogLogger::log(const LogRecord& record) {
    if (!should_log(record.level)) {
        return;
    }

    const spdlog::source_loc loc{
        record.location.file_name(),
        static_cast<int>(record.location.line()),
        record.location.function_name()
    };

    if (record.component.empty()) {
        logger_->log(loc, to_spdlog_level(record.level), "{}", record.message);
        return;
    }
    logger_->log(loc, to_spdlog_level(record.level), "[{}] {}", record.component, record.message);
}

bool SpdlogLogger::should_log(LogLevel level) const noexcept {
    return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(min_level_);
}

void SpdlogLogger::set_level(LogLevel level) noexcept {
    min_level_ = level;
    logger_->set_level(to_spdlog_level(level));
}

void SpdlogLogger::flush() {
    logger_->flush();
}

// ─────────────────────────────────────────────────────────────────────────────
// Factories
// ─────────────────────────────────────────────────────────────────────────────

std::unique_ptr<SpdlogLogger> make_spdlog_console_logger(LogLevel min_level) {
    return std::make_unique<SpdlogLogger>(min_level);
}

std::unique_ptr<SpdlogLogger> make_spdlog_console_file_logger(
    const std::string& filename,
    LogLevel min_level,
    std::size_t max_file_bytes,
    std::size_t max_files
) {
    std::vector<spdlog::sink_ptr> sinks{
        std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
        std::make_shared<spdlog::sinks::rotating_file_sink_mt>(filename, max_file_bytes, max_files),
    };
    return std::make_unique<SpdlogLogger>(std::move(sinks), min_level);
}

std::unique_ptr<SpdlogLogger> make_spdlog_async_console_logger(
    LogLevel min_level,
    std::size_t queue_size
) {
    static std::once_flag pool_flag;
    std::call_once(pool_flag, [queue_size]() {
        spdlog::init_thread_pool(queue_size, 1);
    });

    auto logger = std::make_shared<spdlog::async_logger>(
        instance_name("async"),
        std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
        spdlog::thread_pool(),
        spdlog::async_overflow_policy::block
    );
    apply_service_defaults(*logger, min_level);
    return std::make_unique<SpdlogLogger>(std::move(logger));
}

}  // namespace billguard
