#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

namespace billguard {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,
    Debug = 1,
    Info  = 2,
    Warn  = 3,  // Recoverable: unknown account, unhandled event type
    Error = 4,  // Operation failed: store error, rejected signature
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

/// Parse a level name as used in BILLGUARD_LOG_LEVEL ("info", "WARN", ...).
/// Unknown names yield `fallback`.
[[nodiscard]] LogLevel parse_log_level(std::string_view name, LogLevel fallback = LogLevel::Info) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Log Record
// ─────────────────────────────────────────────────────────────────────────────
// `component` names the subsystem emitting the record ("circuit:database",
// "webhook", "sync"). It is rendered as a bracketed prefix by every backend.

struct LogRecord {
    LogLevel level;
    std::string component;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(
        LogLevel lvl,
        std::string_view comp,
        std::string msg,
        std::source_location loc = std::source_location::current()
    )
        : level(lvl)
        , component(comp)
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger Interface
// ─────────────────────────────────────────────────────────────────────────────

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void write(
        LogLevel level,
        std::string_view component,
        std::string_view msg,
        std::source_location loc = std::source_location::current()
    ) {
        if (should_log(level)) {
            log(LogRecord(level, component, std::string(msg), loc));
        }
    }

    void debug(std::string_view component, std::string_view msg,
               std::source_location loc = std::source_location::current()) {
        write(LogLevel::Debug, component, msg, loc);
    }

    void info(std::string_view component, std::string_view msg,
              std::source_location loc = std::source_location::current()) {
        write(LogLevel::Info, component, msg, loc);
    }

    void warn(std::string_view component, std::string_view msg,
              std::source_location loc = std::source_location::current()) {
        write(LogLevel::Warn, component, msg, loc);
    }

    void error(std::string_view component, std::string_view msg,
               std::source_location loc = std::source_location::current()) {
        write(LogLevel::Error, component, msg, loc);
    }

    // std::format helpers; the format string is only evaluated when the
    // level is enabled.
    template<typename... Args>
    void info_fmt(std::string_view component, std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(LogLevel::Info)) {
            log(LogRecord(LogLevel::Info, component, std::format(fmt, std::forward<Args>(args)...)));
        }
    }

    template<typename... Args>
    void warn_fmt(std::string_view component, std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(LogLevel::Warn)) {
            log(LogRecord(LogLevel::Warn, component, std::format(fmt, std::forward<Args>(args)...)));
        }
    }

    template<typename... Args>
    void error_fmt(std::string_view component, std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(LogLevel::Error)) {
            log(LogRecord(LogLevel::Error, component, std::format(fmt, std::forward<Args>(args)...)));
        }
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// NullLogger - default backend, discards everything
// ─────────────────────────────────────────────────────────────────────────────

class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger - stderr, optional ANSI colors
// ─────────────────────────────────────────────────────────────────────────────

class ConsoleLogger final : public ILogger {
public:
    explicit ConsoleLogger(LogLevel min_level = LogLevel::Info)
        : min_level_(min_level)
    {}

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(min_level_);
    }

    void set_level(LogLevel level) noexcept { min_level_ = level; }

    [[nodiscard]] LogLevel level() const noexcept { return min_level_; }

    void set_colors_enabled(bool enabled) noexcept { colors_enabled_ = enabled; }

private:
    LogLevel min_level_;
    bool colors_enabled_ = true;
};

// ─────────────────────────────────────────────────────────────────────────────
// Process-wide logger
// ─────────────────────────────────────────────────────────────────────────────

/// Current logger (NullLogger until set_logger is called).
[[nodiscard]] ILogger& get_logger() noexcept;

/// Replace the process logger. nullptr restores the NullLogger.
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

#define BILLGUARD_LOG_DEBUG(component, msg) \
    do { if (::billguard::get_logger().should_log(::billguard::LogLevel::Debug)) \
         ::billguard::get_logger().debug(component, msg); } while(false)

#define BILLGUARD_LOG_INFO(component, msg) \
    do { if (::billguard::get_logger().should_log(::billguard::LogLevel::Info)) \
         ::billguard::get_logger().info(component, msg); } while(false)

#define BILLGUARD_LOG_WARN(component, msg) \
    do { if (::billguard::get_logger().should_log(::billguard::LogLevel::Warn)) \
         ::billguard::get_logger().warn(component, msg); } while(false)

#define BILLGUARD_LOG_ERROR(component, msg) \
    do { if (::billguard::get_logger().should_log(::billguard::LogLevel::Error)) \
         ::billguard::get_logger().error(component, msg); } while(false)

}  // namespace billguard
