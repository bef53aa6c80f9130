#include "billguard/log/logger.hpp"
#include "billguard/util/time.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace billguard {

namespace {

constexpr std::string_view RESET  = "\033[0m";
constexpr std::string_view GRAY   = "\033[90m";
constexpr std::string_view CYAN   = "\033[36m";
constexpr std::string_view GREEN  = "\033[32m";
constexpr std::string_view YELLOW = "\033[33m";
constexpr std::string_view RED    = "\033[31m";
constexpr std::string_view BLUE   = "\033[34m";

[[nodiscard]] std::string_view level_color(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return GRAY;
        case LogLevel::Debug: return CYAN;
        case LogLevel::Info:  return GREEN;
        case LogLevel::Warn:  return YELLOW;
        case LogLevel::Error:
        case LogLevel::Fatal: return RED;
        case LogLevel::Off:   return RESET;
    }
    return RESET;
}

}  // namespace

LogLevel parse_log_level(std::string_view name, LogLevel fallback) noexcept {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "fatal" || lower == "critical") return LogLevel::Fatal;
    if (lower == "off" || lower == "none") return LogLevel::Off;
    return fallback;
}

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger
// ─────────────────────────────────────────────────────────────────────────────
// Line format: <utc timestamp> <LEVEL> [component] message

void ConsoleLogger::log(const LogRecord& record) {
    if (!should_log(record.level)) {
        return;
    }

    std::ostringstream oss;
    const bool use_colors = colors_enabled_;

    if (use_colors) oss << GRAY;
    oss << format_iso8601(record.timestamp);
    if (use_colors) oss << RESET;

    oss << ' ';
    if (use_colors) oss << level_color(record.level);
    oss << std::setw(5) << std::left << to_string(record.level);
    if (use_colors) oss << RESET;

    if (!record.component.empty()) {
        oss << ' ';
        if (use_colors) oss << BLUE;
        oss << '[' << record.component << ']';
        if (use_colors) oss << RESET;
    }

    oss << ' ' << record.message << '\n';

    static std::mutex output_mutex;
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cerr << oss.str();
}

// ─────────────────────────────────────────────────────────────────────────────
// Process-wide logger
// ─────────────────────────────────────────────────────────────────────────────

namespace {

std::unique_ptr<ILogger>& logger_instance() {
    static std::unique_ptr<ILogger> instance = std::make_unique<NullLogger>();
    return instance;
}

std::mutex& logger_mutex() {
    static std::mutex mutex;
    return mutex;
}

}  // namespace

ILogger& get_logger() noexcept {
    std::lock_guard<std::mutex> lock(logger_mutex());
    return *logger_instance();
}

void set_logger(std::unique_ptr<ILogger> logger) noexcept {
    std::lock_guard<std::mutex> lock(logger_mutex());
    if (logger) {
        logger_instance() = std::move(logger);
    } else {
        logger_instance() = std::make_unique<NullLogger>();
    }
}

}  // namespace billguard
