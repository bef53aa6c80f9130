#ifndef BILLGUARD_UTIL_TIME_HPP
#define BILLGUARD_UTIL_TIME_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace billguard {

/// Wall-clock instant (event creation, period end, ledger rows)
using Timestamp = std::chrono::system_clock::time_point;

[[nodiscard]] inline Timestamp from_unix_seconds(std::int64_t seconds) {
    return Timestamp{std::chrono::seconds{seconds}};
}

[[nodiscard]] inline std::int64_t to_unix_seconds(Timestamp tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

/// "2024-05-01T12:00:00.000Z"
[[nodiscard]] std::string format_iso8601(Timestamp tp);

/// Accepts the output of format_iso8601 (milliseconds optional)
[[nodiscard]] std::optional<Timestamp> parse_iso8601(std::string_view text);

}  // namespace billguard

#endif  // BILLGUARD_UTIL_TIME_HPP
