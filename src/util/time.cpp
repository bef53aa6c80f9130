#include "billguard/util/time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace billguard {

std::string format_iso8601(Timestamp tp) {
    const auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()
    ).count() % 1000;
    if (ms < 0) {
        ms += 1000;
    }

    std::tm tm_buf{};
    gmtime_r(&time_t_val, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
    return oss.str();
}

std::optional<Timestamp> parse_iso8601(std::string_view text) {
    std::tm tm_buf{};
    std::istringstream iss{std::string(text)};
    iss >> std::get_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return std::nullopt;
    }

    int ms = 0;
    if (iss.peek() == '.') {
        iss.get();
        iss >> ms;
        if (iss.fail() || ms < 0 || ms > 999) {
            return std::nullopt;
        }
    }

    const std::time_t seconds = timegm(&tm_buf);
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(seconds) + std::chrono::milliseconds{ms};
}

}  // namespace billguard
