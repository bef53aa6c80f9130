#ifndef BILLGUARD_UTIL_CLOCK_HPP
#define BILLGUARD_UTIL_CLOCK_HPP

#include <chrono>
#include <memory>

namespace billguard {

// ─────────────────────────────────────────────────────────────────────────────
// IClock
// ─────────────────────────────────────────────────────────────────────────────
// Monotonic time source for the failure trackers. Production code uses
// SteadyClock; tests inject a manually advanced clock so window and
// reset-timeout boundaries can be hit to the millisecond.

struct IClock {
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~IClock() = default;

    [[nodiscard]] virtual time_point now() const = 0;
};

class SteadyClock final : public IClock {
public:
    [[nodiscard]] time_point now() const override {
        return std::chrono::steady_clock::now();
    }
};

/// Shared default instance
[[nodiscard]] inline std::shared_ptr<IClock> default_clock() {
    static const auto clock = std::make_shared<SteadyClock>();
    return clock;
}

}  // namespace billguard

#endif  // BILLGUARD_UTIL_CLOCK_HPP
