#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Circuit Breaker (failure tracker)
// ═══════════════════════════════════════════════════════════════════════════
// One instance per external dependency (store, AI inference, billing API).
//
// State Machine:
//
//   ┌─────────┐  failure_threshold failures   ┌────────┐
//   │ CLOSED  │ ─────────────────────────────▶│  OPEN  │◀──────────┐
//   └─────────┘     within failure_window     └────┬───┘           │
//        ▲                                         │ reset_timeout │
//        │                                         │ (lazy, on the │
//        │                                         ▼  next call)   │
//        │    success_threshold consecutive  ┌──────────┐   any    │
//        └───────────────────────────────────│HALF_OPEN │──────────┘
//                      successes             └──────────┘  failure
//
// Thresholds are counts inside a trailing window, not rates. The window is
// pruned before every threshold comparison, so stale failures never count.
// There is no background timer: OPEN -> HALF_OPEN is evaluated by
// can_attempt(), state() and stats().
//
// Usage:
//   CircuitBreaker store_breaker(CircuitBreakerConfig::database());
//
//   auto rows = store_breaker.execute(
//       [&] { return store.load(id); },
//       [](const CircuitOpenError& e) { return cached_rows(e.retry_after()); });
//
// All mutations are serialized by a per-instance mutex. Logging and
// state-change callbacks run after the mutex is released.

#include "billguard/util/clock.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace billguard {

// ─────────────────────────────────────────────────────────────────────────────
// State
// ─────────────────────────────────────────────────────────────────────────────

enum class CircuitState {
    Closed,    ///< Calls pass through
    Open,      ///< Calls rejected until reset_timeout elapses
    HalfOpen   ///< Trial calls allowed; one failure reopens
};

[[nodiscard]] constexpr std::string_view to_string(CircuitState state) noexcept {
    switch (state) {
        case CircuitState::Closed:   return "CLOSED";
        case CircuitState::Open:     return "OPEN";
        case CircuitState::HalfOpen: return "HALF_OPEN";
    }
    return "UNKNOWN";
}

// ─────────────────────────────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────────────────────────────

struct CircuitBreakerConfig {
    /// Dependency name used in logs, errors and health output
    std::string name{"default"};

    /// Failures inside failure_window that open the circuit
    std::size_t failure_threshold{5};

    /// Consecutive HALF_OPEN successes that close the circuit
    std::size_t success_threshold{1};

    /// Time spent OPEN before a trial call is admitted
    std::chrono::milliseconds reset_timeout{30'000};

    /// Trailing window over which failures are counted
    std::chrono::milliseconds failure_window{60'000};

    CircuitBreakerConfig& with_name(std::string value) {
        name = std::move(value);
        return *this;
    }

    CircuitBreakerConfig& with_failure_threshold(std::size_t value) {
        failure_threshold = value;
        return *this;
    }

    CircuitBreakerConfig& with_success_threshold(std::size_t value) {
        success_threshold = value;
        return *this;
    }

    CircuitBreakerConfig& with_reset_timeout(std::chrono::milliseconds value) {
        reset_timeout = value;
        return *this;
    }

    CircuitBreakerConfig& with_failure_window(std::chrono::milliseconds value) {
        failure_window = value;
        return *this;
    }

    /// Empty when the configuration is usable
    [[nodiscard]] std::string validation_error() const;

    // Presets for the dependencies the webhook service talks to
    [[nodiscard]] static CircuitBreakerConfig database();
    [[nodiscard]] static CircuitBreakerConfig ai_inference();
    [[nodiscard]] static CircuitBreakerConfig billing();
};

// ─────────────────────────────────────────────────────────────────────────────
// Statistics snapshot
// ─────────────────────────────────────────────────────────────────────────────

struct CircuitBreakerStats {
    CircuitState state{CircuitState::Closed};
    std::size_t failures{0};    ///< Failures currently inside the window
    std::size_t successes{0};   ///< Consecutive successes
    std::optional<IClock::time_point> last_failure_time;
    std::optional<IClock::time_point> last_success_time;
    std::uint64_t total_requests{0};
    std::uint64_t total_failures{0};
    std::uint64_t total_successes{0};
    std::uint64_t times_opened{0};
};

// ─────────────────────────────────────────────────────────────────────────────
// CircuitOpenError
// ─────────────────────────────────────────────────────────────────────────────
// Thrown by execute() when the call was rejected and no fallback was given.

class CircuitOpenError : public std::runtime_error {
public:
    CircuitOpenError(std::string dependency, std::chrono::milliseconds retry_after);

    [[nodiscard]] const std::string& dependency() const noexcept { return dependency_; }

    /// Time until the circuit will admit a trial call (never negative)
    [[nodiscard]] std::chrono::milliseconds retry_after() const noexcept { return retry_after_; }

private:
    std::string dependency_;
    std::chrono::milliseconds retry_after_;
};

/// A state change computed under the lock, published after it is released.
struct StateTransition {
    CircuitState from;
    CircuitState to;
    std::size_t window_failures;
    bool forced{false};
};

namespace detail {

template <typename T>
struct is_expected : std::false_type {};

template <typename T, typename E>
struct is_expected<tl::expected<T, E>> : std::true_type {};

template <typename T>
inline constexpr bool is_expected_v = is_expected<std::remove_cvref_t<T>>::value;

}  // namespace detail

// ─────────────────────────────────────────────────────────────────────────────
// CircuitBreaker
// ─────────────────────────────────────────────────────────────────────────────

class CircuitBreaker {
public:
    using StateChangeCallback =
        std::function<void(std::string_view name, CircuitState from, CircuitState to)>;

    /// Result of asking the breaker for permission to call
    struct Admission {
        bool admitted{false};
        std::chrono::milliseconds retry_after{0};
    };

    /// Throws std::invalid_argument if the configuration is invalid
    explicit CircuitBreaker(
        CircuitBreakerConfig config,
        std::shared_ptr<IClock> clock = default_clock()
    );

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;
    CircuitBreaker(CircuitBreaker&&) = delete;
    CircuitBreaker& operator=(CircuitBreaker&&) = delete;

    ~CircuitBreaker() = default;

    // ─────────────────────────────────────────────────────────────────────────
    // Core operations
    // ─────────────────────────────────────────────────────────────────────────

    /// Prunes the window and reports whether a call may proceed.
    /// May transition OPEN -> HALF_OPEN.
    [[nodiscard]] bool can_attempt();

    void record_success();
    void record_failure();

    /// Counts a request and evaluates can_attempt(). Used by the guarded
    /// call wrappers; a rejected admission carries the retry delay.
    [[nodiscard]] Admission admit();

    /// Logs a rejected admission and builds the error handed to the caller
    [[nodiscard]] CircuitOpenError rejection(std::chrono::milliseconds retry_after);

    /// Run `op` through the breaker. Rejected calls throw CircuitOpenError.
    /// An exception from `op` is recorded as a failure and rethrown
    /// unchanged; a tl::expected holding an error is recorded as a failure
    /// and returned unchanged.
    template <typename Op>
    auto execute(Op&& op) -> std::invoke_result_t<Op&> {
        const auto admission = admit();
        if (!admission.admitted) {
            throw rejection(admission.retry_after);
        }
        return run_admitted(op);
    }

    /// As above, but a rejected call returns `fallback()` instead of throwing.
    /// The fallback may take `const CircuitOpenError&`. It is never used for
    /// failures of an admitted call.
    template <typename Op, typename Fallback>
    auto execute(Op&& op, Fallback&& fallback) -> std::invoke_result_t<Op&> {
        const auto admission = admit();
        if (!admission.admitted) {
            if constexpr (std::is_invocable_v<Fallback&, const CircuitOpenError&>) {
                return std::invoke(fallback, rejection(admission.retry_after));
            } else {
                (void)rejection(admission.retry_after);
                return std::invoke(fallback);
            }
        }
        return run_admitted(op);
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Queries (refresh-before-read: may perform OPEN -> HALF_OPEN)
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] CircuitState state();
    [[nodiscard]] CircuitBreakerStats stats();

    /// Remaining OPEN time, zero when not OPEN
    [[nodiscard]] std::chrono::milliseconds retry_after();

    [[nodiscard]] const CircuitBreakerConfig& config() const noexcept { return config_; }
    [[nodiscard]] const std::string& name() const noexcept { return config_.name; }

    // ─────────────────────────────────────────────────────────────────────────
    // Administrative overrides
    // ─────────────────────────────────────────────────────────────────────────

    /// Forcing OPEN stamps opened_at with now; any other state clears it
    void force_state(CircuitState state);

    /// Back to CLOSED with an empty window. Lifetime counters are kept.
    void reset();

    void on_state_change(StateChangeCallback callback);

private:
    template <typename Op>
    auto run_admitted(Op& op) -> std::invoke_result_t<Op&> {
        using Result = std::invoke_result_t<Op&>;

        if constexpr (std::is_void_v<Result>) {
            try {
                std::invoke(op);
            } catch (...) {
                record_failure();
                throw;
            }
            record_success();
        } else {
            Result result = [&]() -> Result {
                try {
                    return std::invoke(op);
                } catch (...) {
                    record_failure();
                    throw;
                }
            }();

            if constexpr (detail::is_expected_v<Result>) {
                if (!result) {
                    record_failure();
                    return result;
                }
            }
            record_success();
            return result;
        }
    }

    // Transition helpers; caller holds mutex_
    void prune_locked(IClock::time_point now);
    [[nodiscard]] std::optional<StateTransition> enter_locked(CircuitState to, IClock::time_point now);
    [[nodiscard]] std::optional<StateTransition> refresh_locked(IClock::time_point now);
    [[nodiscard]] bool reset_timeout_elapsed_locked(IClock::time_point now) const;
    [[nodiscard]] std::chrono::milliseconds retry_after_locked(IClock::time_point now) const;

    // Side effects of a transition (logging, callbacks); caller must NOT hold mutex_
    void publish(const StateTransition& transition);

    CircuitBreakerConfig config_;
    std::shared_ptr<IClock> clock_;
    std::string log_component_;

    mutable std::mutex mutex_;
    CircuitState state_{CircuitState::Closed};
    std::deque<IClock::time_point> failure_times_;
    std::size_t consecutive_successes_{0};
    std::optional<IClock::time_point> opened_at_;
    std::optional<IClock::time_point> last_failure_time_;
    std::optional<IClock::time_point> last_success_time_;

    std::uint64_t total_requests_{0};
    std::uint64_t total_failures_{0};
    std::uint64_t total_successes_{0};
    std::uint64_t times_opened_{0};

    std::vector<StateChangeCallback> callbacks_;
};

}  // namespace billguard
