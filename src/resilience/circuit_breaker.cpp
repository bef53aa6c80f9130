#include "billguard/resilience/circuit_breaker.hpp"
#include "billguard/log/logger.hpp"

#include <algorithm>

namespace billguard {

using std::chrono::duration_cast;
using std::chrono::milliseconds;

// ─────────────────────────────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────────────────────────────

std::string CircuitBreakerConfig::validation_error() const {
    if (name.empty()) return "name is required";
    if (failure_threshold == 0) return "failure_threshold must be greater than zero";
    if (success_threshold == 0) return "success_threshold must be greater than zero";
    if (reset_timeout.count() <= 0) return "reset_timeout must be positive";
    if (failure_window.count() <= 0) return "failure_window must be positive";
    return "";
}

CircuitBreakerConfig CircuitBreakerConfig::database() {
    return CircuitBreakerConfig{
        .name = "database",
        .failure_threshold = 5,
        .success_threshold = 3,
        .reset_timeout = milliseconds{30'000},
        .failure_window = milliseconds{60'000},
    };
}

CircuitBreakerConfig CircuitBreakerConfig::ai_inference() {
    return CircuitBreakerConfig{
        .name = "ai-inference",
        .failure_threshold = 3,
        .success_threshold = 2,
        .reset_timeout = milliseconds{60'000},
        .failure_window = milliseconds{120'000},
    };
}

CircuitBreakerConfig CircuitBreakerConfig::billing() {
    return CircuitBreakerConfig{
        .name = "billing",
        .failure_threshold = 3,
        .success_threshold = 2,
        .reset_timeout = milliseconds{30'000},
        .failure_window = milliseconds{60'000},
    };
}

// ─────────────────────────────────────────────────────────────────────────────
// CircuitOpenError
// ─────────────────────────────────────────────────────────────────────────────

CircuitOpenError::CircuitOpenError(std::string dependency, milliseconds retry_after)
    : std::runtime_error("Circuit breaker open for service: " + dependency)
    , dependency_(std::move(dependency))
    , retry_after_(std::max(retry_after, milliseconds{0}))
{}

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig config, std::shared_ptr<IClock> clock)
    : config_(std::move(config))
    , clock_(clock ? std::move(clock) : default_clock())
    , log_component_("circuit:" + config_.name)
{
    const auto error = config_.validation_error();
    if (!error.empty()) {
        throw std::invalid_argument("Invalid CircuitBreakerConfig: " + error);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Core Operations
// ─────────────────────────────────────────────────────────────────────────────

bool CircuitBreaker::can_attempt() {
    std::optional<StateTransition> transition;
    bool allowed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_->now();
        prune_locked(now);
        transition = refresh_locked(now);
        allowed = (state_ != CircuitState::Open);
    }

    if (transition) {
        publish(*transition);
    }
    return allowed;
}

CircuitBreaker::Admission CircuitBreaker::admit() {
    std::optional<StateTransition> transition;
    Admission admission;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_->now();
        ++total_requests_;
        prune_locked(now);
        transition = refresh_locked(now);
        admission.admitted = (state_ != CircuitState::Open);
        if (!admission.admitted) {
            admission.retry_after = retry_after_locked(now);
        }
    }

    if (transition) {
        publish(*transition);
    }
    return admission;
}

void CircuitBreaker::record_success() {
    std::optional<StateTransition> transition;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_->now();
        ++total_successes_;
        ++consecutive_successes_;
        last_success_time_ = now;

        if (state_ == CircuitState::HalfOpen &&
            consecutive_successes_ >= config_.success_threshold) {
            transition = enter_locked(CircuitState::Closed, now);
        }
    }

    if (transition) {
        publish(*transition);
    }
}

void CircuitBreaker::record_failure() {
    std::optional<StateTransition> transition;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_->now();
        ++total_failures_;
        failure_times_.push_back(now);
        last_failure_time_ = now;
        consecutive_successes_ = 0;

        switch (state_) {
            case CircuitState::HalfOpen:
                // A failed trial reopens the circuit and restarts the cooldown
                transition = enter_locked(CircuitState::Open, now);
                break;

            case CircuitState::Closed:
                prune_locked(now);
                if (failure_times_.size() >= config_.failure_threshold) {
                    transition = enter_locked(CircuitState::Open, now);
                }
                break;

            case CircuitState::Open:
                // Late result of a call admitted before the circuit opened
                break;
        }
    }

    if (transition) {
        publish(*transition);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────────────────────────────────────

CircuitState CircuitBreaker::state() {
    std::optional<StateTransition> transition;
    CircuitState current;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_->now();
        prune_locked(now);
        transition = refresh_locked(now);
        current = state_;
    }

    if (transition) {
        publish(*transition);
    }
    return current;
}

CircuitBreakerStats CircuitBreaker::stats() {
    std::optional<StateTransition> transition;
    CircuitBreakerStats snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_->now();
        prune_locked(now);
        transition = refresh_locked(now);

        snapshot.state = state_;
        snapshot.failures = failure_times_.size();
        snapshot.successes = consecutive_successes_;
        snapshot.last_failure_time = last_failure_time_;
        snapshot.last_success_time = last_success_time_;
        snapshot.total_requests = total_requests_;
        snapshot.total_failures = total_failures_;
        snapshot.total_successes = total_successes_;
        snapshot.times_opened = times_opened_;
    }

    if (transition) {
        publish(*transition);
    }
    return snapshot;
}

milliseconds CircuitBreaker::retry_after() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != CircuitState::Open) {
        return milliseconds{0};
    }
    return retry_after_locked(clock_->now());
}

// ─────────────────────────────────────────────────────────────────────────────
// Administrative overrides
// ─────────────────────────────────────────────────────────────────────────────

void CircuitBreaker::force_state(CircuitState state) {
    StateTransition transition{};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        transition = StateTransition{state_, state, failure_times_.size(), true};
        state_ = state;
        consecutive_successes_ = 0;
        if (state == CircuitState::Open) {
            opened_at_ = clock_->now();
        } else {
            opened_at_.reset();
        }
    }

    publish(transition);
}

void CircuitBreaker::reset() {
    std::optional<StateTransition> transition;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != CircuitState::Closed) {
            transition = StateTransition{state_, CircuitState::Closed, failure_times_.size(), true};
        }
        state_ = CircuitState::Closed;
        failure_times_.clear();
        consecutive_successes_ = 0;
        opened_at_.reset();
    }

    get_logger().info(log_component_, "Circuit breaker reset");
    if (transition) {
        publish(*transition);
    }
}

void CircuitBreaker::on_state_change(StateChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.push_back(std::move(callback));
}

// ─────────────────────────────────────────────────────────────────────────────
// Transition helpers (caller holds mutex_)
// ─────────────────────────────────────────────────────────────────────────────

void CircuitBreaker::prune_locked(IClock::time_point now) {
    const auto cutoff = now - config_.failure_window;
    while (!failure_times_.empty() && failure_times_.front() <= cutoff) {
        failure_times_.pop_front();
    }
}

std::optional<StateTransition> CircuitBreaker::enter_locked(CircuitState to, IClock::time_point now) {
    const CircuitState from = state_;
    state_ = to;
    consecutive_successes_ = 0;

    switch (to) {
        case CircuitState::Open:
            opened_at_ = now;
            ++times_opened_;
            break;
        case CircuitState::Closed:
            opened_at_.reset();
            failure_times_.clear();
            break;
        case CircuitState::HalfOpen:
            break;
    }

    return StateTransition{from, to, failure_times_.size(), false};
}

std::optional<StateTransition> CircuitBreaker::refresh_locked(IClock::time_point now) {
    if (state_ == CircuitState::Open && reset_timeout_elapsed_locked(now)) {
        return enter_locked(CircuitState::HalfOpen, now);
    }
    return std::nullopt;
}

bool CircuitBreaker::reset_timeout_elapsed_locked(IClock::time_point now) const {
    if (!opened_at_) {
        // Forced open without a timestamp cannot happen; treat as elapsed
        return true;
    }
    return duration_cast<milliseconds>(now - *opened_at_) >= config_.reset_timeout;
}

milliseconds CircuitBreaker::retry_after_locked(IClock::time_point now) const {
    if (!opened_at_) {
        return milliseconds{0};
    }
    const auto elapsed = duration_cast<milliseconds>(now - *opened_at_);
    return std::max(milliseconds{0}, config_.reset_timeout - elapsed);
}

// ─────────────────────────────────────────────────────────────────────────────
// Side effects (mutex_ released)
// ─────────────────────────────────────────────────────────────────────────────

void CircuitBreaker::publish(const StateTransition& transition) {
    auto& logger = get_logger();
    if (transition.forced) {
        logger.warn_fmt(log_component_, "Circuit breaker state forced: {} -> {}",
                        to_string(transition.from), to_string(transition.to));
    } else {
        logger.info_fmt(log_component_, "Circuit breaker state transition: {} -> {} (window failures: {})",
                        to_string(transition.from), to_string(transition.to),
                        transition.window_failures);
    }

    std::vector<StateChangeCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks = callbacks_;
    }
    // A failing listener must not replace the guarded call's own outcome
    for (const auto& callback : callbacks) {
        try {
            callback(config_.name, transition.from, transition.to);
        } catch (const std::exception& e) {
            logger.error_fmt(log_component_, "State change listener threw: {}", e.what());
        }
    }
}

CircuitOpenError CircuitBreaker::rejection(milliseconds retry_after) {
    get_logger().warn_fmt(log_component_, "Circuit breaker rejected request (retry after {} ms)",
                          retry_after.count());
    return CircuitOpenError(config_.name, retry_after);
}

}  // namespace billguard
