#ifndef BILLGUARD_RESILIENCE_SERVICE_REGISTRY_HPP
#define BILLGUARD_RESILIENCE_SERVICE_REGISTRY_HPP

#include "billguard/resilience/circuit_breaker.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace billguard {

// ─────────────────────────────────────────────────────────────────────────────
// Dependencies
// ─────────────────────────────────────────────────────────────────────────────

enum class Dependency : std::size_t {
    Store = 0,
    AiInference = 1,
    Billing = 2,
};

inline constexpr std::size_t kDependencyCount = 3;

inline constexpr std::array<Dependency, kDependencyCount> kAllDependencies{
    Dependency::Store, Dependency::AiInference, Dependency::Billing};

[[nodiscard]] constexpr std::string_view to_string(Dependency dependency) noexcept {
    switch (dependency) {
        case Dependency::Store:       return "store";
        case Dependency::AiInference: return "ai-inference";
        case Dependency::Billing:     return "billing";
    }
    return "unknown";
}

enum class OverallHealth {
    Healthy,
    Degraded,
    Unhealthy
};

[[nodiscard]] constexpr std::string_view to_string(OverallHealth health) noexcept {
    switch (health) {
        case OverallHealth::Healthy:   return "healthy";
        case OverallHealth::Degraded:  return "degraded";
        case OverallHealth::Unhealthy: return "unhealthy";
    }
    return "unknown";
}

struct ServiceStatus {
    std::string name;
    bool available{true};
    CircuitState state{CircuitState::Closed};
    std::size_t consecutive_failures{0};
    bool degraded{false};
    std::optional<std::chrono::system_clock::time_point> last_check;
    std::optional<std::string> message;
};

struct ServiceRegistryConfig {
    CircuitBreakerConfig store{CircuitBreakerConfig::database()};
    CircuitBreakerConfig ai_inference{CircuitBreakerConfig::ai_inference()};
    CircuitBreakerConfig billing{CircuitBreakerConfig::billing()};
};

// ─────────────────────────────────────────────────────────────────────────────
// ServiceRegistry
// ─────────────────────────────────────────────────────────────────────────────
// Owns one failure tracker per dependency and the health bookkeeping the
// health endpoint reports. Constructed explicitly and passed to whoever
// issues calls; there is no process-wide instance.

class ServiceRegistry {
public:
    using StatusListener = std::function<void(Dependency, const ServiceStatus&)>;

    explicit ServiceRegistry(
        ServiceRegistryConfig config = {},
        std::shared_ptr<IClock> clock = default_clock()
    );

    ServiceRegistry(const ServiceRegistry&) = delete;
    ServiceRegistry& operator=(const ServiceRegistry&) = delete;

    [[nodiscard]] CircuitBreaker& breaker(Dependency dependency) noexcept;

    /// Guarded call that also updates the dependency's health record.
    /// Rejections propagate as CircuitOpenError (or resolve to the fallback).
    template <typename Op>
    auto execute(Dependency dependency, Op&& op) {
        return breaker(dependency).execute([&]() { return observe(dependency, op); });
    }

    template <typename Op, typename Fallback>
    auto execute(Dependency dependency, Op&& op, Fallback&& fallback) {
        return breaker(dependency).execute(
            [&]() { return observe(dependency, op); },
            std::forward<Fallback>(fallback));
    }

    [[nodiscard]] ServiceStatus status(Dependency dependency);
    [[nodiscard]] bool is_available(Dependency dependency);
    [[nodiscard]] OverallHealth overall_health();

    /// Out-of-band probe results (health checks, admin actions)
    void mark_healthy(Dependency dependency);
    void mark_unhealthy(Dependency dependency, std::string message = {});

    /// Every tracker back to CLOSED, health records cleared
    void reset_all();

    void add_listener(StatusListener listener);

    /// {"overall_health": ..., "last_updated": ..., "services": {...}}
    [[nodiscard]] nlohmann::json to_json();

private:
    struct HealthRecord {
        std::size_t consecutive_failures{0};
        std::optional<std::chrono::system_clock::time_point> last_check;
        std::optional<std::string> message;
    };

    template <typename Op>
    auto observe(Dependency dependency, Op& op) -> std::invoke_result_t<Op&> {
        using Result = std::invoke_result_t<Op&>;
        try {
            if constexpr (std::is_void_v<Result>) {
                std::invoke(op);
                note_success(dependency);
            } else {
                Result result = std::invoke(op);
                if constexpr (detail::is_expected_v<Result>) {
                    if (!result) {
                        note_failure(dependency, std::nullopt);
                        return result;
                    }
                }
                note_success(dependency);
                return result;
            }
        } catch (const std::exception& e) {
            note_failure(dependency, std::string(e.what()));
            throw;
        }
    }

    void note_success(Dependency dependency);
    void note_failure(Dependency dependency, std::optional<std::string> message);
    void notify(Dependency dependency);

    [[nodiscard]] static std::size_t index(Dependency dependency) noexcept {
        return static_cast<std::size_t>(dependency);
    }

    std::array<std::unique_ptr<CircuitBreaker>, kDependencyCount> breakers_;

    std::mutex mutex_;
    std::array<HealthRecord, kDependencyCount> health_;
    std::vector<StatusListener> listeners_;
};

/// JSON rendering of a single status entry
[[nodiscard]] nlohmann::json to_json(const ServiceStatus& status);

}  // namespace billguard

#endif  // BILLGUARD_RESILIENCE_SERVICE_REGISTRY_HPP
