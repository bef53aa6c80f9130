#include "billguard/resilience/service_registry.hpp"
#include "billguard/log/logger.hpp"
#include "billguard/util/time.hpp"

namespace billguard {

namespace {

constexpr std::string_view kComponent = "registry";

}  // namespace

ServiceRegistry::ServiceRegistry(ServiceRegistryConfig config, std::shared_ptr<IClock> clock) {
    breakers_[index(Dependency::Store)] =
        std::make_unique<CircuitBreaker>(std::move(config.store), clock);
    breakers_[index(Dependency::AiInference)] =
        std::make_unique<CircuitBreaker>(std::move(config.ai_inference), clock);
    breakers_[index(Dependency::Billing)] =
        std::make_unique<CircuitBreaker>(std::move(config.billing), clock);

    for (const auto dependency : kAllDependencies) {
        breakers_[index(dependency)]->on_state_change(
            [this, dependency](std::string_view name, CircuitState from, CircuitState to) {
                get_logger().info_fmt(kComponent, "Service {} circuit changed {} -> {}",
                                      name, to_string(from), to_string(to));
                notify(dependency);
            });
    }
}

CircuitBreaker& ServiceRegistry::breaker(Dependency dependency) noexcept {
    return *breakers_[index(dependency)];
}

// ─────────────────────────────────────────────────────────────────────────────
// Status
// ─────────────────────────────────────────────────────────────────────────────

ServiceStatus ServiceRegistry::status(Dependency dependency) {
    auto& tracker = breaker(dependency);
    const CircuitState state = tracker.state();

    ServiceStatus result;
    result.name = tracker.name();
    result.state = state;
    result.available = (state != CircuitState::Open);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto& record = health_[index(dependency)];
        result.consecutive_failures = record.consecutive_failures;
        result.last_check = record.last_check;
        result.message = record.message;
    }

    result.degraded = (state == CircuitState::HalfOpen) || result.consecutive_failures > 0;
    return result;
}

bool ServiceRegistry::is_available(Dependency dependency) {
    return breaker(dependency).can_attempt();
}

OverallHealth ServiceRegistry::overall_health() {
    std::size_t unavailable = 0;
    std::size_t degraded = 0;
    bool store_available = true;

    for (const auto dependency : kAllDependencies) {
        const auto s = status(dependency);
        if (!s.available) {
            ++unavailable;
            if (dependency == Dependency::Store) {
                store_available = false;
            }
        } else if (s.degraded) {
            ++degraded;
        }
    }

    if (!store_available || unavailable >= 2) {
        return OverallHealth::Unhealthy;
    }
    if (unavailable > 0 || degraded >= 2) {
        return OverallHealth::Degraded;
    }
    return OverallHealth::Healthy;
}

// ─────────────────────────────────────────────────────────────────────────────
// Probes
// ─────────────────────────────────────────────────────────────────────────────

void ServiceRegistry::mark_healthy(Dependency dependency) {
    note_success(dependency);
    auto& tracker = breaker(dependency);
    if (tracker.state() != CircuitState::Closed) {
        tracker.record_success();
    }
}

void ServiceRegistry::mark_unhealthy(Dependency dependency, std::string message) {
    note_failure(dependency, message.empty() ? std::nullopt : std::optional<std::string>(std::move(message)));
    breaker(dependency).record_failure();
}

void ServiceRegistry::reset_all() {
    for (const auto dependency : kAllDependencies) {
        breaker(dependency).reset();
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        health_.fill(HealthRecord{});
    }
    get_logger().info(kComponent, "All service circuits reset");
}

void ServiceRegistry::add_listener(StatusListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(std::move(listener));
}

// ─────────────────────────────────────────────────────────────────────────────
// Health bookkeeping
// ─────────────────────────────────────────────────────────────────────────────

void ServiceRegistry::note_success(Dependency dependency) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& record = health_[index(dependency)];
    record.consecutive_failures = 0;
    record.last_check = std::chrono::system_clock::now();
    record.message.reset();
}

void ServiceRegistry::note_failure(Dependency dependency, std::optional<std::string> message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& record = health_[index(dependency)];
        ++record.consecutive_failures;
        record.last_check = std::chrono::system_clock::now();
        if (message) {
            record.message = std::move(message);
        }
    }
    notify(dependency);
}

void ServiceRegistry::notify(Dependency dependency) {
    std::vector<StatusListener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners = listeners_;
    }
    if (listeners.empty()) {
        return;
    }

    const auto current = status(dependency);
    for (const auto& listener : listeners) {
        try {
            listener(dependency, current);
        } catch (const std::exception& e) {
            get_logger().error_fmt(kComponent, "Status listener for {} threw: {}",
                                   to_string(dependency), e.what());
        }
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// JSON
// ─────────────────────────────────────────────────────────────────────────────

nlohmann::json to_json(const ServiceStatus& status) {
    nlohmann::json j = {
        {"name", status.name},
        {"available", status.available},
        {"circuit_state", std::string(to_string(status.state))},
        {"consecutive_failures", status.consecutive_failures},
        {"degraded", status.degraded},
        {"last_check", nullptr},
    };
    if (status.last_check) {
        j["last_check"] = format_iso8601(*status.last_check);
    }
    if (status.message) {
        j["message"] = *status.message;
    }
    return j;
}

nlohmann::json ServiceRegistry::to_json() {
    nlohmann::json services = nlohmann::json::object();
    for (const auto dependency : kAllDependencies) {
        services[std::string(billguard::to_string(dependency))] = billguard::to_json(status(dependency));
    }

    return {
        {"overall_health", std::string(billguard::to_string(overall_health()))},
        {"last_updated", format_iso8601(std::chrono::system_clock::now())},
        {"services", std::move(services)},
    };
}

}  // namespace billguard
