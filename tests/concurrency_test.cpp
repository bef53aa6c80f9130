// ═══════════════════════════════════════════════════════════════════════════
// Concurrency Tests
// ═══════════════════════════════════════════════════════════════════════════
// Thread safety of the process logger, the failure trackers and the registry.

#include <catch2/catch_test_macros.hpp>

#include "billguard/log/logger.hpp"
#include "billguard/resilience/circuit_breaker.hpp"
#include "billguard/resilience/service_registry.hpp"
#include "mocks/manual_clock.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace billguard;
using namespace std::chrono_literals;

// ═══════════════════════════════════════════════════════════════════════════
// Logger Concurrency Tests
// ═══════════════════════════════════════════════════════════════════════════

class CountingLogger : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {
        log_count_.fetch_add(1, std::memory_order_relaxed);
    }

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return true;
    }

    [[nodiscard]] std::size_t count() const noexcept {
        return log_count_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<std::size_t> log_count_{0};
};

TEST_CASE("Logger concurrent writes are all delivered", "[concurrency][logger]") {
    constexpr int num_threads = 4;
    constexpr int writes_per_thread = 1000;

    auto counting = std::make_unique<CountingLogger>();
    auto* ptr = counting.get();
    set_logger(std::move(counting));

    std::vector<std::thread> threads;
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([]() {
            for (int j = 0; j < writes_per_thread; ++j) {
                get_logger().info_fmt("worker", "message {}", j);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(ptr->count() == num_threads * writes_per_thread);
    set_logger(nullptr);
    REQUIRE_FALSE(get_logger().should_log(LogLevel::Info));
}

// ═══════════════════════════════════════════════════════════════════════════
// CircuitBreaker Concurrency Tests
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("CircuitBreaker counts concurrent outcomes exactly", "[concurrency][circuit-breaker]") {
    constexpr int num_threads = 8;
    constexpr int calls_per_thread = 500;

    auto clock = std::make_shared<testing::ManualClock>();
    CircuitBreaker breaker(
        CircuitBreakerConfig{}.with_name("shared").with_failure_threshold(1000000), clock);

    std::vector<std::thread> threads;
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&breaker, i]() {
            for (int j = 0; j < calls_per_thread; ++j) {
                const bool fail = ((i + j) % 2 != 0);
                try {
                    (void)breaker.execute([fail]() -> int {
                        if (fail) {
                            throw std::runtime_error("store error");
                        }
                        return 1;
                    });
                } catch (const std::runtime_error&) {
                    // Counted by the breaker
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    const auto stats = breaker.stats();
    REQUIRE(stats.total_requests == num_threads * calls_per_thread);
    REQUIRE(stats.total_failures + stats.total_successes == stats.total_requests);
    REQUIRE(stats.total_failures == num_threads * calls_per_thread / 2);
    REQUIRE(stats.state == CircuitState::Closed);
}

TEST_CASE("CircuitBreaker opens exactly once under concurrent failures", "[concurrency][circuit-breaker]") {
    auto clock = std::make_shared<testing::ManualClock>();
    CircuitBreaker breaker(CircuitBreakerConfig::billing().with_name("billing"), clock);

    std::atomic<int> opened{0};
    breaker.on_state_change([&opened](std::string_view, CircuitState, CircuitState to) {
        if (to == CircuitState::Open) {
            opened.fetch_add(1);
        }
    });

    std::atomic<int> rejected{0};
    std::atomic<int> failed{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            for (int j = 0; j < 50; ++j) {
                try {
                    (void)breaker.execute([]() -> int { throw std::runtime_error("provider down"); });
                } catch (const CircuitOpenError&) {
                    rejected.fetch_add(1);
                } catch (const std::runtime_error&) {
                    failed.fetch_add(1);
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(opened.load() == 1);
    REQUIRE(breaker.stats().times_opened == 1);
    REQUIRE(breaker.state() == CircuitState::Open);
    REQUIRE(rejected.load() > 0);
    REQUIRE(failed.load() + rejected.load() == 400);
}

// ═══════════════════════════════════════════════════════════════════════════
// ServiceRegistry Concurrency Tests
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ServiceRegistry tolerates concurrent calls and health reads", "[concurrency][registry]") {
    auto clock = std::make_shared<testing::ManualClock>();
    ServiceRegistry registry({}, clock);

    std::atomic<bool> done{false};
    std::atomic<int> health_reads{0};

    std::thread reader([&]() {
        while (!done.load()) {
            (void)registry.overall_health();
            (void)registry.to_json();
            health_reads.fetch_add(1);
        }
    });

    std::vector<std::thread> workers;
    for (int i = 0; i < 4; ++i) {
        workers.emplace_back([&registry]() {
            for (int j = 0; j < 200; ++j) {
                (void)registry.execute(Dependency::AiInference, [j]() { return j; });
            }
        });
    }
    for (auto& t : workers) {
        t.join();
    }
    done.store(true);
    reader.join();

    REQUIRE(health_reads.load() > 0);
    REQUIRE(registry.overall_health() == OverallHealth::Healthy);
    REQUIRE(registry.breaker(Dependency::AiInference).stats().total_successes == 800);
}
