// ─────────────────────────────────────────────────────────────────────────────
// Service Configuration Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "billguard/config/service_config.hpp"

#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

using namespace billguard;
using namespace std::chrono_literals;

namespace {

const char* const kVariables[] = {
    "STRIPE_WEBHOOK_SECRET",
    "STRIPE_WEBHOOK_TOLERANCE_SECONDS",
    "STRIPE_SECRET_KEY",
    "STRIPE_API_BASE",
    "STRIPE_PRO_MONTHLY_PRICE_ID",
    "STRIPE_PRO_ANNUAL_PRICE_ID",
    "STRIPE_TRIAL_PERIOD_DAYS",
    "BILLGUARD_DB_PATH",
    "BILLGUARD_LOG_LEVEL",
    "BILLGUARD_LOG_FILE",
    "BILLGUARD_FLAG_DISPUTES",
};

/// Clears every service variable and restores the previous values on exit
class ScopedEnv {
public:
    ScopedEnv() {
        for (const char* name : kVariables) {
            const char* value = std::getenv(name);
            saved_.emplace_back(name, value ? std::optional<std::string>(value) : std::nullopt);
            ::unsetenv(name);
        }
    }

    ~ScopedEnv() {
        for (const auto& [name, value] : saved_) {
            if (value) {
                ::setenv(name, value->c_str(), 1);
            } else {
                ::unsetenv(name);
            }
        }
    }

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

    void set(const char* name, const std::string& value) {
        ::setenv(name, value.c_str(), 1);
    }

private:
    std::vector<std::pair<const char*, std::optional<std::string>>> saved_;
};

}  // namespace

TEST_CASE("config_from_env uses defaults for unset variables", "[config]") {
    ScopedEnv env;

    const auto config = config_from_env();
    REQUIRE(config.webhook_secret.empty());
    REQUIRE(config.webhook_tolerance == 300s);
    REQUIRE(config.db_path == "billguard.db");
    REQUIRE(config.log_level == LogLevel::Info);
    REQUIRE(config.log_file.empty());
    REQUIRE_FALSE(config.flag_disputes_for_review);
    REQUIRE(config.billing_api.api_base == "https://api.stripe.com");
    REQUIRE(config.billing_api.trial_period_days == 7);
    REQUIRE_FALSE(config.billing_api.is_configured());
    REQUIRE(config.breakers.store.failure_threshold == 5);

    REQUIRE(config.validation_error() == "webhook secret is not configured");
    REQUIRE_FALSE(config.is_valid());
}

TEST_CASE("config_from_env reads every variable", "[config]") {
    ScopedEnv env;
    env.set("STRIPE_WEBHOOK_SECRET", "whsec_env");
    env.set("STRIPE_WEBHOOK_TOLERANCE_SECONDS", "120");
    env.set("STRIPE_SECRET_KEY", "sk_test_env");
    env.set("STRIPE_API_BASE", "http://localhost:12111");
    env.set("STRIPE_PRO_MONTHLY_PRICE_ID", "price_m");
    env.set("STRIPE_PRO_ANNUAL_PRICE_ID", "price_a");
    env.set("STRIPE_TRIAL_PERIOD_DAYS", "0");
    env.set("BILLGUARD_DB_PATH", "/var/lib/billguard/ledger.db");
    env.set("BILLGUARD_LOG_LEVEL", "debug");
    env.set("BILLGUARD_LOG_FILE", "/var/log/billguard.log");
    env.set("BILLGUARD_FLAG_DISPUTES", "Yes");

    const auto config = config_from_env();
    REQUIRE(config.webhook_secret == "whsec_env");
    REQUIRE(config.webhook_tolerance == 120s);
    REQUIRE(config.db_path == "/var/lib/billguard/ledger.db");
    REQUIRE(config.log_level == LogLevel::Debug);
    REQUIRE(config.log_file == "/var/log/billguard.log");
    REQUIRE(config.flag_disputes_for_review);
    REQUIRE(config.billing_api.secret_key == "sk_test_env");
    REQUIRE(config.billing_api.api_base == "http://localhost:12111");
    REQUIRE(config.billing_api.pro_monthly_price_id == "price_m");
    REQUIRE(config.billing_api.pro_annual_price_id == "price_a");
    REQUIRE(config.billing_api.trial_period_days == 0);
    REQUIRE(config.is_valid());
}

TEST_CASE("config_from_env rejects malformed numbers", "[config]") {
    ScopedEnv env;

    SECTION("tolerance not a number") {
        env.set("STRIPE_WEBHOOK_TOLERANCE_SECONDS", "5m");
        REQUIRE_THROWS_AS(config_from_env(), std::invalid_argument);
    }

    SECTION("tolerance not positive") {
        env.set("STRIPE_WEBHOOK_TOLERANCE_SECONDS", "0");
        REQUIRE_THROWS_AS(config_from_env(), std::invalid_argument);
    }

    SECTION("trial days") {
        env.set("STRIPE_TRIAL_PERIOD_DAYS", "seven");
        REQUIRE_THROWS_AS(config_from_env(), std::invalid_argument);
    }
}

TEST_CASE("ServiceConfig validation reports the first problem", "[config]") {
    auto valid = ServiceConfig{}.with_webhook_secret("whsec_1");
    REQUIRE(valid.is_valid());

    REQUIRE(ServiceConfig{valid}.with_webhook_tolerance(0s).validation_error() ==
            "webhook tolerance must be positive");
    REQUIRE(ServiceConfig{valid}.with_db_path("").validation_error() == "database path is empty");

    const auto insecure = ServiceConfig{valid}.with_billing_api(
        BillingApiConfig{}.with_api_base("http://api.example.com"));
    REQUIRE(insecure.validation_error() == "billing api: api_base must use https for non-loopback hosts");

    auto bad_breaker = valid;
    bad_breaker.breakers.billing.failure_threshold = 0;
    const auto error = bad_breaker.validation_error();
    REQUIRE(error.has_value());
    REQUIRE(error->find("circuit breaker 'billing'") == 0);
}

TEST_CASE("make_service_logger honours the configured level", "[config][logging]") {
    const auto logger = make_service_logger(ServiceConfig{}.with_log_level(LogLevel::Warn));
    REQUIRE(logger != nullptr);
    REQUIRE(logger->should_log(LogLevel::Warn));
    REQUIRE_FALSE(logger->should_log(LogLevel::Info));
}
