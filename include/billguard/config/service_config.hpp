#pragma once

#include "billguard/billing/billing_api_client.hpp"
#include "billguard/log/logger.hpp"
#include "billguard/resilience/service_registry.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace billguard {

// ─────────────────────────────────────────────────────────────────────────────
// ServiceConfig
// ─────────────────────────────────────────────────────────────────────────────
// Everything the webhook service needs at startup. Build it in code with the
// with_* setters or read it from the environment:
//
//   STRIPE_WEBHOOK_SECRET              webhook signing secret
//   STRIPE_WEBHOOK_TOLERANCE_SECONDS   signature age limit (default 300)
//   STRIPE_SECRET_KEY                  API key for checkout/portal sessions
//   STRIPE_API_BASE                    API base URL (default https://api.stripe.com)
//   STRIPE_PRO_MONTHLY_PRICE_ID        price for the monthly plan
//   STRIPE_PRO_ANNUAL_PRICE_ID         price for the annual plan
//   STRIPE_TRIAL_PERIOD_DAYS           trial length for new subscriptions (default 7)
//   BILLGUARD_DB_PATH                  SQLite database file (default billguard.db)
//   BILLGUARD_LOG_LEVEL                trace|debug|info|warn|error|off
//   BILLGUARD_LOG_FILE                 also log to this file
//   BILLGUARD_FLAG_DISPUTES            1/true to queue disputes for review

struct ServiceConfig {
    std::string webhook_secret;
    std::chrono::seconds webhook_tolerance{300};
    std::string db_path{"billguard.db"};
    LogLevel log_level{LogLevel::Info};
    std::string log_file;
    bool flag_disputes_for_review{false};
    BillingApiConfig billing_api;
    ServiceRegistryConfig breakers;

    ServiceConfig& with_webhook_secret(std::string value) {
        webhook_secret = std::move(value);
        return *this;
    }

    ServiceConfig& with_webhook_tolerance(std::chrono::seconds value) {
        webhook_tolerance = value;
        return *this;
    }

    ServiceConfig& with_db_path(std::string value) {
        db_path = std::move(value);
        return *this;
    }

    ServiceConfig& with_log_level(LogLevel value) {
        log_level = value;
        return *this;
    }

    ServiceConfig& with_log_file(std::string value) {
        log_file = std::move(value);
        return *this;
    }

    ServiceConfig& with_flag_disputes_for_review(bool value) {
        flag_disputes_for_review = value;
        return *this;
    }

    ServiceConfig& with_billing_api(BillingApiConfig value) {
        billing_api = std::move(value);
        return *this;
    }

    /// Empty when the configuration can start a service.
    /// A missing webhook secret is reported here; every delivery would fail.
    [[nodiscard]] std::optional<std::string> validation_error() const;

    [[nodiscard]] bool is_valid() const { return !validation_error().has_value(); }
};

/// Read the environment on top of the defaults.
/// Throws std::invalid_argument for values that do not parse.
[[nodiscard]] ServiceConfig config_from_env();

/// spdlog console logger, plus a file sink when log_file is set
[[nodiscard]] std::unique_ptr<ILogger> make_service_logger(const ServiceConfig& config);

}  // namespace billguard
