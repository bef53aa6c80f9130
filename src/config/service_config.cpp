#include "billguard/config/service_config.hpp"
#include "billguard/log/spdlog_logger.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <stdexcept>

namespace billguard {

// ─────────────────────────────────────────────────────────────────────────────
// Helper Functions
// ─────────────────────────────────────────────────────────────────────────────

namespace {

std::string get_env(const char* name, const std::string& fallback = "") {
    const char* value = std::getenv(name);
    return value ? value : fallback;
}

long long parse_integer(const char* name, const std::string& text) {
    long long value = 0;
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        throw std::invalid_argument(std::string(name) + " must be an integer, got '" + text + "'");
    }
    return value;
}

bool parse_flag(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower == "1" || lower == "true" || lower == "yes" || lower == "on";
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// ServiceConfig
// ─────────────────────────────────────────────────────────────────────────────

std::optional<std::string> ServiceConfig::validation_error() const {
    if (webhook_secret.empty()) {
        return "webhook secret is not configured";
    }
    if (webhook_tolerance.count() <= 0) {
        return "webhook tolerance must be positive";
    }
    if (db_path.empty()) {
        return "database path is empty";
    }
    if (auto error = billing_api.validation_error()) {
        return "billing api: " + *error;
    }
    for (const auto* breaker : {&breakers.store, &breakers.ai_inference, &breakers.billing}) {
        const std::string error = breaker->validation_error();
        if (!error.empty()) {
            return "circuit breaker '" + breaker->name + "': " + error;
        }
    }
    return std::nullopt;
}

ServiceConfig config_from_env() {
    ServiceConfig config;

    config.webhook_secret = get_env("STRIPE_WEBHOOK_SECRET");

    const std::string tolerance = get_env("STRIPE_WEBHOOK_TOLERANCE_SECONDS");
    if (!tolerance.empty()) {
        const auto seconds = parse_integer("STRIPE_WEBHOOK_TOLERANCE_SECONDS", tolerance);
        if (seconds <= 0) {
            throw std::invalid_argument("STRIPE_WEBHOOK_TOLERANCE_SECONDS must be positive");
        }
        config.webhook_tolerance = std::chrono::seconds{seconds};
    }

    config.db_path = get_env("BILLGUARD_DB_PATH", config.db_path);
    config.log_level = parse_log_level(get_env("BILLGUARD_LOG_LEVEL"), config.log_level);
    config.log_file = get_env("BILLGUARD_LOG_FILE");
    config.flag_disputes_for_review = parse_flag(get_env("BILLGUARD_FLAG_DISPUTES"));

    auto& api = config.billing_api;
    api.secret_key = get_env("STRIPE_SECRET_KEY");
    api.api_base = get_env("STRIPE_API_BASE", api.api_base);
    api.pro_monthly_price_id = get_env("STRIPE_PRO_MONTHLY_PRICE_ID");
    api.pro_annual_price_id = get_env("STRIPE_PRO_ANNUAL_PRICE_ID");

    const std::string trial_days = get_env("STRIPE_TRIAL_PERIOD_DAYS");
    if (!trial_days.empty()) {
        api.trial_period_days = static_cast<int>(parse_integer("STRIPE_TRIAL_PERIOD_DAYS", trial_days));
    }

    return config;
}

std::unique_ptr<ILogger> make_service_logger(const ServiceConfig& config) {
    if (config.log_file.empty()) {
        return make_spdlog_console_logger(config.log_level);
    }
    return make_spdlog_console_file_logger(config.log_file, config.log_level);
}

}  // namespace billguard
