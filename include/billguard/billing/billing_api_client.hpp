#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Billing API Client
// ═══════════════════════════════════════════════════════════════════════════
// Thin client for the provider's hosted checkout and customer portal pages.
// Both calls return the URL to redirect the user to.
//
// Requests are form-encoded POSTs authenticated with the secret key. Every
// request goes through the billing circuit breaker: transport errors, 429 and
// 5xx replies count against the provider; other 4xx replies are the caller's
// problem and do not.

#include "billguard/billing/subscription.hpp"
#include "billguard/http/http_client.hpp"
#include "billguard/resilience/circuit_breaker.hpp"

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace billguard {

// ─────────────────────────────────────────────────────────────────────────────
// Errors
// ─────────────────────────────────────────────────────────────────────────────

enum class BillingErrorCode {
    NotConfigured,    ///< No secret key or price id; nothing was sent
    InvalidRequest,   ///< Missing argument; nothing was sent
    Unavailable,      ///< Billing circuit open; nothing was sent
    Transport,        ///< Request did not complete
    Provider,         ///< Non-2xx reply
    InvalidResponse   ///< 2xx reply without a usable URL
};

[[nodiscard]] constexpr std::string_view to_string(BillingErrorCode code) noexcept {
    switch (code) {
        case BillingErrorCode::NotConfigured:   return "NotConfigured";
        case BillingErrorCode::InvalidRequest:  return "InvalidRequest";
        case BillingErrorCode::Unavailable:     return "Unavailable";
        case BillingErrorCode::Transport:       return "Transport";
        case BillingErrorCode::Provider:        return "Provider";
        case BillingErrorCode::InvalidResponse: return "InvalidResponse";
    }
    return "Unknown";
}

struct BillingError {
    BillingErrorCode code;
    std::string message;
    int http_status{0};
    std::chrono::milliseconds retry_after{0};

    static BillingError not_configured(std::string msg) {
        return {BillingErrorCode::NotConfigured, std::move(msg), 0, std::chrono::milliseconds{0}};
    }
    static BillingError invalid_request(std::string msg) {
        return {BillingErrorCode::InvalidRequest, std::move(msg), 0, std::chrono::milliseconds{0}};
    }
    static BillingError unavailable(const CircuitOpenError& error) {
        return {BillingErrorCode::Unavailable, error.what(), 0, error.retry_after()};
    }
    static BillingError transport(const HttpClientError& error) {
        return {BillingErrorCode::Transport, error.message, 0, std::chrono::milliseconds{0}};
    }
    static BillingError provider(int status, std::string msg) {
        return {BillingErrorCode::Provider, std::move(msg), status, std::chrono::milliseconds{0}};
    }
    static BillingError invalid_response(std::string msg) {
        return {BillingErrorCode::InvalidResponse, std::move(msg), 0, std::chrono::milliseconds{0}};
    }
};

template <typename T>
using BillingResult = tl::expected<T, BillingError>;

// ─────────────────────────────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────────────────────────────

enum class BillingPlan { Monthly, Annual };

[[nodiscard]] constexpr std::string_view to_string(BillingPlan plan) noexcept {
    return plan == BillingPlan::Monthly ? "monthly" : "annual";
}

struct BillingApiConfig {
    std::string secret_key;
    std::string api_base{"https://api.stripe.com"};
    std::string pro_monthly_price_id;
    std::string pro_annual_price_id;
    int trial_period_days{7};
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds request_timeout{15000};

    BillingApiConfig& with_secret_key(std::string value) {
        secret_key = std::move(value);
        return *this;
    }

    BillingApiConfig& with_api_base(std::string value) {
        api_base = std::move(value);
        return *this;
    }

    BillingApiConfig& with_price_ids(std::string monthly, std::string annual) {
        pro_monthly_price_id = std::move(monthly);
        pro_annual_price_id = std::move(annual);
        return *this;
    }

    BillingApiConfig& with_trial_period_days(int value) {
        trial_period_days = value;
        return *this;
    }

    [[nodiscard]] bool is_configured() const noexcept { return !secret_key.empty(); }

    /// Empty when valid. The API base must be https unless it is loopback.
    [[nodiscard]] std::optional<std::string> validation_error() const;
};

struct CheckoutSessionParams {
    AccountId account_id{0};
    std::string customer_email;
    BillingPlan plan{BillingPlan::Monthly};
    std::string success_url;
    std::string cancel_url;
};

/// application/x-www-form-urlencoded body, keys in the given order.
/// Nested provider parameters use bracket keys ("metadata[userId]").
[[nodiscard]] std::string form_encode(const std::vector<std::pair<std::string, std::string>>& fields);

// ─────────────────────────────────────────────────────────────────────────────
// BillingApiClient
// ─────────────────────────────────────────────────────────────────────────────

class BillingApiClient {
public:
    /// Throws std::invalid_argument if http is null or the config is invalid.
    /// An unconfigured client (no secret key) is allowed and fails each call.
    BillingApiClient(
        BillingApiConfig config,
        std::shared_ptr<IHttpClient> http,
        CircuitBreaker& breaker
    );

    [[nodiscard]] BillingResult<std::string> create_checkout_session(const CheckoutSessionParams& params);

    [[nodiscard]] BillingResult<std::string> create_portal_session(
        const std::string& customer_id,
        const std::string& return_url
    );

    [[nodiscard]] const BillingApiConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] BillingResult<std::string> post_for_url(
        const std::string& path,
        const std::string& body,
        std::string_view operation
    );

    BillingApiConfig config_;
    std::shared_ptr<IHttpClient> http_;
    CircuitBreaker& breaker_;
};

}  // namespace billguard
