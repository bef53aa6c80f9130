#include "billguard/billing/billing_api_client.hpp"
#include "billguard/http/http_types.hpp"
#include "billguard/log/logger.hpp"

#include <cctype>
#include <stdexcept>

namespace billguard {

namespace {

constexpr std::string_view kComponent = "billing-api";
constexpr std::string_view kFormContentType = "application/x-www-form-urlencoded";

void append_form_component(std::string& out, std::string_view text) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    for (const char ch : text) {
        const auto c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
            out += ch;
        } else if (c == ' ') {
            out += '+';
        } else {
            out += '%';
            out += kHex[c >> 4];
            out += kHex[c & 0x0F];
        }
    }
}

// Provider error replies look like {"error":{"message":"...","type":"..."}}
std::string provider_error_message(const HttpClientResponse& response) {
    const auto body = nlohmann::json::parse(response.body, nullptr, false);
    if (body.is_object() && body.contains("error") && body["error"].is_object()) {
        const auto& error = body["error"];
        if (error.contains("message") && error["message"].is_string()) {
            return error["message"].get<std::string>();
        }
    }
    return "Billing provider returned HTTP " + std::to_string(response.status_code);
}

bool counts_against_provider(int status) {
    return status == 429 || status >= 500;
}

}  // namespace

std::optional<std::string> BillingApiConfig::validation_error() const {
    const auto url = parse_url(api_base);
    if (!url) {
        return "api_base is not a valid http(s) URL: " + api_base;
    }
    if (!url->is_secure() && !url->is_loopback()) {
        return "api_base must use https for non-loopback hosts";
    }
    if (trial_period_days < 0) {
        return "trial_period_days must not be negative";
    }
    if (connect_timeout.count() <= 0 || request_timeout.count() <= 0) {
        return "timeouts must be positive";
    }
    return std::nullopt;
}

std::string form_encode(const std::vector<std::pair<std::string, std::string>>& fields) {
    std::string out;
    for (const auto& [key, value] : fields) {
        if (!out.empty()) {
            out += '&';
        }
        append_form_component(out, key);
        out += '=';
        append_form_component(out, value);
    }
    return out;
}

BillingApiClient::BillingApiClient(
    BillingApiConfig config,
    std::shared_ptr<IHttpClient> http,
    CircuitBreaker& breaker
)
    : config_(std::move(config))
    , http_(std::move(http))
    , breaker_(breaker)
{
    if (!http_) {
        throw std::invalid_argument("BillingApiClient: http client cannot be null");
    }
    if (auto error = config_.validation_error()) {
        throw std::invalid_argument("BillingApiClient: " + *error);
    }

    const auto url = parse_url(config_.api_base);
    HttpClientOptions options;
    options.base_url = url->origin();
    if (url->path != "/") {
        options.base_url += url->path;
    }
    options.connect_timeout = config_.connect_timeout;
    options.read_timeout = config_.request_timeout;
    if (config_.is_configured()) {
        options.default_headers.emplace("Authorization", "Bearer " + config_.secret_key);
    }
    http_->configure(options);
}

BillingResult<std::string> BillingApiClient::create_checkout_session(const CheckoutSessionParams& params) {
    if (!config_.is_configured()) {
        return tl::unexpected(BillingError::not_configured(
            "Billing is not configured. Set STRIPE_SECRET_KEY."));
    }

    const std::string& price_id = (params.plan == BillingPlan::Monthly)
        ? config_.pro_monthly_price_id
        : config_.pro_annual_price_id;
    if (price_id.empty()) {
        return tl::unexpected(BillingError::not_configured(
            "Price ID for " + std::string(to_string(params.plan)) + " plan is not configured."));
    }
    if (params.account_id <= 0) {
        return tl::unexpected(BillingError::invalid_request("Checkout requires an account id"));
    }

    const std::string account = std::to_string(params.account_id);
    const std::string plan(to_string(params.plan));

    std::vector<std::pair<std::string, std::string>> fields = {
        {"mode", "subscription"},
        {"payment_method_types[0]", "card"},
        {"line_items[0][price]", price_id},
        {"line_items[0][quantity]", "1"},
        {"success_url", params.success_url},
        {"cancel_url", params.cancel_url},
        {"client_reference_id", account},
        {"metadata[userId]", account},
        {"metadata[plan]", plan},
        {"subscription_data[metadata][userId]", account},
        {"subscription_data[metadata][plan]", plan},
        {"allow_promotion_codes", "true"},
    };
    if (!params.customer_email.empty()) {
        fields.emplace_back("customer_email", params.customer_email);
    }
    if (config_.trial_period_days > 0) {
        fields.emplace_back("subscription_data[trial_period_days]", std::to_string(config_.trial_period_days));
    }

    return post_for_url("/v1/checkout/sessions", form_encode(fields), "checkout session");
}

BillingResult<std::string> BillingApiClient::create_portal_session(
    const std::string& customer_id,
    const std::string& return_url
) {
    if (!config_.is_configured()) {
        return tl::unexpected(BillingError::not_configured("Billing is not configured."));
    }
    if (customer_id.empty()) {
        return tl::unexpected(BillingError::invalid_request("No billing customer on file for this account"));
    }

    const std::string body = form_encode({
        {"customer", customer_id},
        {"return_url", return_url},
    });
    return post_for_url("/v1/billing_portal/sessions", body, "portal session");
}

BillingResult<std::string> BillingApiClient::post_for_url(
    const std::string& path,
    const std::string& body,
    std::string_view operation
) {
    // Only provider-side trouble is returned as an error from inside the
    // breaker; client errors pass through as a response.
    auto response = breaker_.execute(
        [&]() -> BillingResult<HttpClientResponse> {
            auto result = http_->post({path, body, std::string(kFormContentType), {}});
            if (!result) {
                return tl::unexpected(BillingError::transport(result.error()));
            }
            if (counts_against_provider(result->status_code)) {
                return tl::unexpected(BillingError::provider(result->status_code, provider_error_message(*result)));
            }
            return std::move(*result);
        },
        [](const CircuitOpenError& open) -> BillingResult<HttpClientResponse> {
            return tl::unexpected(BillingError::unavailable(open));
        });

    if (!response) {
        get_logger().error_fmt(kComponent, "Failed to create {}: {}", operation, response.error().message);
        return tl::unexpected(std::move(response.error()));
    }

    if (!response->is_success()) {
        auto error = BillingError::provider(response->status_code, provider_error_message(*response));
        get_logger().warn_fmt(kComponent, "Provider rejected {} (HTTP {}): {}",
                              operation, response->status_code, error.message);
        return tl::unexpected(std::move(error));
    }

    const auto json = nlohmann::json::parse(response->body, nullptr, false);
    if (!json.is_object() || !json.contains("url") || !json["url"].is_string()) {
        return tl::unexpected(BillingError::invalid_response("Failed to create " + std::string(operation) + " URL"));
    }

    get_logger().info_fmt(kComponent, "Created {}", operation);
    return json["url"].get<std::string>();
}

}  // namespace billguard
