// ─────────────────────────────────────────────────────────────────────────────
// billguard-webhook-replay - Billing Webhook Replay Tool
// ─────────────────────────────────────────────────────────────────────────────
// Feeds a saved webhook delivery through the same authenticate -> dedupe ->
// synchronize path the service uses, against a local SQLite database.
//
// Usage:
//   # Replay a captured delivery with its original signature header
//   billguard-webhook-replay --payload event.json \
//            --signature "t=1714557600,v1=5257a869..." --secret whsec_xxx
//
//   # Sign the payload now (local testing against a scratch database)
//   billguard-webhook-replay --payload event.json --sign --secret whsec_xxx \
//            --db /tmp/billing.db --account 42
//
//   # Create a checkout or portal session URL (needs STRIPE_SECRET_KEY)
//   billguard-webhook-replay --checkout 42 --plan annual --email ada@example.com
//   billguard-webhook-replay --portal cus_123 --return-url https://app.example.com
//
// Reads STRIPE_WEBHOOK_SECRET, BILLGUARD_DB_PATH and the other service
// variables from the environment; flags override them.

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "billguard/billing/billing_api_client.hpp"
#include "billguard/config/service_config.hpp"
#include "billguard/http/http_client.hpp"
#include "billguard/http/webhook_endpoint.hpp"
#include "billguard/store/sqlite_billing_store.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace billguard;
using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset   = "\033[0m";
    const char* bold    = "\033[1m";
    const char* dim     = "\033[2m";
    const char* red     = "\033[31m";
    const char* green   = "\033[32m";
    const char* yellow  = "\033[33m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Helpers
// ═══════════════════════════════════════════════════════════════════════════

void print_error(const std::string& msg) {
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << msg << "\n";
}

bool read_file(const std::string& path, std::string& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    out = buffer.str();
    return true;
}

const char* status_color(int status) {
    if (status >= 500) return color::red;
    if (status >= 400) return color::yellow;
    return color::green;
}

// ═══════════════════════════════════════════════════════════════════════════
// Session Commands
// ═══════════════════════════════════════════════════════════════════════════

int run_session_command(const cxxopts::ParseResult& result, const ServiceConfig& config, bool json_output) {
    ServiceRegistry registry(config.breakers);
    BillingApiClient client(config.billing_api, make_http_client(), registry.breaker(Dependency::Billing));

    BillingResult<std::string> url = tl::unexpected(BillingError::invalid_request("no session requested"));
    if (result.count("checkout")) {
        const std::string plan = result["plan"].as<std::string>();
        if (plan != "monthly" && plan != "annual") {
            print_error("--plan must be monthly or annual");
            return 1;
        }
        url = client.create_checkout_session(CheckoutSessionParams{
            .account_id = result["checkout"].as<std::int64_t>(),
            .customer_email = result.count("email") ? result["email"].as<std::string>() : std::string{},
            .plan = plan == "annual" ? BillingPlan::Annual : BillingPlan::Monthly,
            .success_url = result["success-url"].as<std::string>(),
            .cancel_url = result["cancel-url"].as<std::string>(),
        });
    } else {
        url = client.create_portal_session(result["portal"].as<std::string>(), result["return-url"].as<std::string>());
    }

    if (json_output) {
        Json out = url ? Json{{"url", *url}} : Json{{"error", url.error().message}};
        if (result.count("health")) {
            out["health"] = registry.to_json();
        }
        std::cout << out.dump(2) << "\n";
    } else if (url) {
        std::cout << *url << "\n";
    } else {
        print_error(url.error().message);
    }
    return url ? 0 : 2;
}

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("billguard-webhook-replay", "Billing Webhook Replay Tool");

    options.add_options()
        ("p,payload", "File holding the raw webhook body", cxxopts::value<std::string>())
        ("s,signature", "Stripe-Signature header value", cxxopts::value<std::string>())
        ("sign", "Compute a fresh signature header for the payload")
        ("secret", "Webhook signing secret (or STRIPE_WEBHOOK_SECRET)", cxxopts::value<std::string>())
        ("d,db", "SQLite database path (or BILLGUARD_DB_PATH)", cxxopts::value<std::string>())
        ("tolerance", "Signature age limit in seconds", cxxopts::value<long long>())
        ("account", "Create the account before replaying (repeatable)", cxxopts::value<std::vector<std::int64_t>>())
        ("flag-disputes", "Queue dispute events for manual review")
        ("checkout", "Create a checkout session URL for this account id", cxxopts::value<std::int64_t>())
        ("plan", "Checkout plan: monthly|annual", cxxopts::value<std::string>()->default_value("monthly"))
        ("email", "Customer email for checkout", cxxopts::value<std::string>())
        ("success-url", "Checkout success URL", cxxopts::value<std::string>()->default_value("http://localhost:3000/billing?success=true"))
        ("cancel-url", "Checkout cancel URL", cxxopts::value<std::string>()->default_value("http://localhost:3000/billing?canceled=true"))
        ("portal", "Create a billing portal session URL for this customer id", cxxopts::value<std::string>())
        ("return-url", "Portal return URL", cxxopts::value<std::string>()->default_value("http://localhost:3000/billing"))
        ("health", "Print dependency health after the replay")
        ("log-level", "trace|debug|info|warn|error|off", cxxopts::value<std::string>())
        ("j,json", "Output the reply as JSON")
        ("no-color", "Disable colored output")
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }

        color::enabled = !result.count("no-color");
        const bool json_output = result.count("json") > 0;

        const bool session_command = result.count("checkout") || result.count("portal");
        if (session_command) {
            ServiceConfig config = config_from_env();
            if (result.count("log-level")) {
                config.with_log_level(parse_log_level(result["log-level"].as<std::string>(), config.log_level));
            }
            set_logger(make_service_logger(config));
            return run_session_command(result, config, json_output);
        }

        if (!result.count("payload")) {
            print_error("--payload is required");
            std::cout << "\n" << options.help() << "\n";
            return 1;
        }
        if (!result.count("signature") && !result.count("sign")) {
            print_error("Provide --signature or use --sign");
            return 1;
        }

        // Environment first, flags on top
        ServiceConfig config = config_from_env();
        if (result.count("secret")) {
            config.with_webhook_secret(result["secret"].as<std::string>());
        }
        if (result.count("db")) {
            config.with_db_path(result["db"].as<std::string>());
        }
        if (result.count("tolerance")) {
            config.with_webhook_tolerance(std::chrono::seconds{result["tolerance"].as<long long>()});
        }
        if (result.count("log-level")) {
            config.with_log_level(parse_log_level(result["log-level"].as<std::string>(), config.log_level));
        }
        if (result.count("flag-disputes")) {
            config.with_flag_disputes_for_review(true);
        }

        if (auto error = config.validation_error()) {
            print_error("Invalid configuration: " + *error);
            return 1;
        }

        set_logger(make_service_logger(config));

        std::string payload;
        if (!read_file(result["payload"].as<std::string>(), payload)) {
            print_error("Cannot read payload file: " + result["payload"].as<std::string>());
            return 1;
        }
        BILLGUARD_LOG_INFO("replay", "Replaying " + std::to_string(payload.size()) + " byte payload against " +
                                         config.db_path);

        std::string signature;
        if (result.count("sign")) {
            signature = WebhookAuthenticator::build_header(
                config.webhook_secret, to_unix_seconds(std::chrono::system_clock::now()), payload);
            if (!json_output) {
                std::cout << color::c(color::dim) << "Signed: " << signature << color::c(color::reset) << "\n";
            }
        } else {
            signature = result["signature"].as<std::string>();
        }

        auto store = SqliteBillingStore::open(config.db_path);
        if (!store) {
            print_error("Cannot open database " + config.db_path + ": " + store.error().message);
            return 1;
        }
        std::shared_ptr<IBillingStore> billing_store = std::move(*store);

        if (result.count("account")) {
            for (const auto account_id : result["account"].as<std::vector<std::int64_t>>()) {
                if (auto ensured = billing_store->ensure_account(account_id); !ensured) {
                    print_error("Cannot create account " + std::to_string(account_id) + ": " +
                                ensured.error().message);
                    return 1;
                }
            }
        }

        ServiceRegistry registry(config.breakers);
        WebhookAuthenticator authenticator(config.webhook_secret, config.webhook_tolerance);
        WebhookProcessor processor(
            billing_store,
            registry.breaker(Dependency::Store),
            SubscriptionSynchronizer(
                SynchronizerConfig{}.with_flag_disputes_for_review(config.flag_disputes_for_review)));
        WebhookEndpoint endpoint(authenticator, processor);

        InboundRequest request{payload, {{std::string(kSignatureHeader), signature}}};
        const HttpReply reply = endpoint.handle(request);

        if (json_output) {
            Json out = {{"status", reply.status}, {"body", reply.body}};
            if (result.count("health")) {
                out["health"] = registry.to_json();
            }
            std::cout << out.dump(2) << "\n";
        } else {
            std::cout << color::c(color::bold) << "HTTP " << color::c(status_color(reply.status))
                      << reply.status << color::c(color::reset) << "\n"
                      << reply.body.dump(2) << "\n";
            if (result.count("health")) {
                std::cout << color::c(color::bold) << "Health" << color::c(color::reset) << "\n"
                          << registry.to_json().dump(2) << "\n";
            }
        }

        return reply.status == 200 ? 0 : 2;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    } catch (const std::invalid_argument& e) {
        print_error(e.what());
        return 1;
    }
}
