#ifndef BILLGUARD_HTTP_WEBHOOK_ENDPOINT_HPP
#define BILLGUARD_HTTP_WEBHOOK_ENDPOINT_HPP

#include "billguard/billing/webhook_authenticator.hpp"
#include "billguard/billing/webhook_processor.hpp"
#include "billguard/http/http_types.hpp"
#include "billguard/util/time.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace billguard {

inline constexpr std::string_view kHandlerFailedMessage = "Webhook handler failed";

/// Raw inbound delivery as the HTTP layer received it. The body must be the
/// exact bytes that were signed.
struct InboundRequest {
    std::string body;
    HeaderList headers;
};

struct HttpReply {
    int status{200};
    nlohmann::json body;
};

// ─────────────────────────────────────────────────────────────────────────────
// WebhookEndpoint
// ─────────────────────────────────────────────────────────────────────────────
// Framework-agnostic handler for the billing webhook route:
//
//   400 {"error": <reason>}                 authentication failed
//   200 {"received": true[, "skipped"...]}  processed or already processed
//   500 {"error": "Webhook handler failed"} store failure or open circuit
//
// A 500 makes the provider redeliver; nothing was committed for the event.

class WebhookEndpoint {
public:
    WebhookEndpoint(const WebhookAuthenticator& authenticator, WebhookProcessor& processor);

    [[nodiscard]] HttpReply handle(
        const InboundRequest& request,
        Timestamp now = std::chrono::system_clock::now()
    );

private:
    const WebhookAuthenticator& authenticator_;
    WebhookProcessor& processor_;
};

}  // namespace billguard

#endif  // BILLGUARD_HTTP_WEBHOOK_ENDPOINT_HPP
