#include "billguard/http/webhook_endpoint.hpp"
#include "billguard/log/logger.hpp"

namespace billguard {

namespace {

constexpr std::string_view kComponent = "endpoint";

}  // namespace

WebhookEndpoint::WebhookEndpoint(const WebhookAuthenticator& authenticator, WebhookProcessor& processor)
    : authenticator_(authenticator)
    , processor_(processor)
{}

HttpReply WebhookEndpoint::handle(const InboundRequest& request, Timestamp now) {
    const auto signatures = find_headers(request.headers, kSignatureHeader);

    auto event = authenticator_.verify(request.body, signatures, now);
    if (!event) {
        get_logger().warn_fmt(kComponent, "Webhook signature verification failed: {}", event.error().reason);
        return {400, {{"error", event.error().reason}}};
    }

    auto outcome = processor_.process(*event);
    if (!outcome) {
        if (outcome.error().code == ProcessErrorCode::DependencyUnavailable) {
            get_logger().warn_fmt(kComponent, "Store unavailable, provider will retry in {}ms or later",
                                  outcome.error().retry_after.count());
        }
        return {500, {{"error", std::string(kHandlerFailedMessage)}}};
    }

    return {200, outcome->to_json()};
}

}  // namespace billguard
