#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Billing Events
// ═══════════════════════════════════════════════════════════════════════════
// Provider payloads are loosely typed. Each known event type decodes into
// one alternative of BillingEventBody; anything else becomes
// UnrecognizedEvent. Decoding never throws on missing or mistyped fields:
// absent values are std::nullopt and the handlers decide what to do.

#include "billguard/billing/subscription.hpp"

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace billguard {

// Event type tags as sent by the provider
namespace event_type {
inline constexpr std::string_view kCheckoutSessionCompleted = "checkout.session.completed";
inline constexpr std::string_view kSubscriptionCreated      = "customer.subscription.created";
inline constexpr std::string_view kSubscriptionUpdated      = "customer.subscription.updated";
inline constexpr std::string_view kSubscriptionDeleted      = "customer.subscription.deleted";
inline constexpr std::string_view kInvoicePaymentSucceeded  = "invoice.payment_succeeded";
inline constexpr std::string_view kInvoicePaymentFailed     = "invoice.payment_failed";
inline constexpr std::string_view kDisputeCreated           = "charge.dispute.created";
inline constexpr std::string_view kDisputeClosed            = "charge.dispute.closed";
inline constexpr std::string_view kCustomerDeleted          = "customer.deleted";
}  // namespace event_type

// ─────────────────────────────────────────────────────────────────────────────
// Event bodies
// ─────────────────────────────────────────────────────────────────────────────

struct CheckoutCompleted {
    std::optional<std::string> session_id;
    std::optional<std::string> customer_id;
    std::optional<std::string> client_reference_id;  ///< Takes priority
    std::optional<std::string> metadata_user_id;      ///< metadata.userId
};

struct SubscriptionChanged {
    enum class Kind { Created, Updated };

    Kind kind{Kind::Updated};
    std::optional<std::string> subscription_id;
    std::optional<std::string> customer_id;
    std::optional<std::string> status;  ///< Raw provider status
    std::optional<Timestamp> period_end;
};

struct SubscriptionDeleted {
    std::optional<std::string> subscription_id;
    std::optional<std::string> customer_id;
};

struct InvoicePaymentSucceeded {
    std::optional<std::string> invoice_id;
    std::optional<std::string> customer_id;
};

struct InvoicePaymentFailed {
    std::optional<std::string> invoice_id;
    std::optional<std::string> customer_id;
    std::optional<std::int64_t> attempt_count;
};

struct DisputeEvent {
    enum class Phase { Created, Closed };

    Phase phase{Phase::Created};
    std::optional<std::string> dispute_id;
    std::optional<std::string> charge_id;
    /// Only known when the charge or payment intent was expanded
    std::optional<std::string> customer_id;
    std::optional<std::string> reason;
    std::optional<std::string> status;
};

struct CustomerDeleted {
    std::optional<std::string> customer_id;
};

struct UnrecognizedEvent {
    std::string type;
};

using BillingEventBody = std::variant<
    CheckoutCompleted,
    SubscriptionChanged,
    SubscriptionDeleted,
    InvoicePaymentSucceeded,
    InvoicePaymentFailed,
    DisputeEvent,
    CustomerDeleted,
    UnrecognizedEvent
>;

// ─────────────────────────────────────────────────────────────────────────────
// VerifiedEvent
// ─────────────────────────────────────────────────────────────────────────────

struct VerifiedEvent {
    std::optional<std::string> id;
    std::string type;
    std::optional<Timestamp> created;
    bool livemode{false};
    nlohmann::json object;  ///< data.object, kept for the ledger
    BillingEventBody body;
};

/// Decode the body of a known event type from its data.object
[[nodiscard]] BillingEventBody decode_event_body(std::string_view type, const nlohmann::json& object);

/// Decode a full event envelope. Fails with a reason when the envelope lacks
/// a string `type` or an object `data.object`.
[[nodiscard]] tl::expected<VerifiedEvent, std::string> decode_event(const nlohmann::json& envelope);

}  // namespace billguard
