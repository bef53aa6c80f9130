#ifndef BILLGUARD_BILLING_SUBSCRIPTION_SYNCHRONIZER_HPP
#define BILLGUARD_BILLING_SUBSCRIPTION_SYNCHRONIZER_HPP

#include "billguard/billing/billing_event.hpp"
#include "billguard/store/billing_store.hpp"

#include <string_view>

namespace billguard {

/// What a handler did with an event. Every value is a successful outcome;
/// store failures come back as StoreError instead.
enum class SyncOutcome {
    Applied,           ///< A record was written
    NoChange,          ///< Event understood, nothing to write
    MissingReference,  ///< Event carries no usable account/customer reference
    AccountNotFound,   ///< No local account for the reference
    Unhandled          ///< Event type has no handler
};

[[nodiscard]] constexpr std::string_view to_string(SyncOutcome outcome) noexcept {
    switch (outcome) {
        case SyncOutcome::Applied:          return "applied";
        case SyncOutcome::NoChange:         return "no_change";
        case SyncOutcome::MissingReference: return "missing_reference";
        case SyncOutcome::AccountNotFound:  return "account_not_found";
        case SyncOutcome::Unhandled:        return "unhandled";
    }
    return "unknown";
}

struct SynchronizerConfig {
    /// Write a DisputeFlag for every dispute event
    bool flag_disputes_for_review{false};

    SynchronizerConfig& with_flag_disputes_for_review(bool value) {
        flag_disputes_for_review = value;
        return *this;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// SubscriptionSynchronizer
// ─────────────────────────────────────────────────────────────────────────────
// Applies one verified, previously unseen event to the subscription records
// inside the caller's transaction. Missing local records are an expected race
// with account creation: they are logged and acknowledged, never raised.
// Subscription updates are last-write-wins on the fields they touch.

class SubscriptionSynchronizer {
public:
    explicit SubscriptionSynchronizer(SynchronizerConfig config = {});

    [[nodiscard]] StoreResult<SyncOutcome> apply(IBillingTransaction& tx, const VerifiedEvent& event) const;

    [[nodiscard]] const SynchronizerConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] StoreResult<SyncOutcome> on_checkout_completed(
        IBillingTransaction& tx, const CheckoutCompleted& event) const;
    [[nodiscard]] StoreResult<SyncOutcome> on_subscription_changed(
        IBillingTransaction& tx, const SubscriptionChanged& event) const;
    [[nodiscard]] StoreResult<SyncOutcome> on_subscription_deleted(
        IBillingTransaction& tx, const SubscriptionDeleted& event) const;
    [[nodiscard]] StoreResult<SyncOutcome> on_payment_succeeded(
        IBillingTransaction& tx, const InvoicePaymentSucceeded& event) const;
    [[nodiscard]] StoreResult<SyncOutcome> on_payment_failed(
        IBillingTransaction& tx, const InvoicePaymentFailed& event) const;
    [[nodiscard]] StoreResult<SyncOutcome> on_dispute(
        IBillingTransaction& tx, const DisputeEvent& event) const;
    [[nodiscard]] StoreResult<SyncOutcome> on_customer_deleted(
        IBillingTransaction& tx, const CustomerDeleted& event) const;

    SynchronizerConfig config_;
};

}  // namespace billguard

#endif  // BILLGUARD_BILLING_SUBSCRIPTION_SYNCHRONIZER_HPP
