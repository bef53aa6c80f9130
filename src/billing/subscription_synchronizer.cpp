#include "billguard/billing/subscription_synchronizer.hpp"
#include "billguard/log/logger.hpp"

#include <charconv>
#include <type_traits>
#include <variant>

namespace billguard {

namespace {

constexpr std::string_view kComponent = "sync";

std::optional<AccountId> parse_account_id(std::string_view text) {
    AccountId id = 0;
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, id);
    if (ec != std::errc{} || ptr != last || id <= 0) {
        return std::nullopt;
    }
    return id;
}

// Customer-keyed lookup that logs the expected "not linked yet" race
StoreResult<std::optional<SubscriptionRecord>> lookup_customer(
    IBillingTransaction& tx,
    const std::string& customer_id,
    std::string_view event_name
) {
    auto record = tx.find_by_customer(customer_id);
    if (record && !*record) {
        get_logger().warn_fmt(kComponent, "{}: no account found for customer {}", event_name, customer_id);
    }
    return record;
}

}  // namespace

SubscriptionSynchronizer::SubscriptionSynchronizer(SynchronizerConfig config)
    : config_(config)
{}

StoreResult<SyncOutcome> SubscriptionSynchronizer::apply(IBillingTransaction& tx, const VerifiedEvent& event) const {
    return std::visit([&](const auto& body) -> StoreResult<SyncOutcome> {
        using T = std::decay_t<decltype(body)>;
        if constexpr (std::is_same_v<T, CheckoutCompleted>) {
            return on_checkout_completed(tx, body);
        } else if constexpr (std::is_same_v<T, SubscriptionChanged>) {
            return on_subscription_changed(tx, body);
        } else if constexpr (std::is_same_v<T, SubscriptionDeleted>) {
            return on_subscription_deleted(tx, body);
        } else if constexpr (std::is_same_v<T, InvoicePaymentSucceeded>) {
            return on_payment_succeeded(tx, body);
        } else if constexpr (std::is_same_v<T, InvoicePaymentFailed>) {
            return on_payment_failed(tx, body);
        } else if constexpr (std::is_same_v<T, DisputeEvent>) {
            return on_dispute(tx, body);
        } else if constexpr (std::is_same_v<T, CustomerDeleted>) {
            return on_customer_deleted(tx, body);
        } else {
            get_logger().info_fmt(kComponent, "Unhandled event type: {}", body.type);
            return SyncOutcome::Unhandled;
        }
    }, event.body);
}

// ─────────────────────────────────────────────────────────────────────────────
// Checkout
// ─────────────────────────────────────────────────────────────────────────────

StoreResult<SyncOutcome> SubscriptionSynchronizer::on_checkout_completed(
    IBillingTransaction& tx,
    const CheckoutCompleted& event
) const {
    const auto& reference = event.client_reference_id ? event.client_reference_id : event.metadata_user_id;
    if (!reference) {
        get_logger().warn(kComponent, "Checkout completed without an account reference");
        return SyncOutcome::MissingReference;
    }

    const auto account_id = parse_account_id(*reference);
    if (!account_id) {
        get_logger().warn_fmt(kComponent, "Checkout completed with invalid account reference '{}'", *reference);
        return SyncOutcome::MissingReference;
    }

    auto found = tx.find_by_account(*account_id);
    if (!found) {
        return tl::unexpected(std::move(found.error()));
    }
    if (!*found) {
        get_logger().warn_fmt(kComponent, "Checkout completed for unknown account {}", *account_id);
        return SyncOutcome::AccountNotFound;
    }

    SubscriptionRecord record = std::move(**found);
    if (event.customer_id) {
        record.billing_customer_id = event.customer_id;
    }
    record.tier = Tier::Pro;

    get_logger().info_fmt(kComponent, "Checkout completed for account {}", *account_id);
    if (auto saved = tx.save_subscription(record); !saved) {
        return tl::unexpected(std::move(saved.error()));
    }
    return SyncOutcome::Applied;
}

// ─────────────────────────────────────────────────────────────────────────────
// Subscription lifecycle
// ─────────────────────────────────────────────────────────────────────────────

StoreResult<SyncOutcome> SubscriptionSynchronizer::on_subscription_changed(
    IBillingTransaction& tx,
    const SubscriptionChanged& event
) const {
    if (!event.customer_id) {
        get_logger().warn(kComponent, "Subscription change without a customer id");
        return SyncOutcome::MissingReference;
    }

    auto found = lookup_customer(tx, *event.customer_id, "subscription change");
    if (!found) {
        return tl::unexpected(std::move(found.error()));
    }
    if (!*found) {
        return SyncOutcome::AccountNotFound;
    }

    const auto status = event.status ? parse_subscription_status(*event.status) : std::nullopt;
    if (!status) {
        get_logger().warn_fmt(kComponent, "Unknown subscription status '{}' for customer {}; treating as inactive",
                              event.status.value_or(""), *event.customer_id);
    }

    SubscriptionRecord record = std::move(**found);
    if (event.subscription_id) {
        record.billing_subscription_id = event.subscription_id;
    }
    record.status = status.value_or(SubscriptionStatus::None);
    record.tier = tier_for_status(record.status);
    record.period_end = event.period_end;

    get_logger().info_fmt(kComponent, "Subscription updated for account {}: {} ({})",
                          record.account_id, to_string(record.status), to_string(record.tier));
    if (auto saved = tx.save_subscription(record); !saved) {
        return tl::unexpected(std::move(saved.error()));
    }
    return SyncOutcome::Applied;
}

StoreResult<SyncOutcome> SubscriptionSynchronizer::on_subscription_deleted(
    IBillingTransaction& tx,
    const SubscriptionDeleted& event
) const {
    if (!event.customer_id) {
        get_logger().warn(kComponent, "Subscription deletion without a customer id");
        return SyncOutcome::MissingReference;
    }

    auto found = lookup_customer(tx, *event.customer_id, "subscription deleted");
    if (!found) {
        return tl::unexpected(std::move(found.error()));
    }
    if (!*found) {
        return SyncOutcome::AccountNotFound;
    }

    SubscriptionRecord record = std::move(**found);
    record.tier = Tier::Free;
    record.status = SubscriptionStatus::Canceled;
    record.billing_subscription_id.reset();
    record.period_end.reset();

    get_logger().info_fmt(kComponent, "Subscription deleted for account {}", record.account_id);
    if (auto saved = tx.save_subscription(record); !saved) {
        return tl::unexpected(std::move(saved.error()));
    }
    return SyncOutcome::Applied;
}

// ─────────────────────────────────────────────────────────────────────────────
// Invoices
// ─────────────────────────────────────────────────────────────────────────────

StoreResult<SyncOutcome> SubscriptionSynchronizer::on_payment_succeeded(
    IBillingTransaction& tx,
    const InvoicePaymentSucceeded& event
) const {
    if (!event.customer_id) {
        return SyncOutcome::MissingReference;
    }

    // A new customer is normally not linked yet; checkout will do it
    auto found = tx.find_by_customer(*event.customer_id);
    if (!found) {
        return tl::unexpected(std::move(found.error()));
    }
    if (!*found) {
        get_logger().debug(kComponent, "Payment succeeded for unlinked customer " + *event.customer_id);
        return SyncOutcome::AccountNotFound;
    }

    SubscriptionRecord record = std::move(**found);
    get_logger().info_fmt(kComponent, "Payment succeeded for account {}", record.account_id);
    if (record.tier == Tier::Pro) {
        return SyncOutcome::NoChange;
    }

    // Upgrades regardless of subscription status; heals a missed subscription update
    record.tier = Tier::Pro;
    if (auto saved = tx.save_subscription(record); !saved) {
        return tl::unexpected(std::move(saved.error()));
    }
    return SyncOutcome::Applied;
}

StoreResult<SyncOutcome> SubscriptionSynchronizer::on_payment_failed(
    IBillingTransaction& tx,
    const InvoicePaymentFailed& event
) const {
    if (!event.customer_id) {
        return SyncOutcome::MissingReference;
    }

    auto found = tx.find_by_customer(*event.customer_id);
    if (!found) {
        return tl::unexpected(std::move(found.error()));
    }
    if (!*found) {
        return SyncOutcome::AccountNotFound;
    }

    // Never downgrade here; the provider retries and a later subscription
    // status event carries the decision.
    get_logger().warn_fmt(kComponent, "Payment failed for account {} (attempt {})",
                          (*found)->account_id, event.attempt_count.value_or(0));
    return SyncOutcome::NoChange;
}

// ─────────────────────────────────────────────────────────────────────────────
// Disputes
// ─────────────────────────────────────────────────────────────────────────────

StoreResult<SyncOutcome> SubscriptionSynchronizer::on_dispute(
    IBillingTransaction& tx,
    const DisputeEvent& event
) const {
    const bool created = (event.phase == DisputeEvent::Phase::Created);
    const std::string dispute_id = event.dispute_id.value_or("unknown");
    const std::string reason = event.reason.value_or("unspecified");
    const std::string status = event.status.value_or("unknown");

    if (created) {
        get_logger().warn_fmt(kComponent, "Dispute {} created for charge {}: reason={}, status={}",
                              dispute_id, event.charge_id.value_or("unknown"), reason, status);
    } else {
        get_logger().info_fmt(kComponent, "Dispute {} closed: status={}", dispute_id, status);
        if (status == "lost") {
            get_logger().warn_fmt(kComponent, "Dispute {} lost; funds returned to customer", dispute_id);
        }
    }

    std::optional<AccountId> account_id;
    if (event.customer_id) {
        auto found = tx.find_by_customer(*event.customer_id);
        if (!found) {
            return tl::unexpected(std::move(found.error()));
        }
        if (*found) {
            account_id = (*found)->account_id;
            get_logger().info_fmt(kComponent, "Dispute {} affects account {}", dispute_id, *account_id);
        }
    } else {
        get_logger().warn_fmt(kComponent, "Dispute {} charge not expanded; customer unknown", dispute_id);
    }

    if (!config_.flag_disputes_for_review) {
        return SyncOutcome::NoChange;
    }

    DisputeFlag flag{
        .dispute_id = dispute_id,
        .account_id = account_id,
        .billing_customer_id = event.customer_id,
        .reason = reason,
        .status = status,
        .flagged_at = std::chrono::system_clock::now(),
    };
    if (auto flagged = tx.flag_dispute(flag); !flagged) {
        return tl::unexpected(std::move(flagged.error()));
    }
    return SyncOutcome::Applied;
}

// ─────────────────────────────────────────────────────────────────────────────
// Customer deletion
// ─────────────────────────────────────────────────────────────────────────────

StoreResult<SyncOutcome> SubscriptionSynchronizer::on_customer_deleted(
    IBillingTransaction& tx,
    const CustomerDeleted& event
) const {
    if (!event.customer_id) {
        return SyncOutcome::MissingReference;
    }

    auto found = tx.find_by_customer(*event.customer_id);
    if (!found) {
        return tl::unexpected(std::move(found.error()));
    }
    if (!*found) {
        get_logger().info_fmt(kComponent, "Customer {} deleted but no account found", *event.customer_id);
        return SyncOutcome::AccountNotFound;
    }

    SubscriptionRecord record = std::move(**found);
    record.billing_customer_id.reset();
    record.billing_subscription_id.reset();
    record.status = SubscriptionStatus::None;
    record.period_end.reset();
    record.tier = Tier::Free;

    get_logger().info_fmt(kComponent, "Customer deleted for account {}; billing data cleared", record.account_id);
    if (auto saved = tx.save_subscription(record); !saved) {
        return tl::unexpected(std::move(saved.error()));
    }
    return SyncOutcome::Applied;
}

}  // namespace billguard
