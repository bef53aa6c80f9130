// ─────────────────────────────────────────────────────────────────────────────
// Subscription Synchronizer Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "billguard/billing/subscription_synchronizer.hpp"
#include "billguard/store/memory_billing_store.hpp"
#include "mocks/billing_events.hpp"
#include "mocks/test_logger.hpp"

#include <optional>

using namespace billguard;
using namespace billguard::testing;

namespace {

struct SyncFixture {
    MemoryBillingStore store;
    SubscriptionSynchronizer synchronizer;

    explicit SyncFixture(SynchronizerConfig config = {})
        : synchronizer(config)
    {}

    SyncOutcome apply(const nlohmann::json& envelope) {
        auto tx = store.begin();
        REQUIRE(tx.has_value());
        auto outcome = synchronizer.apply(**tx, to_event(envelope));
        REQUIRE(outcome.has_value());
        REQUIRE((*tx)->commit().has_value());
        return *outcome;
    }

    SubscriptionRecord record(AccountId id) {
        auto found = store.find_by_account(id);
        REQUIRE(found.has_value());
        REQUIRE(found->has_value());
        return **found;
    }

    /// Account 42 linked to cus_42 with the given tier
    void seed_linked(Tier tier, SubscriptionStatus status = SubscriptionStatus::Active) {
        REQUIRE(store.ensure_account(42).has_value());
        auto tx = store.begin();
        REQUIRE(tx.has_value());
        auto seeded = SubscriptionRecord::for_new_account(42);
        seeded.billing_customer_id = "cus_42";
        seeded.billing_subscription_id = "sub_42";
        seeded.tier = tier;
        seeded.status = status;
        REQUIRE((*tx)->save_subscription(seeded).has_value());
        REQUIRE((*tx)->commit().has_value());
    }
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Checkout
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Checkout links the customer and upgrades the account", "[billing][sync]") {
    SyncFixture f;
    REQUIRE(f.store.ensure_account(42).has_value());

    REQUIRE(f.apply(checkout_completed_json("evt_1", "42", "cus_42")) == SyncOutcome::Applied);

    const auto record = f.record(42);
    REQUIRE(record.tier == Tier::Pro);
    REQUIRE(record.billing_customer_id == "cus_42");
}

TEST_CASE("Checkout prefers client_reference_id over metadata", "[billing][sync]") {
    SyncFixture f;
    REQUIRE(f.store.ensure_account(42).has_value());
    REQUIRE(f.store.ensure_account(7).has_value());

    REQUIRE(f.apply(checkout_completed_json("evt_1", "42", "cus_42", "7")) == SyncOutcome::Applied);

    REQUIRE(f.record(42).tier == Tier::Pro);
    REQUIRE(f.record(7).tier == Tier::Free);
}

TEST_CASE("Checkout falls back to metadata.userId", "[billing][sync]") {
    SyncFixture f;
    REQUIRE(f.store.ensure_account(7).has_value());

    REQUIRE(f.apply(checkout_completed_json("evt_1", std::nullopt, "cus_7", "7")) == SyncOutcome::Applied);
    REQUIRE(f.record(7).billing_customer_id == "cus_7");
}

TEST_CASE("Checkout without a usable account reference is a logged no-op", "[billing][sync]") {
    ScopedTestLogger logger;
    SyncFixture f;
    REQUIRE(f.store.ensure_account(42).has_value());

    REQUIRE(f.apply(checkout_completed_json("evt_1", std::nullopt, "cus_42")) == SyncOutcome::MissingReference);
    REQUIRE(f.apply(checkout_completed_json("evt_2", "forty-two", "cus_42")) == SyncOutcome::MissingReference);
    REQUIRE(f.apply(checkout_completed_json("evt_3", "-5", "cus_42")) == SyncOutcome::MissingReference);
    REQUIRE(f.apply(checkout_completed_json("evt_4", "9999", "cus_42")) == SyncOutcome::AccountNotFound);

    REQUIRE(f.record(42).tier == Tier::Free);
    REQUIRE(f.store.committed_subscription_writes() == 0);
    REQUIRE(logger->contains(LogLevel::Warn, "unknown account 9999"));
}

// ═══════════════════════════════════════════════════════════════════════════
// Subscription lifecycle
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Subscription status maps to tier", "[billing][sync]") {
    struct Case {
        const char* status;
        SubscriptionStatus expected_status;
        Tier expected_tier;
    };
    const Case cases[] = {
        {"active", SubscriptionStatus::Active, Tier::Pro},
        {"trialing", SubscriptionStatus::Trialing, Tier::Pro},
        {"past_due", SubscriptionStatus::PastDue, Tier::Free},
        {"unpaid", SubscriptionStatus::Unpaid, Tier::Free},
        {"incomplete", SubscriptionStatus::Incomplete, Tier::Free},
        {"incomplete_expired", SubscriptionStatus::IncompleteExpired, Tier::Free},
        {"canceled", SubscriptionStatus::Canceled, Tier::Free},
    };

    for (const auto& c : cases) {
        SyncFixture f;
        f.seed_linked(Tier::Free, SubscriptionStatus::None);

        const auto outcome = f.apply(subscription_json(
            "evt_1", event_type::kSubscriptionUpdated, "cus_42", "sub_new", c.status, 1717236000));

        REQUIRE(outcome == SyncOutcome::Applied);
        const auto record = f.record(42);
        REQUIRE(record.status == c.expected_status);
        REQUIRE(record.tier == c.expected_tier);
        REQUIRE(record.billing_subscription_id == "sub_new");
        REQUIRE(record.period_end == from_unix_seconds(1717236000));
    }
}

TEST_CASE("Unknown provider status is treated as inactive", "[billing][sync]") {
    ScopedTestLogger logger;
    SyncFixture f;
    f.seed_linked(Tier::Pro);

    REQUIRE(f.apply(subscription_json(
        "evt_1", event_type::kSubscriptionUpdated, "cus_42", "sub_42", "paused")) == SyncOutcome::Applied);

    const auto record = f.record(42);
    REQUIRE(record.status == SubscriptionStatus::None);
    REQUIRE(record.tier == Tier::Free);
    REQUIRE(logger->contains(LogLevel::Warn, "paused"));
}

TEST_CASE("Subscription update without a status downgrades to free", "[billing][sync]") {
    ScopedTestLogger logger;
    SyncFixture f;
    f.seed_linked(Tier::Pro);

    auto payload = subscription_json("evt_1", event_type::kSubscriptionUpdated, "cus_42", "sub_42", "active");
    payload["data"]["object"].erase("status");
    REQUIRE(f.apply(payload) == SyncOutcome::Applied);

    const auto record = f.record(42);
    REQUIRE(record.status == SubscriptionStatus::None);
    REQUIRE(record.tier == Tier::Free);
    REQUIRE(logger->contains(LogLevel::Warn, "Unknown subscription status '' for customer cus_42"));
}

TEST_CASE("Subscription update for an unknown customer creates nothing", "[billing][sync]") {
    SyncFixture f;

    REQUIRE(f.apply(subscription_json(
        "evt_1", event_type::kSubscriptionUpdated, "cus_ghost", "sub_1", "active")) == SyncOutcome::AccountNotFound);

    REQUIRE(f.store.committed_subscription_writes() == 0);
    REQUIRE_FALSE(f.store.find_by_account(42)->has_value());
}

TEST_CASE("Subscription deletion downgrades and clears the subscription", "[billing][sync]") {
    SyncFixture f;
    f.seed_linked(Tier::Pro);

    REQUIRE(f.apply(subscription_json(
        "evt_1", event_type::kSubscriptionDeleted, "cus_42", "sub_42", "canceled")) == SyncOutcome::Applied);

    const auto record = f.record(42);
    REQUIRE(record.tier == Tier::Free);
    REQUIRE(record.status == SubscriptionStatus::Canceled);
    REQUIRE_FALSE(record.billing_subscription_id.has_value());
    REQUIRE_FALSE(record.period_end.has_value());
    REQUIRE(record.billing_customer_id == "cus_42");
}

// ═══════════════════════════════════════════════════════════════════════════
// Invoices
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Payment success upgrades a free account and leaves pro alone", "[billing][sync]") {
    SECTION("free account") {
        SyncFixture f;
        f.seed_linked(Tier::Free, SubscriptionStatus::PastDue);
        REQUIRE(f.apply(invoice_json("evt_1", event_type::kInvoicePaymentSucceeded, "cus_42")) == SyncOutcome::Applied);
        REQUIRE(f.record(42).tier == Tier::Pro);
    }

    SECTION("pro account") {
        SyncFixture f;
        f.seed_linked(Tier::Pro);
        const auto writes = f.store.committed_subscription_writes();
        REQUIRE(f.apply(invoice_json("evt_1", event_type::kInvoicePaymentSucceeded, "cus_42")) == SyncOutcome::NoChange);
        REQUIRE(f.store.committed_subscription_writes() == writes);
    }

    SECTION("unlinked customer") {
        SyncFixture f;
        REQUIRE(f.apply(invoice_json("evt_1", event_type::kInvoicePaymentSucceeded, "cus_new")) ==
                SyncOutcome::AccountNotFound);
    }
}

TEST_CASE("Payment failure never downgrades", "[billing][sync]") {
    ScopedTestLogger logger;
    SyncFixture f;
    f.seed_linked(Tier::Pro);
    const auto writes = f.store.committed_subscription_writes();

    REQUIRE(f.apply(invoice_json("evt_1", event_type::kInvoicePaymentFailed, "cus_42", 2)) == SyncOutcome::NoChange);

    REQUIRE(f.record(42).tier == Tier::Pro);
    REQUIRE(f.store.committed_subscription_writes() == writes);
    REQUIRE(logger->contains(LogLevel::Warn, "attempt 2"));
}

// ═══════════════════════════════════════════════════════════════════════════
// Disputes
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Disputes are logged and never change the tier", "[billing][sync]") {
    SyncFixture f;
    f.seed_linked(Tier::Pro);

    REQUIRE(f.apply(dispute_json("evt_1", event_type::kDisputeCreated, "cus_42", "needs_response")) ==
            SyncOutcome::NoChange);
    REQUIRE(f.apply(dispute_json("evt_2", event_type::kDisputeClosed, "cus_42", "lost")) == SyncOutcome::NoChange);

    REQUIRE(f.record(42).tier == Tier::Pro);
    REQUIRE(f.store.dispute_flags()->empty());
}

TEST_CASE("Disputes are queued for review when configured", "[billing][sync]") {
    SyncFixture f{SynchronizerConfig{}.with_flag_disputes_for_review(true)};
    f.seed_linked(Tier::Pro);

    REQUIRE(f.apply(dispute_json("evt_1", event_type::kDisputeCreated, "cus_42", "needs_response")) ==
            SyncOutcome::Applied);

    auto unexpanded = dispute_json("evt_2", event_type::kDisputeCreated, "cus_42", "needs_response", "duplicate");
    unexpanded["data"]["object"]["charge"] = "ch_2";
    REQUIRE(f.apply(unexpanded) == SyncOutcome::Applied);

    const auto flags = f.store.dispute_flags();
    REQUIRE(flags->size() == 2);
    REQUIRE((*flags)[0].account_id == 42);
    REQUIRE((*flags)[0].billing_customer_id == "cus_42");
    REQUIRE((*flags)[0].reason == "fraudulent");
    REQUIRE_FALSE((*flags)[1].account_id.has_value());
    REQUIRE((*flags)[1].reason == "duplicate");
    REQUIRE(f.record(42).tier == Tier::Pro);
}

// ═══════════════════════════════════════════════════════════════════════════
// Customer deletion and unknown events
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Customer deletion clears billing data", "[billing][sync]") {
    SyncFixture f;
    f.seed_linked(Tier::Pro);

    REQUIRE(f.apply(customer_deleted_json("evt_1", "cus_42")) == SyncOutcome::Applied);

    const auto record = f.record(42);
    REQUIRE(record == SubscriptionRecord::for_new_account(42));
}

TEST_CASE("Unrecognized events are acknowledged without writes", "[billing][sync]") {
    SyncFixture f;
    f.seed_linked(Tier::Pro);
    const auto writes = f.store.committed_subscription_writes();

    REQUIRE(f.apply(envelope("evt_1", "payout.paid", {{"id", "po_1"}})) == SyncOutcome::Unhandled);
    REQUIRE(f.store.committed_subscription_writes() == writes);
}

TEST_CASE("Subscription lifecycle round trip", "[billing][sync]") {
    SyncFixture f;
    REQUIRE(f.store.ensure_account(42).has_value());

    REQUIRE(f.apply(checkout_completed_json("evt_1", "42", "cus_42")) == SyncOutcome::Applied);
    REQUIRE(f.apply(subscription_json(
        "evt_2", event_type::kSubscriptionCreated, "cus_42", "sub_42", "trialing", 1717236000)) == SyncOutcome::Applied);
    REQUIRE(f.record(42).tier == Tier::Pro);

    REQUIRE(f.apply(subscription_json(
        "evt_3", event_type::kSubscriptionUpdated, "cus_42", "sub_42", "past_due", 1717236000)) == SyncOutcome::Applied);
    REQUIRE(f.record(42).tier == Tier::Free);

    REQUIRE(f.apply(invoice_json("evt_4", event_type::kInvoicePaymentSucceeded, "cus_42")) == SyncOutcome::Applied);
    REQUIRE(f.record(42).tier == Tier::Pro);

    REQUIRE(f.apply(subscription_json(
        "evt_5", event_type::kSubscriptionDeleted, "cus_42", "sub_42", "canceled")) == SyncOutcome::Applied);

    const auto record = f.record(42);
    REQUIRE(record.tier == Tier::Free);
    REQUIRE(record.status == SubscriptionStatus::Canceled);
    REQUIRE(record.billing_customer_id == "cus_42");
}
