// ─────────────────────────────────────────────────────────────────────────────
// Memory Billing Store Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "billguard/store/memory_billing_store.hpp"

using namespace billguard;

namespace {

ProcessedEventRecord ledger_row(const std::string& id) {
    return ProcessedEventRecord{
        .event_id = id,
        .event_type = "customer.subscription.updated",
        .processed_at = from_unix_seconds(1714557600),
        .payload = "{}",
    };
}

}  // namespace

TEST_CASE("MemoryBillingStore ledger keys on event id", "[store][memory]") {
    MemoryBillingStore store;

    {
        auto tx = store.begin();
        REQUIRE(tx.has_value());
        REQUIRE(*(*tx)->insert_processed_event(ledger_row("evt_1")) == InsertOutcome::Inserted);
        REQUIRE(*(*tx)->insert_processed_event(ledger_row("evt_1")) == InsertOutcome::Duplicate);
        REQUIRE((*tx)->commit().has_value());
    }

    auto tx = store.begin();
    REQUIRE(*(*tx)->insert_processed_event(ledger_row("evt_1")) == InsertOutcome::Duplicate);
    REQUIRE(*(*tx)->insert_processed_event(ledger_row("evt_2")) == InsertOutcome::Inserted);
    REQUIRE((*tx)->commit().has_value());

    REQUIRE(*store.processed_event_count() == 2);
    auto found = store.find_processed_event("evt_1");
    REQUIRE(found->has_value());
    REQUIRE((*found)->processed_at == from_unix_seconds(1714557600));
}

TEST_CASE("MemoryBillingStore discards uncommitted work", "[store][memory]") {
    MemoryBillingStore store;
    REQUIRE(store.ensure_account(42).has_value());

    SECTION("explicit rollback") {
        auto tx = store.begin();
        REQUIRE(*(*tx)->insert_processed_event(ledger_row("evt_1")) == InsertOutcome::Inserted);
        (*tx)->rollback();
        (*tx)->rollback();
    }

    SECTION("destroyed without commit") {
        auto tx = store.begin();
        auto record = SubscriptionRecord::for_new_account(42);
        record.tier = Tier::Pro;
        REQUIRE((*tx)->save_subscription(record).has_value());
        REQUIRE(*(*tx)->insert_processed_event(ledger_row("evt_1")) == InsertOutcome::Inserted);
    }

    REQUIRE(*store.processed_event_count() == 0);
    REQUIRE((*store.find_by_account(42))->tier == Tier::Free);
    REQUIRE(store.committed_subscription_writes() == 0);

    // The writer lock was released
    auto next = store.begin();
    REQUIRE(next.has_value());
}

TEST_CASE("MemoryBillingStore transactions see their own writes", "[store][memory]") {
    MemoryBillingStore store;
    REQUIRE(store.ensure_account(7).has_value());

    auto tx = store.begin();
    auto record = SubscriptionRecord::for_new_account(7);
    record.billing_customer_id = "cus_7";
    REQUIRE((*tx)->save_subscription(record).has_value());

    auto by_customer = (*tx)->find_by_customer("cus_7");
    REQUIRE(by_customer->has_value());
    REQUIRE((*by_customer)->account_id == 7);

    // Committed state is unchanged until commit
    REQUIRE_FALSE((*store.find_by_account(7))->billing_customer_id.has_value());

    REQUIRE((*tx)->commit().has_value());
    REQUIRE((*store.find_by_account(7))->billing_customer_id == "cus_7");
    REQUIRE(store.committed_subscription_writes() == 1);
}

TEST_CASE("MemoryBillingStore rejects use after commit", "[store][memory]") {
    MemoryBillingStore store;
    auto tx = store.begin();
    REQUIRE((*tx)->commit().has_value());

    auto again = (*tx)->commit();
    REQUIRE_FALSE(again.has_value());
    REQUIRE(again.error().code == StoreErrorCode::Internal);
    REQUIRE_FALSE((*tx)->insert_processed_event(ledger_row("evt_1")).has_value());
}

TEST_CASE("MemoryBillingStore ensure_account keeps existing records", "[store][memory]") {
    MemoryBillingStore store;
    REQUIRE(store.ensure_account(42).has_value());
    {
        auto tx = store.begin();
        auto record = SubscriptionRecord::for_new_account(42);
        record.tier = Tier::Pro;
        REQUIRE((*tx)->save_subscription(record).has_value());
        REQUIRE((*tx)->commit().has_value());
    }

    REQUIRE(store.ensure_account(42).has_value());
    REQUIRE((*store.find_by_account(42))->tier == Tier::Pro);
    REQUIRE_FALSE(store.find_by_account(43)->has_value());
}
