#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Billing Store Interface
// ═══════════════════════════════════════════════════════════════════════════
// Persistence seam for the idempotency ledger and subscription records.
//
// The ledger's correctness rests on the store: insert_processed_event()
// must enforce event id uniqueness itself (a unique key, not an in-memory
// check in the caller), because duplicate deliveries can land on different
// processes. A duplicate insert is reported as InsertOutcome::Duplicate,
// not as an error.
//
// Writes happen inside an IBillingTransaction. Destroying a transaction
// without commit() rolls it back, so the ledger row and the subscription
// mutation it guards become visible together or not at all.

#include "billguard/billing/subscription.hpp"
#include "billguard/store/store_error.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace billguard {

enum class InsertOutcome {
    Inserted,
    Duplicate
};

class IBillingTransaction {
public:
    virtual ~IBillingTransaction() = default;

    [[nodiscard]] virtual StoreResult<InsertOutcome> insert_processed_event(
        const ProcessedEventRecord& record) = 0;

    [[nodiscard]] virtual StoreResult<std::optional<SubscriptionRecord>> find_by_account(
        AccountId account_id) = 0;

    [[nodiscard]] virtual StoreResult<std::optional<SubscriptionRecord>> find_by_customer(
        std::string_view billing_customer_id) = 0;

    /// Upsert keyed by account_id
    [[nodiscard]] virtual StoreResult<void> save_subscription(const SubscriptionRecord& record) = 0;

    [[nodiscard]] virtual StoreResult<void> flag_dispute(const DisputeFlag& flag) = 0;

    [[nodiscard]] virtual StoreResult<void> commit() = 0;

    /// Idempotent; also performed by the destructor when not committed
    virtual void rollback() noexcept = 0;
};

class IBillingStore {
public:
    virtual ~IBillingStore() = default;

    [[nodiscard]] virtual StoreResult<std::unique_ptr<IBillingTransaction>> begin() = 0;

    // Committed-state reads

    [[nodiscard]] virtual StoreResult<std::optional<ProcessedEventRecord>> find_processed_event(
        std::string_view event_id) = 0;

    [[nodiscard]] virtual StoreResult<std::optional<SubscriptionRecord>> find_by_account(
        AccountId account_id) = 0;

    [[nodiscard]] virtual StoreResult<std::size_t> processed_event_count() = 0;

    [[nodiscard]] virtual StoreResult<std::vector<DisputeFlag>> dispute_flags() = 0;

    /// Account creation hook: inserts SubscriptionRecord::for_new_account()
    /// when the account has no record yet.
    [[nodiscard]] virtual StoreResult<void> ensure_account(AccountId account_id) = 0;
};

}  // namespace billguard
