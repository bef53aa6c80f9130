#pragma once

#include "billguard/store/billing_store.hpp"

#include <map>
#include <mutex>

namespace billguard {

// ─────────────────────────────────────────────────────────────────────────────
// MemoryBillingStore
// ─────────────────────────────────────────────────────────────────────────────
// In-process store for tests and single-process tooling. A transaction works
// on a snapshot copy and holds the writer lock until it commits or rolls
// back, so transactions are serialized and the ledger key check is exact.

class MemoryBillingStore final : public IBillingStore {
public:
    MemoryBillingStore() = default;

    MemoryBillingStore(const MemoryBillingStore&) = delete;
    MemoryBillingStore& operator=(const MemoryBillingStore&) = delete;

    [[nodiscard]] StoreResult<std::unique_ptr<IBillingTransaction>> begin() override;

    [[nodiscard]] StoreResult<std::optional<ProcessedEventRecord>> find_processed_event(
        std::string_view event_id) override;

    [[nodiscard]] StoreResult<std::optional<SubscriptionRecord>> find_by_account(
        AccountId account_id) override;

    [[nodiscard]] StoreResult<std::size_t> processed_event_count() override;

    [[nodiscard]] StoreResult<std::vector<DisputeFlag>> dispute_flags() override;

    [[nodiscard]] StoreResult<void> ensure_account(AccountId account_id) override;

    /// Number of committed subscription writes (save_subscription calls that
    /// reached a commit). Lets tests count mutations.
    [[nodiscard]] std::size_t committed_subscription_writes() const;

    struct State {
        std::map<std::string, ProcessedEventRecord, std::less<>> events;
        std::map<AccountId, SubscriptionRecord> subscriptions;
        std::vector<DisputeFlag> disputes;
        std::size_t subscription_writes{0};
    };

private:
    friend class MemoryBillingTransaction;

    std::mutex writer_mutex_;        ///< Held by the open transaction
    mutable std::mutex state_mutex_; ///< Guards committed_
    State committed_;
};

}  // namespace billguard
