#pragma once

#include "billguard/store/billing_store.hpp"
#include "billguard/store/sqlite_database.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace billguard {

// ─────────────────────────────────────────────────────────────────────────────
// SqliteBillingStore
// ─────────────────────────────────────────────────────────────────────────────
// Production store. The ledger table keys on event_id, so concurrent
// deliveries (threads here, or other processes on the same file) produce
// exactly one row. Transactions use BEGIN IMMEDIATE to take the write lock up
// front; contention waits up to the busy timeout and then surfaces as
// StoreErrorCode::Busy.
//
// One connection per store. Work on the connection is serialized by a
// mutex held for the lifetime of a transaction.

class SqliteBillingStore final : public IBillingStore {
public:
    /// Opens (creating if needed) the database file and applies the schema
    [[nodiscard]] static StoreResult<std::unique_ptr<SqliteBillingStore>> open(const std::string& path);

    SqliteBillingStore(const SqliteBillingStore&) = delete;
    SqliteBillingStore& operator=(const SqliteBillingStore&) = delete;

    [[nodiscard]] StoreResult<std::unique_ptr<IBillingTransaction>> begin() override;

    [[nodiscard]] StoreResult<std::optional<ProcessedEventRecord>> find_processed_event(
        std::string_view event_id) override;

    [[nodiscard]] StoreResult<std::optional<SubscriptionRecord>> find_by_account(
        AccountId account_id) override;

    [[nodiscard]] StoreResult<std::size_t> processed_event_count() override;

    [[nodiscard]] StoreResult<std::vector<DisputeFlag>> dispute_flags() override;

    [[nodiscard]] StoreResult<void> ensure_account(AccountId account_id) override;

    [[nodiscard]] const std::string& path() const noexcept { return db_->path(); }

private:
    explicit SqliteBillingStore(std::unique_ptr<sqlite::Database> db);

    [[nodiscard]] StoreResult<void> migrate();

    std::unique_ptr<sqlite::Database> db_;
    std::mutex mutex_;
};

}  // namespace billguard
