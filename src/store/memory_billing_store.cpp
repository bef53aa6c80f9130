#include "billguard/store/memory_billing_store.hpp"

namespace billguard {

// ─────────────────────────────────────────────────────────────────────────────
// MemoryBillingTransaction: snapshot + writer lock
// ─────────────────────────────────────────────────────────────────────────────

class MemoryBillingTransaction final : public IBillingTransaction {
public:
    explicit MemoryBillingTransaction(MemoryBillingStore& store)
        : store_(store)
        , writer_lock_(store.writer_mutex_)
    {
        std::lock_guard<std::mutex> lock(store_.state_mutex_);
        working_ = store_.committed_;
    }

    ~MemoryBillingTransaction() override {
        rollback();
    }

    StoreResult<InsertOutcome> insert_processed_event(const ProcessedEventRecord& record) override {
        if (auto error = check_open()) {
            return tl::unexpected(std::move(*error));
        }
        const auto [it, inserted] = working_.events.try_emplace(record.event_id, record);
        return inserted ? InsertOutcome::Inserted : InsertOutcome::Duplicate;
    }

    StoreResult<std::optional<SubscriptionRecord>> find_by_account(AccountId account_id) override {
        if (auto error = check_open()) {
            return tl::unexpected(std::move(*error));
        }
        const auto it = working_.subscriptions.find(account_id);
        if (it == working_.subscriptions.end()) {
            return std::optional<SubscriptionRecord>{};
        }
        return std::optional<SubscriptionRecord>{it->second};
    }

    StoreResult<std::optional<SubscriptionRecord>> find_by_customer(std::string_view billing_customer_id) override {
        if (auto error = check_open()) {
            return tl::unexpected(std::move(*error));
        }
        for (const auto& [id, record] : working_.subscriptions) {
            if (record.billing_customer_id && *record.billing_customer_id == billing_customer_id) {
                return std::optional<SubscriptionRecord>{record};
            }
        }
        return std::optional<SubscriptionRecord>{};
    }

    StoreResult<void> save_subscription(const SubscriptionRecord& record) override {
        if (auto error = check_open()) {
            return tl::unexpected(std::move(*error));
        }
        working_.subscriptions[record.account_id] = record;
        ++working_.subscription_writes;
        return {};
    }

    StoreResult<void> flag_dispute(const DisputeFlag& flag) override {
        if (auto error = check_open()) {
            return tl::unexpected(std::move(*error));
        }
        working_.disputes.push_back(flag);
        return {};
    }

    StoreResult<void> commit() override {
        if (auto error = check_open()) {
            return tl::unexpected(std::move(*error));
        }
        {
            std::lock_guard<std::mutex> lock(store_.state_mutex_);
            store_.committed_ = std::move(working_);
        }
        finished_ = true;
        writer_lock_.unlock();
        return {};
    }

    void rollback() noexcept override {
        if (finished_) {
            return;
        }
        finished_ = true;
        writer_lock_.unlock();
    }

private:
    [[nodiscard]] std::optional<StoreError> check_open() const {
        if (finished_) {
            return StoreError::internal("transaction already finished");
        }
        return std::nullopt;
    }

    MemoryBillingStore& store_;
    std::unique_lock<std::mutex> writer_lock_;
    MemoryBillingStore::State working_;
    bool finished_{false};
};

// ─────────────────────────────────────────────────────────────────────────────
// MemoryBillingStore
// ─────────────────────────────────────────────────────────────────────────────

StoreResult<std::unique_ptr<IBillingTransaction>> MemoryBillingStore::begin() {
    return std::unique_ptr<IBillingTransaction>(std::make_unique<MemoryBillingTransaction>(*this));
}

StoreResult<std::optional<ProcessedEventRecord>> MemoryBillingStore::find_processed_event(std::string_view event_id) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    const auto it = committed_.events.find(event_id);
    if (it == committed_.events.end()) {
        return std::optional<ProcessedEventRecord>{};
    }
    return std::optional<ProcessedEventRecord>{it->second};
}

StoreResult<std::optional<SubscriptionRecord>> MemoryBillingStore::find_by_account(AccountId account_id) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    const auto it = committed_.subscriptions.find(account_id);
    if (it == committed_.subscriptions.end()) {
        return std::optional<SubscriptionRecord>{};
    }
    return std::optional<SubscriptionRecord>{it->second};
}

StoreResult<std::size_t> MemoryBillingStore::processed_event_count() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return committed_.events.size();
}

StoreResult<std::vector<DisputeFlag>> MemoryBillingStore::dispute_flags() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return committed_.disputes;
}

StoreResult<void> MemoryBillingStore::ensure_account(AccountId account_id) {
    std::lock_guard<std::mutex> writer(writer_mutex_);
    std::lock_guard<std::mutex> lock(state_mutex_);
    committed_.subscriptions.try_emplace(account_id, SubscriptionRecord::for_new_account(account_id));
    return {};
}

std::size_t MemoryBillingStore::committed_subscription_writes() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return committed_.subscription_writes;
}

}  // namespace billguard
