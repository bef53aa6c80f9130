#include "billguard/store/sqlite_billing_store.hpp"
#include "billguard/log/logger.hpp"

#include <functional>
#include <stdexcept>

namespace billguard {

namespace {

constexpr std::string_view kComponent = "sqlite-store";

constexpr const char* kSchema = R"sql(
CREATE TABLE IF NOT EXISTS processed_events (
    event_id     TEXT PRIMARY KEY,
    event_type   TEXT NOT NULL,
    processed_at TEXT NOT NULL,
    payload      TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS subscriptions (
    account_id              INTEGER PRIMARY KEY,
    billing_customer_id     TEXT,
    billing_subscription_id TEXT,
    status                  TEXT NOT NULL DEFAULT 'none',
    tier                    TEXT NOT NULL DEFAULT 'free',
    period_end              INTEGER
);

CREATE INDEX IF NOT EXISTS idx_subscriptions_customer
    ON subscriptions(billing_customer_id);

CREATE TABLE IF NOT EXISTS dispute_flags (
    id                  INTEGER PRIMARY KEY AUTOINCREMENT,
    dispute_id          TEXT NOT NULL,
    account_id          INTEGER,
    billing_customer_id TEXT,
    reason              TEXT NOT NULL,
    status              TEXT NOT NULL,
    flagged_at          TEXT NOT NULL
);
)sql";

constexpr std::string_view kSelectSubscription =
    "SELECT account_id, billing_customer_id, billing_subscription_id, status, tier, period_end "
    "FROM subscriptions ";

SubscriptionRecord read_subscription(const sqlite::Statement& st) {
    SubscriptionRecord record;
    record.account_id = st.column_int64(0);
    record.billing_customer_id = st.column_optional_text(1);
    record.billing_subscription_id = st.column_optional_text(2);
    record.status = parse_subscription_status(st.column_text(3)).value_or(SubscriptionStatus::None);
    record.tier = parse_tier(st.column_text(4)).value_or(Tier::Free);
    if (const auto seconds = st.column_optional_int64(5)) {
        record.period_end = from_unix_seconds(*seconds);
    }
    return record;
}

StoreResult<std::optional<SubscriptionRecord>> query_subscription(
    sqlite::Database& db,
    std::string_view where,
    const std::function<void(sqlite::Statement&)>& bind
) {
    std::string sql(kSelectSubscription);
    sql.append(where);

    auto st = db.prepare(sql);
    if (!st) {
        return tl::unexpected(std::move(st.error()));
    }
    bind(*st);

    const int rc = st->step();
    if (rc == SQLITE_ROW) {
        return std::optional<SubscriptionRecord>{read_subscription(*st)};
    }
    if (rc == SQLITE_DONE) {
        return std::optional<SubscriptionRecord>{};
    }
    return tl::unexpected(db.translate(rc));
}

StoreResult<std::optional<SubscriptionRecord>> select_by_account(sqlite::Database& db, AccountId account_id) {
    return query_subscription(db, "WHERE account_id = ?;",
                              [account_id](sqlite::Statement& st) { st.bind_int64(1, account_id); });
}

StoreResult<std::optional<SubscriptionRecord>> select_by_customer(sqlite::Database& db, std::string_view customer_id) {
    return query_subscription(db, "WHERE billing_customer_id = ? ORDER BY account_id LIMIT 1;",
                              [customer_id](sqlite::Statement& st) { st.bind_text(1, customer_id); });
}

StoreResult<void> step_done(sqlite::Database& db, sqlite::Statement& st) {
    const int rc = st.step();
    if (rc != SQLITE_DONE) {
        return tl::unexpected(db.translate(rc));
    }
    return {};
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// SqliteBillingTransaction
// ─────────────────────────────────────────────────────────────────────────────

class SqliteBillingTransaction final : public IBillingTransaction {
public:
    SqliteBillingTransaction(sqlite::Database& db, std::unique_lock<std::mutex> lock)
        : db_(db)
        , lock_(std::move(lock))
    {}

    ~SqliteBillingTransaction() override {
        rollback();
    }

    StoreResult<InsertOutcome> insert_processed_event(const ProcessedEventRecord& record) override {
        if (finished_) {
            return tl::unexpected(StoreError::internal("transaction already finished"));
        }

        auto st = db_.prepare(
            "INSERT INTO processed_events(event_id, event_type, processed_at, payload) "
            "VALUES(?, ?, ?, ?);");
        if (!st) {
            return tl::unexpected(std::move(st.error()));
        }
        st->bind_text(1, record.event_id);
        st->bind_text(2, record.event_type);
        st->bind_text(3, format_iso8601(record.processed_at));
        st->bind_text(4, record.payload);

        const int rc = st->step();
        if (rc == SQLITE_DONE) {
            return InsertOutcome::Inserted;
        }
        if (sqlite::is_unique_violation(db_.handle(), rc)) {
            return InsertOutcome::Duplicate;
        }
        return tl::unexpected(db_.translate(rc));
    }

    StoreResult<std::optional<SubscriptionRecord>> find_by_account(AccountId account_id) override {
        if (finished_) {
            return tl::unexpected(StoreError::internal("transaction already finished"));
        }
        return select_by_account(db_, account_id);
    }

    StoreResult<std::optional<SubscriptionRecord>> find_by_customer(std::string_view billing_customer_id) override {
        if (finished_) {
            return tl::unexpected(StoreError::internal("transaction already finished"));
        }
        return select_by_customer(db_, billing_customer_id);
    }

    StoreResult<void> save_subscription(const SubscriptionRecord& record) override {
        if (finished_) {
            return tl::unexpected(StoreError::internal("transaction already finished"));
        }

        auto st = db_.prepare(
            "INSERT INTO subscriptions(account_id, billing_customer_id, billing_subscription_id, "
            "status, tier, period_end) VALUES(?, ?, ?, ?, ?, ?) "
            "ON CONFLICT(account_id) DO UPDATE SET "
            "billing_customer_id = excluded.billing_customer_id, "
            "billing_subscription_id = excluded.billing_subscription_id, "
            "status = excluded.status, tier = excluded.tier, period_end = excluded.period_end;");
        if (!st) {
            return tl::unexpected(std::move(st.error()));
        }
        st->bind_int64(1, record.account_id);
        st->bind_optional_text(2, record.billing_customer_id);
        st->bind_optional_text(3, record.billing_subscription_id);
        st->bind_text(4, to_string(record.status));
        st->bind_text(5, to_string(record.tier));
        st->bind_optional_int64(6, record.period_end
            ? std::optional<std::int64_t>(to_unix_seconds(*record.period_end))
            : std::nullopt);
        return step_done(db_, *st);
    }

    StoreResult<void> flag_dispute(const DisputeFlag& flag) override {
        if (finished_) {
            return tl::unexpected(StoreError::internal("transaction already finished"));
        }

        auto st = db_.prepare(
            "INSERT INTO dispute_flags(dispute_id, account_id, billing_customer_id, reason, status, flagged_at) "
            "VALUES(?, ?, ?, ?, ?, ?);");
        if (!st) {
            return tl::unexpected(std::move(st.error()));
        }
        st->bind_text(1, flag.dispute_id);
        st->bind_optional_int64(2, flag.account_id);
        st->bind_optional_text(3, flag.billing_customer_id);
        st->bind_text(4, flag.reason);
        st->bind_text(5, flag.status);
        st->bind_text(6, format_iso8601(flag.flagged_at));
        return step_done(db_, *st);
    }

    StoreResult<void> commit() override {
        if (finished_) {
            return tl::unexpected(StoreError::internal("transaction already finished"));
        }
        auto result = db_.exec("COMMIT;");
        if (!result) {
            // COMMIT can fail with SQLITE_BUSY and leave the transaction open
            rollback();
            return result;
        }
        finished_ = true;
        lock_.unlock();
        return {};
    }

    void rollback() noexcept override {
        if (finished_) {
            return;
        }
        finished_ = true;
        char* err = nullptr;
        if (sqlite3_exec(db_.handle(), "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
            get_logger().error(kComponent, std::string("ROLLBACK failed: ") + (err ? err : "unknown error"));
        }
        sqlite3_free(err);
        lock_.unlock();
    }

private:
    sqlite::Database& db_;
    std::unique_lock<std::mutex> lock_;
    bool finished_{false};
};

// ─────────────────────────────────────────────────────────────────────────────
// SqliteBillingStore
// ─────────────────────────────────────────────────────────────────────────────

StoreResult<std::unique_ptr<SqliteBillingStore>> SqliteBillingStore::open(const std::string& path) {
    std::unique_ptr<sqlite::Database> db;
    try {
        db = std::make_unique<sqlite::Database>(path);
    } catch (const std::runtime_error& e) {
        return tl::unexpected(StoreError::io_error(e.what()));
    }

    std::unique_ptr<SqliteBillingStore> store(new SqliteBillingStore(std::move(db)));
    if (auto migrated = store->migrate(); !migrated) {
        return tl::unexpected(std::move(migrated.error()));
    }

    get_logger().info_fmt(kComponent, "Opened billing store at {}", path);
    return store;
}

SqliteBillingStore::SqliteBillingStore(std::unique_ptr<sqlite::Database> db)
    : db_(std::move(db))
{}

StoreResult<void> SqliteBillingStore::migrate() {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_->exec(kSchema);
}

StoreResult<std::unique_ptr<IBillingTransaction>> SqliteBillingStore::begin() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (auto begun = db_->exec("BEGIN IMMEDIATE;"); !begun) {
        return tl::unexpected(std::move(begun.error()));
    }
    return std::unique_ptr<IBillingTransaction>(
        std::make_unique<SqliteBillingTransaction>(*db_, std::move(lock)));
}

StoreResult<std::optional<ProcessedEventRecord>> SqliteBillingStore::find_processed_event(std::string_view event_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto st = db_->prepare(
        "SELECT event_id, event_type, processed_at, payload FROM processed_events WHERE event_id = ?;");
    if (!st) {
        return tl::unexpected(std::move(st.error()));
    }
    st->bind_text(1, event_id);

    const int rc = st->step();
    if (rc == SQLITE_DONE) {
        return std::optional<ProcessedEventRecord>{};
    }
    if (rc != SQLITE_ROW) {
        return tl::unexpected(db_->translate(rc));
    }

    ProcessedEventRecord record;
    record.event_id = st->column_text(0);
    record.event_type = st->column_text(1);
    record.processed_at = parse_iso8601(st->column_text(2)).value_or(Timestamp{});
    record.payload = st->column_text(3);
    return std::optional<ProcessedEventRecord>{std::move(record)};
}

StoreResult<std::optional<SubscriptionRecord>> SqliteBillingStore::find_by_account(AccountId account_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return select_by_account(*db_, account_id);
}

StoreResult<std::size_t> SqliteBillingStore::processed_event_count() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto st = db_->prepare("SELECT COUNT(*) FROM processed_events;");
    if (!st) {
        return tl::unexpected(std::move(st.error()));
    }
    const int rc = st->step();
    if (rc != SQLITE_ROW) {
        return tl::unexpected(db_->translate(rc));
    }
    return static_cast<std::size_t>(st->column_int64(0));
}

StoreResult<std::vector<DisputeFlag>> SqliteBillingStore::dispute_flags() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto st = db_->prepare(
        "SELECT dispute_id, account_id, billing_customer_id, reason, status, flagged_at "
        "FROM dispute_flags ORDER BY id;");
    if (!st) {
        return tl::unexpected(std::move(st.error()));
    }

    std::vector<DisputeFlag> flags;
    int rc = SQLITE_ROW;
    while ((rc = st->step()) == SQLITE_ROW) {
        DisputeFlag flag;
        flag.dispute_id = st->column_text(0);
        flag.account_id = st->column_optional_int64(1);
        flag.billing_customer_id = st->column_optional_text(2);
        flag.reason = st->column_text(3);
        flag.status = st->column_text(4);
        flag.flagged_at = parse_iso8601(st->column_text(5)).value_or(Timestamp{});
        flags.push_back(std::move(flag));
    }
    if (rc != SQLITE_DONE) {
        return tl::unexpected(db_->translate(rc));
    }
    return flags;
}

StoreResult<void> SqliteBillingStore::ensure_account(AccountId account_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto st = db_->prepare(
        "INSERT INTO subscriptions(account_id, status, tier) VALUES(?, 'none', 'free') "
        "ON CONFLICT(account_id) DO NOTHING;");
    if (!st) {
        return tl::unexpected(std::move(st.error()));
    }
    st->bind_int64(1, account_id);
    return step_done(*db_, *st);
}

}  // namespace billguard
