#ifndef BILLGUARD_BILLING_SUBSCRIPTION_HPP
#define BILLGUARD_BILLING_SUBSCRIPTION_HPP

#include "billguard/util/time.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace billguard {

using AccountId = std::int64_t;

// ─────────────────────────────────────────────────────────────────────────────
// Tier
// ─────────────────────────────────────────────────────────────────────────────

enum class Tier {
    Free,
    Pro
};

[[nodiscard]] constexpr std::string_view to_string(Tier tier) noexcept {
    switch (tier) {
        case Tier::Free: return "free";
        case Tier::Pro:  return "pro";
    }
    return "free";
}

[[nodiscard]] std::optional<Tier> parse_tier(std::string_view text) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Subscription status (provider vocabulary plus None for "never subscribed")
// ─────────────────────────────────────────────────────────────────────────────

enum class SubscriptionStatus {
    Active,
    Trialing,
    Incomplete,
    IncompleteExpired,
    PastDue,
    Unpaid,
    Canceled,
    None
};

[[nodiscard]] constexpr std::string_view to_string(SubscriptionStatus status) noexcept {
    switch (status) {
        case SubscriptionStatus::Active:            return "active";
        case SubscriptionStatus::Trialing:          return "trialing";
        case SubscriptionStatus::Incomplete:        return "incomplete";
        case SubscriptionStatus::IncompleteExpired: return "incomplete_expired";
        case SubscriptionStatus::PastDue:           return "past_due";
        case SubscriptionStatus::Unpaid:            return "unpaid";
        case SubscriptionStatus::Canceled:          return "canceled";
        case SubscriptionStatus::None:              return "none";
    }
    return "none";
}

/// nullopt for anything outside the provider vocabulary
[[nodiscard]] std::optional<SubscriptionStatus> parse_subscription_status(std::string_view text) noexcept;

/// {active, trialing} grant pro; everything else is free
[[nodiscard]] constexpr Tier tier_for_status(SubscriptionStatus status) noexcept {
    return (status == SubscriptionStatus::Active || status == SubscriptionStatus::Trialing)
        ? Tier::Pro
        : Tier::Free;
}

// ─────────────────────────────────────────────────────────────────────────────
// Records
// ─────────────────────────────────────────────────────────────────────────────

struct SubscriptionRecord {
    AccountId account_id{0};
    std::optional<std::string> billing_customer_id;
    std::optional<std::string> billing_subscription_id;
    SubscriptionStatus status{SubscriptionStatus::None};
    Tier tier{Tier::Free};
    std::optional<Timestamp> period_end;

    /// State every account starts in
    [[nodiscard]] static SubscriptionRecord for_new_account(AccountId id) {
        SubscriptionRecord record;
        record.account_id = id;
        return record;
    }

    bool operator==(const SubscriptionRecord&) const = default;
};

/// Ledger row; one per distinct provider event id
struct ProcessedEventRecord {
    std::string event_id;
    std::string event_type;
    Timestamp processed_at;
    std::string payload;  ///< data.object as serialized JSON, for audit
};

/// Manual review queue entry written for charge disputes
struct DisputeFlag {
    std::string dispute_id;
    std::optional<AccountId> account_id;
    std::optional<std::string> billing_customer_id;
    std::string reason;
    std::string status;
    Timestamp flagged_at;
};

}  // namespace billguard

#endif  // BILLGUARD_BILLING_SUBSCRIPTION_HPP
