#include "billguard/billing/subscription.hpp"

namespace billguard {

std::optional<Tier> parse_tier(std::string_view text) noexcept {
    if (text == "free") return Tier::Free;
    if (text == "pro") return Tier::Pro;
    return std::nullopt;
}

std::optional<SubscriptionStatus> parse_subscription_status(std::string_view text) noexcept {
    if (text == "active") return SubscriptionStatus::Active;
    if (text == "trialing") return SubscriptionStatus::Trialing;
    if (text == "incomplete") return SubscriptionStatus::Incomplete;
    if (text == "incomplete_expired") return SubscriptionStatus::IncompleteExpired;
    if (text == "past_due") return SubscriptionStatus::PastDue;
    if (text == "unpaid") return SubscriptionStatus::Unpaid;
    if (text == "canceled") return SubscriptionStatus::Canceled;
    if (text == "none") return SubscriptionStatus::None;
    return std::nullopt;
}

}  // namespace billguard
