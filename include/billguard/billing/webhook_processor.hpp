#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Webhook Processor (idempotency ledger + dispatch)
// ═══════════════════════════════════════════════════════════════════════════
// Processes one verified event exactly once in effect:
//
//   1. no event id            -> dispatch without deduplication
//   2. ledger lookup hit      -> skipped ("Already processed")
//   3. BEGIN; insert ledger row (unique key); duplicate -> rollback, skipped
//   4. dispatch to the synchronizer inside the same transaction
//   5. COMMIT                 -> received
//
// The lookup in step 2 is only a fast path; the unique key in step 3 is what
// makes concurrent deliveries safe. A failure anywhere before COMMIT rolls
// back the ledger row together with the mutation, so a redelivery retries
// the whole event.
//
// All store work runs through the store's circuit breaker. When the circuit
// is open the event is not attempted and the result carries the retry delay.

#include "billguard/billing/billing_event.hpp"
#include "billguard/billing/subscription_synchronizer.hpp"
#include "billguard/resilience/circuit_breaker.hpp"
#include "billguard/store/billing_store.hpp"

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace billguard {

inline constexpr std::string_view kAlreadyProcessedReason = "Already processed";

struct ProcessOutcome {
    bool received{true};
    bool skipped{false};
    std::optional<std::string> reason;
    /// Handler result; absent for skipped events
    std::optional<SyncOutcome> sync;

    [[nodiscard]] static ProcessOutcome handled(SyncOutcome outcome) {
        return {true, false, std::nullopt, outcome};
    }

    [[nodiscard]] static ProcessOutcome already_processed() {
        return {true, true, std::string(kAlreadyProcessedReason), std::nullopt};
    }

    /// Reply body: {"received":true} or {"received":true,"skipped":true,"reason":...}
    [[nodiscard]] nlohmann::json to_json() const;
};

enum class ProcessErrorCode {
    Persistence,            ///< Store failed; nothing was committed
    DependencyUnavailable,  ///< Store circuit open; not attempted
    Dispatch                ///< Handler raised unexpectedly; rolled back
};

[[nodiscard]] constexpr std::string_view to_string(ProcessErrorCode code) noexcept {
    switch (code) {
        case ProcessErrorCode::Persistence:           return "Persistence";
        case ProcessErrorCode::DependencyUnavailable: return "DependencyUnavailable";
        case ProcessErrorCode::Dispatch:              return "Dispatch";
    }
    return "Unknown";
}

struct ProcessError {
    ProcessErrorCode code;
    std::string message;
    std::chrono::milliseconds retry_after{0};

    [[nodiscard]] static ProcessError persistence(const StoreError& error) {
        return {ProcessErrorCode::Persistence,
                std::string(to_string(error.code)) + ": " + error.message,
                std::chrono::milliseconds{0}};
    }

    [[nodiscard]] static ProcessError dependency_unavailable(const CircuitOpenError& error) {
        return {ProcessErrorCode::DependencyUnavailable, error.what(), error.retry_after()};
    }

    [[nodiscard]] static ProcessError dispatch(std::string msg) {
        return {ProcessErrorCode::Dispatch, std::move(msg), std::chrono::milliseconds{0}};
    }
};

using ProcessResult = tl::expected<ProcessOutcome, ProcessError>;

class WebhookProcessor {
public:
    /// Throws std::invalid_argument if store is null
    WebhookProcessor(
        std::shared_ptr<IBillingStore> store,
        CircuitBreaker& store_breaker,
        SubscriptionSynchronizer synchronizer = SubscriptionSynchronizer{}
    );

    [[nodiscard]] ProcessResult process(const VerifiedEvent& event);

private:
    [[nodiscard]] ProcessResult process_unguarded(const VerifiedEvent& event);

    std::shared_ptr<IBillingStore> store_;
    CircuitBreaker& store_breaker_;
    SubscriptionSynchronizer synchronizer_;
};

}  // namespace billguard
