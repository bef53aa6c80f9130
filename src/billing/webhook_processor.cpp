#include "billguard/billing/webhook_processor.hpp"
#include "billguard/log/logger.hpp"

#include <stdexcept>

namespace billguard {

namespace {

constexpr std::string_view kComponent = "webhook";

}  // namespace

nlohmann::json ProcessOutcome::to_json() const {
    nlohmann::json j = {{"received", received}};
    if (skipped) {
        j["skipped"] = true;
        j["reason"] = reason.value_or(std::string(kAlreadyProcessedReason));
    }
    return j;
}

WebhookProcessor::WebhookProcessor(
    std::shared_ptr<IBillingStore> store,
    CircuitBreaker& store_breaker,
    SubscriptionSynchronizer synchronizer
)
    : store_(std::move(store))
    , store_breaker_(store_breaker)
    , synchronizer_(std::move(synchronizer))
{
    if (!store_) {
        throw std::invalid_argument("WebhookProcessor: store cannot be null");
    }
}

ProcessResult WebhookProcessor::process(const VerifiedEvent& event) {
    get_logger().info_fmt(kComponent, "Received event: {} (ID: {})", event.type, event.id.value_or("none"));

    try {
        auto result = store_breaker_.execute(
            [&]() { return process_unguarded(event); },
            [&](const CircuitOpenError& open) -> ProcessResult {
                return tl::unexpected(ProcessError::dependency_unavailable(open));
            });

        if (!result) {
            get_logger().error_fmt(kComponent, "Event {} failed: {}", event.id.value_or("none"),
                                   result.error().message);
        }
        return result;
    } catch (const std::exception& e) {
        // The breaker has already recorded the failure
        get_logger().error_fmt(kComponent, "Handler error for event {}: {}", event.id.value_or("none"), e.what());
        return tl::unexpected(ProcessError::dispatch(e.what()));
    } catch (...) {
        get_logger().error_fmt(kComponent, "Handler error for event {}: unknown exception", event.id.value_or("none"));
        return tl::unexpected(ProcessError::dispatch("unknown exception"));
    }
}

ProcessResult WebhookProcessor::process_unguarded(const VerifiedEvent& event) {
    if (event.id) {
        auto existing = store_->find_processed_event(*event.id);
        if (!existing) {
            return tl::unexpected(ProcessError::persistence(existing.error()));
        }
        if (*existing) {
            get_logger().info_fmt(kComponent, "Event {} already processed at {}, skipping",
                                  *event.id, format_iso8601((*existing)->processed_at));
            return ProcessOutcome::already_processed();
        }
    }

    auto tx = store_->begin();
    if (!tx) {
        return tl::unexpected(ProcessError::persistence(tx.error()));
    }

    if (event.id) {
        const ProcessedEventRecord record{
            .event_id = *event.id,
            .event_type = event.type,
            .processed_at = std::chrono::system_clock::now(),
            .payload = event.object.dump(),
        };

        auto inserted = (*tx)->insert_processed_event(record);
        if (!inserted) {
            return tl::unexpected(ProcessError::persistence(inserted.error()));
        }
        if (*inserted == InsertOutcome::Duplicate) {
            // Lost the race to a concurrent delivery of the same event
            (*tx)->rollback();
            get_logger().info_fmt(kComponent, "Event {} recorded concurrently, skipping", *event.id);
            return ProcessOutcome::already_processed();
        }
    }

    auto synced = synchronizer_.apply(**tx, event);
    if (!synced) {
        return tl::unexpected(ProcessError::persistence(synced.error()));
    }

    if (auto committed = (*tx)->commit(); !committed) {
        return tl::unexpected(ProcessError::persistence(committed.error()));
    }

    if (event.id) {
        get_logger().info_fmt(kComponent, "Marked event {} as processed ({})", *event.id, to_string(*synced));
    }
    return ProcessOutcome::handled(*synced);
}

}  // namespace billguard
