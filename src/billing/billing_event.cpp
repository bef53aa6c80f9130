#include "billguard/billing/billing_event.hpp"

namespace billguard {

namespace {

using Json = nlohmann::json;

std::optional<std::string> string_field(const Json& object, const char* key) {
    if (!object.is_object()) {
        return std::nullopt;
    }
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return std::nullopt;
    }
    auto value = it->get<std::string>();
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::int64_t> integer_field(const Json& object, const char* key) {
    if (!object.is_object()) {
        return std::nullopt;
    }
    const auto it = object.find(key);
    if (it == object.end() || !it->is_number_integer()) {
        return std::nullopt;
    }
    return it->get<std::int64_t>();
}

const Json* object_field(const Json& object, const char* key) {
    if (!object.is_object()) {
        return nullptr;
    }
    const auto it = object.find(key);
    if (it == object.end() || !it->is_object()) {
        return nullptr;
    }
    return &*it;
}

// Expandable references arrive either as an id string or as the full object
std::optional<std::string> reference_id(const Json& object, const char* key) {
    if (auto id = string_field(object, key)) {
        return id;
    }
    if (const Json* expanded = object_field(object, key)) {
        return string_field(*expanded, "id");
    }
    return std::nullopt;
}

std::optional<Timestamp> period_end_of(const Json& subscription) {
    if (auto seconds = integer_field(subscription, "current_period_end")) {
        return from_unix_seconds(*seconds);
    }

    // Newer API versions only carry the period on subscription items
    const Json* items = object_field(subscription, "items");
    if (!items) {
        return std::nullopt;
    }
    const auto data = items->find("data");
    if (data == items->end() || !data->is_array() || data->empty()) {
        return std::nullopt;
    }
    if (auto seconds = integer_field(data->front(), "current_period_end")) {
        return from_unix_seconds(*seconds);
    }
    return std::nullopt;
}

std::optional<std::string> dispute_customer(const Json& dispute) {
    if (const Json* charge = object_field(dispute, "charge")) {
        if (auto customer = reference_id(*charge, "customer")) {
            return customer;
        }
    }
    if (const Json* intent = object_field(dispute, "payment_intent")) {
        return reference_id(*intent, "customer");
    }
    return std::nullopt;
}

CheckoutCompleted decode_checkout(const Json& session) {
    CheckoutCompleted event;
    event.session_id = string_field(session, "id");
    event.customer_id = reference_id(session, "customer");
    event.client_reference_id = string_field(session, "client_reference_id");
    if (const Json* metadata = object_field(session, "metadata")) {
        event.metadata_user_id = string_field(*metadata, "userId");
    }
    return event;
}

SubscriptionChanged decode_subscription_changed(SubscriptionChanged::Kind kind, const Json& subscription) {
    SubscriptionChanged event;
    event.kind = kind;
    event.subscription_id = string_field(subscription, "id");
    event.customer_id = reference_id(subscription, "customer");
    event.status = string_field(subscription, "status");
    event.period_end = period_end_of(subscription);
    return event;
}

DisputeEvent decode_dispute(DisputeEvent::Phase phase, const Json& dispute) {
    DisputeEvent event;
    event.phase = phase;
    event.dispute_id = string_field(dispute, "id");
    event.charge_id = reference_id(dispute, "charge");
    event.customer_id = dispute_customer(dispute);
    event.reason = string_field(dispute, "reason");
    event.status = string_field(dispute, "status");
    return event;
}

}  // namespace

BillingEventBody decode_event_body(std::string_view type, const nlohmann::json& object) {
    if (type == event_type::kCheckoutSessionCompleted) {
        return decode_checkout(object);
    }
    if (type == event_type::kSubscriptionCreated) {
        return decode_subscription_changed(SubscriptionChanged::Kind::Created, object);
    }
    if (type == event_type::kSubscriptionUpdated) {
        return decode_subscription_changed(SubscriptionChanged::Kind::Updated, object);
    }
    if (type == event_type::kSubscriptionDeleted) {
        return SubscriptionDeleted{string_field(object, "id"), reference_id(object, "customer")};
    }
    if (type == event_type::kInvoicePaymentSucceeded) {
        return InvoicePaymentSucceeded{string_field(object, "id"), reference_id(object, "customer")};
    }
    if (type == event_type::kInvoicePaymentFailed) {
        return InvoicePaymentFailed{
            string_field(object, "id"),
            reference_id(object, "customer"),
            integer_field(object, "attempt_count"),
        };
    }
    if (type == event_type::kDisputeCreated) {
        return decode_dispute(DisputeEvent::Phase::Created, object);
    }
    if (type == event_type::kDisputeClosed) {
        return decode_dispute(DisputeEvent::Phase::Closed, object);
    }
    if (type == event_type::kCustomerDeleted) {
        return CustomerDeleted{string_field(object, "id")};
    }
    return UnrecognizedEvent{std::string(type)};
}

tl::expected<VerifiedEvent, std::string> decode_event(const nlohmann::json& envelope) {
    if (!envelope.is_object()) {
        return tl::unexpected(std::string("Event payload is not a JSON object"));
    }

    auto type = string_field(envelope, "type");
    if (!type) {
        return tl::unexpected(std::string("Event payload has no type"));
    }

    const Json* data = object_field(envelope, "data");
    const Json* object = data ? object_field(*data, "object") : nullptr;
    if (!object) {
        return tl::unexpected(std::string("Event payload has no data.object"));
    }

    VerifiedEvent event;
    event.id = string_field(envelope, "id");
    event.type = std::move(*type);
    if (auto created = integer_field(envelope, "created")) {
        event.created = from_unix_seconds(*created);
    }
    if (const auto it = envelope.find("livemode"); it != envelope.end() && it->is_boolean()) {
        event.livemode = it->get<bool>();
    }
    event.object = *object;
    event.body = decode_event_body(event.type, event.object);
    return event;
}

}  // namespace billguard
