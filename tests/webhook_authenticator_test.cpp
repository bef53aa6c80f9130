// ─────────────────────────────────────────────────────────────────────────────
// Webhook Authenticator Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "billguard/billing/webhook_authenticator.hpp"
#include "mocks/billing_events.hpp"

#include <chrono>
#include <limits>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

using namespace billguard;
using namespace billguard::testing;
using namespace std::chrono_literals;

namespace {

constexpr std::string_view kSecret = "whsec_test_secret";
constexpr std::int64_t kSignedAt = 1714557600;

const Timestamp kNow = from_unix_seconds(kSignedAt + 10);

std::string sample_payload() {
    return checkout_completed_json("evt_auth_1", "42", "cus_1").dump();
}

std::string sign(std::string_view payload, std::int64_t at = kSignedAt, std::string_view secret = kSecret) {
    return WebhookAuthenticator::build_header(secret, at, payload);
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Signing
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("compute_signature is lowercase hex HMAC-SHA256 over timestamp.payload", "[billing][auth]") {
    const auto signature = WebhookAuthenticator::compute_signature(kSecret, kSignedAt, R"({"id":"evt_1"})");

    REQUIRE(signature == "a17e983eea1d0da6cb061b0f73cdcc8f35392cef9c48b57a4aed6db9d42b3c8c");
}

TEST_CASE("build_header renders t and v1", "[billing][auth]") {
    const auto header = WebhookAuthenticator::build_header(kSecret, kSignedAt, R"({"id":"evt_1"})");

    REQUIRE(header == "t=1714557600,v1=a17e983eea1d0da6cb061b0f73cdcc8f35392cef9c48b57a4aed6db9d42b3c8c");
}

// ═══════════════════════════════════════════════════════════════════════════
// Accepting
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("WebhookAuthenticator accepts a correctly signed event", "[billing][auth]") {
    WebhookAuthenticator auth{std::string(kSecret)};
    const auto payload = sample_payload();

    const auto event = auth.verify(payload, sign(payload), kNow);

    REQUIRE(event.has_value());
    REQUIRE(event->id == "evt_auth_1");
    REQUIRE(event->type == "checkout.session.completed");
    REQUIRE(std::holds_alternative<CheckoutCompleted>(event->body));
}

TEST_CASE("WebhookAuthenticator accepts any matching v1 entry", "[billing][auth]") {
    WebhookAuthenticator auth{std::string(kSecret)};
    const auto payload = sample_payload();
    const auto good = WebhookAuthenticator::compute_signature(kSecret, kSignedAt, payload);
    const auto stale = WebhookAuthenticator::compute_signature("whsec_old_secret", kSignedAt, payload);

    const std::string header = "t=" + std::to_string(kSignedAt) + ",v1=" + stale + ",v0=ignored,v1=" + good;

    REQUIRE(auth.verify(payload, header, kNow).has_value());
}

TEST_CASE("WebhookAuthenticator tolerates whitespace between header items", "[billing][auth]") {
    WebhookAuthenticator auth{std::string(kSecret)};
    const auto payload = sample_payload();
    const auto signature = WebhookAuthenticator::compute_signature(kSecret, kSignedAt, payload);

    const std::string header = "t=" + std::to_string(kSignedAt) + ", v1=" + signature;

    REQUIRE(auth.verify(payload, header, kNow).has_value());
}

TEST_CASE("WebhookAuthenticator accepts an event at the tolerance limit", "[billing][auth]") {
    WebhookAuthenticator auth{std::string(kSecret), 300s};
    const auto payload = sample_payload();

    REQUIRE(auth.verify(payload, sign(payload), from_unix_seconds(kSignedAt + 300)).has_value());
}

// ═══════════════════════════════════════════════════════════════════════════
// Rejecting
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("WebhookAuthenticator rejects without a configured secret", "[billing][auth]") {
    WebhookAuthenticator auth{""};
    const auto payload = sample_payload();

    const auto result = auth.verify(payload, sign(payload), kNow);

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == SignatureErrorCode::SecretNotConfigured);
    REQUIRE_FALSE(auth.has_secret());
}

TEST_CASE("WebhookAuthenticator rejects missing and duplicated headers", "[billing][auth]") {
    WebhookAuthenticator auth{std::string(kSecret)};
    const auto payload = sample_payload();

    SECTION("no header") {
        const auto result = auth.verify(payload, std::vector<std::string>{}, kNow);
        REQUIRE(result.error().code == SignatureErrorCode::MissingHeader);
        REQUIRE(result.error().reason == "Missing signature");
    }

    SECTION("empty header") {
        const auto result = auth.verify(payload, std::string_view("  "), kNow);
        REQUIRE(result.error().code == SignatureErrorCode::MissingHeader);
    }

    SECTION("header repeated") {
        const std::vector<std::string> headers{sign(payload), sign(payload)};
        const auto result = auth.verify(payload, headers, kNow);
        REQUIRE(result.error().code == SignatureErrorCode::DuplicateHeader);
    }
}

TEST_CASE("WebhookAuthenticator rejects malformed headers", "[billing][auth]") {
    WebhookAuthenticator auth{std::string(kSecret)};
    const auto payload = sample_payload();
    const auto signature = WebhookAuthenticator::compute_signature(kSecret, kSignedAt, payload);

    const std::vector<std::string> malformed{
        "v1=" + signature,                            // no timestamp
        "t=" + std::to_string(kSignedAt),             // no signature
        "t=yesterday,v1=" + signature,                // timestamp not numeric
        "garbage",
    };

    for (const auto& header : malformed) {
        const auto result = auth.verify(payload, header, kNow);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == SignatureErrorCode::MalformedHeader);
    }
}

TEST_CASE("WebhookAuthenticator rejects a tampered body", "[billing][auth]") {
    WebhookAuthenticator auth{std::string(kSecret)};
    const auto payload = sample_payload();
    const auto header = sign(payload);

    auto tampered = payload;
    tampered.replace(tampered.find("\"42\""), 4, "\"43\"");

    const auto result = auth.verify(tampered, header, kNow);

    REQUIRE(result.error().code == SignatureErrorCode::SignatureMismatch);
    REQUIRE(result.error().reason == "No signatures found matching the expected signature for payload");
}

TEST_CASE("WebhookAuthenticator rejects a signature made with another secret", "[billing][auth]") {
    WebhookAuthenticator auth{std::string(kSecret)};
    const auto payload = sample_payload();

    const auto result = auth.verify(payload, sign(payload, kSignedAt, "whsec_attacker"), kNow);

    REQUIRE(result.error().code == SignatureErrorCode::SignatureMismatch);
}

TEST_CASE("WebhookAuthenticator rejects a stale timestamp", "[billing][auth]") {
    WebhookAuthenticator auth{std::string(kSecret), 300s};
    const auto payload = sample_payload();

    const auto result = auth.verify(payload, sign(payload), from_unix_seconds(kSignedAt + 301));

    REQUIRE(result.error().code == SignatureErrorCode::TimestampOutsideTolerance);
}

TEST_CASE("WebhookAuthenticator rejects non-positive timestamps even when signed", "[billing][auth]") {
    WebhookAuthenticator auth{std::string(kSecret)};
    const auto payload = sample_payload();

    for (const std::int64_t at : {std::numeric_limits<std::int64_t>::min(), std::int64_t{-1}, std::int64_t{0}}) {
        const auto result = auth.verify(payload, sign(payload, at), kNow);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == SignatureErrorCode::MalformedHeader);
    }
}

TEST_CASE("WebhookAuthenticator rejects signed payloads that are not events", "[billing][auth]") {
    WebhookAuthenticator auth{std::string(kSecret)};

    const std::vector<std::string> payloads{
        "not json at all",
        R"([1,2,3])",
        R"({"id":"evt_1","data":{"object":{}}})",                 // no type
        R"({"id":"evt_1","type":"customer.deleted","data":{}})",  // no data.object
    };

    for (const auto& payload : payloads) {
        const auto result = auth.verify(payload, sign(payload), kNow);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == SignatureErrorCode::InvalidPayload);
    }
}

TEST_CASE("WebhookAuthenticator requires a positive tolerance", "[billing][auth]") {
    REQUIRE_THROWS_AS(WebhookAuthenticator(std::string(kSecret), 0s), std::invalid_argument);
}
