#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Webhook Authenticator
// ═══════════════════════════════════════════════════════════════════════════
// Verifies the provider's signature header:
//
//   Stripe-Signature: t=1714557600,v1=5257a869...,v1=...
//
// The expected signature is hex(HMAC-SHA256(secret, "<t>.<raw body>")). Any
// v1 entry may match (the provider sends several while rolling secrets).
// Events older than the tolerance are rejected; verification fails closed
// and never touches the ledger or subscription records.

#include "billguard/billing/billing_event.hpp"
#include "billguard/util/time.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace billguard {

inline constexpr std::string_view kSignatureHeader = "Stripe-Signature";

enum class SignatureErrorCode {
    SecretNotConfigured,
    MissingHeader,
    DuplicateHeader,
    MalformedHeader,
    SignatureMismatch,
    TimestampOutsideTolerance,
    InvalidPayload
};

[[nodiscard]] constexpr std::string_view to_string(SignatureErrorCode code) noexcept {
    switch (code) {
        case SignatureErrorCode::SecretNotConfigured:       return "SecretNotConfigured";
        case SignatureErrorCode::MissingHeader:             return "MissingHeader";
        case SignatureErrorCode::DuplicateHeader:           return "DuplicateHeader";
        case SignatureErrorCode::MalformedHeader:           return "MalformedHeader";
        case SignatureErrorCode::SignatureMismatch:         return "SignatureMismatch";
        case SignatureErrorCode::TimestampOutsideTolerance: return "TimestampOutsideTolerance";
        case SignatureErrorCode::InvalidPayload:            return "InvalidPayload";
    }
    return "Unknown";
}

struct SignatureError {
    SignatureErrorCode code;
    std::string reason;  ///< Human-readable, safe to return to the sender

    [[nodiscard]] static SignatureError secret_not_configured() {
        return {SignatureErrorCode::SecretNotConfigured, "Webhook secret not configured"};
    }

    [[nodiscard]] static SignatureError missing_header() {
        return {SignatureErrorCode::MissingHeader, "Missing signature"};
    }

    [[nodiscard]] static SignatureError duplicate_header() {
        return {SignatureErrorCode::DuplicateHeader, "Signature header must be a single value"};
    }

    [[nodiscard]] static SignatureError malformed_header() {
        return {SignatureErrorCode::MalformedHeader,
                "Unable to extract timestamp and signatures from header"};
    }

    [[nodiscard]] static SignatureError signature_mismatch() {
        return {SignatureErrorCode::SignatureMismatch,
                "No signatures found matching the expected signature for payload"};
    }

    [[nodiscard]] static SignatureError timestamp_outside_tolerance() {
        return {SignatureErrorCode::TimestampOutsideTolerance, "Timestamp outside the tolerance zone"};
    }

    [[nodiscard]] static SignatureError invalid_payload(std::string detail) {
        return {SignatureErrorCode::InvalidPayload, "Invalid payload: " + std::move(detail)};
    }
};

template <typename T>
using SignatureResult = tl::expected<T, SignatureError>;

class WebhookAuthenticator {
public:
    static constexpr std::chrono::seconds kDefaultTolerance{300};

    /// An empty secret is accepted here and rejected by every verify() call.
    /// Throws std::invalid_argument if tolerance is not positive.
    explicit WebhookAuthenticator(
        std::string secret,
        std::chrono::seconds tolerance = kDefaultTolerance
    );

    /// `signature_headers` holds every occurrence of the signature header
    /// on the request; anything but exactly one is rejected.
    [[nodiscard]] SignatureResult<VerifiedEvent> verify(
        std::string_view payload,
        const std::vector<std::string>& signature_headers,
        Timestamp now = std::chrono::system_clock::now()
    ) const;

    [[nodiscard]] SignatureResult<VerifiedEvent> verify(
        std::string_view payload,
        std::string_view signature_header,
        Timestamp now = std::chrono::system_clock::now()
    ) const;

    [[nodiscard]] bool has_secret() const noexcept { return !secret_.empty(); }
    [[nodiscard]] std::chrono::seconds tolerance() const noexcept { return tolerance_; }

    /// hex(HMAC-SHA256(secret, "<timestamp>.<payload>"))
    [[nodiscard]] static std::string compute_signature(
        std::string_view secret,
        std::int64_t timestamp,
        std::string_view payload
    );

    /// "t=<timestamp>,v1=<signature>", for tooling and tests
    [[nodiscard]] static std::string build_header(
        std::string_view secret,
        std::int64_t timestamp,
        std::string_view payload
    );

private:
    std::string secret_;
    std::chrono::seconds tolerance_;
};

}  // namespace billguard
