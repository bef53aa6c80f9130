#include "billguard/billing/webhook_authenticator.hpp"
#include "billguard/log/logger.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <charconv>
#include <stdexcept>

namespace billguard {

namespace {

constexpr std::string_view kComponent = "webhook-auth";

struct ParsedHeader {
    std::int64_t timestamp{0};
    std::vector<std::string_view> signatures;
};

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

std::optional<ParsedHeader> parse_header(std::string_view header) {
    ParsedHeader parsed;
    bool has_timestamp = false;

    while (!header.empty()) {
        const auto comma = header.find(',');
        const auto item = trim(header.substr(0, comma));
        header = (comma == std::string_view::npos) ? std::string_view{} : header.substr(comma + 1);

        const auto eq = item.find('=');
        if (eq == std::string_view::npos) {
            continue;
        }
        const auto key = item.substr(0, eq);
        const auto value = item.substr(eq + 1);

        if (key == "t") {
            const auto* first = value.data();
            const auto* last = value.data() + value.size();
            const auto [ptr, ec] = std::from_chars(first, last, parsed.timestamp);
            if (ec != std::errc{} || ptr != last || parsed.timestamp <= 0) {
                return std::nullopt;
            }
            has_timestamp = true;
        } else if (key == "v1" && !value.empty()) {
            parsed.signatures.push_back(value);
        }
    }

    if (!has_timestamp || parsed.signatures.empty()) {
        return std::nullopt;
    }
    return parsed;
}

bool constant_time_equals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

}  // namespace

WebhookAuthenticator::WebhookAuthenticator(std::string secret, std::chrono::seconds tolerance)
    : secret_(std::move(secret))
    , tolerance_(tolerance)
{
    if (tolerance_.count() <= 0) {
        throw std::invalid_argument("WebhookAuthenticator: tolerance must be positive");
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Verification
// ─────────────────────────────────────────────────────────────────────────────

SignatureResult<VerifiedEvent> WebhookAuthenticator::verify(
    std::string_view payload,
    const std::vector<std::string>& signature_headers,
    Timestamp now
) const {
    if (signature_headers.size() > 1) {
        return tl::unexpected(SignatureError::duplicate_header());
    }
    if (signature_headers.empty()) {
        return tl::unexpected(SignatureError::missing_header());
    }
    return verify(payload, std::string_view(signature_headers.front()), now);
}

SignatureResult<VerifiedEvent> WebhookAuthenticator::verify(
    std::string_view payload,
    std::string_view signature_header,
    Timestamp now
) const {
    if (secret_.empty()) {
        get_logger().error(kComponent, "Webhook secret not configured; rejecting event");
        return tl::unexpected(SignatureError::secret_not_configured());
    }

    if (trim(signature_header).empty()) {
        return tl::unexpected(SignatureError::missing_header());
    }

    const auto parsed = parse_header(signature_header);
    if (!parsed) {
        return tl::unexpected(SignatureError::malformed_header());
    }

    const auto expected = compute_signature(secret_, parsed->timestamp, payload);
    bool matched = false;
    for (const auto candidate : parsed->signatures) {
        // Evaluate every candidate; no early exit on match
        matched = constant_time_equals(expected, candidate) || matched;
    }
    if (!matched) {
        return tl::unexpected(SignatureError::signature_mismatch());
    }

    if (parsed->timestamp < to_unix_seconds(now) - tolerance_.count()) {
        return tl::unexpected(SignatureError::timestamp_outside_tolerance());
    }

    const auto envelope = nlohmann::json::parse(payload, nullptr, false);
    if (envelope.is_discarded()) {
        return tl::unexpected(SignatureError::invalid_payload("body is not valid JSON"));
    }

    auto event = decode_event(envelope);
    if (!event) {
        return tl::unexpected(SignatureError::invalid_payload(std::move(event.error())));
    }
    return std::move(*event);
}

// ─────────────────────────────────────────────────────────────────────────────
// Signing
// ─────────────────────────────────────────────────────────────────────────────

std::string WebhookAuthenticator::compute_signature(
    std::string_view secret,
    std::int64_t timestamp,
    std::string_view payload
) {
    std::string signed_payload = std::to_string(timestamp);
    signed_payload.push_back('.');
    signed_payload.append(payload);

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    const auto* result = HMAC(
        EVP_sha256(),
        secret.data(), static_cast<int>(secret.size()),
        reinterpret_cast<const unsigned char*>(signed_payload.data()), signed_payload.size(),
        digest, &digest_len);
    if (result == nullptr) {
        throw std::runtime_error("HMAC-SHA256 computation failed");
    }

    static constexpr char kHex[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        hex.push_back(kHex[digest[i] >> 4]);
        hex.push_back(kHex[digest[i] & 0x0F]);
    }
    return hex;
}

std::string WebhookAuthenticator::build_header(
    std::string_view secret,
    std::int64_t timestamp,
    std::string_view payload
) {
    return "t=" + std::to_string(timestamp) + ",v1=" + compute_signature(secret, timestamp, payload);
}

}  // namespace billguard
