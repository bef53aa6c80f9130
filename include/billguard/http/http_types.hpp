#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace billguard {

// ─────────────────────────────────────────────────────────────────────────────
// Case-Insensitive Header Lookup
// ─────────────────────────────────────────────────────────────────────────────
// HTTP header names are case-insensitive per RFC 7230.

[[nodiscard]] inline bool header_name_equals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::ranges::equal(a, b, [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

/// Outbound request headers (one value per name)
using HeaderMap = std::unordered_map<std::string, std::string>;

/// Inbound request headers in arrival order; a name may repeat
using HeaderList = std::vector<std::pair<std::string, std::string>>;

[[nodiscard]] inline std::optional<std::string> get_header(
    const HeaderMap& headers,
    std::string_view name
) {
    const auto it = std::ranges::find_if(headers, [&name](const auto& pair) {
        return header_name_equals(pair.first, name);
    });
    if (it != headers.end()) {
        return it->second;
    }
    return std::nullopt;
}

/// Every value carried under `name`, in arrival order
[[nodiscard]] inline std::vector<std::string> find_headers(
    const HeaderList& headers,
    std::string_view name
) {
    std::vector<std::string> values;
    for (const auto& [key, value] : headers) {
        if (header_name_equals(key, name)) {
            values.push_back(value);
        }
    }
    return values;
}

// ─────────────────────────────────────────────────────────────────────────────
// URL Components
// ─────────────────────────────────────────────────────────────────────────────
// Parsed base URL for outbound API calls.

struct UrlComponents {
    std::string scheme;   // "http" or "https"
    std::string host;     // "api.stripe.com"
    std::uint16_t port;   // 443 for https, 80 for http (or explicit)
    std::string path;     // "/" (includes leading slash)

    [[nodiscard]] bool is_secure() const {
        return scheme == "https";
    }

    [[nodiscard]] bool is_loopback() const {
        return host == "localhost" || host == "127.0.0.1" || host == "[::1]";
    }

    /// scheme://host[:port] with the default port omitted
    [[nodiscard]] std::string origin() const;
};

/// Parse an http(s) URL with ada-url. Returns nullopt for anything else.
[[nodiscard]] std::optional<UrlComponents> parse_url(const std::string& url);

}  // namespace billguard
