#include "billguard/http/http_types.hpp"

#include <ada.h>

namespace billguard {

std::string UrlComponents::origin() const {
    const bool default_port = (is_secure() && port == 443) || (!is_secure() && port == 80);
    if (default_port) {
        return scheme + "://" + host;
    }
    return scheme + "://" + host + ":" + std::to_string(port);
}

std::optional<UrlComponents> parse_url(const std::string& url) {
    auto parsed = ada::parse<ada::url>(url);
    if (!parsed) {
        return std::nullopt;
    }

    const auto& ada_url = parsed.value();

    // ada returns "https:"; drop the colon
    std::string scheme(ada_url.get_protocol());
    if (!scheme.empty() && scheme.back() == ':') {
        scheme.pop_back();
    }

    const bool is_https = (scheme == "https");
    if (!is_https && scheme != "http") {
        return std::nullopt;
    }

    std::string host(ada_url.get_hostname());
    if (host.empty()) {
        return std::nullopt;
    }

    std::uint16_t port = is_https ? 443 : 80;
    const auto port_str = ada_url.get_port();
    if (!port_str.empty()) {
        port = static_cast<std::uint16_t>(std::stoi(std::string(port_str)));
    }

    std::string path(ada_url.get_pathname());
    if (path.empty()) {
        path = "/";
    }

    UrlComponents result;
    result.scheme = std::move(scheme);
    result.host = std::move(host);
    result.port = port;
    result.path = std::move(path);
    return result;
}

}  // namespace billguard
