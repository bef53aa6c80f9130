#include "billguard/http/http_client.hpp"

#include <cpr/cpr.h>

#include <algorithm>
#include <mutex>
#include <optional>
#include <string_view>

namespace billguard {

namespace {

// Relative API paths only: no control bytes, no way out of the base path
std::optional<HttpClientError> check_api_path(std::string_view path) {
    const bool has_control = std::any_of(path.begin(), path.end(), [](unsigned char c) {
        return c < 0x20 || c == 0x7F;
    });
    if (has_control) {
        return HttpClientError::invalid_request("Path contains control characters");
    }

    for (const std::string_view needle : {"..", "%2e", "%2E", "\\", "%5c", "%5C"}) {
        if (path.find(needle) != std::string_view::npos) {
            return HttpClientError::invalid_request("Path escapes the API base: " + std::string(path));
        }
    }
    return std::nullopt;
}

HttpClientError from_cpr_error(const cpr::Error& error) {
    switch (error.code) {
        case cpr::ErrorCode::OPERATION_TIMEDOUT:
            return HttpClientError::timeout(error.message);
        case cpr::ErrorCode::SSL_CONNECT_ERROR:
            return HttpClientError::tls(error.message);
        default:
            break;
    }
    // Certificate failures surface under several codes depending on the cpr version
    if (error.message.find("SSL") != std::string::npos || error.message.find("certificate") != std::string::npos) {
        return HttpClientError::tls(error.message);
    }
    return HttpClientError::connection_failed(error.message);
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// CprHttpClient
// ─────────────────────────────────────────────────────────────────────────────
// One cpr::Session reused across requests so libcurl keeps the provider
// connection alive. Requests are serialized on it.

class CprHttpClient final : public IHttpClient {
public:
    void configure(const HttpClientOptions& options) override {
        std::lock_guard<std::mutex> lock(mutex_);
        base_url_ = options.base_url;
        while (!base_url_.empty() && base_url_.back() == '/') {
            base_url_.pop_back();
        }
        default_headers_ = options.default_headers;
        session_.SetConnectTimeout(cpr::ConnectTimeout{options.connect_timeout});
        session_.SetTimeout(cpr::Timeout{options.read_timeout});
    }

    HttpClientResult<HttpClientResponse> post(const HttpPostRequest& request) override {
        if (auto invalid = check_api_path(request.path)) {
            return tl::unexpected(std::move(*invalid));
        }

        std::lock_guard<std::mutex> lock(mutex_);

        cpr::Header header;
        for (const auto& [name, value] : default_headers_) {
            header[name] = value;
        }
        for (const auto& [name, value] : request.headers) {
            header[name] = value;
        }
        header["Content-Type"] = request.content_type;

        const std::string separator = (!request.path.empty() && request.path.front() == '/') ? "" : "/";
        session_.SetUrl(cpr::Url{base_url_ + separator + request.path});
        session_.SetHeader(header);
        session_.SetBody(cpr::Body{request.body});

        const cpr::Response response = session_.Post();
        if (response.error) {
            return tl::unexpected(from_cpr_error(response.error));
        }

        HttpClientResponse reply;
        reply.status_code = static_cast<int>(response.status_code);
        reply.body = response.text;
        reply.headers.insert(response.header.begin(), response.header.end());
        return reply;
    }

private:
    std::mutex mutex_;
    cpr::Session session_;
    std::string base_url_;
    HeaderMap default_headers_;
};

std::unique_ptr<IHttpClient> make_http_client() {
    return std::make_unique<CprHttpClient>();
}

}  // namespace billguard
