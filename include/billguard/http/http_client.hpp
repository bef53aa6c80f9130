#pragma once

#include "billguard/http/http_types.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace billguard {

// ─────────────────────────────────────────────────────────────────────────────
// Outbound HTTP
// ─────────────────────────────────────────────────────────────────────────────

struct HttpClientError {
    enum class Code {
        ConnectionFailed,
        Timeout,
        Tls,
        InvalidRequest,
        Unknown
    };

    Code code;
    std::string message;

    static HttpClientError connection_failed(std::string msg) { return {Code::ConnectionFailed, std::move(msg)}; }
    static HttpClientError timeout(std::string msg) { return {Code::Timeout, std::move(msg)}; }
    static HttpClientError tls(std::string msg) { return {Code::Tls, std::move(msg)}; }
    static HttpClientError invalid_request(std::string msg) { return {Code::InvalidRequest, std::move(msg)}; }
    static HttpClientError unknown(std::string msg) { return {Code::Unknown, std::move(msg)}; }
};

template <typename T>
using HttpClientResult = tl::expected<T, HttpClientError>;

/// Applied once, before the first request
struct HttpClientOptions {
    std::string base_url;
    HeaderMap default_headers;
    std::chrono::milliseconds connect_timeout{10'000};
    std::chrono::milliseconds read_timeout{30'000};
};

/// Path is relative to HttpClientOptions::base_url
struct HttpPostRequest {
    std::string path;
    std::string body;
    std::string content_type;
    HeaderMap headers;
};

struct HttpClientResponse {
    int status_code{0};
    HeaderMap headers;
    std::string body;

    [[nodiscard]] bool is_success() const noexcept {
        return status_code >= 200 && status_code < 300;
    }
};

// Seam for the billing provider API. Tests substitute a scripted mock.
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual void configure(const HttpClientOptions& options) = 0;

    /// Transport failures come back as HttpClientError. Any HTTP status,
    /// 4xx and 5xx included, is a response.
    [[nodiscard]] virtual HttpClientResult<HttpClientResponse> post(const HttpPostRequest& request) = 0;
};

/// cpr-backed client
[[nodiscard]] std::unique_ptr<IHttpClient> make_http_client();

}  // namespace billguard
