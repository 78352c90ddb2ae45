#pragma once

#include "apiwire/transport/http_types.hpp"
#include "apiwire/transport/replayable_body.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace apiwire {

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Client Error
// ─────────────────────────────────────────────────────────────────────────────
// A failure before any response was obtained. The category is assigned by the
// transport implementation from its own error codes so callers never have to
// inspect message text.

struct HttpClientError {
    enum class Code {
        ConnectionFailed,
        HandshakeTimeout,   // timed out while connecting / negotiating TLS
        Timeout,            // timed out after the connection was up
        SslError,
        InvalidRequest,
        Unknown
    };

    Code code;
    std::string message;

    static HttpClientError connection_failed(const std::string& msg) {
        return {Code::ConnectionFailed, msg};
    }
    static HttpClientError handshake_timeout(const std::string& msg) {
        return {Code::HandshakeTimeout, msg};
    }
    static HttpClientError timeout(const std::string& msg) {
        return {Code::Timeout, msg};
    }
    static HttpClientError ssl_error(const std::string& msg) {
        return {Code::SslError, msg};
    }
    static HttpClientError invalid_request(const std::string& msg) {
        return {Code::InvalidRequest, msg};
    }
    static HttpClientError unknown(const std::string& msg) {
        return {Code::Unknown, msg};
    }
};

[[nodiscard]] constexpr std::string_view to_string(HttpClientError::Code code) noexcept {
    switch (code) {
        case HttpClientError::Code::ConnectionFailed: return "ConnectionFailed";
        case HttpClientError::Code::HandshakeTimeout: return "HandshakeTimeout";
        case HttpClientError::Code::Timeout:          return "Timeout";
        case HttpClientError::Code::SslError:         return "SslError";
        case HttpClientError::Code::InvalidRequest:   return "InvalidRequest";
        case HttpClientError::Code::Unknown:          return "Unknown";
    }
    return "Unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Client Response
// ─────────────────────────────────────────────────────────────────────────────
// The body is fully buffered: the wire stream is read exactly once and the
// decoder may parse the copy as often as it needs.

struct HttpClientResponse {
    int status_code{0};
    HeaderMap headers;
    std::string body;

    [[nodiscard]] bool is_success() const {
        return (status_code >= 200) && (status_code <= 299);
    }
};

template <typename T>
using HttpClientResult = tl::expected<T, HttpClientError>;

// ─────────────────────────────────────────────────────────────────────────────
// IHttpClient
// ─────────────────────────────────────────────────────────────────────────────
// The transport seam. Implementations must allow concurrent send() calls from
// independent threads; connection reuse is their business. Configuration
// setters are meant for construction time only.

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual void set_connect_timeout(std::chrono::milliseconds timeout) = 0;

    // Whole-transfer timeout; zero means none
    virtual void set_read_timeout(std::chrono::milliseconds timeout) = 0;

    virtual void set_verify_ssl(bool verify) = 0;

    /// Perform one attempt. `body` is a fresh reader for this attempt only.
    [[nodiscard]] virtual HttpClientResult<HttpClientResponse> send(
        const HttpRequest& request,
        BodyReader body
    ) = 0;
};

/// Default transport (cpr / libcurl).
std::unique_ptr<IHttpClient> make_http_client();

}  // namespace apiwire
