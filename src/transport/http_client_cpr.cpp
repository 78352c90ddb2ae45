#include "apiwire/transport/http_client_cpr.hpp"

#include <cpr/cpr.h>
#include <curl/curl.h>

#include <atomic>

namespace apiwire {

namespace detail {

HttpClientError map_transfer_error(
    TransferFailure failure,
    const std::string& message,
    bool is_https,
    ConnectionProgress progress
) {
    switch (failure) {
        case TransferFailure::TimedOut: {
            const bool handshake_pending = !progress.tcp_connected
                || (is_https && !progress.tls_established);
            if (handshake_pending) {
                return HttpClientError::handshake_timeout(message);
            }
            return HttpClientError::timeout(message);
        }

        case TransferFailure::SslConnect:
            return HttpClientError::ssl_error(message);

        case TransferFailure::Other:
            break;
    }
    return HttpClientError::connection_failed(message);
}

std::vector<std::string> to_curl_header_lines(const HeaderMap& headers, bool has_body) {
    std::vector<std::string> lines;
    for (const auto& [name, values] : headers) {
        if (values.empty()) {
            continue;
        }
        std::string joined;
        for (const auto& value : values) {
            if (!joined.empty()) {
                joined += ", ";
            }
            joined += value;
        }
        // "Name;" is libcurl's spelling of a header sent with an empty value
        lines.push_back(joined.empty() ? name + ";" : name + ": " + joined);
    }

    auto suppress = [&](const char* name) {
        if (!get_header(headers, name).has_value()) {
            lines.push_back(std::string(name) + ":");
        }
    };
    suppress("Accept");
    suppress("Expect");
    if (has_body) {
        suppress("Content-Type");
    }
    return lines;
}

}  // namespace detail

// ─────────────────────────────────────────────────────────────────────────────
// CprHttpClient
// ─────────────────────────────────────────────────────────────────────────────
// cpr (C++ Requests) over libcurl. Every send() builds its own cpr::Session,
// so concurrent calls never share curl handles.
//
// cpr prepares the handle, then the header list is replaced with one that
// also suppresses libcurl's own defaults, and the transfer is performed here
// so the connect/TLS timings can be read before cpr builds the response.

class CprHttpClient final : public IHttpClient {
public:
    void set_connect_timeout(std::chrono::milliseconds timeout) override {
        connect_timeout_ms_.store(timeout.count());
    }

    void set_read_timeout(std::chrono::milliseconds timeout) override {
        read_timeout_ms_.store(timeout.count());
    }

    void set_verify_ssl(bool verify) override {
        verify_ssl_.store(verify);
    }

    HttpClientResult<HttpClientResponse> send(
        const HttpRequest& request,
        BodyReader body
    ) override {
        cpr::Session session;
        session.SetUrl(cpr::Url{request.url});
        session.SetConnectTimeout(cpr::ConnectTimeout{std::chrono::milliseconds{connect_timeout_ms_.load()}});
        session.SetTimeout(cpr::Timeout{std::chrono::milliseconds{read_timeout_ms_.load()}});
        session.SetVerifySsl(cpr::VerifySsl{verify_ssl_.load()});

        const bool has_body = body.has_body();
        if (has_body) {
            session.SetBody(cpr::Body{body.read_all()});
        }

        prepare(session, request.method);

        CURL* handle = session.GetCurlHolder()->handle;
        HeaderList header_list(nullptr, &curl_slist_free_all);
        for (const auto& line : detail::to_curl_header_lines(request.headers, has_body)) {
            curl_slist* appended = curl_slist_append(header_list.get(), line.c_str());
            if (appended == nullptr) {
                return tl::unexpected(HttpClientError::invalid_request("Could not allocate header list"));
            }
            if (header_list == nullptr) {
                header_list.reset(appended);
            }
        }
        if (curl_easy_setopt(handle, CURLOPT_HTTPHEADER, header_list.get()) != CURLE_OK) {
            return tl::unexpected(HttpClientError::invalid_request("Could not set request headers"));
        }

        const CURLcode code = curl_easy_perform(handle);
        if (code != CURLE_OK) {
            const bool is_https = (request.url.rfind("https://", 0) == 0);
            return tl::unexpected(detail::map_transfer_error(
                to_transfer_failure(code),
                curl_easy_strerror(code),
                is_https,
                read_progress(handle)));
        }

        return convert_response(session.Complete(code));
    }

private:
    using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

    static void prepare(cpr::Session& session, HttpMethod method) {
        switch (method) {
            case HttpMethod::Get:     session.PrepareGet(); return;
            case HttpMethod::Post:    session.PreparePost(); return;
            case HttpMethod::Put:     session.PreparePut(); return;
            case HttpMethod::Patch:   session.PreparePatch(); return;
            case HttpMethod::Delete:  session.PrepareDelete(); return;
            case HttpMethod::Head:    session.PrepareHead(); return;
            case HttpMethod::Options: session.PrepareOptions(); return;
        }
        session.PrepareGet();
    }

    static detail::TransferFailure to_transfer_failure(CURLcode code) {
        switch (code) {
            case CURLE_OPERATION_TIMEDOUT:
                return detail::TransferFailure::TimedOut;
            case CURLE_SSL_CONNECT_ERROR:
                return detail::TransferFailure::SslConnect;
            default:
                return detail::TransferFailure::Other;
        }
    }

    // Both timings stay zero until the corresponding step has completed
    static detail::ConnectionProgress read_progress(CURL* handle) {
        curl_off_t connect_us = 0;
        curl_off_t appconnect_us = 0;
        const bool have_connect =
            (curl_easy_getinfo(handle, CURLINFO_CONNECT_TIME_T, &connect_us) == CURLE_OK);
        const bool have_appconnect =
            (curl_easy_getinfo(handle, CURLINFO_APPCONNECT_TIME_T, &appconnect_us) == CURLE_OK);

        detail::ConnectionProgress progress;
        progress.tcp_connected = have_connect && (connect_us > 0);
        progress.tls_established = have_appconnect && (appconnect_us > 0);
        return progress;
    }

    static HttpClientResult<HttpClientResponse> convert_response(const cpr::Response& response) {
        const bool has_error = (response.error.code != cpr::ErrorCode::OK);
        if (has_error) {
            return tl::unexpected(HttpClientError::connection_failed(response.error.message));
        }

        HttpClientResponse result;
        result.status_code = static_cast<int>(response.status_code);
        result.body = response.text;
        for (const auto& [name, value] : response.header) {
            add_header(result.headers, name, value);
        }
        return result;
    }

    std::atomic<std::int64_t> connect_timeout_ms_{10'000};
    std::atomic<std::int64_t> read_timeout_ms_{30'000};
    std::atomic<bool> verify_ssl_{true};
};

std::unique_ptr<IHttpClient> make_http_client() {
    return std::make_unique<CprHttpClient>();
}

}  // namespace apiwire
