#pragma once

#include "apiwire/transport/http_client.hpp"

#include <string>
#include <vector>

namespace apiwire {

// ═══════════════════════════════════════════════════════════════════════════
// cpr transport internals (exposed for testing)
// ═══════════════════════════════════════════════════════════════════════════
// The cpr client reduces libcurl's result to these plain types so the error
// mapping and the header list can be checked without a network.

namespace detail {

// What libcurl reported, reduced to the cases the mapping distinguishes
enum class TransferFailure {
    TimedOut,
    SslConnect,
    Other
};

// How far the attempt got before it failed
struct ConnectionProgress {
    bool tcp_connected{false};
    bool tls_established{false};
};

// A timeout is a handshake timeout only while the TCP connect, or the TLS
// handshake of an https URL, is still unfinished. Once the request could
// have reached the server it is a plain Timeout.
[[nodiscard]] HttpClientError map_transfer_error(
    TransferFailure failure,
    const std::string& message,
    bool is_https,
    ConnectionProgress progress
);

// Header lines for CURLOPT_HTTPHEADER. Repeated values are folded into a
// comma-separated list (RFC 7230 §3.2.2). Headers libcurl would otherwise add
// on its own (Accept, Expect, and Content-Type when a body is sent) are
// suppressed with a valueless "Name:" line unless the request sets them.
[[nodiscard]] std::vector<std::string> to_curl_header_lines(
    const HeaderMap& headers,
    bool has_body
);

}  // namespace detail

}  // namespace apiwire
