#ifndef APIWIRE_ENGINE_ENGINE_CONFIG_HPP
#define APIWIRE_ENGINE_ENGINE_CONFIG_HPP

#include "apiwire/codec/content_codec.hpp"
#include "apiwire/transport/http_types.hpp"
#include "apiwire/transport/retry_policy.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace apiwire {

struct IBackoffPolicy;

// ─────────────────────────────────────────────────────────────────────────────
// Engine Configuration
// ─────────────────────────────────────────────────────────────────────────────
// Fixed for the lifetime of an Engine. A client library typically builds one
// of these per remote API:
//
//   auto config = EngineConfig{}
//       .with_content_mode(ContentMode::Json)
//       .with_base_url("https://api.example.com/v2/")
//       .with_bearer_token(token)
//       .with_max_retries(3);

struct EngineConfig {
    // ─────────────────────────────────────────────────────────────────────────
    // Content negotiation
    // ─────────────────────────────────────────────────────────────────────────

    ContentMode content_mode{ContentMode::Json};

    // Only JSON mode sets Accept/Content-Type by default. When enabled, XML
    // mode sets them to application/xml the same way.
    bool xml_content_headers{false};

    // ─────────────────────────────────────────────────────────────────────────
    // Transport
    // ─────────────────────────────────────────────────────────────────────────

    // Shared transport. If null the engine creates the cpr client and applies
    // the timeouts and TLS setting below to it; a supplied client is used as
    // configured by its owner.
    std::shared_ptr<IHttpClient> http_client;

    std::chrono::milliseconds connect_timeout{10'000};

    // Whole-transfer limit per attempt; 0 = none
    std::chrono::milliseconds read_timeout{30'000};

    bool verify_ssl{true};

    // ─────────────────────────────────────────────────────────────────────────
    // Requests
    // ─────────────────────────────────────────────────────────────────────────

    // Base for RequestSpec::relative_url; unused for absolute URLs
    std::string base_url;

    // Sent with every request, before content defaults and the per-call
    // overlay
    HeaderMap default_headers;

    // ─────────────────────────────────────────────────────────────────────────
    // Retry
    // ─────────────────────────────────────────────────────────────────────────

    std::size_t max_retries{RetryPolicy::kDefaultMaxRetries};

    // Null = ExponentialBackoff (1s doubling, up to 1s jitter)
    std::shared_ptr<IBackoffPolicy> backoff_policy;

    // Extra statuses to retry besides 500 and 503
    StatusRetryPredicate should_retry_status;

    // ─────────────────────────────────────────────────────────────────────────
    // Diagnostics
    // ─────────────────────────────────────────────────────────────────────────

    // Debug-level traces of URL, headers, bodies and responses. Observation
    // only; behaviour is identical either way.
    bool diagnostics{false};

    // ─────────────────────────────────────────────────────────────────────────
    // Builder-style helpers
    // ─────────────────────────────────────────────────────────────────────────

    EngineConfig& with_content_mode(ContentMode mode);
    EngineConfig& with_xml_content_headers(bool enable = true);
    EngineConfig& with_http_client(std::shared_ptr<IHttpClient> client);
    EngineConfig& with_connect_timeout(std::chrono::milliseconds timeout);
    EngineConfig& with_read_timeout(std::chrono::milliseconds timeout);
    EngineConfig& with_verify_ssl(bool verify);
    EngineConfig& with_base_url(const std::string& url);
    EngineConfig& with_header(const std::string& name, const std::string& value);
    EngineConfig& with_bearer_token(const std::string& token);
    EngineConfig& with_max_retries(std::size_t retries);
    EngineConfig& with_backoff_policy(std::shared_ptr<IBackoffPolicy> policy);
    EngineConfig& with_retry_predicate(StatusRetryPredicate predicate);
    EngineConfig& with_diagnostics(bool enable = true);
};

}  // namespace apiwire

#endif  // APIWIRE_ENGINE_ENGINE_CONFIG_HPP
