#include "apiwire/engine/engine_config.hpp"

#include "apiwire/transport/backoff_policy.hpp"
#include "apiwire/transport/http_client.hpp"

namespace apiwire {

EngineConfig& EngineConfig::with_content_mode(ContentMode mode) {
    content_mode = mode;
    return *this;
}

EngineConfig& EngineConfig::with_xml_content_headers(bool enable) {
    xml_content_headers = enable;
    return *this;
}

EngineConfig& EngineConfig::with_http_client(std::shared_ptr<IHttpClient> client) {
    http_client = std::move(client);
    return *this;
}

EngineConfig& EngineConfig::with_connect_timeout(std::chrono::milliseconds timeout) {
    connect_timeout = timeout;
    return *this;
}

EngineConfig& EngineConfig::with_read_timeout(std::chrono::milliseconds timeout) {
    read_timeout = timeout;
    return *this;
}

EngineConfig& EngineConfig::with_verify_ssl(bool verify) {
    verify_ssl = verify;
    return *this;
}

EngineConfig& EngineConfig::with_base_url(const std::string& url) {
    base_url = url;
    return *this;
}

EngineConfig& EngineConfig::with_header(const std::string& name, const std::string& value) {
    set_header(default_headers, name, value);
    return *this;
}

EngineConfig& EngineConfig::with_bearer_token(const std::string& token) {
    set_header(default_headers, "Authorization", "Bearer " + token);
    return *this;
}

EngineConfig& EngineConfig::with_max_retries(std::size_t retries) {
    max_retries = retries;
    return *this;
}

EngineConfig& EngineConfig::with_backoff_policy(std::shared_ptr<IBackoffPolicy> policy) {
    backoff_policy = std::move(policy);
    return *this;
}

EngineConfig& EngineConfig::with_retry_predicate(StatusRetryPredicate predicate) {
    should_retry_status = std::move(predicate);
    return *this;
}

EngineConfig& EngineConfig::with_diagnostics(bool enable) {
    diagnostics = enable;
    return *this;
}

}  // namespace apiwire
