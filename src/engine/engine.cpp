#include "apiwire/engine/engine.hpp"

#include "apiwire/log/logger.hpp"
#include "apiwire/transport/backoff_policy.hpp"

#include <sstream>

namespace apiwire {

namespace {

std::shared_ptr<IHttpClient> make_configured_client(const EngineConfig& config) {
    if (config.http_client != nullptr) {
        return config.http_client;
    }
    std::shared_ptr<IHttpClient> client = make_http_client();
    client->set_connect_timeout(config.connect_timeout);
    client->set_read_timeout(config.read_timeout);
    client->set_verify_ssl(config.verify_ssl);
    return client;
}

std::shared_ptr<const RetryPolicy> make_retry_policy(const EngineConfig& config) {
    auto policy = std::make_shared<RetryPolicy>();
    policy->with_max_retries(config.max_retries);
    if (config.should_retry_status) {
        policy->with_status_predicate(config.should_retry_status);
    }
    return policy;
}

std::string format_headers(const HeaderMap& headers) {
    std::ostringstream out;
    for (const auto& [name, values] : headers) {
        out << "\n  " << name << ":";
        for (const auto& value : values) {
            out << ' ' << value;
        }
    }
    return out.str();
}

}  // namespace

Engine::Engine(EngineConfig config)
    : config_(std::move(config))
    , client_(make_configured_client(config_))
    , builder_(config_.content_mode, config_.base_url, config_.default_headers, config_.xml_content_headers)
    , executor_(make_retry_policy(config_), config_.backoff_policy)
    , decoder_(config_.content_mode)
{}

EngineResult<CallResult> Engine::call(const RequestSpec& spec) {
    auto built = builder_.build(spec);
    if (!built.has_value()) {
        APIWIRE_LOG_DEBUG("Request build failed: {}", built.error().message);
        return tl::unexpected(std::move(built.error()));
    }

    request_count_.fetch_add(1, std::memory_order_relaxed);

    if (config_.diagnostics) {
        trace_request(spec, *built);
    }

    auto executed = executor_.execute(client_.get(), &built->request, built->body, spec.max_retries);
    if (!executed.has_value()) {
        auto err = EngineError::transport_failure(
            HttpClientError::invalid_request("Request was not sent: no transport"));
        err.set_request(built->request);
        return tl::unexpected(std::move(err));
    }

    if (config_.diagnostics) {
        trace_response(*executed);
    }

    if (executed->classification != Classification::Success) {
        return tl::unexpected(terminal_error(spec, built->request, std::move(*executed)));
    }

    HttpClientResponse& response = *executed->outcome.response;
    auto decoded = decoder_.decode_success(response, spec.response_model);
    if (!decoded.has_value()) {
        auto err = EngineError::decode_error(decoded.error());
        err.set_request(built->request);
        err.set_response(response);
        err.attempts = executed->attempts;
        return tl::unexpected(std::move(err));
    }

    CallResult result;
    result.request = std::move(built->request);
    result.response = std::move(response);
    result.attempts = executed->attempts;
    return result;
}

EngineError Engine::terminal_error(
    const RequestSpec& spec,
    const HttpRequest& request,
    ExecutionResult&& result
) const {
    AttemptOutcome& outcome = result.outcome;

    EngineError err = outcome.transport_error.has_value()
        ? EngineError::transport_failure(*outcome.transport_error)
        : EngineError::status_error(outcome.status_code());
    err.set_request(request);
    err.attempts = result.attempts;

    if (outcome.response.has_value()) {
        err.set_response(*outcome.response);
        decoder_.decode_failure(*outcome.response, spec.error_model, err);
    } else {
        APIWIRE_LOG_WARN("{} {} failed without a response: {}",
            to_string(request.method), request.url, err.message);
    }
    return err;
}

void Engine::trace_request(const RequestSpec& spec, const BuiltRequest& built) const {
    APIWIRE_LOG_DEBUG("Request {} {} (content mode {})",
        to_string(built.request.method), built.request.url, to_string(config_.content_mode));
    APIWIRE_LOG_DEBUG("Request headers:{}", format_headers(built.request.headers));

    if (spec.has_raw_body()) {
        APIWIRE_LOG_DEBUG("Raw body: {} bytes", built.body.bytes().size());
    } else if (spec.has_body_model()) {
        APIWIRE_LOG_DEBUG("Encoded body:\n{}", built.body.bytes());
    }
}

void Engine::trace_response(const ExecutionResult& result) const {
    const AttemptOutcome& outcome = result.outcome;

    APIWIRE_LOG_DEBUG("Outcome after {} attempt(s): {}, status {}",
        result.attempts, to_string(result.classification), outcome.status_code());
    if (outcome.response.has_value()) {
        APIWIRE_LOG_DEBUG("Response headers:{}", format_headers(outcome.response->headers));
        APIWIRE_LOG_DEBUG("Response body:\n{}", outcome.response->body);
    }
}

}  // namespace apiwire
