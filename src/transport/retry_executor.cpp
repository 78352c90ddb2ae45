#include "apiwire/transport/retry_executor.hpp"

#include "apiwire/log/logger.hpp"

#include <thread>

namespace apiwire {

RetryExecutor::RetryExecutor(
    std::shared_ptr<const RetryPolicy> retry_policy,
    std::shared_ptr<IBackoffPolicy> backoff_policy
)
    : retry_policy_(std::move(retry_policy))
    , backoff_policy_(std::move(backoff_policy))
{
    if (retry_policy_ == nullptr) {
        retry_policy_ = std::make_shared<RetryPolicy>();
    }
    if (backoff_policy_ == nullptr) {
        backoff_policy_ = std::make_shared<ExponentialBackoff>();
    }
}

std::optional<ExecutionResult> RetryExecutor::execute(
    IHttpClient* client,
    const HttpRequest* request,
    ReplayableBody& body,
    std::optional<std::size_t> max_retries
) const {
    if ((client == nullptr) || (request == nullptr)) {
        APIWIRE_LOG_DEBUG("execute: {} is null", (client == nullptr) ? "client" : "request");
        return std::nullopt;
    }

    const std::size_t budget = max_retries.value_or(retry_policy_->max_retries());
    ExecutionResult result;

    for (std::size_t attempt = 0; ; ++attempt) {
        if (attempt > 0) {
            APIWIRE_LOG_INFO("Starting retry {} for {} {}",
                attempt, to_string(request->method), request->url);
            const auto delay = backoff_policy_->next_delay(attempt - 1);
            if (delay.count() > 0) {
                std::this_thread::sleep_for(delay);
            }
        }

        auto sent = client->send(*request, body.open());

        AttemptOutcome outcome;
        if (sent.has_value()) {
            outcome.response = std::move(*sent);
        } else {
            outcome.transport_error = std::move(sent.error());
            APIWIRE_LOG_DEBUG("Attempt {} failed in transport: {} ({})",
                attempt + 1, outcome.transport_error->message,
                to_string(outcome.transport_error->code));
        }

        result.classification = retry_policy_->classify(outcome);
        result.outcome = std::move(outcome);
        result.attempts = attempt + 1;

        const bool retryable = (result.classification == Classification::Retryable);
        const bool budget_left = (attempt < budget);
        if (!(retryable && budget_left)) {
            break;
        }
    }

    if (result.classification == Classification::Retryable) {
        APIWIRE_LOG_WARN("Giving up on {} {} after {} attempts: {}",
            to_string(request->method), request->url, result.attempts,
            RetryPolicy::failure_message(result.outcome));
    }
    return result;
}

}  // namespace apiwire
