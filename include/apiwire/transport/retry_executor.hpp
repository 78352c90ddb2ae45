#ifndef APIWIRE_TRANSPORT_RETRY_EXECUTOR_HPP
#define APIWIRE_TRANSPORT_RETRY_EXECUTOR_HPP

#include "apiwire/transport/backoff_policy.hpp"
#include "apiwire/transport/http_client.hpp"
#include "apiwire/transport/replayable_body.hpp"
#include "apiwire/transport/retry_policy.hpp"

#include <cstddef>
#include <memory>
#include <optional>

namespace apiwire {

/// Terminal outcome of the send loop.
struct ExecutionResult {
    AttemptOutcome outcome;
    Classification classification{Classification::TerminalError};
    std::size_t attempts{0};
};

// ─────────────────────────────────────────────────────────────────────────────
// RetryExecutor
// ─────────────────────────────────────────────────────────────────────────────
// Owns the send loop of one logical call:
//
//   for attempt in 0..=max_retries:
//       if attempt > 0: sleep(backoff(attempt - 1))
//       send(request, body.open())
//       classify; stop unless Retryable and budget left
//
// The loop runs on the caller's thread, sleeps included. The last outcome is
// always returned, even when it is still retryable.

class RetryExecutor {
public:
    RetryExecutor(
        std::shared_ptr<const RetryPolicy> retry_policy,
        std::shared_ptr<IBackoffPolicy> backoff_policy
    );

    /// Returns nullopt, without sending, when `client` or `request` is null.
    /// `max_retries` overrides the policy's budget for this call.
    [[nodiscard]] std::optional<ExecutionResult> execute(
        IHttpClient* client,
        const HttpRequest* request,
        ReplayableBody& body,
        std::optional<std::size_t> max_retries = std::nullopt
    ) const;

    [[nodiscard]] const RetryPolicy& retry_policy() const noexcept {
        return *retry_policy_;
    }

private:
    std::shared_ptr<const RetryPolicy> retry_policy_;
    std::shared_ptr<IBackoffPolicy> backoff_policy_;
};

}  // namespace apiwire

#endif  // APIWIRE_TRANSPORT_RETRY_EXECUTOR_HPP
