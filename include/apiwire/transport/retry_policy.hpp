#ifndef APIWIRE_TRANSPORT_RETRY_POLICY_HPP
#define APIWIRE_TRANSPORT_RETRY_POLICY_HPP

#include "apiwire/transport/http_client.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <set>
#include <string>

namespace apiwire {

// ─────────────────────────────────────────────────────────────────────────────
// AttemptOutcome
// ─────────────────────────────────────────────────────────────────────────────
// What one send attempt produced. Exactly one of `response` and
// `transport_error` is set by a well-behaved transport.

struct AttemptOutcome {
    std::optional<HttpClientResponse> response;
    std::optional<HttpClientError> transport_error;

    /// 0 when no response was obtained
    [[nodiscard]] int status_code() const noexcept {
        return response.has_value() ? response->status_code : 0;
    }
};

enum class Classification {
    Success,
    Retryable,
    TerminalError
};

[[nodiscard]] constexpr std::string_view to_string(Classification c) noexcept {
    switch (c) {
        case Classification::Success:       return "Success";
        case Classification::Retryable:     return "Retryable";
        case Classification::TerminalError: return "TerminalError";
    }
    return "Unknown";
}

/// Caller-supplied extension of the retryable status set.
using StatusRetryPredicate = std::function<bool(int status_code)>;

// ─────────────────────────────────────────────────────────────────────────────
// RetryPolicy
// ─────────────────────────────────────────────────────────────────────────────
// Decides which attempt outcomes are worth repeating and how many repeats a
// call gets. Retries are reserved for transient overload: 500 and 503 by
// default, plus handshake timeouts. Client errors (4xx) are final.
//
//   RetryPolicy policy;
//   policy.with_max_retries(3)
//         .with_retryable_status(502)
//         .with_status_predicate([](int s) { return s == 429; });

class RetryPolicy {
public:
    static constexpr std::size_t kDefaultMaxRetries = 5;

    RetryPolicy()
        : max_retries_(kDefaultMaxRetries)
        , retry_on_handshake_timeout_(true)
        , retryable_statuses_{500, 503}
    {}

    /// Retries after the first attempt (total attempts = max_retries + 1).
    RetryPolicy& with_max_retries(std::size_t retries) {
        max_retries_ = retries;
        return *this;
    }

    RetryPolicy& with_retry_on_handshake_timeout(bool enable) {
        retry_on_handshake_timeout_ = enable;
        return *this;
    }

    RetryPolicy& with_retryable_status(int status_code) {
        retryable_statuses_.insert(status_code);
        return *this;
    }

    RetryPolicy& without_retryable_status(int status_code) {
        retryable_statuses_.erase(status_code);
        return *this;
    }

    RetryPolicy& with_status_predicate(StatusRetryPredicate predicate) {
        status_predicate_ = std::move(predicate);
        return *this;
    }

    [[nodiscard]] std::size_t max_retries() const noexcept {
        return max_retries_;
    }

    [[nodiscard]] bool should_retry_http_status(int status_code) const;

    [[nodiscard]] bool should_retry_transport_error(HttpClientError::Code code) const noexcept;

    [[nodiscard]] Classification classify(const AttemptOutcome& outcome) const;

    /// Human-readable reason for a non-successful outcome.
    [[nodiscard]] static std::string failure_message(const AttemptOutcome& outcome);

private:
    std::size_t max_retries_;
    bool retry_on_handshake_timeout_;
    std::set<int> retryable_statuses_;
    StatusRetryPredicate status_predicate_;
};

}  // namespace apiwire

#endif  // APIWIRE_TRANSPORT_RETRY_POLICY_HPP
