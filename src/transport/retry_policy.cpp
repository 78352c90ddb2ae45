#include "apiwire/transport/retry_policy.hpp"

namespace apiwire {

bool RetryPolicy::should_retry_http_status(int status_code) const {
    if (retryable_statuses_.contains(status_code)) {
        return true;
    }
    const bool has_predicate = static_cast<bool>(status_predicate_);
    return has_predicate && status_predicate_(status_code);
}

bool RetryPolicy::should_retry_transport_error(HttpClientError::Code code) const noexcept {
    switch (code) {
        case HttpClientError::Code::HandshakeTimeout:
            return retry_on_handshake_timeout_;

        case HttpClientError::Code::ConnectionFailed:
        case HttpClientError::Code::Timeout:
        case HttpClientError::Code::SslError:
        case HttpClientError::Code::InvalidRequest:
        case HttpClientError::Code::Unknown:
            return false;
    }
    return false;
}

Classification RetryPolicy::classify(const AttemptOutcome& outcome) const {
    const int status = outcome.status_code();
    const bool has_transport_error = outcome.transport_error.has_value();

    const bool in_success_range = (status >= 200) && (status <= 299);
    if ((has_transport_error == false) && in_success_range) {
        return Classification::Success;
    }

    // A retryable status wins even if the transport also reported an error
    if ((status != 0) && should_retry_http_status(status)) {
        return Classification::Retryable;
    }

    if (has_transport_error && should_retry_transport_error(outcome.transport_error->code)) {
        return Classification::Retryable;
    }

    return Classification::TerminalError;
}

std::string RetryPolicy::failure_message(const AttemptOutcome& outcome) {
    if (outcome.transport_error.has_value()) {
        return outcome.transport_error->message;
    }
    return "Server returned statuscode " + std::to_string(outcome.status_code());
}

}  // namespace apiwire
