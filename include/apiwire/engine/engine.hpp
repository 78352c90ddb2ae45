#ifndef APIWIRE_ENGINE_ENGINE_HPP
#define APIWIRE_ENGINE_ENGINE_HPP

#include "apiwire/engine/engine_config.hpp"
#include "apiwire/engine/engine_error.hpp"
#include "apiwire/engine/request_builder.hpp"
#include "apiwire/engine/request_spec.hpp"
#include "apiwire/engine/response_decoder.hpp"
#include "apiwire/transport/http_client.hpp"
#include "apiwire/transport/retry_executor.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>

namespace apiwire {

/// A successful call: the last request sent and the 2xx response to it.
struct CallResult {
    HttpRequest request;
    HttpClientResponse response;
    std::size_t attempts{0};
};

// ─────────────────────────────────────────────────────────────────────────────
// Engine
// ─────────────────────────────────────────────────────────────────────────────
// One engine per remote API, shared by all endpoint wrappers of a client
// library. call() runs synchronously on the calling thread:
//
//   build → send with retry → classify → decode → CallResult | EngineError
//
// Calls from several threads may overlap. The only state they share is the
// request counter (atomic) and the transport, which must tolerate concurrent
// use.

class Engine {
public:
    explicit Engine(EngineConfig config = {});

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    [[nodiscard]] EngineResult<CallResult> call(const RequestSpec& spec);

    /// Logical calls that got past request building (retries not counted).
    [[nodiscard]] std::int64_t request_count() const noexcept {
        return request_count_.load(std::memory_order_relaxed);
    }

    void reset_request_count() noexcept {
        request_count_.store(0, std::memory_order_relaxed);
    }

    [[nodiscard]] ContentMode content_mode() const noexcept {
        return config_.content_mode;
    }

    [[nodiscard]] const EngineConfig& config() const noexcept {
        return config_;
    }

private:
    [[nodiscard]] EngineError terminal_error(
        const RequestSpec& spec,
        const HttpRequest& request,
        ExecutionResult&& result
    ) const;

    void trace_request(const RequestSpec& spec, const BuiltRequest& built) const;
    void trace_response(const ExecutionResult& result) const;

    EngineConfig config_;
    std::shared_ptr<IHttpClient> client_;
    RequestBuilder builder_;
    RetryExecutor executor_;
    ResponseDecoder decoder_;
    std::atomic<std::int64_t> request_count_{0};
};

}  // namespace apiwire

#endif  // APIWIRE_ENGINE_ENGINE_HPP
