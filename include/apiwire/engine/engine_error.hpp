#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Engine Error
// ═══════════════════════════════════════════════════════════════════════════
// The error carrier returned by Engine::call. It is populated through setters
// only; the engine never reads it back.

#include "apiwire/transport/http_client.hpp"
#include "apiwire/transport/http_types.hpp"

#include <tl/expected.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace apiwire {

enum class EngineErrorCode {
    BuildError,       ///< body encoding or URL construction failed, nothing sent
    TransportError,   ///< no response obtained (connection, TLS, timeout)
    StatusError,      ///< response obtained with a non-2xx status
    DecodeError       ///< 2xx response whose body did not fit the response model
};

[[nodiscard]] constexpr std::string_view to_string(EngineErrorCode code) noexcept {
    switch (code) {
        case EngineErrorCode::BuildError:     return "BuildError";
        case EngineErrorCode::TransportError: return "TransportError";
        case EngineErrorCode::StatusError:    return "StatusError";
        case EngineErrorCode::DecodeError:    return "DecodeError";
    }
    return "Unknown";
}

/// Key under which undecodable error bodies are kept.
inline constexpr std::string_view kResponseMessageExtra = "response_message";

struct EngineError {
    EngineErrorCode code{EngineErrorCode::TransportError};
    std::string message;
    std::optional<HttpRequest> request;
    std::optional<HttpClientResponse> response;
    std::optional<HttpClientError> transport_error;
    std::size_t attempts{0};
    std::map<std::string, std::string> extra;

    // ─────────────────────────────────────────────────────────────────────────
    // Carrier setters
    // ─────────────────────────────────────────────────────────────────────────

    void set_request(const HttpRequest& req) {
        request = req;
    }

    void set_response(const HttpClientResponse& resp) {
        response = resp;
    }

    void set_message(std::string msg) {
        message = std::move(msg);
    }

    void set_extra(const std::string& key, std::string value) {
        extra[key] = std::move(value);
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Queries
    // ─────────────────────────────────────────────────────────────────────────

    /// Status of the last response, 0 if none was obtained
    [[nodiscard]] int status_code() const noexcept {
        return response.has_value() ? response->status_code : 0;
    }

    [[nodiscard]] std::optional<std::string> get_extra(const std::string& key) const {
        const auto it = extra.find(key);
        if (it == extra.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Factory Methods
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] static EngineError build_error(std::string msg) {
        EngineError err;
        err.code = EngineErrorCode::BuildError;
        err.message = std::move(msg);
        return err;
    }

    [[nodiscard]] static EngineError transport_failure(const HttpClientError& cause) {
        EngineError err;
        err.code = EngineErrorCode::TransportError;
        err.message = cause.message;
        err.transport_error = cause;
        return err;
    }

    [[nodiscard]] static EngineError status_error(int status) {
        EngineError err;
        err.code = EngineErrorCode::StatusError;
        err.message = "Server returned statuscode " + std::to_string(status);
        return err;
    }

    [[nodiscard]] static EngineError decode_error(std::string msg) {
        EngineError err;
        err.code = EngineErrorCode::DecodeError;
        err.message = std::move(msg);
        return err;
    }
};

template <typename T>
using EngineResult = tl::expected<T, EngineError>;

}  // namespace apiwire
