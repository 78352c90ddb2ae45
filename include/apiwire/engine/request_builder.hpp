#ifndef APIWIRE_ENGINE_REQUEST_BUILDER_HPP
#define APIWIRE_ENGINE_REQUEST_BUILDER_HPP

#include "apiwire/codec/content_codec.hpp"
#include "apiwire/engine/engine_error.hpp"
#include "apiwire/engine/request_spec.hpp"
#include "apiwire/transport/http_types.hpp"
#include "apiwire/transport/replayable_body.hpp"

#include <string>

namespace apiwire {

/// A request ready for the send loop.
struct BuiltRequest {
    HttpRequest request;
    ReplayableBody body;
};

// ─────────────────────────────────────────────────────────────────────────────
// RequestBuilder
// ─────────────────────────────────────────────────────────────────────────────
// Turns a RequestSpec into an HttpRequest plus the captured body bytes.
//
// Body:    raw bytes verbatim > no model > form-encoded model > codec model
// Headers: engine defaults, then content defaults (JSON mode, or XML mode when
//          enabled), then the RequestSpec overlay (delete-then-replace per name)
//
// Any failure is a BuildError and nothing is sent.

class RequestBuilder {
public:
    explicit RequestBuilder(
        ContentMode mode,
        std::string base_url = {},
        HeaderMap default_headers = {},
        bool xml_content_headers = false
    );

    [[nodiscard]] EngineResult<BuiltRequest> build(const RequestSpec& spec) const;

    [[nodiscard]] ContentMode content_mode() const noexcept {
        return mode_;
    }

private:
    [[nodiscard]] tl::expected<std::string, std::string> target_url(const RequestSpec& spec) const;

    [[nodiscard]] CodecResult<ReplayableBody> capture_body(const RequestSpec& spec) const;

    void apply_content_defaults(const RequestSpec& spec, HeaderMap& headers) const;

    ContentMode mode_;
    std::string base_url_;
    HeaderMap default_headers_;
    bool xml_content_headers_;
};

}  // namespace apiwire

#endif  // APIWIRE_ENGINE_REQUEST_BUILDER_HPP
