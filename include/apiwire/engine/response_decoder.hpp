#ifndef APIWIRE_ENGINE_RESPONSE_DECODER_HPP
#define APIWIRE_ENGINE_RESPONSE_DECODER_HPP

#include "apiwire/codec/content_codec.hpp"
#include "apiwire/engine/engine_error.hpp"
#include "apiwire/transport/http_client.hpp"

#include <optional>

namespace apiwire {

// ─────────────────────────────────────────────────────────────────────────────
// ResponseDecoder
// ─────────────────────────────────────────────────────────────────────────────
// Fills the caller's models from the buffered response body. Both paths read
// the same buffered copy; nothing goes back to the network.
//
// Success path: a decode failure is fatal (a 200 with an unparseable body is
// not a success).
// Failure path: a decode failure is not; the raw body text is attached to the
// error under "response_message" instead.

class ResponseDecoder {
public:
    explicit ResponseDecoder(ContentMode mode)
        : mode_(mode)
    {}

    [[nodiscard]] CodecResult<void> decode_success(
        const HttpClientResponse& response,
        const std::optional<ModelSink>& sink
    ) const;

    void decode_failure(
        const HttpClientResponse& response,
        const std::optional<ModelSink>& sink,
        EngineError& error
    ) const;

private:
    ContentMode mode_;
};

}  // namespace apiwire

#endif  // APIWIRE_ENGINE_RESPONSE_DECODER_HPP
