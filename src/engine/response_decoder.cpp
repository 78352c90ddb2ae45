#include "apiwire/engine/response_decoder.hpp"

#include "apiwire/log/logger.hpp"

namespace apiwire {

CodecResult<void> ResponseDecoder::decode_success(
    const HttpClientResponse& response,
    const std::optional<ModelSink>& sink
) const {
    if (!sink.has_value()) {
        return {};
    }
    return sink->decode(response.body, mode_);
}

void ResponseDecoder::decode_failure(
    const HttpClientResponse& response,
    const std::optional<ModelSink>& sink,
    EngineError& error
) const {
    if (!sink.has_value()) {
        return;
    }

    auto decoded = sink->decode(response.body, mode_);
    if (!decoded.has_value()) {
        APIWIRE_LOG_DEBUG("Error body did not match error model: {}", decoded.error());
        error.set_extra(std::string(kResponseMessageExtra), response.body);
    }
}

}  // namespace apiwire
