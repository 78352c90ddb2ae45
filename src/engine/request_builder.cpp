#include "apiwire/engine/request_builder.hpp"

#include <type_traits>
#include <variant>

namespace apiwire {

RequestBuilder::RequestBuilder(
    ContentMode mode,
    std::string base_url,
    HeaderMap default_headers,
    bool xml_content_headers
)
    : mode_(mode)
    , base_url_(std::move(base_url))
    , default_headers_(std::move(default_headers))
    , xml_content_headers_(xml_content_headers)
{}

EngineResult<BuiltRequest> RequestBuilder::build(const RequestSpec& spec) const {
    auto url = target_url(spec);
    if (!url.has_value()) {
        return tl::unexpected(EngineError::build_error(url.error()));
    }

    BuiltRequest built;
    built.request.method = spec.method;
    built.request.url = std::move(*url);

    auto body = capture_body(spec);
    if (!body.has_value()) {
        auto err = EngineError::build_error(body.error());
        err.set_request(built.request);
        return tl::unexpected(std::move(err));
    }
    built.body = std::move(*body);

    built.request.headers = default_headers_;
    apply_content_defaults(spec, built.request.headers);
    apply_header_overlay(built.request.headers, spec.headers);

    return built;
}

tl::expected<std::string, std::string> RequestBuilder::target_url(const RequestSpec& spec) const {
    std::string absolute = spec.url;

    const bool use_relative = absolute.empty();
    if (use_relative) {
        if (spec.relative_url.empty()) {
            return tl::unexpected(std::string("Request has no URL"));
        }
        if (base_url_.empty()) {
            return tl::unexpected("Relative URL '" + spec.relative_url + "' without a base URL");
        }
        auto resolved = resolve_url(base_url_, spec.relative_url);
        if (!resolved.has_value()) {
            return tl::unexpected(resolved.error());
        }
        absolute = std::move(*resolved);
    }

    if (spec.parameters.has_value()) {
        return build_url(absolute, *spec.parameters);
    }
    return build_url(absolute);
}

CodecResult<ReplayableBody> RequestBuilder::capture_body(const RequestSpec& spec) const {
    return std::visit([&](const auto& body) -> CodecResult<ReplayableBody> {
        using Body = std::decay_t<decltype(body)>;

        if constexpr (std::is_same_v<Body, std::monostate>) {
            return ReplayableBody{};
        } else if constexpr (std::is_same_v<Body, RawBody>) {
            return body.capture();
        } else {
            auto encoded = spec.wants_form_encoding() ? body.encode_form() : body.encode(mode_);
            if (!encoded.has_value()) {
                return tl::unexpected(encoded.error());
            }
            return ReplayableBody::from_bytes(std::move(*encoded));
        }
    }, spec.body);
}

void RequestBuilder::apply_content_defaults(const RequestSpec& spec, HeaderMap& headers) const {
    if (spec.has_body_model() && spec.wants_form_encoding()) {
        set_header(headers, "Content-Type", std::string(kFormMediaType));
    }

    const bool sets_defaults = (mode_ == ContentMode::Json)
        || ((mode_ == ContentMode::Xml) && xml_content_headers_);
    if (!sets_defaults) {
        return;
    }

    const std::string negotiated(media_type(mode_));
    set_header(headers, "Accept", negotiated);
    if (spec.has_body_model() && !spec.wants_form_encoding()) {
        set_header(headers, "Content-Type", negotiated);
    }
}

}  // namespace apiwire
