#ifndef APIWIRE_CODEC_CONTENT_CODEC_HPP
#define APIWIRE_CODEC_CONTENT_CODEC_HPP

#include "apiwire/transport/http_types.hpp"

#include <boost/property_tree/ptree.hpp>
#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <concepts>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>

namespace apiwire {

using Json = nlohmann::json;
using XmlTree = boost::property_tree::ptree;

// ─────────────────────────────────────────────────────────────────────────────
// Content Mode
// ─────────────────────────────────────────────────────────────────────────────
// Negotiated once per engine; drives both request encoding and response
// decoding. Raw mode still encodes and decodes models as JSON but sets no
// Accept / Content-Type defaults.

enum class ContentMode {
    Json,
    Xml,
    Raw
};

[[nodiscard]] std::string_view to_string(ContentMode mode) noexcept;

/// Media type for request bodies and Accept; empty for Raw.
[[nodiscard]] std::string_view media_type(ContentMode mode) noexcept;

inline constexpr std::string_view kFormMediaType = "application/x-www-form-urlencoded";

template <typename T>
using CodecResult = tl::expected<T, std::string>;

// ─────────────────────────────────────────────────────────────────────────────
// Model mappings
// ─────────────────────────────────────────────────────────────────────────────
// JSON uses nlohmann's to_json / from_json (ADL or adl_serializer).
// XML uses two ADL functions over a Boost property tree holding the whole
// document, root element included:
//
//   void to_xml(apiwire::XmlTree& doc, const Order& o) { doc.put("order.id", o.id); }
//   void from_xml(const apiwire::XmlTree& doc, Order& o) { o.id = doc.get<int>("order.id"); }

template <typename T>
concept JsonEncodable = requires(const T& model) {
    Json(model);
};

template <typename T>
concept JsonDecodable = requires(const Json& doc, T& target) {
    doc.get_to(target);
};

template <typename T>
concept XmlEncodable = requires(XmlTree& doc, const T& model) {
    to_xml(doc, model);
};

template <typename T>
concept XmlDecodable = requires(const XmlTree& doc, T& target) {
    from_xml(doc, target);
};

namespace codec_detail {

[[nodiscard]] CodecResult<std::string> dump_json(const Json& doc);
[[nodiscard]] CodecResult<Json> parse_json(std::string_view bytes);
[[nodiscard]] CodecResult<std::string> write_xml(const XmlTree& doc);
[[nodiscard]] CodecResult<XmlTree> read_xml(std::string_view bytes);

/// Flatten a JSON object into form fields (see encode_form_model).
[[nodiscard]] CodecResult<FormFields> flatten_form_fields(const Json& doc);

}  // namespace codec_detail

// ─────────────────────────────────────────────────────────────────────────────
// Encoding
// ─────────────────────────────────────────────────────────────────────────────

template <JsonEncodable T>
[[nodiscard]] CodecResult<std::string> encode_json(const T& model) {
    try {
        return codec_detail::dump_json(Json(model));
    } catch (const Json::exception& e) {
        return tl::unexpected(std::string("JSON encoding failed: ") + e.what());
    }
}

template <XmlEncodable T>
[[nodiscard]] CodecResult<std::string> encode_xml(const T& model) {
    XmlTree doc;
    try {
        to_xml(doc, model);
    } catch (const boost::property_tree::ptree_error& e) {
        return tl::unexpected(std::string("XML encoding failed: ") + e.what());
    }
    return codec_detail::write_xml(doc);
}

/// x-www-form-urlencoded body from the model's JSON object form: the JSON
/// member names are the keys. Strings go out verbatim, numbers and booleans
/// as their JSON text, null members are skipped, arrays repeat the key and
/// nested objects are sent as compact JSON.
template <JsonEncodable T>
[[nodiscard]] CodecResult<std::string> encode_form_model(const T& model) {
    try {
        auto fields = codec_detail::flatten_form_fields(Json(model));
        if (!fields.has_value()) {
            return tl::unexpected(fields.error());
        }
        return encode_form(*fields);
    } catch (const Json::exception& e) {
        return tl::unexpected(std::string("Form encoding failed: ") + e.what());
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Decoding
// ─────────────────────────────────────────────────────────────────────────────
// `target` is only assigned when decoding succeeds.

template <typename T>
    requires JsonDecodable<T> && std::default_initializable<T>
[[nodiscard]] CodecResult<void> decode_json(std::string_view bytes, T& target) {
    auto doc = codec_detail::parse_json(bytes);
    if (!doc.has_value()) {
        return tl::unexpected(doc.error());
    }
    try {
        T decoded{};
        doc->get_to(decoded);
        target = std::move(decoded);
    } catch (const Json::exception& e) {
        return tl::unexpected(std::string("JSON does not match model: ") + e.what());
    }
    return {};
}

template <typename T>
    requires XmlDecodable<T> && std::default_initializable<T>
[[nodiscard]] CodecResult<void> decode_xml(std::string_view bytes, T& target) {
    auto doc = codec_detail::read_xml(bytes);
    if (!doc.has_value()) {
        return tl::unexpected(doc.error());
    }
    try {
        T decoded{};
        from_xml(*doc, decoded);
        target = std::move(decoded);
    } catch (const boost::property_tree::ptree_error& e) {
        return tl::unexpected(std::string("XML does not match model: ") + e.what());
    }
    return {};
}

// ─────────────────────────────────────────────────────────────────────────────
// BodyModel
// ─────────────────────────────────────────────────────────────────────────────
// Type-erased request body model. Holds its own copy of the model; which
// encodings are available is decided at compile time from the mappings T
// provides.

class BodyModel {
public:
    template <typename T>
        requires (JsonEncodable<T> || XmlEncodable<T>)
              && (!std::same_as<std::remove_cvref_t<T>, BodyModel>)
    explicit BodyModel(T model) {
        auto held = std::make_shared<const T>(std::move(model));

        encode_ = [held](ContentMode mode) -> CodecResult<std::string> {
            if (mode == ContentMode::Xml) {
                if constexpr (XmlEncodable<T>) {
                    return encode_xml(*held);
                } else {
                    return tl::unexpected(std::string("Model has no XML mapping"));
                }
            }
            if constexpr (JsonEncodable<T>) {
                return encode_json(*held);
            } else {
                return tl::unexpected(std::string("Model has no JSON mapping"));
            }
        };

        encode_form_ = [held]() -> CodecResult<std::string> {
            if constexpr (JsonEncodable<T>) {
                return encode_form_model(*held);
            } else {
                return tl::unexpected(std::string("Form encoding needs a JSON mapping"));
            }
        };
    }

    [[nodiscard]] CodecResult<std::string> encode(ContentMode mode) const {
        return encode_(mode);
    }

    [[nodiscard]] CodecResult<std::string> encode_form() const {
        return encode_form_();
    }

private:
    std::function<CodecResult<std::string>(ContentMode)> encode_;
    std::function<CodecResult<std::string>()> encode_form_;
};

// ─────────────────────────────────────────────────────────────────────────────
// ModelSink
// ─────────────────────────────────────────────────────────────────────────────
// Type-erased, non-owning reference to a caller's response or error model.
// A std::string target receives the body text unchanged in every mode.

class ModelSink {
public:
    template <typename T>
        requires (!std::same_as<std::remove_cvref_t<T>, ModelSink>)
    explicit ModelSink(T& target) {
        T* out = &target;

        decode_ = [out](std::string_view bytes, ContentMode mode) -> CodecResult<void> {
            if constexpr (std::same_as<T, std::string>) {
                out->assign(bytes);
                return {};
            } else {
                if (mode == ContentMode::Xml) {
                    if constexpr (XmlDecodable<T> && std::default_initializable<T>) {
                        return decode_xml(bytes, *out);
                    } else {
                        return tl::unexpected(std::string("Model has no XML mapping"));
                    }
                }
                if constexpr (JsonDecodable<T> && std::default_initializable<T>) {
                    return decode_json(bytes, *out);
                } else {
                    return tl::unexpected(std::string("Model has no JSON mapping"));
                }
            }
        };
    }

    [[nodiscard]] CodecResult<void> decode(std::string_view bytes, ContentMode mode) const {
        return decode_(bytes, mode);
    }

private:
    std::function<CodecResult<void>(std::string_view, ContentMode)> decode_;
};

}  // namespace apiwire

#endif  // APIWIRE_CODEC_CONTENT_CODEC_HPP
