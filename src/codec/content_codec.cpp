#include "apiwire/codec/content_codec.hpp"

#include <boost/property_tree/xml_parser.hpp>

#include <sstream>

namespace apiwire {

std::string_view to_string(ContentMode mode) noexcept {
    switch (mode) {
        case ContentMode::Json: return "json";
        case ContentMode::Xml:  return "xml";
        case ContentMode::Raw:  return "raw";
    }
    return "unknown";
}

std::string_view media_type(ContentMode mode) noexcept {
    switch (mode) {
        case ContentMode::Json: return "application/json";
        case ContentMode::Xml:  return "application/xml";
        case ContentMode::Raw:  return "";
    }
    return "";
}

namespace codec_detail {

CodecResult<std::string> dump_json(const Json& doc) {
    try {
        return doc.dump();
    } catch (const Json::exception& e) {
        // e.g. a string member that is not valid UTF-8
        return tl::unexpected(std::string("JSON encoding failed: ") + e.what());
    }
}

CodecResult<Json> parse_json(std::string_view bytes) {
    Json doc = Json::parse(bytes, nullptr, false);
    if (doc.is_discarded()) {
        return tl::unexpected(std::string("Body is not valid JSON"));
    }
    return doc;
}

CodecResult<std::string> write_xml(const XmlTree& doc) {
    std::ostringstream out;
    try {
        boost::property_tree::write_xml(out, doc);
    } catch (const boost::property_tree::xml_parser_error& e) {
        return tl::unexpected(std::string("XML encoding failed: ") + e.what());
    }
    return std::move(out).str();
}

CodecResult<XmlTree> read_xml(std::string_view bytes) {
    std::istringstream in{std::string(bytes)};
    XmlTree doc;
    try {
        boost::property_tree::read_xml(in, doc, boost::property_tree::xml_parser::trim_whitespace);
    } catch (const boost::property_tree::xml_parser_error& e) {
        return tl::unexpected(std::string("Body is not valid XML: ") + e.what());
    }
    return doc;
}

namespace {

std::string form_value(const Json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

}  // namespace

CodecResult<FormFields> flatten_form_fields(const Json& doc) {
    if (!doc.is_object()) {
        return tl::unexpected("Form encoding needs a JSON object, got " + std::string(doc.type_name()));
    }

    FormFields fields;
    for (const auto& [key, value] : doc.items()) {
        if (value.is_null()) {
            continue;
        }
        if (value.is_array()) {
            for (const auto& element : value) {
                if (!element.is_null()) {
                    fields.emplace_back(key, form_value(element));
                }
            }
            continue;
        }
        fields.emplace_back(key, form_value(value));
    }
    return fields;
}

}  // namespace codec_detail

}  // namespace apiwire
