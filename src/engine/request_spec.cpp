#include "apiwire/engine/request_spec.hpp"

namespace apiwire {

RequestSpec& RequestSpec::with_parameter(const std::string& key, const std::string& value) {
    if (!parameters.has_value()) {
        parameters.emplace();
    }
    (*parameters)[key] = value;
    return *this;
}

RequestSpec& RequestSpec::with_raw_body(std::string bytes) {
    body.emplace<RawBody>(std::move(bytes));
    return *this;
}

RequestSpec& RequestSpec::with_raw_body(std::istream& source) {
    body.emplace<RawBody>(source);
    return *this;
}

RequestSpec& RequestSpec::with_header(const std::string& name, const std::string& value) {
    add_header(headers, name, value);
    return *this;
}

RequestSpec& RequestSpec::without_header(const std::string& name) {
    // An empty value list in the overlay deletes the header
    headers.erase(name);
    headers.emplace(name, std::vector<std::string>{});
    return *this;
}

RequestSpec& RequestSpec::with_form_urlencoded(bool enable) {
    form_urlencoded = enable;
    return *this;
}

RequestSpec& RequestSpec::with_max_retries(std::size_t retries) {
    max_retries = retries;
    return *this;
}

}  // namespace apiwire
