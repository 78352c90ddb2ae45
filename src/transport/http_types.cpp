#include "apiwire/transport/http_types.hpp"

#include <ada.h>

namespace apiwire {

void apply_header_overlay(HeaderMap& headers, const HeaderMap& overlay) {
    for (const auto& [name, values] : overlay) {
        headers.erase(name);
        if (values.empty()) {
            continue;
        }
        headers.emplace(name, values);
    }
}

namespace {

tl::expected<ada::url, std::string> parse_http_url(std::string_view input, const ada::url* base) {
    auto parsed = ada::parse<ada::url>(input, base);
    if (!parsed.has_value()) {
        return tl::unexpected("Malformed URL: " + std::string(input));
    }

    // ada reports the scheme with its trailing colon
    const std::string protocol = std::string(parsed->get_protocol());
    const bool is_http = (protocol == "http:") || (protocol == "https:");
    if (is_http == false) {
        return tl::unexpected("Unsupported URL scheme '" + protocol + "' in " + std::string(input));
    }
    return std::move(*parsed);
}

}  // namespace

tl::expected<std::string, std::string> build_url(std::string_view url, const QueryParams& params) {
    auto parsed = parse_http_url(url, nullptr);
    if (!parsed.has_value()) {
        return tl::unexpected(parsed.error());
    }

    if (!params.empty()) {
        std::string existing = std::string(parsed->get_search());
        if ((!existing.empty()) && (existing.front() == '?')) {
            existing.erase(0, 1);
        }

        ada::url_search_params search(existing);
        for (const auto& [key, value] : params) {
            search.set(key, value);
        }
        parsed->set_search(search.to_string());
    }

    return std::string(parsed->get_href());
}

tl::expected<std::string, std::string> resolve_url(std::string_view base, std::string_view relative) {
    auto base_url = parse_http_url(base, nullptr);
    if (!base_url.has_value()) {
        return tl::unexpected(base_url.error());
    }

    auto resolved = parse_http_url(relative, &*base_url);
    if (!resolved.has_value()) {
        return tl::unexpected(resolved.error());
    }
    return std::string(resolved->get_href());
}

std::string encode_form(const FormFields& fields) {
    ada::url_search_params form;
    for (const auto& [key, value] : fields) {
        form.append(key, value);
    }
    return form.to_string();
}

}  // namespace apiwire
