#pragma once

#include <tl/expected.hpp>

#include <algorithm>
#include <cctype>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace apiwire {

// ─────────────────────────────────────────────────────────────────────────────
// Header Map
// ─────────────────────────────────────────────────────────────────────────────
// HTTP header names are case-insensitive (RFC 7230) and a name may carry
// several values. Ordering of values within a name is preserved.

struct CaseInsensitiveLess {
    bool operator()(std::string_view lhs, std::string_view rhs) const noexcept {
        return std::lexicographical_compare(
            lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
            [](char a, char b) {
                return std::tolower(static_cast<unsigned char>(a)) <
                       std::tolower(static_cast<unsigned char>(b));
            });
    }
};

using HeaderMap = std::map<std::string, std::vector<std::string>, CaseInsensitiveLess>;

/// Replace every value of `name` with a single value.
inline void set_header(HeaderMap& headers, const std::string& name, const std::string& value) {
    headers.erase(name);
    headers.emplace(name, std::vector<std::string>{value});
}

/// Append a value to `name`, keeping existing ones.
inline void add_header(HeaderMap& headers, const std::string& name, const std::string& value) {
    headers[name].push_back(value);
}

inline void del_header(HeaderMap& headers, const std::string& name) {
    headers.erase(name);
}

/// First value of `name`, or nullopt if absent (or present with no values).
[[nodiscard]] inline std::optional<std::string> get_header(
    const HeaderMap& headers,
    const std::string& name
) {
    const auto it = headers.find(name);
    const bool found = (it != headers.end()) && (!it->second.empty());
    if (found) {
        return it->second.front();
    }
    return std::nullopt;
}

/// Delete-then-replace every header named in `overlay`. An empty value list
/// leaves the header removed.
void apply_header_overlay(HeaderMap& headers, const HeaderMap& overlay);

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Method
// ─────────────────────────────────────────────────────────────────────────────

enum class HttpMethod {
    Get,
    Post,
    Put,
    Patch,
    Delete,
    Head,
    Options
};

inline std::string to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:     return "GET";
        case HttpMethod::Post:    return "POST";
        case HttpMethod::Put:     return "PUT";
        case HttpMethod::Patch:   return "PATCH";
        case HttpMethod::Delete:  return "DELETE";
        case HttpMethod::Head:    return "HEAD";
        case HttpMethod::Options: return "OPTIONS";
    }
    return "UNKNOWN";
}

// ─────────────────────────────────────────────────────────────────────────────
// HttpRequest
// ─────────────────────────────────────────────────────────────────────────────
// Transport-level request. The body is not part of it: it travels separately
// as a ReplayableBody so every attempt re-reads the same captured bytes.

struct HttpRequest {
    HttpMethod method{HttpMethod::Get};
    std::string url;    // absolute, query already encoded
    HeaderMap headers;

    HttpRequest& with_header(const std::string& name, const std::string& value) {
        set_header(headers, name, value);
        return *this;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// URL helpers (ada-url)
// ─────────────────────────────────────────────────────────────────────────────

/// Query parameters, one value per key. A std::map so that setting a key twice
/// keeps the last value and encoding is ordered by key.
using QueryParams = std::map<std::string, std::string>;

using FormFields = std::vector<std::pair<std::string, std::string>>;

/// Validate `url` (http/https only) and merge `params` into its query string,
/// replacing same-named keys. Returns the serialized href or a message.
[[nodiscard]] tl::expected<std::string, std::string> build_url(
    std::string_view url,
    const QueryParams& params = {}
);

/// Resolve `relative` against `base` (WHATWG rules).
[[nodiscard]] tl::expected<std::string, std::string> resolve_url(
    std::string_view base,
    std::string_view relative
);

/// application/x-www-form-urlencoded serialization; repeated keys are kept.
[[nodiscard]] std::string encode_form(const FormFields& fields);

}  // namespace apiwire
