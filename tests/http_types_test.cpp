#include <catch2/catch_test_macros.hpp>

#include "apiwire/transport/http_types.hpp"

using namespace apiwire;

// ═══════════════════════════════════════════════════════════════════════════
// Header Map
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("HeaderMap lookups ignore case", "[http][headers]") {
    HeaderMap headers;
    set_header(headers, "Content-Type", "application/json");

    REQUIRE(get_header(headers, "content-type") == "application/json");
    REQUIRE(get_header(headers, "CONTENT-TYPE") == "application/json");
    REQUIRE(headers.size() == 1);

    set_header(headers, "content-type", "application/xml");
    REQUIRE(headers.size() == 1);
    REQUIRE(get_header(headers, "Content-Type") == "application/xml");
}

TEST_CASE("add_header keeps existing values in order", "[http][headers]") {
    HeaderMap headers;
    add_header(headers, "Accept", "application/json");
    add_header(headers, "accept", "text/plain");

    const std::vector<std::string> expected{"application/json", "text/plain"};
    REQUIRE(headers.size() == 1);
    REQUIRE(headers.at("Accept") == expected);
    REQUIRE(get_header(headers, "Accept") == "application/json");
}

TEST_CASE("get_header on a missing or empty header", "[http][headers]") {
    HeaderMap headers;
    headers["X-Empty"];

    REQUIRE(get_header(headers, "X-Missing").has_value() == false);
    REQUIRE(get_header(headers, "X-Empty").has_value() == false);
}

TEST_CASE("apply_header_overlay replaces, removes and adds", "[http][headers]") {
    HeaderMap headers;
    set_header(headers, "Accept", "application/json");
    add_header(headers, "X-Trace", "a");
    add_header(headers, "X-Trace", "b");
    set_header(headers, "Authorization", "Bearer token");

    HeaderMap overlay;
    overlay["accept"] = {"application/vnd.api+json"};
    overlay["Authorization"] = {};
    overlay["X-Request-Id"] = {"42"};

    apply_header_overlay(headers, overlay);

    SECTION("named header is replaced, not merged") {
        REQUIRE(headers.at("Accept") == std::vector<std::string>{"application/vnd.api+json"});
    }

    SECTION("empty value list removes the header") {
        REQUIRE(headers.count("Authorization") == 0);
    }

    SECTION("new header is added") {
        REQUIRE(get_header(headers, "X-Request-Id") == "42");
    }

    SECTION("headers not named in the overlay are untouched") {
        const std::vector<std::string> expected{"a", "b"};
        REQUIRE(headers.at("X-Trace") == expected);
    }
}

TEST_CASE("HttpMethod to_string", "[http]") {
    REQUIRE(to_string(HttpMethod::Get) == "GET");
    REQUIRE(to_string(HttpMethod::Post) == "POST");
    REQUIRE(to_string(HttpMethod::Put) == "PUT");
    REQUIRE(to_string(HttpMethod::Patch) == "PATCH");
    REQUIRE(to_string(HttpMethod::Delete) == "DELETE");
    REQUIRE(to_string(HttpMethod::Head) == "HEAD");
    REQUIRE(to_string(HttpMethod::Options) == "OPTIONS");
}

// ═══════════════════════════════════════════════════════════════════════════
// URL construction
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("build_url without parameters normalizes the URL", "[http][url]") {
    auto url = build_url("https://api.example.com");
    REQUIRE(url.has_value());
    REQUIRE(*url == "https://api.example.com/");
}

TEST_CASE("build_url encodes parameters in key order", "[http][url]") {
    QueryParams params;
    params["page"] = "2";
    params["filter"] = "status eq open";

    auto url = build_url("https://api.example.com/items", params);
    REQUIRE(url.has_value());
    REQUIRE(*url == "https://api.example.com/items?filter=status+eq+open&page=2");
}

TEST_CASE("build_url merges into an existing query", "[http][url]") {
    QueryParams params;
    params["page"] = "2";
    params["limit"] = "10";

    auto url = build_url("https://api.example.com/items?page=1&sort=asc", params);
    REQUIRE(url.has_value());
    REQUIRE(*url == "https://api.example.com/items?page=2&sort=asc&limit=10");
}

TEST_CASE("build_url rejects malformed and non-HTTP URLs", "[http][url]") {
    SECTION("malformed") {
        auto url = build_url("not a url");
        REQUIRE_FALSE(url.has_value());
        REQUIRE(url.error().find("Malformed URL") != std::string::npos);
    }

    SECTION("unsupported scheme") {
        auto url = build_url("ftp://files.example.com/report.csv");
        REQUIRE_FALSE(url.has_value());
        REQUIRE(url.error().find("Unsupported URL scheme") != std::string::npos);
    }
}

TEST_CASE("resolve_url follows relative reference rules", "[http][url]") {
    SECTION("path relative to a directory base") {
        auto url = resolve_url("https://api.example.com/v2/", "orders/42");
        REQUIRE(url.has_value());
        REQUIRE(*url == "https://api.example.com/v2/orders/42");
    }

    SECTION("absolute path replaces the base path") {
        auto url = resolve_url("https://api.example.com/v2/", "/health");
        REQUIRE(url.has_value());
        REQUIRE(*url == "https://api.example.com/health");
    }

    SECTION("invalid base") {
        auto url = resolve_url("::", "orders");
        REQUIRE_FALSE(url.has_value());
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Form encoding
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("encode_form keeps repeated keys and escapes values", "[http][form]") {
    FormFields fields{
        {"tag", "a"},
        {"tag", "b"},
        {"note", "x y&z"}
    };

    REQUIRE(encode_form(fields) == "tag=a&tag=b&note=x+y%26z");
}

TEST_CASE("encode_form of nothing is empty", "[http][form]") {
    REQUIRE(encode_form({}).empty());
}
