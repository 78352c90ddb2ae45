#include <catch2/catch_test_macros.hpp>

#include "apiwire/engine/response_decoder.hpp"

using namespace apiwire;

namespace {

struct ApiError {
    std::string code;
    std::string detail;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ApiError, code, detail)

struct Balance {
    long cents{0};
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Balance, cents)

HttpClientResponse make_response(int status, std::string body) {
    return HttpClientResponse{status, {}, std::move(body)};
}

}  // namespace

TEST_CASE("decode_success without a model ignores the body", "[decoder]") {
    ResponseDecoder decoder(ContentMode::Json);

    auto result = decoder.decode_success(make_response(200, "not json"), std::nullopt);
    REQUIRE(result.has_value());
}

TEST_CASE("decode_success fills the response model", "[decoder]") {
    ResponseDecoder decoder(ContentMode::Json);
    Balance balance;

    auto result = decoder.decode_success(make_response(200, R"({"cents":1250})"), ModelSink(balance));
    REQUIRE(result.has_value());
    REQUIRE(balance.cents == 1250);
}

TEST_CASE("decode_success reports an unparseable body", "[decoder]") {
    ResponseDecoder decoder(ContentMode::Json);
    Balance balance{7};

    auto result = decoder.decode_success(make_response(200, "<html>oops</html>"), ModelSink(balance));
    REQUIRE_FALSE(result.has_value());
    REQUIRE(balance.cents == 7);
}

TEST_CASE("decode_failure fills the error model", "[decoder]") {
    ResponseDecoder decoder(ContentMode::Json);
    ApiError api_error;
    EngineError error = EngineError::status_error(404);

    decoder.decode_failure(
        make_response(404, R"({"code":"not_found","detail":"no such invoice"})"),
        ModelSink(api_error),
        error);

    REQUIRE(api_error.code == "not_found");
    REQUIRE(api_error.detail == "no such invoice");
    REQUIRE(error.extra.empty());
    REQUIRE(error.code == EngineErrorCode::StatusError);
}

TEST_CASE("decode_failure keeps an undecodable body as response_message", "[decoder]") {
    ResponseDecoder decoder(ContentMode::Json);
    ApiError api_error;
    EngineError error = EngineError::status_error(502);

    decoder.decode_failure(make_response(502, "<html>Bad Gateway</html>"), ModelSink(api_error), error);

    REQUIRE(error.get_extra(std::string(kResponseMessageExtra)) == "<html>Bad Gateway</html>");
    REQUIRE(error.code == EngineErrorCode::StatusError);
    REQUIRE(error.message == "Server returned statuscode 502");
}

TEST_CASE("decode_failure without an error model changes nothing", "[decoder]") {
    ResponseDecoder decoder(ContentMode::Json);
    EngineError error = EngineError::status_error(500);

    decoder.decode_failure(make_response(500, "whatever"), std::nullopt, error);

    REQUIRE(error.extra.empty());
}

TEST_CASE("decode_failure into a string model takes the raw text", "[decoder]") {
    ResponseDecoder decoder(ContentMode::Xml);
    std::string text;
    EngineError error = EngineError::status_error(400);

    decoder.decode_failure(make_response(400, "plain text reason"), ModelSink(text), error);

    REQUIRE(text == "plain text reason");
    REQUIRE(error.extra.empty());
}
