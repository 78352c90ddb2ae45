// ═══════════════════════════════════════════════════════════════════════════
// Engine Logging Tests
// ═══════════════════════════════════════════════════════════════════════════
// The records an engine call leaves in the process-wide logger.

#include <catch2/catch_test_macros.hpp>

#include "apiwire/apiwire.hpp"
#include "mocks/capturing_logger.hpp"
#include "mocks/mock_http_client.hpp"

using namespace apiwire;
using namespace apiwire::testing;

namespace {

const std::string kLedgerUrl = "https://api.example.com/v1/ledger";

EngineConfig quiet_config(const std::shared_ptr<MockHttpClient>& client) {
    return EngineConfig{}
        .with_http_client(client)
        .with_backoff_policy(std::make_shared<NoBackoff>());
}

bool ends_with(std::string_view text, std::string_view suffix) {
    return (text.size() >= suffix.size())
        && (text.substr(text.size() - suffix.size()) == suffix);
}

}  // namespace

TEST_CASE("Without a configured logger nothing is accepted", "[log]") {
    set_logger(nullptr);

    auto logger = current_logger();
    REQUIRE_FALSE(logger->should_log(LogLevel::Debug));
    REQUIRE_FALSE(logger->should_log(LogLevel::Warn));
    REQUIRE_FALSE(logger->should_log(LogLevel::Error));
}

TEST_CASE("Each retry is logged at Info with method and URL", "[log][retry]") {
    auto captured = std::make_shared<CapturingLogger>(LogLevel::Info);
    ScopedLogger scope(captured);

    auto client = std::make_shared<MockHttpClient>();
    client->queue_response(503, "");
    client->queue_response(500, "");
    client->queue_response(200, "");
    Engine engine(quiet_config(client));

    auto result = engine.call(RequestSpec{HttpMethod::Get, kLedgerUrl});
    REQUIRE(result.has_value());

    const std::vector<std::string> expected{
        "Starting retry 1 for GET " + kLedgerUrl,
        "Starting retry 2 for GET " + kLedgerUrl
    };
    REQUIRE(captured->messages(LogLevel::Info) == expected);
    REQUIRE(captured->messages(LogLevel::Warn).empty());
}

TEST_CASE("A first-attempt success logs nothing at Info or above", "[log]") {
    auto captured = std::make_shared<CapturingLogger>(LogLevel::Info);
    ScopedLogger scope(captured);

    auto client = std::make_shared<MockHttpClient>();
    Engine engine(quiet_config(client));

    REQUIRE(engine.call(RequestSpec{HttpMethod::Get, kLedgerUrl}).has_value());
    REQUIRE(captured->size() == 0);
}

TEST_CASE("Exhausted retries are logged at Warn", "[log][retry]") {
    auto captured = std::make_shared<CapturingLogger>(LogLevel::Info);
    ScopedLogger scope(captured);

    auto client = std::make_shared<MockHttpClient>();
    client->set_response_handler([](const RecordedRequest&) -> HttpClientResult<HttpClientResponse> {
        return HttpClientResponse{503, {}, "busy"};
    });
    Engine engine(quiet_config(client).with_max_retries(1));

    auto result = engine.call(RequestSpec{HttpMethod::Delete, kLedgerUrl});
    REQUIRE_FALSE(result.has_value());

    const std::vector<std::string> warnings{
        "Giving up on DELETE " + kLedgerUrl + " after 2 attempts: Server returned statuscode 503"
    };
    REQUIRE(captured->messages(LogLevel::Warn) == warnings);
}

TEST_CASE("A terminal status is not a give-up", "[log][retry]") {
    auto captured = std::make_shared<CapturingLogger>(LogLevel::Info);
    ScopedLogger scope(captured);

    auto client = std::make_shared<MockHttpClient>();
    client->queue_response(404, "");
    Engine engine(quiet_config(client));

    REQUIRE_FALSE(engine.call(RequestSpec{HttpMethod::Get, kLedgerUrl}).has_value());
    REQUIRE(captured->size() == 0);
}

TEST_CASE("A failure without any response is logged at Warn", "[log][transport]") {
    auto captured = std::make_shared<CapturingLogger>(LogLevel::Debug);
    ScopedLogger scope(captured);

    auto client = std::make_shared<MockHttpClient>();
    client->queue_timeout("Operation timed out after 30000 milliseconds");
    Engine engine(quiet_config(client));

    auto result = engine.call(RequestSpec{HttpMethod::Post, kLedgerUrl});
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().attempts == 1);

    REQUIRE(captured->contains("Attempt 1 failed in transport: Operation timed out after 30000 milliseconds (Timeout)"));
    const std::vector<std::string> warnings{
        "POST " + kLedgerUrl + " failed without a response: Operation timed out after 30000 milliseconds"
    };
    REQUIRE(captured->messages(LogLevel::Warn) == warnings);
}

TEST_CASE("Handshake timeouts are logged per attempt at Debug", "[log][transport]") {
    auto captured = std::make_shared<CapturingLogger>(LogLevel::Debug);
    ScopedLogger scope(captured);

    auto client = std::make_shared<MockHttpClient>();
    client->queue_handshake_timeout();
    client->queue_response(200, "");
    Engine engine(quiet_config(client));

    REQUIRE(engine.call(RequestSpec{HttpMethod::Get, kLedgerUrl}).has_value());

    const auto debug = captured->messages(LogLevel::Debug);
    REQUIRE(debug.size() == 1);
    REQUIRE(debug[0] == "Attempt 1 failed in transport: TLS handshake timeout (HandshakeTimeout)");
    REQUIRE(captured->messages(LogLevel::Info).size() == 1);
}

TEST_CASE("Diagnostics are Debug records and only appear when enabled", "[log][diagnostics]") {
    auto client = std::make_shared<MockHttpClient>();

    SECTION("disabled") {
        auto captured = std::make_shared<CapturingLogger>(LogLevel::Debug);
        ScopedLogger scope(captured);
        Engine engine(quiet_config(client));

        REQUIRE(engine.call(RequestSpec{HttpMethod::Get, kLedgerUrl}).has_value());
        REQUIRE(captured->size() == 0);
    }

    SECTION("enabled") {
        auto captured = std::make_shared<CapturingLogger>(LogLevel::Debug);
        ScopedLogger scope(captured);
        Engine engine(quiet_config(client).with_diagnostics());

        REQUIRE(engine.call(RequestSpec{HttpMethod::Get, kLedgerUrl}).has_value());
        REQUIRE(captured->contains("Request GET " + kLedgerUrl + " (content mode json)"));
        REQUIRE(captured->contains("Outcome after 1 attempt(s)"));
        REQUIRE(captured->messages(LogLevel::Info).empty());
    }

    SECTION("enabled but filtered by the logger level") {
        auto captured = std::make_shared<CapturingLogger>(LogLevel::Info);
        ScopedLogger scope(captured);
        Engine engine(quiet_config(client).with_diagnostics());

        REQUIRE(engine.call(RequestSpec{HttpMethod::Get, kLedgerUrl}).has_value());
        REQUIRE(captured->size() == 0);
    }
}

TEST_CASE("Records carry the engine call site", "[log]") {
    auto captured = std::make_shared<CapturingLogger>(LogLevel::Info);
    ScopedLogger scope(captured);

    auto client = std::make_shared<MockHttpClient>();
    client->queue_response(503, "");
    client->queue_response(200, "");
    Engine engine(quiet_config(client));

    REQUIRE(engine.call(RequestSpec{HttpMethod::Get, kLedgerUrl}).has_value());

    const auto records = captured->records();
    REQUIRE(records.size() == 1);
    REQUIRE(ends_with(records[0].location.file_name(), "retry_executor.cpp"));
    REQUIRE(records[0].location.line() > 0);
}

TEST_CASE("APIWIRE_LOG macros format with std::format syntax", "[log]") {
    auto captured = std::make_shared<CapturingLogger>(LogLevel::Info);
    ScopedLogger scope(captured);

    APIWIRE_LOG_DEBUG("filtered {}", 1);
    APIWIRE_LOG_INFO("retry {} of {}", 2, 5);
    APIWIRE_LOG_WARN("{} {}", "GET", kLedgerUrl);
    APIWIRE_LOG_ERROR("plain");

    const auto records = captured->records();
    REQUIRE(records.size() == 3);
    REQUIRE(records[0].level == LogLevel::Info);
    REQUIRE(records[0].message == "retry 2 of 5");
    REQUIRE(records[1].message == "GET " + kLedgerUrl);
    REQUIRE(records[2].level == LogLevel::Error);
    REQUIRE(ends_with(records[2].location.file_name(), "logger_test.cpp"));
}

TEST_CASE("A replaced logger stays alive for whoever still holds it", "[log]") {
    auto first = std::make_shared<CapturingLogger>();
    set_logger(first);

    auto held = current_logger();
    set_logger(nullptr);

    held->log(LogRecord{LogLevel::Info, "late", std::chrono::system_clock::now(),
                        std::source_location::current()});
    REQUIRE(first->messages(LogLevel::Info) == std::vector<std::string>{"late"});
    REQUIRE_FALSE(current_logger()->should_log(LogLevel::Error));
}

TEST_CASE("LogLevel names", "[log]") {
    REQUIRE(to_string(LogLevel::Debug) == "DEBUG");
    REQUIRE(to_string(LogLevel::Info) == "INFO");
    REQUIRE(to_string(LogLevel::Warn) == "WARN");
    REQUIRE(to_string(LogLevel::Off) == "OFF");
}
