// Example 01: Basic Call
//
// Demonstrates a client library endpoint wrapper on top of the engine: one
// GET with a typed response model and a typed error model.

#include <apiwire/apiwire.hpp>
#include <apiwire/log/spdlog_logger.hpp>

#include <iostream>
#include <string>

using namespace apiwire;

struct Slideshow {
    std::string title;
    std::string author;
};

void from_json(const Json& j, Slideshow& s) {
    const Json& show = j.at("slideshow");
    show.at("title").get_to(s.title);
    show.at("author").get_to(s.author);
}

struct ServiceError {
    std::string message;
};

void from_json(const Json& j, ServiceError& e) {
    e.message = j.value("message", "");
}

int main(int argc, char* argv[]) {
    std::string base_url = "https://httpbin.org/";
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--base-url" && i + 1 < argc) {
            base_url = argv[++i];
        } else if (arg == "--verbose") {
            verbose = true;
        }
    }

    std::cout << "=== Basic Call Example ===\n\n";

    // 1. Route engine logs through spdlog
    set_logger(make_spdlog_console_logger("httpbin", verbose ? LogLevel::Debug : LogLevel::Info));

    // 2. One engine per remote API
    Engine engine(EngineConfig{}
        .with_content_mode(ContentMode::Json)
        .with_base_url(base_url)
        .with_header("User-Agent", "apiwire-example/0.3")
        .with_max_retries(2)
        .with_diagnostics(verbose));

    // 3. Describe the call
    Slideshow slideshow;
    ServiceError service_error;

    RequestSpec spec;
    spec.method = HttpMethod::Get;
    spec.relative_url = "json";
    spec.with_response_model(slideshow)
        .with_error_model(service_error);

    // 4. Run it
    auto result = engine.call(spec);
    if (!result) {
        const EngineError& err = result.error();
        std::cerr << "ERROR [" << to_string(err.code) << "]: " << err.message << "\n";
        if (!service_error.message.empty()) {
            std::cerr << "  service said: " << service_error.message << "\n";
        }
        if (auto raw = err.get_extra(std::string(kResponseMessageExtra))) {
            std::cerr << "  body: " << *raw << "\n";
        }
        return 1;
    }

    std::cout << "Status:   " << result->response.status_code << "\n";
    std::cout << "Attempts: " << result->attempts << "\n";
    std::cout << "Title:    " << slideshow.title << "\n";
    std::cout << "Author:   " << slideshow.author << "\n";
    std::cout << "Calls:    " << engine.request_count() << "\n";
    return 0;
}
