#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

namespace apiwire {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────
// What the engine emits at each level:
//   Debug  diagnostics traces, build failures, transport errors per attempt
//   Info   "Starting retry N for METHOD url"
//   Warn   give-ups and failures that never produced a response

enum class LogLevel : std::uint8_t {
    Trace = 0,
    Debug = 1,
    Info  = 2,
    Warn  = 3,
    Error = 4,
    Off   = 5
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

/// One formatted line. `location` is the engine call site, not the logger.
struct LogRecord {
    LogLevel level;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger
// ─────────────────────────────────────────────────────────────────────────────
// Backend-agnostic sink. Implementations are called from every thread that
// runs an engine call and must serialize their own output.

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    // Checked before the message is formatted
    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;
};

class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Process-wide logger
// ─────────────────────────────────────────────────────────────────────────────
// Every engine writes here. A log statement holds its own reference, so
// replacing the logger while calls are in flight is safe.

[[nodiscard]] std::shared_ptr<ILogger> current_logger();

// nullptr restores the NullLogger
void set_logger(std::shared_ptr<ILogger> logger);

namespace detail {

template <typename... Args>
void log_formatted(
    LogLevel level,
    std::source_location location,
    std::format_string<Args...> fmt,
    Args&&... args
) {
    const std::shared_ptr<ILogger> logger = current_logger();
    if (!logger->should_log(level)) {
        return;
    }
    logger->log(LogRecord{
        level,
        std::format(fmt, std::forward<Args>(args)...),
        std::chrono::system_clock::now(),
        location
    });
}

}  // namespace detail

// std::format syntax; arguments are not formatted when the level is off
#define APIWIRE_LOG(level, ...) \
    ::apiwire::detail::log_formatted(level, std::source_location::current(), __VA_ARGS__)

#define APIWIRE_LOG_DEBUG(...) APIWIRE_LOG(::apiwire::LogLevel::Debug, __VA_ARGS__)
#define APIWIRE_LOG_INFO(...)  APIWIRE_LOG(::apiwire::LogLevel::Info, __VA_ARGS__)
#define APIWIRE_LOG_WARN(...)  APIWIRE_LOG(::apiwire::LogLevel::Warn, __VA_ARGS__)
#define APIWIRE_LOG_ERROR(...) APIWIRE_LOG(::apiwire::LogLevel::Error, __VA_ARGS__)

}  // namespace apiwire
