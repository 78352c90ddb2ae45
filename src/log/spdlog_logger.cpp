#include "apiwire/log/spdlog_logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <stdexcept>

namespace apiwire {

namespace {

// [12:00:01.250] [billing-api] [info] Starting retry 1 for GET https://...
constexpr const char* kConsolePattern = "[%H:%M:%S.%e] [%n] [%^%l%$] %v";

}  // namespace

SpdlogLogger::SpdlogLogger(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger))
{
    if (logger_ == nullptr) {
        throw std::invalid_argument("SpdlogLogger: logger cannot be null");
    }
}

spdlog::level::level_enum SpdlogLogger::to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info:  return spdlog::level::info;
        case LogLevel::Warn:  return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Off:   return spdlog::level::off;
    }
    return spdlog::level::info;
}

LogLevel SpdlogLogger::from_spdlog_level(spdlog::level::level_enum level) noexcept {
    switch (level) {
        case spdlog::level::trace: return LogLevel::Trace;
        case spdlog::level::debug: return LogLevel::Debug;
        case spdlog::level::info:  return LogLevel::Info;
        case spdlog::level::warn:  return LogLevel::Warn;
        case spdlog::level::off:   return LogLevel::Off;
        default:                   return LogLevel::Error;  // err, critical
    }
}

bool SpdlogLogger::should_log(LogLevel level) const noexcept {
    return (level != LogLevel::Off) && logger_->should_log(to_spdlog_level(level));
}

void SpdlogLogger::log(const LogRecord& record) {
    if (!should_log(record.level)) {
        return;
    }

    const spdlog::source_loc where{
        record.location.file_name(),
        static_cast<int>(record.location.line()),
        record.location.function_name()
    };
    logger_->log(
        record.timestamp,
        where,
        to_spdlog_level(record.level),
        spdlog::string_view_t(record.message.data(), record.message.size())
    );
}

std::shared_ptr<SpdlogLogger> make_spdlog_console_logger(const std::string& name, LogLevel min_level) {
    auto logger = std::make_shared<spdlog::logger>(
        name,
        std::make_shared<spdlog::sinks::stderr_color_sink_mt>()
    );
    logger->set_pattern(kConsolePattern);
    logger->set_level(SpdlogLogger::to_spdlog_level(min_level));
    return std::make_shared<SpdlogLogger>(std::move(logger));
}

}  // namespace apiwire
