#pragma once

#include "apiwire/log/logger.hpp"

#include <memory>
#include <string>

#include <spdlog/logger.h>

namespace apiwire {

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger
// ─────────────────────────────────────────────────────────────────────────────
// Routes engine records into a spdlog logger owned by the client library.
// The spdlog logger's own level decides what is written, so the library can
// keep adjusting it through spdlog after installing this adapter.

class SpdlogLogger final : public ILogger {
public:
    explicit SpdlogLogger(std::shared_ptr<spdlog::logger> logger);

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override;

    [[nodiscard]] spdlog::logger& backend() const noexcept {
        return *logger_;
    }

    [[nodiscard]] static spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept;

private:
    std::shared_ptr<spdlog::logger> logger_;
};

/// Colour stderr logger named after the client library, e.g. "billing-api".
/// Not registered with spdlog, so several libraries may reuse a name.
[[nodiscard]] std::shared_ptr<SpdlogLogger> make_spdlog_console_logger(
    const std::string& name,
    LogLevel min_level = LogLevel::Info
);

}  // namespace apiwire
