#include "apiwire/log/logger.hpp"

#include <mutex>

namespace apiwire {

namespace {

std::mutex& logger_mutex() {
    static std::mutex mutex;
    return mutex;
}

std::shared_ptr<ILogger>& logger_instance() {
    static std::shared_ptr<ILogger> instance = std::make_shared<NullLogger>();
    return instance;
}

}  // namespace

std::shared_ptr<ILogger> current_logger() {
    std::lock_guard<std::mutex> lock(logger_mutex());
    return logger_instance();
}

void set_logger(std::shared_ptr<ILogger> logger) {
    if (logger == nullptr) {
        logger = std::make_shared<NullLogger>();
    }
    std::lock_guard<std::mutex> lock(logger_mutex());
    logger_instance() = std::move(logger);
}

}  // namespace apiwire
