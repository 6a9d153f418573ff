#include "negotiate/log/logger.hpp"

#include <mutex>

namespace negotiate {

namespace {

NullLogger& null_logger() {
    static NullLogger instance;
    return instance;
}

std::unique_ptr<ILogger>& installed_logger() {
    static std::unique_ptr<ILogger> instance;
    return instance;
}

std::mutex& logger_mutex() {
    static std::mutex mutex;
    return mutex;
}

}  // namespace

ILogger& get_logger() noexcept {
    std::lock_guard<std::mutex> lock(logger_mutex());
    auto& installed = installed_logger();
    if (installed != nullptr) {
        return *installed;
    }
    return null_logger();
}

void set_logger(std::unique_ptr<ILogger> logger) noexcept {
    std::lock_guard<std::mutex> lock(logger_mutex());
    installed_logger() = std::move(logger);
}

}  // namespace negotiate
