#include "geofetch/logging.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace geofetch::log {

namespace {

constexpr const char* kLoggerName = "geofetch";

std::mutex& registryMutex() {
    static std::mutex mutex;
    return mutex;
}

std::shared_ptr<spdlog::logger> createLocked() {
    auto logger = spdlog::get(kLoggerName);
    if (!logger) {
        logger = spdlog::stderr_color_mt(kLoggerName);
        logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    }
    return logger;
}

} // namespace

void init(spdlog::level::level_enum level) {
    std::lock_guard<std::mutex> lock(registryMutex());
    auto logger = createLocked();
    logger->set_level(level);
}

std::shared_ptr<spdlog::logger> get() {
    if (auto logger = spdlog::get(kLoggerName)) {
        return logger;
    }
    std::lock_guard<std::mutex> lock(registryMutex());
    return createLocked();
}

} // namespace geofetch::log
