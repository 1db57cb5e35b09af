#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace geofetch::log {

// Creates (or reconfigures) the "geofetch" stderr logger.
void init(spdlog::level::level_enum level = spdlog::level::info);

// The shared logger; created at info level on first use if init() was not called.
[[nodiscard]] std::shared_ptr<spdlog::logger> get();

} // namespace geofetch::log
