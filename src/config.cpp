#include "geofetch/config.hpp"

#include <stdexcept>

namespace geofetch {

void EngineConfig::validate() const {
    if (output_dir.empty()) {
        throw std::invalid_argument("output_dir must not be empty");
    }
    if (max_concurrent < 1) {
        throw std::invalid_argument("max_concurrent must be at least 1");
    }
    if (max_range_requests < 1) {
        throw std::invalid_argument("max_range_requests must be at least 1");
    }
    if (max_attempts < 1) {
        throw std::invalid_argument("max_attempts must be at least 1");
    }
    if (backoff_base.count() < 0) {
        throw std::invalid_argument("backoff_base must not be negative");
    }
    if (connect_timeout.count() <= 0 || low_speed_time.count() <= 0) {
        throw std::invalid_argument("network timeouts must be positive");
    }
}

} // namespace geofetch
