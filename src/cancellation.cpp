#include "geofetch/cancellation.hpp"

#include <algorithm>
#include <thread>

namespace geofetch {

bool CancellationToken::sleepFor(std::chrono::milliseconds duration) const {
    constexpr std::chrono::milliseconds slice{20};

    const auto deadline = std::chrono::steady_clock::now() + duration;
    while (!isCancelled()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(slice, remaining));
    }
    return false;
}

} // namespace geofetch
