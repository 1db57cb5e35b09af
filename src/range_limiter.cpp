#include "geofetch/range_limiter.hpp"
#include "geofetch/cancellation.hpp"

#include <algorithm>
#include <chrono>

namespace geofetch {

RangeLimiter::RangeLimiter(std::size_t slots) : capacity_(std::max<std::size_t>(1, slots)) {}

bool RangeLimiter::acquire(const CancellationToken& cancel) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (in_use_ >= capacity_) {
        if (cancel.isCancelled()) {
            return false;
        }
        cv_.wait_for(lock, std::chrono::milliseconds(50));
    }
    if (cancel.isCancelled()) {
        return false;
    }
    ++in_use_;
    return true;
}

void RangeLimiter::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_use_ > 0) {
            --in_use_;
        }
    }
    cv_.notify_one();
}

std::size_t RangeLimiter::inUse() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_use_;
}

} // namespace geofetch
