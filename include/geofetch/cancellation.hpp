#pragma once

#include <atomic>
#include <chrono>

namespace geofetch {

// Run-scoped stop flag. cancel() only touches a lock-free atomic, so it may be
// called from a signal handler.
class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }

    [[nodiscard]] bool isCancelled() const noexcept {
        return cancelled_.load(std::memory_order_relaxed);
    }

    // Sleeps for up to `duration`; returns false if cancelled before or during the wait.
    bool sleepFor(std::chrono::milliseconds duration) const;

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace geofetch
