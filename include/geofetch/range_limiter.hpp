#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace geofetch {

class CancellationToken;

// Caps the number of ranged requests outstanding across all jobs.
class RangeLimiter {
public:
    explicit RangeLimiter(std::size_t slots);

    // Blocks until a slot is free. Returns false if the run was cancelled first.
    [[nodiscard]] bool acquire(const CancellationToken& cancel);
    void release();

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] std::size_t inUse() const;

    class Slot {
    public:
        Slot(RangeLimiter& limiter, const CancellationToken& cancel)
            : limiter_(limiter), held_(limiter.acquire(cancel)) {}
        ~Slot() {
            if (held_) {
                limiter_.release();
            }
        }
        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;

        [[nodiscard]] bool held() const noexcept { return held_; }

    private:
        RangeLimiter& limiter_;
        bool held_;
    };

private:
    const std::size_t capacity_;
    std::size_t in_use_{0};
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace geofetch
