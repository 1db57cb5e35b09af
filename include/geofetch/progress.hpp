#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace geofetch {

struct ProgressEvent {
    enum class Type { JobStarted, Bytes, BytesDiscarded, JobCompleted, JobFailed };

    Type type{Type::Bytes};
    std::size_t job_id{0};
    std::uint64_t bytes{0}; // object size for JobStarted, delta otherwise
    std::string text;       // key for JobStarted, reason for JobFailed
};

// Multi-producer queue feeding the single rendering consumer.
class ProgressEventQueue {
public:
    void push(ProgressEvent event);
    // Waits up to `timeout` for an event; empty when timed out or closed and drained.
    [[nodiscard]] std::optional<ProgressEvent> pop(std::chrono::milliseconds timeout);
    void close();
    [[nodiscard]] bool closed() const;

private:
    std::deque<ProgressEvent> events_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_{false};
};

struct ProgressSnapshot {
    std::uint64_t total_bytes{0};
    std::uint64_t bytes_transferred{0};
    std::size_t total_files{0};
    std::size_t files_completed{0};
    std::size_t files_failed{0};
    std::size_t files_skipped{0};
    std::chrono::steady_clock::duration elapsed{};
    double bytes_per_second{0.0};
    std::optional<std::chrono::seconds> eta;
};

class ProgressAggregator {
public:
    ProgressAggregator();

    // Events are published to `queue` while attached; pass nullptr to detach.
    void attach(ProgressEventQueue* queue) noexcept;

    void begin(std::uint64_t total_bytes, std::size_t total_files);

    void jobStarted(std::size_t job_id, const std::string& key, std::uint64_t size);
    void addBytes(std::size_t job_id, std::uint64_t bytes);
    // Withdraws bytes counted by an attempt that is going to be retried.
    void discardBytes(std::size_t job_id, std::uint64_t bytes);
    void jobCompleted(std::size_t job_id);
    void jobFailed(std::size_t job_id, const std::string& reason);
    void jobSkipped();

    [[nodiscard]] ProgressSnapshot snapshot() const;

private:
    void publish(ProgressEvent event);

    std::atomic<ProgressEventQueue*> queue_{nullptr};
    std::atomic<std::uint64_t> total_bytes_{0};
    std::atomic<std::uint64_t> bytes_transferred_{0};
    std::atomic<std::size_t> total_files_{0};
    std::atomic<std::size_t> files_completed_{0};
    std::atomic<std::size_t> files_failed_{0};
    std::atomic<std::size_t> files_skipped_{0};
    std::atomic<std::chrono::steady_clock::rep> start_ticks_;
};

[[nodiscard]] std::string formatSize(std::uint64_t bytes);
[[nodiscard]] std::string formatDuration(std::chrono::seconds duration);

} // namespace geofetch
