#include "geofetch/progress.hpp"

#include <utility>

#include <fmt/format.h>

namespace geofetch {

void ProgressEventQueue::push(ProgressEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        events_.push_back(std::move(event));
    }
    cv_.notify_one();
}

std::optional<ProgressEvent> ProgressEventQueue::pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !events_.empty() || closed_; });
    if (events_.empty()) {
        return std::nullopt;
    }
    ProgressEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

void ProgressEventQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool ProgressEventQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

ProgressAggregator::ProgressAggregator()
    : start_ticks_(std::chrono::steady_clock::now().time_since_epoch().count()) {}

void ProgressAggregator::attach(ProgressEventQueue* queue) noexcept {
    queue_.store(queue);
}

void ProgressAggregator::begin(std::uint64_t total_bytes, std::size_t total_files) {
    total_bytes_.store(total_bytes);
    total_files_.store(total_files);
    bytes_transferred_.store(0);
    files_completed_.store(0);
    files_failed_.store(0);
    files_skipped_.store(0);
    start_ticks_.store(std::chrono::steady_clock::now().time_since_epoch().count());
}

void ProgressAggregator::jobStarted(std::size_t job_id, const std::string& key, std::uint64_t size) {
    publish({ProgressEvent::Type::JobStarted, job_id, size, key});
}

void ProgressAggregator::addBytes(std::size_t job_id, std::uint64_t bytes) {
    bytes_transferred_.fetch_add(bytes, std::memory_order_relaxed);
    publish({ProgressEvent::Type::Bytes, job_id, bytes, {}});
}

void ProgressAggregator::discardBytes(std::size_t job_id, std::uint64_t bytes) {
    bytes_transferred_.fetch_sub(bytes, std::memory_order_relaxed);
    publish({ProgressEvent::Type::BytesDiscarded, job_id, bytes, {}});
}

void ProgressAggregator::jobCompleted(std::size_t job_id) {
    files_completed_.fetch_add(1);
    publish({ProgressEvent::Type::JobCompleted, job_id, 0, {}});
}

void ProgressAggregator::jobFailed(std::size_t job_id, const std::string& reason) {
    files_failed_.fetch_add(1);
    publish({ProgressEvent::Type::JobFailed, job_id, 0, reason});
}

void ProgressAggregator::jobSkipped() {
    files_skipped_.fetch_add(1);
}

ProgressSnapshot ProgressAggregator::snapshot() const {
    using Clock = std::chrono::steady_clock;

    ProgressSnapshot snap;
    snap.total_bytes = total_bytes_.load();
    snap.bytes_transferred = bytes_transferred_.load();
    snap.total_files = total_files_.load();
    snap.files_completed = files_completed_.load();
    snap.files_failed = files_failed_.load();
    snap.files_skipped = files_skipped_.load();

    const Clock::time_point started{Clock::duration{start_ticks_.load()}};
    snap.elapsed = Clock::now() - started;

    const double seconds = std::chrono::duration<double>(snap.elapsed).count();
    if (seconds > 0.0) {
        snap.bytes_per_second = static_cast<double>(snap.bytes_transferred) / seconds;
    }
    if (snap.bytes_per_second > 0.0 && snap.total_bytes >= snap.bytes_transferred) {
        const double remaining = static_cast<double>(snap.total_bytes - snap.bytes_transferred);
        snap.eta = std::chrono::seconds(static_cast<std::chrono::seconds::rep>(remaining / snap.bytes_per_second));
    }
    return snap;
}

void ProgressAggregator::publish(ProgressEvent event) {
    if (auto* queue = queue_.load()) {
        queue->push(std::move(event));
    }
}

std::string formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;
    constexpr double TB = GB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (value >= TB) {
        return fmt::format("{:.2f} TB", value / TB);
    } else if (value >= GB) {
        return fmt::format("{:.2f} GB", value / GB);
    } else if (value >= MB) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (value >= KB) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

std::string formatDuration(std::chrono::seconds duration) {
    const auto total = duration.count();
    if (total >= 3600) {
        return fmt::format("{}:{:02}:{:02}", total / 3600, (total / 60) % 60, total % 60);
    }
    return fmt::format("{:02}:{:02}", total / 60, total % 60);
}

} // namespace geofetch
