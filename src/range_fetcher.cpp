#include "geofetch/range_fetcher.hpp"
#include "geofetch/cancellation.hpp"
#include "geofetch/logging.hpp"
#include "geofetch/output_file.hpp"
#include "geofetch/progress.hpp"
#include "geofetch/range_limiter.hpp"
#include "geofetch/transfer_job.hpp"

#include <algorithm>
#include <optional>

#include <fmt/format.h>

namespace geofetch {

std::chrono::milliseconds RetryPolicy::backoff(int attempt) const {
    const int shift = std::clamp(attempt - 1, 0, 20);
    return base * (std::chrono::milliseconds::rep{1} << shift);
}

RangeFetcher::RangeFetcher(HttpTransport& transport,
                           const EngineConfig& config,
                           ProgressAggregator& progress,
                           const CancellationToken& cancel,
                           RangeLimiter* limiter)
    : transport_(transport),
      config_(config),
      progress_(progress),
      cancel_(cancel),
      limiter_(limiter),
      policy_{config.max_attempts, config.backoff_base, config.backoff_jitter},
      rng_(std::random_device{}()) {}

bool RangeFetcher::fetch(const std::string& url, std::size_t job_id, Part& part, OutputFile& file, bool ranged) {
    part.status = PartStatus::InProgress;
    part.error = ErrorKind::None;
    part.error_message.clear();

    for (int n = 1; n <= policy_.max_attempts; ++n) {
        if (cancel_.isCancelled()) {
            part.error = ErrorKind::Cancelled;
            part.error_message = "Download cancelled";
            break;
        }

        std::optional<RangeLimiter::Slot> slot;
        if (ranged && limiter_) {
            slot.emplace(*limiter_, cancel_);
            if (!slot->held()) {
                part.error = ErrorKind::Cancelled;
                part.error_message = "Download cancelled";
                break;
            }
        }

        ++part.attempts;
        part.bytes_written = 0;
        const Attempt result = attempt(url, job_id, part, file, ranged);
        part.bytes_written = result.written;
        slot.reset();

        if (result.error == ErrorKind::None) {
            part.status = PartStatus::Done;
            return true;
        }

        part.error = result.error;
        part.error_message = result.message;
        if (result.written > 0) {
            progress_.discardBytes(job_id, result.written);
        }

        if (!isRetryable(result.error) || n == policy_.max_attempts) {
            break;
        }

        const auto delay = jittered(policy_.backoff(n));
        log::get()->debug("Part {} of {} failed ({}), retrying in {} ms [{}/{}]",
                          part.index, url, result.message, delay.count(), n, policy_.max_attempts);
        if (!cancel_.sleepFor(delay)) {
            part.error = ErrorKind::Cancelled;
            part.error_message = "Download cancelled";
            break;
        }
    }

    part.status = PartStatus::Failed;
    return false;
}

RangeFetcher::Attempt RangeFetcher::attempt(const std::string& url, std::size_t job_id, const Part& part,
                                            OutputFile& file, bool ranged) {
    HttpRequest request;
    request.url = url;
    if (ranged) {
        request.range = ByteRange{part.start, part.end};
    }
    request.connect_timeout = config_.connect_timeout;
    request.low_speed_time = config_.low_speed_time;

    const std::uint64_t expected = part.length();
    Attempt result;
    bool write_failed = false;

    const auto sink = [&](const char* data, std::size_t size) {
        // Never spill past the part's end into a neighbour's region.
        if (result.written + size > expected) {
            return false;
        }
        if (!file.writeAt(part.start + result.written, data, size)) {
            write_failed = true;
            return false;
        }
        result.written += size;
        progress_.addBytes(job_id, size);
        return true;
    };

    const HttpResponse response = transport_.get(request, sink, cancel_);
    const long success = ranged ? 206 : 200;

    if (write_failed) {
        result.error = ErrorKind::Filesystem;
        result.message = fmt::format("Cannot write {} at offset {}", file.path().string(),
                                     part.start + result.written);
    } else if (response.transport == TransportStatus::Cancelled || cancel_.isCancelled()) {
        result.error = ErrorKind::Cancelled;
        result.message = "Download cancelled";
    } else if (response.transport == TransportStatus::SinkRejected) {
        result.error = ErrorKind::SizeMismatch;
        result.message = fmt::format("Received more than the expected {} bytes", expected);
    } else if (response.transport != TransportStatus::Ok) {
        result.error = ErrorKind::TransientNetwork;
        result.message = response.error;
    } else if (response.status == 429 || response.status >= 500) {
        result.error = ErrorKind::TransientNetwork;
        result.message = fmt::format("HTTP {}", response.status);
    } else if (response.status >= 400) {
        result.error = ErrorKind::PermanentHttp;
        result.message = fmt::format("HTTP {}", response.status);
    } else if (response.status == 0) {
        result.error = ErrorKind::TransientNetwork;
        result.message = "No HTTP status received";
    } else if (response.status != success) {
        result.error = ranged ? ErrorKind::RangeNotSupported : ErrorKind::PermanentHttp;
        result.message = fmt::format("Unexpected HTTP {} (expected {})", response.status, success);
    } else if (result.written != expected) {
        result.error = ErrorKind::SizeMismatch;
        result.message = fmt::format("Received {} of {} bytes", result.written, expected);
    }

    return result;
}

std::chrono::milliseconds RangeFetcher::jittered(std::chrono::milliseconds delay) {
    if (!policy_.jitter || delay.count() <= 1) {
        return delay;
    }
    std::uniform_int_distribution<std::chrono::milliseconds::rep> spread(0, delay.count() / 2);
    return delay + std::chrono::milliseconds(spread(rng_));
}

} // namespace geofetch
