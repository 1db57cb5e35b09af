#include "geofetch/transfer_strategy.hpp"
#include "geofetch/cancellation.hpp"
#include "geofetch/logging.hpp"
#include "geofetch/output_file.hpp"
#include "geofetch/progress.hpp"
#include "geofetch/range_fetcher.hpp"
#include "geofetch/range_limiter.hpp"
#include "geofetch/transfer_job.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <memory>
#include <system_error>
#include <thread>
#include <vector>

#include <fmt/format.h>

namespace geofetch {

TransferStrategy::TransferStrategy(HttpTransport& transport,
                                   const EngineConfig& config,
                                   RangeLimiter& limiter,
                                   ProgressAggregator& progress,
                                   const CancellationToken& cancel)
    : transport_(transport),
      config_(config),
      limiter_(limiter),
      progress_(progress),
      cancel_(cancel) {}

bool TransferStrategy::useMultipart(std::uint64_t size) const noexcept {
    return config_.multipart_count > 1 && size > config_.split_threshold;
}

void TransferStrategy::execute(TransferJob& job, const std::filesystem::path& destination) {
    job.status = JobStatus::InProgress;
    job.parts.clear();

    const std::uint64_t size = job.descriptor.size();
    std::unique_ptr<OutputFile> file;
    try {
        file = std::make_unique<OutputFile>(destination, size);
    } catch (const DownloadError& e) {
        job.fail(e.kind(), e.what());
        return;
    }

    if (size > 0 && useMultipart(size)) {
        runMultipart(job, *file);

        const bool range_ignored = std::any_of(job.parts.begin(), job.parts.end(), [](const Part& p) {
            return p.error == ErrorKind::RangeNotSupported;
        });
        if (range_ignored && !cancel_.isCancelled()) {
            log::get()->info("{}: server ignored the Range header, falling back to a single stream",
                             job.descriptor.key());
            for (const auto& part : job.parts) {
                if (part.status == PartStatus::Done) {
                    progress_.discardBytes(job.id, part.bytes_written);
                }
            }
            job.parts.clear();
            runSingle(job, *file);
        }
    } else if (size > 0) {
        runSingle(job, *file);
    }

    settle(job, *file);
}

void TransferStrategy::runSingle(TransferJob& job, OutputFile& file) {
    Part whole;
    whole.index = 0;
    whole.start = 0;
    whole.end = job.descriptor.size() - 1;
    job.parts.push_back(whole);

    RangeFetcher fetcher(transport_, config_, progress_, cancel_);
    fetcher.fetch(job.descriptor.sourceUrl(), job.id, job.parts.back(), file, false);
    job.attempt_count += job.parts.back().attempts;
}

void TransferStrategy::runMultipart(TransferJob& job, OutputFile& file) {
    job.parts = planParts(job.descriptor.size(), config_.multipart_count);
    log::get()->debug("{}: {} parts of up to {}", job.descriptor.key(), job.parts.size(),
                      formatSize(job.parts.front().length()));

    // Parts beyond the range cap could only wait for a slot, so they share a
    // pool no larger than the cap and pull the next unstarted part.
    const std::size_t worker_count =
        std::min(job.parts.size(), std::max<std::size_t>(config_.max_range_requests, 1));
    std::atomic<std::size_t> next{0};

    const auto drainParts = [this, &job, &file, &next] {
        while (true) {
            const std::size_t index = next.fetch_add(1);
            if (index >= job.parts.size()) {
                break;
            }
            Part& part = job.parts[index];
            try {
                RangeFetcher fetcher(transport_, config_, progress_, cancel_, &limiter_);
                fetcher.fetch(job.descriptor.sourceUrl(), job.id, part, file, true);
            } catch (const std::exception& e) {
                part.status = PartStatus::Failed;
                part.error = ErrorKind::TransientNetwork;
                part.error_message = e.what();
            }
        }
    };

    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    try {
        for (std::size_t i = 0; i < worker_count; ++i) {
            workers.emplace_back(drainParts);
        }
    } catch (const std::system_error& e) {
        log::get()->warn("{}: started {} of {} part workers: {}", job.descriptor.key(), workers.size(),
                         worker_count, e.what());
        if (workers.empty()) {
            drainParts();
        }
    }

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    for (const auto& part : job.parts) {
        job.attempt_count += part.attempts;
    }
}

void TransferStrategy::settle(TransferJob& job, OutputFile& file) {
    const auto failed = std::find_if(job.parts.begin(), job.parts.end(), [](const Part& p) {
        return p.status != PartStatus::Done;
    });

    if (failed != job.parts.end()) {
        const ErrorKind kind = failed->error == ErrorKind::None ? ErrorKind::TransientNetwork : failed->error;
        if (job.parts.size() > 1) {
            job.fail(kind, fmt::format("part {} (bytes {}-{}): {}", failed->index, failed->start,
                                       failed->end, failed->error_message));
        } else {
            job.fail(kind, failed->error_message);
        }
        return;
    }

    if (job.bytesWritten() != job.descriptor.size()) {
        job.fail(ErrorKind::SizeMismatch, fmt::format("wrote {} of {} bytes", job.bytesWritten(),
                                                      job.descriptor.size()));
        return;
    }

    if (!file.sync()) {
        job.fail(ErrorKind::Filesystem, fmt::format("cannot flush {}", file.path().string()));
        return;
    }

    job.status = JobStatus::Completed;
}

} // namespace geofetch
