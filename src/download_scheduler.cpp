#include "geofetch/download_scheduler.hpp"
#include "geofetch/cancellation.hpp"
#include "geofetch/logging.hpp"
#include "geofetch/manifest_store.hpp"
#include "geofetch/range_limiter.hpp"
#include "geofetch/transfer_job.hpp"
#include "geofetch/transfer_strategy.hpp"

#include <algorithm>
#include <exception>
#include <system_error>
#include <thread>
#include <utility>

#include <fmt/format.h>

namespace geofetch {

namespace fs = std::filesystem;

DownloadScheduler::DownloadScheduler(EngineConfig config,
                                     HttpTransport& transport,
                                     ProgressAggregator& progress,
                                     const CancellationToken& cancel)
    : config_(std::move(config)),
      transport_(transport),
      progress_(progress),
      cancel_(cancel) {}

std::size_t DownloadScheduler::run(const std::vector<Descriptor>& descriptors) {
    config_.validate();

    report_ = RunReport{};
    report_.requested = descriptors.size();
    in_progress_ = 0;
    peak_in_progress_ = 0;

    std::error_code ec;
    fs::create_directories(config_.output_dir, ec);
    if (ec) {
        throw DownloadError(ErrorKind::FatalSetup,
                            fmt::format("Failed to create download directory: {} - {}",
                                        config_.output_dir.string(), ec.message()));
    }

    ManifestStore manifest(config_.output_dir / kManifestFileName, config_.repository);
    manifest.load();

    std::vector<const Descriptor*> ordered;
    ordered.reserve(descriptors.size());
    for (const auto& descriptor : descriptors) {
        ordered.push_back(&descriptor);
    }
    if (config_.order_largest_first) {
        std::stable_sort(ordered.begin(), ordered.end(), [](const Descriptor* a, const Descriptor* b) {
            return a->size() > b->size();
        });
    }

    std::vector<Scheduled> queue;
    queue.reserve(ordered.size());
    std::vector<JobFailure> rejected;
    std::uint64_t total_bytes = 0;

    for (const Descriptor* descriptor : ordered) {
        fs::path destination;
        try {
            destination = resolveDestination(config_.output_dir, descriptor->key(), config_.strip_prefix);
        } catch (const DownloadError& e) {
            rejected.push_back({descriptor->key(), e.kind(), e.what()});
            continue;
        }

        if (config_.resume && manifest.isSatisfied(*descriptor, destination)) {
            ++report_.skipped;
            continue;
        }

        total_bytes += descriptor->size();
        queue.push_back({descriptor, std::move(destination)});
    }

    progress_.begin(total_bytes, descriptors.size());
    for (std::size_t i = 0; i < report_.skipped; ++i) {
        progress_.jobSkipped();
    }
    report_.completed = report_.skipped;

    for (const auto& failure : rejected) {
        log::get()->warn("Skipping {}: {}", failure.key, failure.message);
        progress_.jobFailed(queue.size() + report_.failed, failure.message);
        recordFailure(failure.key, failure.kind, failure.message);
    }

    log::get()->info("{} of {} objects already downloaded; fetching {} ({}) into {}",
                     report_.skipped, descriptors.size(), queue.size(), formatSize(total_bytes),
                     config_.output_dir.string());

    RangeLimiter limiter(config_.max_range_requests);
    TransferStrategy strategy(transport_, config_, limiter, progress_, cancel_);

    std::atomic<std::size_t> next{0};
    const auto worker = [&] {
        while (!cancel_.isCancelled()) {
            const std::size_t index = next.fetch_add(1);
            if (index >= queue.size()) {
                break;
            }
            runJob(index, queue[index], manifest, strategy);
        }
    };

    const std::size_t worker_count = std::min(config_.max_concurrent, queue.size());
    std::vector<std::thread> pool;
    pool.reserve(worker_count);
    try {
        for (std::size_t i = 0; i < worker_count; ++i) {
            pool.emplace_back(worker);
        }
    } catch (const std::system_error& e) {
        if (pool.empty()) {
            throw DownloadError(ErrorKind::FatalSetup,
                                fmt::format("Cannot start download workers: {}", e.what()));
        }
        log::get()->warn("Started only {} of {} download workers: {}", pool.size(), worker_count, e.what());
    }

    for (auto& thread : pool) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    const std::size_t started = std::min(next.load(), queue.size());
    report_.not_started = queue.size() - started;
    report_.peak_in_progress = peak_in_progress_.load();
    report_.progress = progress_.snapshot();

    if (cancel_.isCancelled()) {
        log::get()->warn("Download interrupted; {} objects were not started", report_.not_started);
    }

    return report_.completed;
}

void DownloadScheduler::runJob(std::size_t job_id, const Scheduled& item, ManifestStore& manifest,
                               TransferStrategy& strategy) {
    const Descriptor& descriptor = *item.descriptor;

    const std::size_t now = ++in_progress_;
    std::size_t peak = peak_in_progress_.load();
    while (now > peak && !peak_in_progress_.compare_exchange_weak(peak, now)) {
    }

    TransferJob job(descriptor, job_id);
    try {
        progress_.jobStarted(job_id, descriptor.key(), descriptor.size());
        // A rewrite must not start while the manifest on disk still lists the key.
        if (manifest.find(descriptor.key()) && !manifest.forget(descriptor.key())) {
            job.fail(ErrorKind::Manifest,
                     fmt::format("cannot remove the manifest entry before rewriting {}",
                                 item.destination.string()));
        } else {
            strategy.execute(job, item.destination);

            if (job.status == JobStatus::Completed) {
                manifest.recordCompleted(descriptor.key(), descriptor.size());
            }
        }
    } catch (const std::exception& e) {
        job.fail(ErrorKind::Filesystem, e.what());
    }

    --in_progress_;

    if (job.status == JobStatus::Completed) {
        progress_.jobCompleted(job_id);
        log::get()->debug("Downloaded {} ({}, {} attempts)", descriptor.key(),
                          formatSize(descriptor.size()), job.attempt_count);
        std::lock_guard<std::mutex> lock(report_mutex_);
        ++report_.completed;
        return;
    }

    progress_.jobFailed(job_id, job.error_message);
    if (job.error != ErrorKind::Cancelled) {
        log::get()->warn("Failed to download {}: {} ({})", descriptor.key(), job.error_message,
                         toString(job.error));
    }
    recordFailure(descriptor.key(), job.error, job.error_message);
}

void DownloadScheduler::recordFailure(const std::string& key, ErrorKind kind, const std::string& message) {
    std::lock_guard<std::mutex> lock(report_mutex_);
    ++report_.failed;
    report_.failures.push_back({key, kind, message});
}

} // namespace geofetch
