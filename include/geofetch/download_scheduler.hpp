#pragma once

#include "config.hpp"
#include "descriptor.hpp"
#include "errors.hpp"
#include "progress.hpp"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace geofetch {

class CancellationToken;
class HttpTransport;
class ManifestStore;
class TransferStrategy;

struct JobFailure {
    std::string key;
    ErrorKind kind{ErrorKind::None};
    std::string message;
};

struct RunReport {
    std::size_t requested{0};
    std::size_t completed{0}; // includes skipped
    std::size_t skipped{0};
    std::size_t failed{0};
    std::size_t not_started{0};
    std::size_t peak_in_progress{0};
    std::vector<JobFailure> failures;
    ProgressSnapshot progress;
};

// Runs a batch of descriptors over a fixed pool of max_concurrent workers,
// consulting and updating the manifest under output_dir.
class DownloadScheduler {
public:
    DownloadScheduler(EngineConfig config,
                      HttpTransport& transport,
                      ProgressAggregator& progress,
                      const CancellationToken& cancel);

    // Returns the number of objects that ended Completed, including those
    // satisfied by the manifest. Throws DownloadError(FatalSetup) when
    // output_dir cannot be created.
    std::size_t run(const std::vector<Descriptor>& descriptors);

    [[nodiscard]] const RunReport& report() const noexcept { return report_; }

private:
    struct Scheduled {
        const Descriptor* descriptor;
        std::filesystem::path destination;
    };

    void runJob(std::size_t job_id, const Scheduled& item, ManifestStore& manifest,
                TransferStrategy& strategy);
    void recordFailure(const std::string& key, ErrorKind kind, const std::string& message);

    EngineConfig config_;
    HttpTransport& transport_;
    ProgressAggregator& progress_;
    const CancellationToken& cancel_;

    std::atomic<std::size_t> in_progress_{0};
    std::atomic<std::size_t> peak_in_progress_{0};
    std::mutex report_mutex_;
    RunReport report_;
};

} // namespace geofetch
