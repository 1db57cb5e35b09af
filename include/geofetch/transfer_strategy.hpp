#pragma once

#include "config.hpp"

#include <cstdint>
#include <filesystem>

namespace geofetch {

class CancellationToken;
class HttpTransport;
class OutputFile;
class ProgressAggregator;
class RangeLimiter;
struct TransferJob;

// Decides between a single streamed GET and an N-way ranged transfer for one
// object, runs it, and settles the job's final status.
class TransferStrategy {
public:
    TransferStrategy(HttpTransport& transport,
                     const EngineConfig& config,
                     RangeLimiter& limiter,
                     ProgressAggregator& progress,
                     const CancellationToken& cancel);

    [[nodiscard]] bool useMultipart(std::uint64_t size) const noexcept;

    // Leaves job.status Completed or Failed. A failed job keeps its partially
    // written file.
    void execute(TransferJob& job, const std::filesystem::path& destination);

private:
    void runSingle(TransferJob& job, OutputFile& file);
    void runMultipart(TransferJob& job, OutputFile& file);
    void settle(TransferJob& job, OutputFile& file);

    HttpTransport& transport_;
    const EngineConfig& config_;
    RangeLimiter& limiter_;
    ProgressAggregator& progress_;
    const CancellationToken& cancel_;
};

} // namespace geofetch
