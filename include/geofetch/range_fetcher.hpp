#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "http_transport.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <random>
#include <string>

namespace geofetch {

class CancellationToken;
class OutputFile;
class ProgressAggregator;
class RangeLimiter;
struct Part;

struct RetryPolicy {
    int max_attempts{3};
    std::chrono::milliseconds base{1000};
    bool jitter{true};

    // Delay before the attempt following failed attempt `attempt` (1-based):
    // base * 2^(attempt - 1), without jitter.
    [[nodiscard]] std::chrono::milliseconds backoff(int attempt) const;
};

// Runs one part (or the whole object) to completion: GET, write at the part's
// offset, classify the outcome, back off and retry transient failures.
class RangeFetcher {
public:
    RangeFetcher(HttpTransport& transport,
                 const EngineConfig& config,
                 ProgressAggregator& progress,
                 const CancellationToken& cancel,
                 RangeLimiter* limiter = nullptr);

    // `ranged` selects a Range request covering [part.start, part.end]; otherwise
    // the part must span the whole object and a plain GET is sent. Ranged
    // attempts hold a limiter slot while the request is outstanding. Returns
    // true when the part ends Done.
    bool fetch(const std::string& url, std::size_t job_id, Part& part, OutputFile& file, bool ranged);

private:
    struct Attempt {
        ErrorKind error{ErrorKind::None};
        std::string message;
        std::uint64_t written{0};
    };

    [[nodiscard]] Attempt attempt(const std::string& url, std::size_t job_id, const Part& part,
                                  OutputFile& file, bool ranged);
    [[nodiscard]] std::chrono::milliseconds jittered(std::chrono::milliseconds delay);

    HttpTransport& transport_;
    const EngineConfig& config_;
    ProgressAggregator& progress_;
    const CancellationToken& cancel_;
    RangeLimiter* limiter_;
    RetryPolicy policy_;
    std::minstd_rand rng_;
};

} // namespace geofetch
