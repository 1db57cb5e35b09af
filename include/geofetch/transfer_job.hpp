#pragma once

#include "descriptor.hpp"
#include "errors.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace geofetch {

enum class PartStatus { Pending, InProgress, Done, Failed };
enum class JobStatus { Pending, InProgress, Completed, Failed };

[[nodiscard]] const char* toString(JobStatus status) noexcept;

struct Part {
    std::size_t index{0};
    std::uint64_t start{0};
    std::uint64_t end{0}; // inclusive
    PartStatus status{PartStatus::Pending};
    std::uint64_t bytes_written{0};
    int attempts{0};
    ErrorKind error{ErrorKind::None};
    std::string error_message;

    [[nodiscard]] std::uint64_t length() const noexcept { return end - start + 1; }
};

struct TransferJob {
    explicit TransferJob(Descriptor d, std::size_t job_id = 0)
        : descriptor(std::move(d)), id(job_id) {}

    Descriptor descriptor;
    std::size_t id;
    JobStatus status{JobStatus::Pending};
    int attempt_count{0};
    std::vector<Part> parts;
    ErrorKind error{ErrorKind::None};
    std::string error_message;

    [[nodiscard]] std::uint64_t bytesWritten() const noexcept;
    void fail(ErrorKind kind, std::string message);
};

// Splits [0, size) into at most `count` contiguous parts of ceil(size / count)
// bytes; the last part takes the remainder. Empty for size == 0.
[[nodiscard]] std::vector<Part> planParts(std::uint64_t size, std::size_t count);

} // namespace geofetch
