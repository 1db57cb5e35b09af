#include "geofetch/transfer_job.hpp"

#include <algorithm>

namespace geofetch {

const char* toString(JobStatus status) noexcept {
    switch (status) {
    case JobStatus::Pending:
        return "pending";
    case JobStatus::InProgress:
        return "in progress";
    case JobStatus::Completed:
        return "completed";
    case JobStatus::Failed:
        return "failed";
    }
    return "unknown";
}

std::uint64_t TransferJob::bytesWritten() const noexcept {
    std::uint64_t total = 0;
    for (const auto& part : parts) {
        total += part.bytes_written;
    }
    return total;
}

void TransferJob::fail(ErrorKind kind, std::string message) {
    status = JobStatus::Failed;
    if (error == ErrorKind::None) {
        error = kind;
        error_message = std::move(message);
    }
}

std::vector<Part> planParts(std::uint64_t size, std::size_t count) {
    std::vector<Part> parts;
    if (size == 0) {
        return parts;
    }

    count = std::max<std::size_t>(1, count);
    const std::uint64_t part_size = (size + count - 1) / count;
    parts.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const std::uint64_t start = static_cast<std::uint64_t>(i) * part_size;
        if (start >= size) {
            break;
        }

        Part part;
        part.index = i;
        part.start = start;
        part.end = std::min(size, start + part_size) - 1;
        parts.push_back(part);
    }
    return parts;
}

} // namespace geofetch
