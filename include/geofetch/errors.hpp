#pragma once

#include <stdexcept>
#include <string>

namespace geofetch {

enum class ErrorKind {
    None,
    TransientNetwork,
    PermanentHttp,
    SizeMismatch,
    RangeNotSupported,
    Filesystem,
    Manifest,
    FatalSetup,
    InvalidDescriptor,
    Cancelled
};

[[nodiscard]] const char* toString(ErrorKind kind) noexcept;

// Only transient failures consume another attempt.
[[nodiscard]] bool isRetryable(ErrorKind kind) noexcept;

class DownloadError : public std::runtime_error {
public:
    DownloadError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace geofetch
