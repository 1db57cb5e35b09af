#include "geofetch/errors.hpp"

namespace geofetch {

const char* toString(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::None:
        return "none";
    case ErrorKind::TransientNetwork:
        return "transient network error";
    case ErrorKind::PermanentHttp:
        return "permanent HTTP error";
    case ErrorKind::SizeMismatch:
        return "size mismatch";
    case ErrorKind::RangeNotSupported:
        return "range not supported";
    case ErrorKind::Filesystem:
        return "filesystem error";
    case ErrorKind::Manifest:
        return "manifest error";
    case ErrorKind::FatalSetup:
        return "fatal setup error";
    case ErrorKind::InvalidDescriptor:
        return "invalid descriptor";
    case ErrorKind::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

bool isRetryable(ErrorKind kind) noexcept {
    return kind == ErrorKind::TransientNetwork || kind == ErrorKind::SizeMismatch;
}

} // namespace geofetch
