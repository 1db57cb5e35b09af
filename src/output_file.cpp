#include "geofetch/output_file.hpp"
#include "geofetch/errors.hpp"

#include <cerrno>
#include <cstring>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <sys/types.h>
#include <unistd.h>

namespace geofetch {

namespace fs = std::filesystem;

OutputFile::OutputFile(fs::path path, std::uint64_t size)
    : path_(std::move(path)), size_(size) {
    std::error_code ec;
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
        if (ec) {
            throw DownloadError(ErrorKind::Filesystem,
                                fmt::format("Cannot create directory {}: {}",
                                            path_.parent_path().string(), ec.message()));
        }
    }

    file_.reset(std::fopen(path_.c_str(), "wb+"));
    if (!file_) {
        throw DownloadError(ErrorKind::Filesystem,
                            fmt::format("Cannot create destination file {}: {}",
                                        path_.string(), std::strerror(errno)));
    }

    if (ftruncate(fileno(file_.get()), static_cast<off_t>(size_)) == -1) {
        const int err = errno;
        file_.reset();
        throw DownloadError(ErrorKind::Filesystem,
                            fmt::format("Cannot resize destination file {} to {} bytes: {}",
                                        path_.string(), size_, std::strerror(err)));
    }
}

bool OutputFile::writeAt(std::uint64_t offset, const char* data, std::size_t size) noexcept {
    if (!file_ || offset + size > size_) {
        return false;
    }

    const int fd = fileno(file_.get());
    while (size > 0) {
        const ssize_t written = ::pwrite(fd, data, size, static_cast<off_t>(offset));
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        data += written;
        size -= static_cast<std::size_t>(written);
        offset += static_cast<std::uint64_t>(written);
    }
    return true;
}

bool OutputFile::sync() noexcept {
    return file_ && ::fsync(fileno(file_.get())) == 0;
}

} // namespace geofetch
