#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>

namespace geofetch {

// Destination file pre-sized to the object's length. Parts write disjoint
// regions through writeAt(), which needs no locking.
class OutputFile {
public:
    // Creates parent directories, creates or truncates the file and resizes it
    // to `size`. Throws DownloadError(Filesystem).
    OutputFile(std::filesystem::path path, std::uint64_t size);

    OutputFile(const OutputFile&) = delete;
    OutputFile& operator=(const OutputFile&) = delete;

    [[nodiscard]] bool writeAt(std::uint64_t offset, const char* data, std::size_t size) noexcept;
    [[nodiscard]] bool sync() noexcept;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::uint64_t size() const noexcept { return size_; }

private:
    struct FileDeleter {
        void operator()(FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    std::filesystem::path path_;
    std::uint64_t size_;
    std::unique_ptr<FILE, FileDeleter> file_;
};

} // namespace geofetch
