#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace geofetch {

// One remote object as produced by the lister.
class Descriptor {
public:
    using Clock = std::chrono::system_clock;

    // Throws DownloadError when the key or URL is empty or the key has a ".." segment.
    Descriptor(std::string key, std::uint64_t size, std::string source_url,
               Clock::time_point last_modified = {});

    [[nodiscard]] const std::string& key() const noexcept { return key_; }
    [[nodiscard]] std::uint64_t size() const noexcept { return size_; }
    [[nodiscard]] const std::string& sourceUrl() const noexcept { return source_url_; }
    [[nodiscard]] Clock::time_point lastModified() const noexcept { return last_modified_; }

private:
    std::string key_;
    std::uint64_t size_;
    std::string source_url_;
    Clock::time_point last_modified_;
};

// Maps a repository key under output_dir. The prefix is removed first when the
// key starts with it. Throws DownloadError(Filesystem) if the result would
// leave output_dir.
[[nodiscard]] std::filesystem::path resolveDestination(const std::filesystem::path& output_dir,
                                                       const std::string& key,
                                                       const std::string& strip_prefix = {});

} // namespace geofetch
