#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace geofetch {

struct EngineConfig {
    std::filesystem::path output_dir{"."};
    std::string repository;
    std::string strip_prefix;

    std::size_t max_concurrent{10};
    std::size_t multipart_count{8};
    std::size_t max_range_requests{16};
    std::uint64_t split_threshold{10ULL * 1024 * 1024};

    int max_attempts{3};
    std::chrono::milliseconds backoff_base{1000};
    bool backoff_jitter{true};

    std::chrono::seconds connect_timeout{30};
    std::chrono::seconds low_speed_time{60};

    bool quiet{false};
    bool resume{true};
    bool order_largest_first{false};

    // Throws std::invalid_argument naming the first offending field.
    void validate() const;
};

inline constexpr const char* kManifestFileName = ".download_manifest.json";

} // namespace geofetch
