#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace geofetch {

class Descriptor;

struct ManifestEntry {
    std::string key;
    std::uint64_t size{0};
    bool completed{false};
};

// Persisted set of keys whose downloads completed and size-verified.
class ManifestStore {
public:
    ManifestStore(std::filesystem::path file, std::string repository);

    // Reads the manifest file. A missing, unreadable or malformed file leaves
    // the store empty; returns false in the latter two cases.
    bool load();

    [[nodiscard]] std::optional<ManifestEntry> find(const std::string& key) const;

    // True when `descriptor` can be skipped: a completed entry exists, the
    // destination exists and its size equals the descriptor's size.
    [[nodiscard]] bool isSatisfied(const Descriptor& descriptor,
                                   const std::filesystem::path& destination) const;

    // Records the key and rewrites the manifest atomically. Returns false if the
    // file could not be written; the in-memory entry is kept.
    bool recordCompleted(const std::string& key, std::uint64_t size);

    // Drops the key before its file is rewritten, so an interrupted rewrite is
    // never mistaken for a completed download. No-op for unknown keys.
    bool forget(const std::string& key);

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return file_; }
    [[nodiscard]] const std::string& repository() const noexcept { return repository_; }

private:
    bool persistLocked() const;

    std::filesystem::path file_;
    std::string repository_;
    std::map<std::string, ManifestEntry> entries_;
    mutable std::mutex mutex_;
};

} // namespace geofetch
