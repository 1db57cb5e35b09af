#include "geofetch/descriptor.hpp"
#include "geofetch/errors.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

#include <fmt/format.h>

namespace geofetch {

namespace fs = std::filesystem;

namespace {

bool hasTraversalSegment(const std::string& key) {
    std::size_t begin = 0;
    while (begin <= key.size()) {
        const std::size_t slash = key.find_first_of("/\\", begin);
        const std::size_t end = (slash == std::string::npos) ? key.size() : slash;
        if (key.compare(begin, end - begin, "..") == 0) {
            return true;
        }
        if (slash == std::string::npos) {
            break;
        }
        begin = slash + 1;
    }
    return false;
}

std::string stripRepositoryPrefix(const std::string& key, std::string prefix) {
    while (!prefix.empty() && prefix.back() == '/') {
        prefix.pop_back();
    }
    if (prefix.empty()) {
        return key;
    }
    if (key.size() > prefix.size() && key.compare(0, prefix.size(), prefix) == 0
        && key[prefix.size()] == '/') {
        return key.substr(prefix.size() + 1);
    }
    return key;
}

} // namespace

Descriptor::Descriptor(std::string key, std::uint64_t size, std::string source_url,
                       Clock::time_point last_modified)
    : key_(std::move(key)),
      size_(size),
      source_url_(std::move(source_url)),
      last_modified_(last_modified) {
    if (key_.empty()) {
        throw DownloadError(ErrorKind::InvalidDescriptor, "Descriptor key is empty");
    }
    if (source_url_.empty()) {
        throw DownloadError(ErrorKind::InvalidDescriptor,
                            fmt::format("Descriptor '{}' has no source URL", key_));
    }
    if (hasTraversalSegment(key_)) {
        throw DownloadError(ErrorKind::Filesystem,
                            fmt::format("Key '{}' contains a '..' segment", key_));
    }
}

fs::path resolveDestination(const fs::path& output_dir, const std::string& key,
                            const std::string& strip_prefix) {
    std::string relative = stripRepositoryPrefix(key, strip_prefix);
    relative.erase(0, relative.find_first_not_of('/'));

    if (relative.empty()) {
        throw DownloadError(ErrorKind::Filesystem,
                            fmt::format("Key '{}' does not name a file", key));
    }
    if (hasTraversalSegment(relative)) {
        throw DownloadError(ErrorKind::Filesystem,
                            fmt::format("Key '{}' contains a '..' segment", key));
    }

    const fs::path rel{relative};
    if (rel.has_root_path()) {
        throw DownloadError(ErrorKind::Filesystem,
                            fmt::format("Key '{}' is an absolute path", key));
    }

    std::error_code ec;
    fs::path root = fs::absolute(output_dir, ec);
    if (ec) {
        throw DownloadError(ErrorKind::Filesystem,
                            fmt::format("Cannot resolve {}: {}", output_dir.string(), ec.message()));
    }
    root = root.lexically_normal();
    if (!root.has_filename() && root.has_relative_path()) {
        root = root.parent_path();
    }
    const fs::path candidate = (root / rel).lexically_normal();

    const auto [root_it, candidate_it] =
        std::mismatch(root.begin(), root.end(), candidate.begin(), candidate.end());
    if (root_it != root.end() || candidate_it == candidate.end()) {
        throw DownloadError(ErrorKind::Filesystem,
                            fmt::format("Key '{}' resolves outside {}", key, output_dir.string()));
    }

    return candidate;
}

} // namespace geofetch
