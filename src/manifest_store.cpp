#include "geofetch/manifest_store.hpp"
#include "geofetch/descriptor.hpp"
#include "geofetch/errors.hpp"
#include "geofetch/logging.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <memory>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <unistd.h>

namespace geofetch {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

struct FileDeleter {
    void operator()(FILE* fp) const noexcept {
        if (fp) {
            std::fclose(fp);
        }
    }
};

void writeDurably(const fs::path& path, const std::string& text) {
    std::unique_ptr<FILE, FileDeleter> out{std::fopen(path.c_str(), "wb")};
    if (!out) {
        throw DownloadError(ErrorKind::Manifest,
                            fmt::format("cannot create {}: {}", path.string(), std::strerror(errno)));
    }
    if (std::fwrite(text.data(), 1, text.size(), out.get()) != text.size()
        || std::fflush(out.get()) != 0
        || ::fsync(fileno(out.get())) != 0) {
        throw DownloadError(ErrorKind::Manifest,
                            fmt::format("cannot write {}: {}", path.string(), std::strerror(errno)));
    }
}

} // namespace

ManifestStore::ManifestStore(fs::path file, std::string repository)
    : file_(std::move(file)), repository_(std::move(repository)) {}

bool ManifestStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();

    std::error_code ec;
    if (!fs::exists(file_, ec)) {
        return true;
    }

    try {
        std::ifstream in(file_);
        if (!in.is_open()) {
            throw DownloadError(ErrorKind::Manifest, "cannot open file");
        }

        const json doc = json::parse(in);
        if (!doc.is_object() || !doc.contains("downloaded") || !doc["downloaded"].is_array()) {
            throw DownloadError(ErrorKind::Manifest, "missing \"downloaded\" list");
        }

        const std::string recorded_repository = doc.value("repository", std::string{});
        if (!repository_.empty() && !recorded_repository.empty() && recorded_repository != repository_) {
            log::get()->warn("Manifest {} belongs to repository '{}', not '{}'; ignoring it",
                             file_.string(), recorded_repository, repository_);
            return true;
        }

        const json sizes = doc.value("sizes", json::object());
        for (const auto& item : doc["downloaded"]) {
            if (!item.is_string()) {
                continue;
            }
            ManifestEntry entry;
            entry.key = item.get<std::string>();
            entry.completed = true;
            const auto size = sizes.find(entry.key);
            if (size != sizes.end() && size->is_number_unsigned()) {
                entry.size = size->get<std::uint64_t>();
            }
            entries_[entry.key] = entry;
        }
    } catch (const json::exception& e) {
        entries_.clear();
        log::get()->warn("Manifest {} is corrupt ({}); downloading everything again", file_.string(), e.what());
        return false;
    } catch (const DownloadError& e) {
        entries_.clear();
        log::get()->warn("Manifest {} is unreadable ({}); downloading everything again", file_.string(), e.what());
        return false;
    }

    log::get()->info("Loaded {} completed entries from {}", entries_.size(), file_.string());
    return true;
}

std::optional<ManifestEntry> ManifestStore::find(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ManifestStore::isSatisfied(const Descriptor& descriptor, const fs::path& destination) const {
    const auto entry = find(descriptor.key());
    if (!entry || !entry->completed) {
        return false;
    }
    // A recorded size of 0 predates size tracking; rely on the file check alone.
    if (entry->size != 0 && entry->size != descriptor.size()) {
        return false;
    }

    std::error_code ec;
    if (!fs::is_regular_file(destination, ec)) {
        return false;
    }
    const auto on_disk = fs::file_size(destination, ec);
    return !ec && on_disk == descriptor.size();
}

bool ManifestStore::recordCompleted(const std::string& key, std::uint64_t size) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key] = ManifestEntry{key, size, true};
    return persistLocked();
}

bool ManifestStore::forget(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.erase(key) == 0) {
        return true;
    }
    return persistLocked();
}

std::size_t ManifestStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

bool ManifestStore::persistLocked() const {
    json doc;
    doc["repository"] = repository_;
    doc["downloaded"] = json::array();
    doc["sizes"] = json::object();
    for (const auto& [key, entry] : entries_) {
        if (!entry.completed) {
            continue;
        }
        doc["downloaded"].push_back(key);
        doc["sizes"][key] = entry.size;
    }

    const fs::path tmp = fs::path(file_.string() + ".tmp");
    try {
        writeDurably(tmp, doc.dump(2));
    } catch (const DownloadError& e) {
        log::get()->warn("Cannot update manifest: {}", e.what());
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return false;
    }

    std::error_code ec;
    fs::rename(tmp, file_, ec);
    if (ec) {
        log::get()->warn("Cannot replace manifest {}: {}", file_.string(), ec.message());
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

} // namespace geofetch
