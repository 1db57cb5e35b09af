#include "geofetch/listing.hpp"
#include "geofetch/errors.hpp"

#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <fmt/format.h>

namespace geofetch {

using json = nlohmann::json;

bool parseTimestamp(const std::string& text, Descriptor::Clock::time_point& out) {
    std::tm tm{};
    std::istringstream in(text);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        return false;
    }

    // Fractional seconds and a UTC designator may follow; other offsets are not accepted.
    std::string rest;
    std::getline(in, rest);
    std::size_t pos = 0;
    if (pos < rest.size() && rest[pos] == '.') {
        ++pos;
        while (pos < rest.size() && rest[pos] >= '0' && rest[pos] <= '9') {
            ++pos;
        }
    }
    if (pos < rest.size() && (rest[pos] == 'Z' || rest[pos] == 'z')) {
        ++pos;
    } else if (rest.compare(pos, std::string::npos, "+00:00") == 0) {
        pos = rest.size();
    }
    if (pos != rest.size()) {
        return false;
    }

    const std::time_t seconds = timegm(&tm);
    if (seconds == static_cast<std::time_t>(-1)) {
        return false;
    }
    out = Descriptor::Clock::from_time_t(seconds);
    return true;
}

Listing parseListing(const json& document) {
    const json* objects = &document;
    if (document.is_object() && document.contains("objects")) {
        objects = &document["objects"];
    }
    if (!objects->is_array()) {
        throw std::runtime_error("Listing must be an array of objects or {\"objects\": [...]}");
    }

    Listing listing;
    listing.descriptors.reserve(objects->size());

    std::size_t index = 0;
    for (const auto& item : *objects) {
        const std::size_t position = index++;
        try {
            if (!item.is_object()) {
                throw DownloadError(ErrorKind::InvalidDescriptor, "entry is not an object");
            }

            const std::string key = item.value("key", std::string{});
            std::string url = item.value("download_url", std::string{});
            if (url.empty()) {
                url = item.value("source_url", std::string{});
            }

            const auto size = item.find("size");
            if (size == item.end() || !size->is_number_unsigned()) {
                throw DownloadError(ErrorKind::InvalidDescriptor,
                                    fmt::format("'{}' has no non-negative integer size", key));
            }

            Descriptor::Clock::time_point modified{};
            const std::string stamp = item.value("last_modified", std::string{});
            if (!stamp.empty() && !parseTimestamp(stamp, modified)) {
                throw DownloadError(ErrorKind::InvalidDescriptor,
                                    fmt::format("'{}' has an unreadable last_modified '{}'", key, stamp));
            }

            listing.descriptors.emplace_back(key, size->get<std::uint64_t>(), url, modified);
        } catch (const DownloadError& e) {
            listing.rejected.push_back(fmt::format("entry {}: {}", position, e.what()));
        } catch (const json::exception& e) {
            listing.rejected.push_back(fmt::format("entry {}: {}", position, e.what()));
        }
    }

    return listing;
}

Listing readListing(const std::filesystem::path& file) {
    std::ifstream in(file);
    if (!in.is_open()) {
        throw std::runtime_error(fmt::format("Cannot open listing {}", file.string()));
    }

    json document;
    try {
        document = json::parse(in);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(fmt::format("Listing {} is not valid JSON: {}", file.string(), e.what()));
    }
    return parseListing(document);
}

} // namespace geofetch
