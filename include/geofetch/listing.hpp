#pragma once

#include "descriptor.hpp"

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace geofetch {

struct Listing {
    std::vector<Descriptor> descriptors;
    std::vector<std::string> rejected; // one message per entry left out
};

// Accepts an array of objects or {"objects": [...]}; each object carries
// key, size, download_url (or source_url) and optionally last_modified.
[[nodiscard]] Listing parseListing(const nlohmann::json& document);

// Throws std::runtime_error when the file cannot be read or is not JSON.
[[nodiscard]] Listing readListing(const std::filesystem::path& file);

// Parses "YYYY-MM-DDTHH:MM:SS" with optional fraction and "Z" as UTC.
[[nodiscard]] bool parseTimestamp(const std::string& text, Descriptor::Clock::time_point& out);

} // namespace geofetch
