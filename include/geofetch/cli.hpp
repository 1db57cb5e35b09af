#pragma once

#include "config.hpp"

#include <filesystem>
#include <iosfwd>

namespace geofetch {

struct CommandLine {
    EngineConfig config;
    bool verbose{false};
    bool show_help{false};
    std::filesystem::path listing_file;
};

// Parses flags into an EngineConfig and validates it. Throws
// std::invalid_argument on an unknown flag, a missing or out-of-range value,
// or anything other than exactly one listing file.
CommandLine parseCommandLine(int argc, const char* const argv[]);

void printUsage(std::ostream& out, const char* program_name);

} // namespace geofetch
