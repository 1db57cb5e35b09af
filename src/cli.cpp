#include "geofetch/cli.hpp"

#include <cstddef>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

namespace geofetch {

namespace {

unsigned long long parseNumber(const std::string& option, const std::string& text,
                               unsigned long long max = std::numeric_limits<unsigned long long>::max()) {
    unsigned long long value = 0;
    try {
        std::size_t consumed = 0;
        value = std::stoull(text, &consumed);
        if (consumed != text.size() || text.front() == '-') {
            throw std::invalid_argument(text);
        }
    } catch (const std::exception&) {
        throw std::invalid_argument(fmt::format("Invalid value for {}: {}", option, text));
    }
    if (value > max) {
        throw std::invalid_argument(fmt::format("Value for {} is too large: {} (at most {})", option, text, max));
    }
    return value;
}

} // namespace

CommandLine parseCommandLine(int argc, const char* const argv[]) {
    CommandLine cli;
    cli.config.output_dir = std::filesystem::current_path();

    int arg_index = 1;
    while (arg_index < argc && argv[arg_index][0] == '-') {
        const std::string option = argv[arg_index];

        if (option == "-h" || option == "--help") {
            cli.show_help = true;
            return cli;
        } else if (option == "-q") {
            cli.config.quiet = true;
            ++arg_index;
            continue;
        } else if (option == "-v") {
            cli.verbose = true;
            ++arg_index;
            continue;
        } else if (option == "--no-resume") {
            cli.config.resume = false;
            ++arg_index;
            continue;
        } else if (option == "--largest-first") {
            cli.config.order_largest_first = true;
            ++arg_index;
            continue;
        }

        if (arg_index + 1 >= argc) {
            throw std::invalid_argument(fmt::format("Missing value for {}", option));
        }
        const std::string value = argv[arg_index + 1];

        if (option == "-d") {
            cli.config.output_dir = value;
        } else if (option == "-t") {
            cli.config.max_concurrent = parseNumber(option, value, std::numeric_limits<std::size_t>::max());
        } else if (option == "-m") {
            cli.config.multipart_count = parseNumber(option, value, std::numeric_limits<std::size_t>::max());
        } else if (option == "-r") {
            cli.config.max_range_requests = parseNumber(option, value, std::numeric_limits<std::size_t>::max());
        } else if (option == "-s") {
            cli.config.split_threshold = parseNumber(option, value);
        } else if (option == "-a") {
            cli.config.max_attempts =
                static_cast<int>(parseNumber(option, value, std::numeric_limits<int>::max()));
        } else if (option == "-p") {
            cli.config.strip_prefix = value;
        } else if (option == "-n") {
            cli.config.repository = value;
        } else {
            throw std::invalid_argument(fmt::format("Unknown option: {}", option));
        }
        arg_index += 2;
    }

    if (argc - arg_index != 1) {
        throw std::invalid_argument("Expected exactly one listing file");
    }
    cli.listing_file = argv[arg_index];
    cli.config.validate();
    return cli;
}

void printUsage(std::ostream& out, const char* program_name) {
    out << "Usage: " << program_name << " [options] <listing.json>" << std::endl;
    out << "Options:\n"
        << "  -d <directory>   Download directory (default: current directory)\n"
        << "  -t <jobs>        Concurrent object downloads (default: 10)\n"
        << "  -m <parts>       Parts per large object, 0 disables splitting (default: 8)\n"
        << "  -r <requests>    Concurrent range requests across all objects (default: 16)\n"
        << "  -s <bytes>       Objects up to this size are fetched whole (default: 10485760)\n"
        << "  -a <attempts>    Attempts per request before giving up (default: 3)\n"
        << "  -p <prefix>      Repository prefix stripped from keys\n"
        << "  -n <name>        Repository name recorded in the manifest\n"
        << "  -q               Quiet: no progress panel, errors only\n"
        << "  -v               Verbose logging\n"
        << "  --no-resume      Download everything, ignoring the manifest\n"
        << "  --largest-first  Start the largest objects first\n"
        << "  -h, --help       Show this message" << std::endl;
}

} // namespace geofetch
