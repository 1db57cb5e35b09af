#include "geofetch/cancellation.hpp"
#include "geofetch/cli.hpp"
#include "geofetch/config.hpp"
#include "geofetch/curl_transport.hpp"
#include "geofetch/download_scheduler.hpp"
#include "geofetch/listing.hpp"
#include "geofetch/logging.hpp"
#include "geofetch/progress.hpp"
#include "geofetch/progress_renderer.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

namespace {

geofetch::CancellationToken* g_cancel = nullptr;

extern "C" void onInterrupt(int) {
    if (g_cancel) {
        g_cancel->cancel();
    }
}

} // namespace

int main(int argc, char** argv) {
    geofetch::CancellationToken cancel;
    geofetch::CommandLine cli;
    try {
        cli = geofetch::parseCommandLine(argc, argv);
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << std::endl;
        geofetch::printUsage(std::cerr, argv[0]);
        return 1;
    }
    if (cli.show_help) {
        geofetch::printUsage(std::cerr, argv[0]);
        return 0;
    }
    const geofetch::EngineConfig& config = cli.config;
    const bool verbose = cli.verbose;
    const std::filesystem::path& listing_file = cli.listing_file;

    geofetch::log::init(config.quiet ? spdlog::level::err
                                     : (verbose ? spdlog::level::debug : spdlog::level::info));
    auto logger = geofetch::log::get();

    try {
        const auto listing = geofetch::readListing(listing_file);
        for (const auto& message : listing.rejected) {
            logger->warn("Ignoring listing {}", message);
        }
        if (listing.descriptors.empty()) {
            logger->warn("No files to download");
            return listing.rejected.empty() ? 0 : 2;
        }

        g_cancel = &cancel;
        std::signal(SIGINT, onInterrupt);
        std::signal(SIGTERM, onInterrupt);

        geofetch::CurlTransport transport;
        geofetch::ProgressAggregator progress;
        std::unique_ptr<geofetch::ProgressRenderer> renderer;
        if (!config.quiet) {
            renderer = std::make_unique<geofetch::ProgressRenderer>(progress, std::cout);
            renderer->start();
        }

        geofetch::DownloadScheduler scheduler(config, transport, progress, cancel);
        const std::size_t successful = scheduler.run(listing.descriptors);
        if (renderer) {
            renderer->stop();
        }
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
        g_cancel = nullptr;

        const auto& report = scheduler.report();
        std::cout << fmt::format("Successfully downloaded {} of {} files ({} already present, {} transferred in {})",
                                 successful, report.requested, report.skipped,
                                 geofetch::formatSize(report.progress.bytes_transferred),
                                 geofetch::formatDuration(std::chrono::duration_cast<std::chrono::seconds>(
                                     report.progress.elapsed)))
                  << std::endl;

        if (report.failed > 0) {
            std::cerr << fmt::format("Failed to download {} files", report.failed) << std::endl;
            if (!config.quiet) {
                for (const auto& failure : report.failures) {
                    std::cerr << fmt::format("  {}: {} ({})", failure.key, failure.message,
                                             geofetch::toString(failure.kind))
                              << std::endl;
                }
            }
        }
        if (report.not_started > 0) {
            std::cerr << fmt::format("Interrupted before starting {} files; run again to resume",
                                     report.not_started)
                      << std::endl;
        }

        if (!listing.rejected.empty()) {
            std::cerr << fmt::format("{} listing entries were not usable", listing.rejected.size()) << std::endl;
        }

        const bool incomplete = report.failed > 0 || report.not_started > 0 || !listing.rejected.empty();
        return incomplete ? 2 : 0;
    } catch (const std::exception& ex) {
        logger->critical("Fatal error: {}", ex.what());
        return 1;
    }
}
