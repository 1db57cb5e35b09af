#pragma once

#include "logging.hpp"
#include "progress.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <map>
#include <string>
#include <thread>

namespace geofetch {

// Consumes the aggregator's event stream on its own thread and redraws a
// terminal panel of in-flight files and overall totals.
class ProgressRenderer {
public:
    explicit ProgressRenderer(ProgressAggregator& aggregator,
                              std::ostream& out,
                              std::chrono::milliseconds refresh = std::chrono::milliseconds(200));
    ~ProgressRenderer();

    ProgressRenderer(const ProgressRenderer&) = delete;
    ProgressRenderer& operator=(const ProgressRenderer&) = delete;

    // While running, the shared logger is raised to error level so log lines
    // do not land inside the panel; stop() restores the previous level.
    void start();
    // Drains remaining events, draws the final panel and joins the thread.
    void stop();

private:
    struct Row {
        std::string key;
        std::uint64_t size{0};
        std::uint64_t done{0};
    };

    void renderLoop();
    void apply(const ProgressEvent& event);
    [[nodiscard]] std::string buildProgressPanel() const;
    [[nodiscard]] static std::string formatTaskLine(const Row& row);
    void redrawPanel(const std::string& panel);

    ProgressAggregator& aggregator_;
    std::ostream& out_;
    std::chrono::milliseconds refresh_;
    ProgressEventQueue queue_;
    std::map<std::size_t, Row> active_;
    std::size_t previous_lines_{0};
    std::thread thread_;
    spdlog::level::level_enum saved_level_{spdlog::level::info};
};

} // namespace geofetch
