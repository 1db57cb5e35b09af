#include "geofetch/progress_renderer.hpp"

#include <algorithm>
#include <filesystem>
#include <ostream>
#include <system_error>

#include <fmt/format.h>

namespace geofetch {

namespace {

constexpr std::size_t kMaxRows = 12;

} // namespace

ProgressRenderer::ProgressRenderer(ProgressAggregator& aggregator,
                                   std::ostream& out,
                                   std::chrono::milliseconds refresh)
    : aggregator_(aggregator), out_(out), refresh_(refresh) {}

ProgressRenderer::~ProgressRenderer() { stop(); }

void ProgressRenderer::start() {
    if (thread_.joinable()) {
        return;
    }
    aggregator_.attach(&queue_);
    try {
        thread_ = std::thread([this] { renderLoop(); });
    } catch (const std::system_error&) {
        aggregator_.attach(nullptr);
        throw;
    }

    auto logger = log::get();
    saved_level_ = logger->level();
    if (saved_level_ < spdlog::level::err) {
        logger->set_level(spdlog::level::err);
    }
}

void ProgressRenderer::stop() {
    if (!thread_.joinable()) {
        return;
    }
    aggregator_.attach(nullptr);
    queue_.close();
    thread_.join();
    log::get()->set_level(saved_level_);
}

void ProgressRenderer::renderLoop() {
    auto next_draw = std::chrono::steady_clock::now();
    while (true) {
        const auto event = queue_.pop(refresh_);
        if (event) {
            apply(*event);
        } else if (queue_.closed()) {
            break;
        }

        const auto now = std::chrono::steady_clock::now();
        if (now >= next_draw) {
            redrawPanel(buildProgressPanel());
            next_draw = now + refresh_;
        }
    }

    redrawPanel(buildProgressPanel());
    out_ << std::flush;
}

void ProgressRenderer::apply(const ProgressEvent& event) {
    switch (event.type) {
    case ProgressEvent::Type::JobStarted:
        active_[event.job_id] = Row{event.text, event.bytes, 0};
        break;
    case ProgressEvent::Type::Bytes: {
        auto it = active_.find(event.job_id);
        if (it != active_.end()) {
            it->second.done += event.bytes;
        }
        break;
    }
    case ProgressEvent::Type::BytesDiscarded: {
        auto it = active_.find(event.job_id);
        if (it != active_.end()) {
            it->second.done -= std::min(it->second.done, event.bytes);
        }
        break;
    }
    case ProgressEvent::Type::JobCompleted:
        active_.erase(event.job_id);
        break;
    case ProgressEvent::Type::JobFailed: {
        auto it = active_.find(event.job_id);
        if (it != active_.end()) {
            if (previous_lines_ > 0) {
                out_ << "\033[" << previous_lines_ << "F\033[J";
                previous_lines_ = 0;
            }
            out_ << fmt::format("✗ {}: {}\n", it->second.key, event.text);
            active_.erase(it);
        }
        break;
    }
    }
}

std::string ProgressRenderer::buildProgressPanel() const {
    const auto snap = aggregator_.snapshot();

    std::string panel;
    panel.reserve(kMaxRows * 128 + 256);
    panel.append("==================================================\n");
    panel += fmt::format("Downloading {} files ({} in flight)\n", snap.total_files, active_.size());
    panel.append("--------------------------------------------------\n");

    std::size_t shown = 0;
    for (const auto& [id, row] : active_) {
        if (shown++ == kMaxRows) {
            panel += fmt::format("... and {} more\n", active_.size() - kMaxRows);
            break;
        }
        panel += formatTaskLine(row);
        panel.push_back('\n');
    }

    panel.append("--------------------------------------------------\n");
    const std::size_t finished = snap.files_completed + snap.files_failed + snap.files_skipped;
    if (snap.total_bytes > 0) {
        const double ratio = static_cast<double>(snap.bytes_transferred) /
                             static_cast<double>(snap.total_bytes);
        panel += fmt::format("Overall: {:>3}% {}/{} • {}/s • ETA {} • files {}/{}",
                             static_cast<int>(std::min(ratio, 1.0) * 100.0),
                             formatSize(snap.bytes_transferred),
                             formatSize(snap.total_bytes),
                             formatSize(static_cast<std::uint64_t>(snap.bytes_per_second)),
                             snap.eta ? formatDuration(*snap.eta) : std::string("--:--"),
                             finished,
                             snap.total_files);
    } else {
        panel += fmt::format("Overall: N/A • files {}/{}", finished, snap.total_files);
    }
    if (snap.files_failed > 0) {
        panel += fmt::format(" ({} failed)", snap.files_failed);
    }
    panel.push_back('\n');
    panel.append("==================================================\n");

    return panel;
}

std::string ProgressRenderer::formatTaskLine(const Row& row) {
    std::string display_name = std::filesystem::path{row.key}.filename().string();
    if (display_name.empty()) {
        display_name = row.key;
    }
    if (display_name.size() > 24) {
        display_name = display_name.substr(0, 24);
    }

    if (row.size == 0) {
        return fmt::format("{:<24} [Initializing...]", display_name);
    }

    const double ratio = std::min(1.0, static_cast<double>(row.done) / static_cast<double>(row.size));
    constexpr int bar_width = 30;
    const int bar_pos = static_cast<int>(ratio * bar_width);

    std::string bar;
    bar.reserve(static_cast<std::size_t>(bar_width) * 3);
    for (int i = 0; i < bar_width; ++i) {
        bar += (i < bar_pos) ? "█" : "░";
    }

    return fmt::format("{:<24} [{}] {:>3}% ({}/{})",
                       display_name,
                       bar,
                       static_cast<int>(ratio * 100.0),
                       formatSize(row.done),
                       formatSize(row.size));
}

void ProgressRenderer::redrawPanel(const std::string& panel) {
    const std::size_t current_lines = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previous_lines_ > 0) {
        out_ << "\033[" << previous_lines_ << "F\033[J";
    }
    out_ << panel;
    previous_lines_ = current_lines;
}

} // namespace geofetch
