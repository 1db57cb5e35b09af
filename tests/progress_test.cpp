#include "geofetch/logging.hpp"
#include "geofetch/progress.hpp"
#include "geofetch/progress_renderer.hpp"

#include <sstream>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

using namespace geofetch;

TEST(ProgressAggregatorTest, ConcurrentUpdatesAreNotLost) {
    ProgressAggregator progress;
    progress.begin(8 * 1000 * 512, 8);

    std::vector<std::thread> threads;
    for (std::size_t t = 0; t < 8; ++t) {
        threads.emplace_back([&progress, t] {
            for (int i = 0; i < 1000; ++i) {
                progress.addBytes(t, 512);
            }
            progress.jobCompleted(t);
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    const auto snap = progress.snapshot();
    EXPECT_EQ(snap.bytes_transferred, 8U * 1000 * 512);
    EXPECT_EQ(snap.total_bytes, snap.bytes_transferred);
    EXPECT_EQ(snap.files_completed, 8U);
    EXPECT_EQ(snap.files_failed, 0U);
}

TEST(ProgressAggregatorTest, DiscardedBytesAreWithdrawn) {
    ProgressAggregator progress;
    progress.begin(100, 1);
    progress.addBytes(0, 60);
    progress.discardBytes(0, 60);
    progress.addBytes(0, 100);
    progress.jobFailed(0, "boom");
    progress.jobSkipped();

    const auto snap = progress.snapshot();
    EXPECT_EQ(snap.bytes_transferred, 100U);
    EXPECT_EQ(snap.files_failed, 1U);
    EXPECT_EQ(snap.files_skipped, 1U);
}

TEST(ProgressAggregatorTest, PublishesEventsOnlyWhileAttached) {
    ProgressAggregator progress;
    ProgressEventQueue queue;

    progress.addBytes(1, 10);
    progress.attach(&queue);
    progress.jobStarted(1, "a/b.tif", 20);
    progress.addBytes(1, 10);
    progress.attach(nullptr);
    progress.jobCompleted(1);

    const auto started = queue.pop(std::chrono::milliseconds(0));
    ASSERT_TRUE(started.has_value());
    EXPECT_EQ(started->type, ProgressEvent::Type::JobStarted);
    EXPECT_EQ(started->text, "a/b.tif");
    EXPECT_EQ(started->bytes, 20U);

    const auto bytes = queue.pop(std::chrono::milliseconds(0));
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(bytes->type, ProgressEvent::Type::Bytes);

    EXPECT_FALSE(queue.pop(std::chrono::milliseconds(0)).has_value());
    EXPECT_EQ(progress.snapshot().bytes_transferred, 20U);
}

TEST(ProgressRendererTest, DrawsPanelFromEventStream) {
    ProgressAggregator progress;
    progress.begin(2048, 2);

    std::ostringstream out;
    {
        ProgressRenderer renderer(progress, out, std::chrono::milliseconds(5));
        renderer.start();
        progress.jobStarted(0, "scenes/tile_0001.tif", 1024);
        progress.addBytes(0, 1024);
        progress.jobCompleted(0);
        progress.jobStarted(1, "scenes/tile_0002.tif", 1024);
        progress.jobFailed(1, "HTTP 404");
        renderer.stop();
    }

    const std::string text = out.str();
    EXPECT_NE(text.find("Overall:"), std::string::npos);
    EXPECT_NE(text.find("scenes/tile_0002.tif: HTTP 404"), std::string::npos);
    EXPECT_NE(text.find("(1 failed)"), std::string::npos);
}

TEST(ProgressRendererTest, HoldsBackLogOutputWhileDrawing) {
    log::init(spdlog::level::info);
    ProgressAggregator progress;
    std::ostringstream out;

    ProgressRenderer renderer(progress, out, std::chrono::milliseconds(5));
    renderer.start();
    EXPECT_EQ(log::get()->level(), spdlog::level::err);
    renderer.stop();
    EXPECT_EQ(log::get()->level(), spdlog::level::info);
}

TEST(FormatTest, HumanReadableSizes) {
    EXPECT_EQ(formatSize(512), "512 B");
    EXPECT_EQ(formatSize(1536), "1.5 KB");
    EXPECT_EQ(formatSize(5ULL * 1024 * 1024), "5.0 MB");
    EXPECT_EQ(formatSize(3ULL * 1024 * 1024 * 1024), "3.00 GB");
    EXPECT_EQ(formatDuration(std::chrono::seconds(75)), "01:15");
    EXPECT_EQ(formatDuration(std::chrono::seconds(3725)), "1:02:05");
}
