#include "geofetch/cancellation.hpp"
#include "geofetch/config.hpp"
#include "geofetch/output_file.hpp"
#include "geofetch/progress.hpp"
#include "geofetch/range_fetcher.hpp"
#include "geofetch/range_limiter.hpp"
#include "geofetch/transfer_job.hpp"

#include "fake_transport.hpp"
#include "temp_dir.hpp"

#include <memory>
#include <thread>

#include <gtest/gtest.h>

using namespace geofetch;
using geofetch::testing::FakeTransport;
using geofetch::testing::TempDir;

namespace {

constexpr const char* kUrl = "https://data.example.org/acct/repo/scene.tif";
constexpr std::uint64_t kSize = 1000;

Part makePart(std::size_t index, std::uint64_t start, std::uint64_t end) {
    Part part;
    part.index = index;
    part.start = start;
    part.end = end;
    return part;
}

} // namespace

class RangeFetcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.backoff_base = std::chrono::milliseconds(1);
        config.backoff_jitter = false;
        transport.addObject(kUrl, kSize);
        file = std::make_unique<OutputFile>(dir.path() / "scene.tif", kSize);
    }

    bool fetch(Part& part, bool ranged = true) {
        RangeFetcher fetcher(transport, config, progress, cancel);
        return fetcher.fetch(kUrl, 0, part, *file, ranged);
    }

    TempDir dir;
    EngineConfig config;
    FakeTransport transport;
    ProgressAggregator progress;
    CancellationToken cancel;
    std::unique_ptr<OutputFile> file;
};

TEST_F(RangeFetcherTest, RangedFetchWritesAtPartOffset) {
    Part part = makePart(1, 250, 499);
    ASSERT_TRUE(fetch(part));
    EXPECT_EQ(part.status, PartStatus::Done);
    EXPECT_EQ(part.bytes_written, 250U);
    EXPECT_EQ(part.attempts, 1);

    const auto requests = transport.requests();
    ASSERT_EQ(requests.size(), 1U);
    ASSERT_TRUE(requests[0].range.has_value());
    EXPECT_EQ(requests[0].range->start, 250U);
    EXPECT_EQ(requests[0].range->end, 499U);
    EXPECT_EQ(progress.snapshot().bytes_transferred, 250U);
}

TEST_F(RangeFetcherTest, WholeObjectFetchSendsNoRange) {
    Part part = makePart(0, 0, kSize - 1);
    ASSERT_TRUE(fetch(part, false));
    file.reset();
    EXPECT_TRUE(FakeTransport::matches(dir.path() / "scene.tif", kUrl, kSize));
    EXPECT_FALSE(transport.requests().at(0).range.has_value());
}

TEST_F(RangeFetcherTest, ServiceUnavailableTwiceThenSuccess) {
    transport.failNext(kUrl, 0, 503, 2);
    Part part = makePart(0, 0, 499);
    ASSERT_TRUE(fetch(part));
    EXPECT_EQ(part.status, PartStatus::Done);
    EXPECT_EQ(part.attempts, 3);
    EXPECT_EQ(transport.requestCount(), 3U);
}

TEST_F(RangeFetcherTest, TooManyRequestsAndDroppedConnectionsAreRetried) {
    transport.failNext(kUrl, 0, 429);
    transport.failNext(kUrl, 0, 0);
    Part part = makePart(0, 0, 99);
    ASSERT_TRUE(fetch(part));
    EXPECT_EQ(part.attempts, 3);
}

TEST_F(RangeFetcherTest, ClientErrorFailsWithoutRetry) {
    transport.failNext(kUrl, 0, 403, 5);
    Part part = makePart(0, 0, 99);
    EXPECT_FALSE(fetch(part));
    EXPECT_EQ(part.status, PartStatus::Failed);
    EXPECT_EQ(part.error, ErrorKind::PermanentHttp);
    EXPECT_EQ(part.attempts, 1);
    EXPECT_EQ(transport.requestCount(), 1U);
}

TEST_F(RangeFetcherTest, GivesUpAfterMaxAttempts) {
    transport.failNext(kUrl, 0, 500, 10);
    Part part = makePart(0, 0, 99);
    EXPECT_FALSE(fetch(part));
    EXPECT_EQ(part.error, ErrorKind::TransientNetwork);
    EXPECT_EQ(part.attempts, config.max_attempts);
    EXPECT_EQ(transport.requestCount(), static_cast<std::size_t>(config.max_attempts));
}

TEST_F(RangeFetcherTest, ShortBodyConsumesAnAttemptAndIsNotDoubleCounted) {
    transport.shortBodyNext(kUrl, 100);
    Part part = makePart(1, 100, 199);
    ASSERT_TRUE(fetch(part));
    EXPECT_EQ(part.attempts, 2);
    EXPECT_EQ(part.bytes_written, 100U);
    EXPECT_EQ(progress.snapshot().bytes_transferred, 100U);
}

TEST_F(RangeFetcherTest, ShortBodyOnEveryAttemptIsSizeMismatch) {
    transport.shortBodyNext(kUrl, 100, 3);
    Part part = makePart(1, 100, 199);
    EXPECT_FALSE(fetch(part));
    EXPECT_EQ(part.error, ErrorKind::SizeMismatch);
    EXPECT_EQ(part.attempts, 3);
}

TEST_F(RangeFetcherTest, IgnoredRangeHeaderIsNotRetried) {
    transport.ignoreRanges(kUrl);
    Part part = makePart(0, 0, 499);
    EXPECT_FALSE(fetch(part));
    EXPECT_EQ(part.error, ErrorKind::RangeNotSupported);
    EXPECT_EQ(part.attempts, 1);
    EXPECT_EQ(part.bytes_written, 0U);
}

TEST_F(RangeFetcherTest, CancelledRunSendsNothing) {
    cancel.cancel();
    Part part = makePart(0, 0, 99);
    EXPECT_FALSE(fetch(part));
    EXPECT_EQ(part.error, ErrorKind::Cancelled);
    EXPECT_EQ(transport.requestCount(), 0U);
}

TEST_F(RangeFetcherTest, CancellationInterruptsBackoff) {
    config.backoff_base = std::chrono::milliseconds(10000);
    transport.failNext(kUrl, 0, 503, 3);

    std::thread canceller([this] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        cancel.cancel();
    });
    const auto started = std::chrono::steady_clock::now();
    Part part = makePart(0, 0, 99);
    EXPECT_FALSE(fetch(part));
    canceller.join();

    EXPECT_EQ(part.error, ErrorKind::Cancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
}

TEST_F(RangeFetcherTest, RangedAttemptsHoldALimiterSlot) {
    RangeLimiter limiter(1);
    ASSERT_TRUE(limiter.acquire(cancel));

    std::thread releaser([&limiter] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        limiter.release();
    });
    RangeFetcher fetcher(transport, config, progress, cancel, &limiter);
    Part part = makePart(0, 0, 99);
    EXPECT_TRUE(fetcher.fetch(kUrl, 0, part, *file, true));
    releaser.join();
    EXPECT_EQ(limiter.inUse(), 0U);
}
