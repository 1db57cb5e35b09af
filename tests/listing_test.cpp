#include "geofetch/listing.hpp"

#include "temp_dir.hpp"

#include <fstream>
#include <stdexcept>

#include <gtest/gtest.h>

using namespace geofetch;
using nlohmann::json;

TEST(ListingTest, ParsesLoaderOutput) {
    const json doc = json::parse(R"([
        {"key": "acct/repo/a.tif", "size": 5242880, "last_modified": "2025-03-01T12:30:00Z",
         "download_url": "https://data.example.org/acct/repo/a.tif"},
        {"key": "acct/repo/b.tif", "size": 0, "source_url": "https://data.example.org/acct/repo/b.tif"}
    ])");

    const Listing listing = parseListing(doc);
    ASSERT_EQ(listing.descriptors.size(), 2U);
    EXPECT_TRUE(listing.rejected.empty());
    EXPECT_EQ(listing.descriptors[0].key(), "acct/repo/a.tif");
    EXPECT_EQ(listing.descriptors[0].size(), 5242880U);
    EXPECT_EQ(listing.descriptors[0].sourceUrl(), "https://data.example.org/acct/repo/a.tif");
    EXPECT_EQ(Descriptor::Clock::to_time_t(listing.descriptors[0].lastModified()), 1740832200);
    EXPECT_EQ(listing.descriptors[1].sourceUrl(), "https://data.example.org/acct/repo/b.tif");
}

TEST(ListingTest, AcceptsObjectsWrapperAndRejectsBadEntries) {
    const json doc = json::parse(R"({"objects": [
        {"key": "ok.tif", "size": 1, "download_url": "http://h/ok.tif"},
        {"key": "../up.tif", "size": 1, "download_url": "http://h/up.tif"},
        {"key": "neg.tif", "size": -4, "download_url": "http://h/neg.tif"},
        {"key": "nosize.tif", "download_url": "http://h/nosize.tif"},
        {"key": "nourl.tif", "size": 3},
        {"key": "when.tif", "size": 3, "download_url": "http://h/when.tif", "last_modified": "yesterday"},
        "not an object"
    ]})");

    const Listing listing = parseListing(doc);
    ASSERT_EQ(listing.descriptors.size(), 1U);
    EXPECT_EQ(listing.descriptors[0].key(), "ok.tif");
    EXPECT_EQ(listing.rejected.size(), 6U);
}

TEST(ListingTest, ParsesFractionalTimestamps) {
    Descriptor::Clock::time_point when;
    ASSERT_TRUE(parseTimestamp("2024-01-02T03:04:05.123Z", when));
    EXPECT_EQ(Descriptor::Clock::to_time_t(when), 1704164645);
    EXPECT_TRUE(parseTimestamp("2024-01-02T03:04:05+00:00", when));
    EXPECT_TRUE(parseTimestamp("2024-01-02T03:04:05", when));
    EXPECT_FALSE(parseTimestamp("2024-01-02T03:04:05+02:00", when));
    EXPECT_FALSE(parseTimestamp("02/01/2024", when));
}

TEST(ListingTest, ReadListingReportsUnreadableFiles) {
    geofetch::testing::TempDir dir;
    EXPECT_THROW((void)readListing(dir.path() / "missing.json"), std::runtime_error);

    const auto bad = dir.path() / "bad.json";
    std::ofstream(bad) << "{ not json";
    EXPECT_THROW((void)readListing(bad), std::runtime_error);

    const auto good = dir.path() / "good.json";
    std::ofstream(good) << R"([{"key": "a", "size": 2, "download_url": "http://h/a"}])";
    EXPECT_EQ(readListing(good).descriptors.size(), 1U);
}
