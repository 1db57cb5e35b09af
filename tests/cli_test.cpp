#include "geofetch/cli.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

using namespace geofetch;

namespace {

CommandLine parse(std::vector<const char*> args) {
    args.insert(args.begin(), "geofetch");
    return parseCommandLine(static_cast<int>(args.size()), args.data());
}

} // namespace

TEST(CommandLineTest, DefaultsNeedOnlyTheListing) {
    const CommandLine cli = parse({"objects.json"});
    EXPECT_EQ(cli.listing_file.string(), "objects.json");
    EXPECT_EQ(cli.config.max_concurrent, 10U);
    EXPECT_EQ(cli.config.multipart_count, 8U);
    EXPECT_EQ(cli.config.max_attempts, 3);
    EXPECT_TRUE(cli.config.resume);
    EXPECT_FALSE(cli.verbose);
    EXPECT_FALSE(cli.show_help);
}

TEST(CommandLineTest, FlagsFillTheConfig) {
    const CommandLine cli = parse({"-d", "/data/out", "-t", "4", "-m", "0", "-r", "32", "-s", "1048576", "-a",
                                   "5", "-p", "acct/repo", "-n", "acct/repo", "-q", "-v", "--no-resume",
                                   "--largest-first", "objects.json"});
    EXPECT_EQ(cli.config.output_dir.string(), "/data/out");
    EXPECT_EQ(cli.config.max_concurrent, 4U);
    EXPECT_EQ(cli.config.multipart_count, 0U);
    EXPECT_EQ(cli.config.max_range_requests, 32U);
    EXPECT_EQ(cli.config.split_threshold, 1048576U);
    EXPECT_EQ(cli.config.max_attempts, 5);
    EXPECT_EQ(cli.config.strip_prefix, "acct/repo");
    EXPECT_EQ(cli.config.repository, "acct/repo");
    EXPECT_TRUE(cli.config.quiet);
    EXPECT_TRUE(cli.verbose);
    EXPECT_FALSE(cli.config.resume);
    EXPECT_TRUE(cli.config.order_largest_first);
}

TEST(CommandLineTest, AttemptsThatDoNotFitAnIntAreRejected) {
    EXPECT_THROW(parse({"-a", "4294967297", "objects.json"}), std::invalid_argument);
    EXPECT_THROW(parse({"-a", "2147483648", "objects.json"}), std::invalid_argument);
    EXPECT_EQ(parse({"-a", "2147483647", "objects.json"}).config.max_attempts, 2147483647);
}

TEST(CommandLineTest, MalformedNumbersAreRejected) {
    EXPECT_THROW(parse({"-t", "-3", "objects.json"}), std::invalid_argument);
    EXPECT_THROW(parse({"-t", "4x", "objects.json"}), std::invalid_argument);
    EXPECT_THROW(parse({"-s", "99999999999999999999999", "objects.json"}), std::invalid_argument);
    EXPECT_THROW(parse({"-t", "0", "objects.json"}), std::invalid_argument);
}

TEST(CommandLineTest, UsageErrors) {
    EXPECT_THROW(parse({}), std::invalid_argument);
    EXPECT_THROW(parse({"a.json", "b.json"}), std::invalid_argument);
    EXPECT_THROW(parse({"-x", "1", "objects.json"}), std::invalid_argument);
    EXPECT_THROW(parse({"objects.json", "-d"}), std::invalid_argument);
    EXPECT_THROW(parse({"-d"}), std::invalid_argument);
}

TEST(CommandLineTest, HelpStopsParsing) {
    EXPECT_TRUE(parse({"-h"}).show_help);
    EXPECT_TRUE(parse({"-t", "0", "--help"}).show_help);

    std::ostringstream out;
    printUsage(out, "geofetch");
    EXPECT_NE(out.str().find("--largest-first"), std::string::npos);
}
