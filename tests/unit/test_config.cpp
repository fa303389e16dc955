/**
 * @file test_config.cpp
 * @brief Unit tests for daemon configuration and CLI parsing
 *
 * Tests cover:
 * - Default configuration values
 * - CLI argument parsing for every option
 * - Range and format validation
 */

#include <gtest/gtest.h>
#include <dmsd/daemon/config.hpp>

#include <string>
#include <vector>

using namespace dmsd::daemon;

class ConfigTest : public ::testing::Test {
protected:
    // Helper to create argc/argv from vector of strings
    std::pair<int, std::vector<char*>> makeArgs(const std::vector<std::string>& args) {
        argv_storage_.clear();
        argv_storage_.reserve(args.size());

        for (const auto& arg : args) {
            argv_storage_.push_back(std::vector<char>(arg.begin(), arg.end()));
            argv_storage_.back().push_back('\0');
        }

        argv_ptrs_.clear();
        for (auto& storage : argv_storage_) {
            argv_ptrs_.push_back(storage.data());
        }

        return {static_cast<int>(argv_ptrs_.size()), argv_ptrs_};
    }

    Config parse(const std::vector<std::string>& args) {
        auto [argc, argv] = makeArgs(args);
        testing::internal::CaptureStderr();
        Config config = parseArgs(argc, argv.data());
        lastError_ = testing::internal::GetCapturedStderr();
        return config;
    }

    std::string lastError_;

private:
    std::vector<std::vector<char>> argv_storage_;
    std::vector<char*> argv_ptrs_;
};

// =============================================================================
// Default Values
// =============================================================================

TEST_F(ConfigTest, DefaultValues) {
    Config config;

    EXPECT_EQ(config.log_level, "INFO");
    EXPECT_EQ(config.ssdp_log, "ssdp.log");
    EXPECT_EQ(config.http_bind, "0.0.0.0");
    EXPECT_EQ(config.http_port, 0);
    EXPECT_EQ(config.interval_ms, 1000);
    EXPECT_EQ(config.multicast_ttl, 4);
    EXPECT_EQ(config.max_age_s, 30);
    EXPECT_FALSE(config.loopback);
    EXPECT_EQ(config.status_port, 0);
    EXPECT_EQ(config.status_bind, "127.0.0.1");
    EXPECT_FALSE(config.help);
}

TEST_F(ConfigTest, ParseNoArgs) {
    Config config = parse({"dmsd"});

    EXPECT_FALSE(config.help);
    EXPECT_EQ(config.ssdp_log, "ssdp.log");
    EXPECT_TRUE(lastError_.empty());
}

TEST_F(ConfigTest, ParseHelp) {
    EXPECT_TRUE(parse({"dmsd", "--help"}).help);
    EXPECT_TRUE(parse({"dmsd", "-h"}).help);
}

// =============================================================================
// Options
// =============================================================================

TEST_F(ConfigTest, ParseLogLevel) {
    Config config = parse({"dmsd", "--log-level", "DEBUG"});
    EXPECT_FALSE(config.help);
    EXPECT_EQ(config.log_level, "DEBUG");
}

TEST_F(ConfigTest, ParseSsdpLog) {
    Config config = parse({"dmsd", "--ssdp-log", "/tmp/packets.log"});
    EXPECT_EQ(config.ssdp_log, "/tmp/packets.log");
}

TEST_F(ConfigTest, EmptySsdpLogDisablesPacketLog) {
    Config config = parse({"dmsd", "--ssdp-log", ""});
    EXPECT_FALSE(config.help);
    EXPECT_TRUE(config.ssdp_log.empty());
}

TEST_F(ConfigTest, ParseHttpOptions) {
    Config config = parse({"dmsd", "--http-bind", "192.168.1.10", "--http-port", "8200"});
    EXPECT_FALSE(config.help);
    EXPECT_EQ(config.http_bind, "192.168.1.10");
    EXPECT_EQ(config.http_port, 8200);
}

TEST_F(ConfigTest, ParseSsdpOptions) {
    Config config = parse({"dmsd", "--interval-ms", "250", "--ttl", "1",
                           "--max-age", "1800", "--loopback", "1"});
    EXPECT_FALSE(config.help);
    EXPECT_EQ(config.interval_ms, 250);
    EXPECT_EQ(config.multicast_ttl, 1);
    EXPECT_EQ(config.max_age_s, 1800);
    EXPECT_TRUE(config.loopback);
}

TEST_F(ConfigTest, ParseStatusOptions) {
    Config config = parse({"dmsd", "--status-port", "50070", "--status-bind", "0.0.0.0"});
    EXPECT_FALSE(config.help);
    EXPECT_EQ(config.status_port, 50070);
    EXPECT_EQ(config.status_bind, "0.0.0.0");
}

// =============================================================================
// Error Handling
// =============================================================================

TEST_F(ConfigTest, UnknownOption) {
    Config config = parse({"dmsd", "--unknown-option", "value"});
    EXPECT_TRUE(config.help);
    EXPECT_NE(lastError_.find("Unknown option"), std::string::npos);
}

TEST_F(ConfigTest, MissingValue) {
    Config config = parse({"dmsd", "--http-port"});
    EXPECT_TRUE(config.help);
    EXPECT_NE(lastError_.find("requires a value"), std::string::npos);
}

TEST_F(ConfigTest, NonNumericPort) {
    EXPECT_TRUE(parse({"dmsd", "--http-port", "eighty"}).help);
    EXPECT_NE(lastError_.find("--http-port"), std::string::npos);
}

TEST_F(ConfigTest, PortOutOfRange) {
    EXPECT_TRUE(parse({"dmsd", "--http-port", "65536"}).help);
    EXPECT_TRUE(parse({"dmsd", "--status-port", "-1"}).help);
    EXPECT_FALSE(parse({"dmsd", "--http-port", "65535"}).help);
}

TEST_F(ConfigTest, IntervalMustBePositive) {
    EXPECT_TRUE(parse({"dmsd", "--interval-ms", "0"}).help);
    EXPECT_TRUE(parse({"dmsd", "--interval-ms", "-5"}).help);
}

TEST_F(ConfigTest, TtlRange) {
    EXPECT_FALSE(parse({"dmsd", "--ttl", "0"}).help);
    EXPECT_FALSE(parse({"dmsd", "--ttl", "255"}).help);
    EXPECT_TRUE(parse({"dmsd", "--ttl", "256"}).help);
}

TEST_F(ConfigTest, LoopbackAcceptsOnlyZeroOrOne) {
    EXPECT_FALSE(parse({"dmsd", "--loopback", "0"}).loopback);
    EXPECT_TRUE(parse({"dmsd", "--loopback", "yes"}).help);
}

// =============================================================================
// Print Usage
// =============================================================================

TEST_F(ConfigTest, PrintUsageListsOptions) {
    testing::internal::CaptureStdout();

    printUsage("dmsd_test");

    std::string output = testing::internal::GetCapturedStdout();

    EXPECT_NE(output.find("dmsd"), std::string::npos);
    EXPECT_NE(output.find("--http-port"), std::string::npos);
    EXPECT_NE(output.find("--ssdp-log"), std::string::npos);
    EXPECT_NE(output.find("--status-port"), std::string::npos);
}
