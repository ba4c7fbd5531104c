// tests/test_utils.cpp
#include <cstdio>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "TestMocks.hpp"
#include "../src/utils/Utils.hpp"

namespace {
    // Silences std::cerr for the lifetime of the object and keeps what was written.
    class CerrCapture {
    public:
        CerrCapture() : old_(std::cerr.rdbuf(captured_.rdbuf())) {}
        ~CerrCapture() { std::cerr.rdbuf(old_); }
        std::string str() const { return captured_.str(); }

    private:
        std::ostringstream captured_;
        std::streambuf* old_;
    };
}

// --- Tests for parseArguments ---

TEST(UtilsTest, ParseArgumentsValidSingle) {
    std::vector<std::string> args = {"key=value"};
    auto result = Utils::parseArguments(args);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 1);
    EXPECT_EQ(result->at("key"), "value");
}

TEST(UtilsTest, ParseArgumentsValidMultiple) {
    std::vector<std::string> args = {"key1=value1", "key2=value2"};
    auto result = Utils::parseArguments(args);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 2);
    EXPECT_EQ(result->at("key1"), "value1");
    EXPECT_EQ(result->at("key2"), "value2");
}

TEST(UtilsTest, ParseArgumentsEmptyInput) {
    std::vector<std::string> args = {};
    auto result = Utils::parseArguments(args);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->empty());
}

TEST(UtilsTest, ParseArgumentsInvalidNoEquals) {
    CerrCapture capture;
    std::vector<std::string> args = {"keyvalue"};
    EXPECT_FALSE(Utils::parseArguments(args).has_value());
}

TEST(UtilsTest, ParseArgumentsInvalidEmptyKey) {
    CerrCapture capture;
    std::vector<std::string> args = {"=value"};
    EXPECT_FALSE(Utils::parseArguments(args).has_value());
}

TEST(UtilsTest, ParseArgumentsMixedValidInvalid) {
    CerrCapture capture;
    std::vector<std::string> args = {"key1=value1", "invalid", "key2=value2"};
    EXPECT_FALSE(Utils::parseArguments(args).has_value());
}

// --- Tests for small helpers ---

TEST(UtilsTest, TrimStripsWhitespace) {
    EXPECT_EQ(Utils::trim("  value \t\r\n"), "value");
    EXPECT_EQ(Utils::trim("   "), "");
}

TEST(UtilsTest, StringToIntRejectsPartialNumbers) {
    EXPECT_EQ(Utils::stringToInt("42").value_or(-1), 42);
    EXPECT_FALSE(Utils::stringToInt("42abc").has_value());
    EXPECT_FALSE(Utils::stringToInt("abc").has_value());
}

TEST(UtilsTest, StringToLogLevel) {
    EXPECT_EQ(Utils::stringToLogLevel("DEBUG"), LogUtils::LogLevel::DEBUG);
    EXPECT_EQ(Utils::stringToLogLevel("WARNING"), LogUtils::LogLevel::WARN);
    EXPECT_THROW(Utils::stringToLogLevel("LOUD"), std::invalid_argument);
}

// --- Tests for loadConfiguration ---

TEST(UtilsTest, LoadConfigurationDefaults) {
    CerrCapture capture;
    std::map<std::string, std::string> args = {{"config", "/nonexistent/localcache.config"}};
    CacheConfig config = Utils::loadConfiguration(args);
    EXPECT_EQ(config.store_max_entries, 10000u);
    EXPECT_EQ(config.async_worker_threads, 2);
    EXPECT_EQ(config.watcher_poll_interval_millis, 200);
    EXPECT_EQ(config.log_level, LogUtils::LogLevel::CERROR);
    EXPECT_TRUE(config.metrics_enabled);
    EXPECT_EQ(config.metrics_batch_size, 512);
    EXPECT_EQ(config.metrics_send_interval_millis, 1000);
}

TEST(UtilsTest, LoadConfigurationFromFile) {
    TempFile file("localcache_config",
                  "# cache settings\n"
                  "store_max_entries = 500\n"
                  "async_worker_threads=3\n"
                  "\n"
                  "log_level=DEBUG\n"
                  "metrics_enabled=0\n"
                  "metrics_batch_size=0\n"
                  "metrics_send_interval_millis=250\n");
    std::map<std::string, std::string> args = {{"config", file.path()}};
    CacheConfig config = Utils::loadConfiguration(args);
    EXPECT_EQ(config.store_max_entries, 500u);
    EXPECT_EQ(config.async_worker_threads, 3);
    EXPECT_EQ(config.log_level, LogUtils::LogLevel::DEBUG);
    EXPECT_FALSE(config.metrics_enabled);
    EXPECT_EQ(config.metrics_batch_size, 0);
    EXPECT_EQ(config.metrics_send_interval_millis, 250);
}

TEST(UtilsTest, LoadConfigurationArgumentsOverrideFile) {
    TempFile file("localcache_override", "store_max_entries=500\n");
    std::map<std::string, std::string> args = {{"config", file.path()}, {"store_max_entries", "25"}};
    CacheConfig config = Utils::loadConfiguration(args);
    EXPECT_EQ(config.store_max_entries, 25u);
}

TEST(UtilsTest, LoadConfigurationInvalidValueKeepsDefault) {
    CerrCapture capture;
    std::map<std::string, std::string> args = {
        {"config", "/nonexistent/localcache.config"},
        {"async_worker_threads", "abc"},
        {"store_max_entries", "-5"}
    };
    CacheConfig config = Utils::loadConfiguration(args);
    EXPECT_EQ(config.async_worker_threads, 2);
    EXPECT_EQ(config.store_max_entries, 10000u);
    EXPECT_NE(capture.str().find("Warning: Invalid positive integer for async_worker_threads"), std::string::npos);
}

TEST(UtilsTest, LoadConfigurationUnknownKeyIsReported) {
    CerrCapture capture;
    std::map<std::string, std::string> args = {{"config", "/nonexistent/localcache.config"}, {"colour", "blue"}};
    Utils::loadConfiguration(args);
    EXPECT_NE(capture.str().find("Unknown configuration key: colour"), std::string::npos);
}

TEST(UtilsTest, ConfigToStringListsEffectiveValues) {
    CacheConfig config;
    config.store_max_entries = 77;
    std::string dump = config.to_string();
    EXPECT_NE(dump.find("store_max_entries: 77"), std::string::npos);
    EXPECT_NE(dump.find("metrics_enabled: true"), std::string::npos);
}
