#include <gtest/gtest.h>
#include "utils/logger.h"
#include "test_helpers.h"
#include <filesystem>

using namespace testbox::utils;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir = testbox::testing::makeTempDir("logger");
        Logger::setAllowSensitiveLogging(false);
        Logger::setLevel(LogLevel::TRACE);
        Logger::enableConsole(false);
        Logger::clearLogs();
    }

    void TearDown() override {
        Logger::shutdown();
        Logger::enableConsole(true);
        Logger::setLevel(LogLevel::INFO);
        std::filesystem::remove_all(testDir);
    }

    std::filesystem::path testDir;
};

TEST_F(LoggerTest, RedactsCredentialValues) {
    std::string out = Logger::redact("clone url=https://x token=abc123 next");
    EXPECT_EQ(out.find("abc123"), std::string::npos);
    EXPECT_NE(out.find("[REDACTED]"), std::string::npos);
    EXPECT_NE(out.find("next"), std::string::npos);

    std::string pw = Logger::redact("password: hunter2");
    EXPECT_EQ(pw.find("hunter2"), std::string::npos);
}

TEST_F(LoggerTest, SensitiveLoggingCanBeAllowed) {
    Logger::setAllowSensitiveLogging(true);
    EXPECT_EQ(Logger::redact("token=abc"), "token=abc");
}

TEST_F(LoggerTest, LevelFiltersEntries) {
    Logger::setLevel(LogLevel::WARN);
    LOG_INFO("hidden message");
    LOG_WARN("visible message");
    auto logs = Logger::getRecentLogs(10);
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_EQ(logs[0].level, LogLevel::WARN);
    EXPECT_NE(logs[0].message.find("visible"), std::string::npos);
}

TEST_F(LoggerTest, ParsesLevelNames) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(Logger::parseLevel("debug", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(Logger::parseLevel("ERROR", level));
    EXPECT_EQ(level, LogLevel::ERROR);
    EXPECT_FALSE(Logger::parseLevel("chatty", level));
}

TEST_F(LoggerTest, CategoryIsRecorded) {
    LOG_CAT(LogLevel::INFO, "cache", "entry stored");
    auto logs = Logger::getRecentLogs(1);
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_EQ(logs[0].category, "cache");
}

TEST_F(LoggerTest, WritesToFile) {
    std::string path = (testDir / "testbox.log").string();
    Logger::init(path);
    Logger::enableFile(true);
    LOG_ERROR("disk message");
    Logger::flush();
    std::string content = testbox::testing::readFile(path);
    EXPECT_NE(content.find("disk message"), std::string::npos);
    EXPECT_EQ(Logger::getLogPath(), path);
}
