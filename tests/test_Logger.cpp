#include <gtest/gtest.h>
#include "utils/Logger.h"
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir = fs::temp_directory_path() / ("tfmcp_logger_test_" + std::to_string(getpid()));
        fs::create_directories(testDir);
        logPath = (testDir / "server.log").string();
    }

    void TearDown() override {
        fs::remove_all(testDir);
    }

    std::string readLog() {
        std::ifstream f(logPath);
        std::stringstream ss;
        ss << f.rdbuf();
        return ss.str();
    }

    fs::path testDir;
    std::string logPath;
};

TEST_F(LoggerTest, FileLoggerWritesTimestampedLines) {
    auto logger = Logger::open(logPath);
    EXPECT_EQ(logger->getPath(), logPath);
    EXPECT_EQ(logger->getLevel(), LogLevel::DEBUG);

    EXPECT_TRUE(logger->info("server starting"));
    EXPECT_TRUE(logger->debug("flushing analytics"));

    std::string content = readLog();
    std::regex line(R"(\[\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\] \[INFO\] server starting\n)");
    EXPECT_TRUE(std::regex_search(content, line)) << content;
    EXPECT_NE(content.find("[DEBUG] flushing analytics"), std::string::npos);
}

TEST_F(LoggerTest, FileIsAppendedNotTruncated) {
    Logger::open(logPath)->info("first run");
    Logger::open(logPath)->info("second run");

    std::string content = readLog();
    EXPECT_NE(content.find("first run"), std::string::npos);
    EXPECT_NE(content.find("second run"), std::string::npos);
}

TEST_F(LoggerTest, TrailingNewlinesAreTrimmed) {
    auto logger = Logger::open(logPath);
    logger->info("payload\n");

    EXPECT_EQ(readLog().find("payload\n\n"), std::string::npos);
}

TEST_F(LoggerTest, UnopenablePathThrows) {
    std::string bad = (testDir / "missing" / "dir" / "server.log").string();
    EXPECT_THROW(Logger::open(bad), std::runtime_error);
}

TEST_F(LoggerTest, EmptyPathLogsToStderr) {
    auto logger = Logger::open("");
    EXPECT_TRUE(logger->getPath().empty());
    EXPECT_EQ(logger->getLevel(), LogLevel::INFO);
}

TEST_F(LoggerTest, LevelFiltersMessagesAndCallback) {
    auto logger = Logger::open(logPath);
    logger->setLevel(LogLevel::WARNING);
    std::vector<std::pair<LogLevel, std::string>> seen;
    logger->setCallback([&](LogLevel level, const std::string& msg) { seen.emplace_back(level, msg); });

    EXPECT_TRUE(logger->info("hidden"));
    logger->warn("visible");
    logger->error("also visible");

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].first, LogLevel::WARNING);
    EXPECT_EQ(seen[0].second, "visible");
    EXPECT_EQ(seen[1].first, LogLevel::ERROR);
    EXPECT_EQ(readLog().find("hidden"), std::string::npos);
    EXPECT_NE(readLog().find("[WARN] visible"), std::string::npos);
}

TEST_F(LoggerTest, RejectedWriteIsReported) {
    if (!fs::exists("/dev/full")) {
        GTEST_SKIP() << "/dev/full not available";
    }
    auto logger = Logger::open("/dev/full");
    EXPECT_FALSE(logger->info("nowhere to go"));
    // The logger stays usable after a failed write
    EXPECT_FALSE(logger->info("still nowhere"));
}

TEST(LogLevelTest, Names) {
    EXPECT_STREQ(logLevelName(LogLevel::DEBUG), "DEBUG");
    EXPECT_STREQ(logLevelName(LogLevel::INFO), "INFO");
    EXPECT_STREQ(logLevelName(LogLevel::WARNING), "WARN");
    EXPECT_STREQ(logLevelName(LogLevel::ERROR), "ERROR");
}
