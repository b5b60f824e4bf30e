#include <sstream>
#include <string>
#include <gtest/gtest.h>
#include "core/logging/logger.hpp"

namespace {

using planloop::core::logging::LogLevel;
using planloop::core::logging::Logger;

// Restores the process-wide logger after each test.
class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override { Logger::get().set_sink(&sink_); }

    void TearDown() override {
        Logger::get().set_sink(nullptr);
        Logger::get().set_min_level(LogLevel::INFO);
        Logger::get().set_run_id("");
    }

    std::ostringstream sink_;
};

TEST_F(LoggerTest, TagsLinesWithLevelAndRunId) {
    Logger::get().set_run_id("run-0000abcd");
    LOG_WARN("disk nearly full");
    EXPECT_EQ(sink_.str(), "[WARN ] [run-0000abcd] disk nearly full\n");
}

TEST_F(LoggerTest, DropsMessagesBelowMinimumLevel) {
    Logger::get().set_min_level(LogLevel::WARN);
    LOG_INFO("hidden");
    LOG_ERROR("shown");
    EXPECT_EQ(sink_.str(), "[ERROR] shown\n");
    EXPECT_FALSE(Logger::get().enabled(LogLevel::DEBUG));
    EXPECT_TRUE(Logger::get().enabled(LogLevel::ERROR));
}

TEST_F(LoggerTest, ParsesLevelNames) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(Logger::parse_level("debug", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(Logger::parse_level("error", level));
    EXPECT_EQ(level, LogLevel::ERROR);
    EXPECT_FALSE(Logger::parse_level("LOUD", level));
    EXPECT_EQ(level, LogLevel::ERROR);
}

}  // namespace
