//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_logger.cpp
// Purpose: Level parsing, filtering and file sink of the process logger
//==========================================================================================================

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

#include "logging/Logger.h"

namespace {

// Restores the process log level after each test
class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override { saved = Logger::logLevel(); }
    void TearDown() override { Logger::setLogLevelFromString(Logger::levelName(saved)); }
    LogLevel saved{LogLevel::LOG_INFO_LEVEL};
};

std::string readAll(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

TEST_F(LoggerTest, LevelNamesParseCaseInsensitively) {
    EXPECT_EQ(Logger::levelFromString("debug"), LogLevel::LOG_DEBUG_LEVEL);
    EXPECT_EQ(Logger::levelFromString("Warning"), LogLevel::LOG_WARN_LEVEL);
    EXPECT_EQ(Logger::levelFromString("ERROR"), LogLevel::LOG_ERROR_LEVEL);
    EXPECT_EQ(Logger::levelFromString("none"), LogLevel::LOG_OFF_LEVEL);
    EXPECT_EQ(Logger::levelFromString("chatty"), LogLevel::LOG_INFO_LEVEL);
    EXPECT_STREQ(Logger::levelName(LogLevel::LOG_WARN_LEVEL), "WARN");
}

TEST_F(LoggerTest, FilteringFollowsConfiguredLevel) {
    Logger::setLogLevelFromString("WARN");
    EXPECT_FALSE(Logger::enabled(LogLevel::LOG_INFO_LEVEL));
    EXPECT_TRUE(Logger::enabled(LogLevel::LOG_WARN_LEVEL));
    EXPECT_TRUE(Logger::enabled(LogLevel::LOG_ERROR_LEVEL));

    int evaluated = 0;
    auto touch = [&evaluated]() { return ++evaluated; };
    LOG_DEBUG("not evaluated {}", touch());
    EXPECT_EQ(evaluated, 0);
    LOG_ERROR("evaluated {}", touch());
    EXPECT_EQ(evaluated, 1);
}

TEST_F(LoggerTest, FileSinkReceivesFormattedLines) {
    const std::string path = ::testing::TempDir() + "toolgate_logger_test.log";
    std::remove(path.c_str());
    Logger::setUseStderr(true);
    ASSERT_TRUE(Logger::setLogFile(path));
    Logger::setLogLevelFromString("INFO");
    LOG_INFO("session {} opened for {}", 42, "client");
    LOG_DEBUG("dropped line");

    const std::string text = readAll(path);
    EXPECT_NE(text.find("[INFO]"), std::string::npos);
    EXPECT_NE(text.find("test_logger.cpp:"), std::string::npos);
    EXPECT_NE(text.find("session 42 opened for client"), std::string::npos);
    EXPECT_EQ(text.find("dropped line"), std::string::npos);
}

TEST_F(LoggerTest, UnopenableFileIsReported) {
    EXPECT_FALSE(Logger::setLogFile("/nonexistent-dir/for/toolgate/log.txt"));
}

TEST_F(LoggerTest, BadFormatStringDoesNotThrow) {
    Logger::setLogLevelFromString("INFO");
    EXPECT_NO_THROW(LOG_INFO("missing argument {} {}", 1));
}
