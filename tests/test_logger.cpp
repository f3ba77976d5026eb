//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_logger.cpp
// Purpose: Log level parsing, filtering and PAYLOAD_LOG_* environment configuration
//==========================================================================================================

#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

#include <unistd.h>

#include "logging/Logger.h"

namespace {

std::string readFile(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        char tmpl[] = "/tmp/payload_log_XXXXXX";
        int fd = ::mkstemp(tmpl);
        ASSERT_GE(fd, 0);
        ::close(fd);
        path = tmpl;
        savedLevel = Logger::sLogLevel;
        Logger::setColorEnabled(false);
        Logger::setLogFile(path);
    }
    void TearDown() override {
        Logger::sLogLevel = savedLevel;
        Logger::setColorEnabled(true);
        ::unsetenv("PAYLOAD_LOG_LEVEL");
        ::unlink(path.c_str());
    }

    std::string path;
    LogLevel savedLevel{LogLevel::LOG_INFO_LEVEL};
};

} // namespace

TEST(LoggerLevels, ParseNames) {
    EXPECT_EQ(Logger::tryLevelFromString("debug"), Logger::Level::DEBUG);
    EXPECT_EQ(Logger::tryLevelFromString("Info"), Logger::Level::INFO);
    EXPECT_EQ(Logger::tryLevelFromString("warning"), Logger::Level::WARN);
    EXPECT_EQ(Logger::tryLevelFromString("WARN"), Logger::Level::WARN);
    EXPECT_EQ(Logger::tryLevelFromString("error"), Logger::Level::ERROR);
    EXPECT_EQ(Logger::tryLevelFromString("fatal"), Logger::Level::FATAL);
    EXPECT_FALSE(Logger::tryLevelFromString("chatty").has_value());
    EXPECT_EQ(Logger::toLogLevel(Logger::Level::ERROR), LogLevel::LOG_ERROR_LEVEL);
}

TEST_F(LoggerTest, WritesFormattedMessageAtOrAboveLevel) {
    ASSERT_TRUE(Logger::setLogLevelFromString("info"));
    LOG_INFO("plugin {} ready", "acme.widget");
    LOG_DEBUG("hidden detail {}", 1);
    LOG_WARN("slow handler {} ms", 1500);

    const std::string text = readFile(path);
    EXPECT_NE(text.find("[INFO]"), std::string::npos);
    EXPECT_NE(text.find("plugin acme.widget ready"), std::string::npos);
    EXPECT_NE(text.find("[WARN]"), std::string::npos);
    EXPECT_NE(text.find("slow handler 1500 ms"), std::string::npos);
    EXPECT_EQ(text.find("hidden detail"), std::string::npos);
}

TEST_F(LoggerTest, UnknownLevelStringKeepsCurrentLevel) {
    Logger::setLogLevel(LogLevel::LOG_ERROR_LEVEL);
    EXPECT_FALSE(Logger::setLogLevelFromString("verbose"));
    EXPECT_EQ(Logger::sLogLevel, LogLevel::LOG_ERROR_LEVEL);
}

TEST_F(LoggerTest, BadFormatStringIsReported) {
    ASSERT_TRUE(Logger::setLogLevelFromString("debug"));
    LOG_INFO("missing arg {} {}", 1);
    EXPECT_NE(readFile(path).find("Format error"), std::string::npos);
}

TEST_F(LoggerTest, ConfigureFromEnvironment) {
    ::setenv("PAYLOAD_LOG_LEVEL", "error", 1);
    Logger::configureFromEnvironment();
    EXPECT_EQ(Logger::sLogLevel, LogLevel::LOG_ERROR_LEVEL);

    ::setenv("PAYLOAD_LOG_LEVEL", "nonsense", 1);
    Logger::configureFromEnvironment();
    EXPECT_EQ(Logger::sLogLevel, LogLevel::LOG_ERROR_LEVEL);

    ::unsetenv("PAYLOAD_LOG_LEVEL");
    Logger::configureFromEnvironment();
    EXPECT_EQ(Logger::sLogLevel, LogLevel::LOG_INFO_LEVEL);
}
