/**
 * @file test_logger.cpp
 * @brief Logger singleton: file output, levels, rotation
 */

#include <gtest/gtest.h>
#include "Logger.h"
#include "TestHelpers.h"

#include <filesystem>
#include <fstream>
#include <string>

using namespace Tessera;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        logFile_ = Testing::uniqueTempPath("tessera_log").string() + ".log";
        Logger::instance().setConsoleOutput(false);
        Logger::instance().setLogFile(logFile_);
    }

    void TearDown() override {
        auto& logger = Logger::instance();
        logger.setLogFile("/dev/null");
        logger.setLevel(LogLevel::INFO);
        logger.setConsoleOutput(true);
        logger.setMaxFileSize(100);
        std::filesystem::remove(logFile_);
    }

    std::string readLog() const {
        std::ifstream file(logFile_);
        return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    }

    std::string logFile_;
};

TEST_F(LoggerTest, Singleton) {
    EXPECT_EQ(&Logger::instance(), &Logger::instance());
}

TEST_F(LoggerTest, WritesComponentAndLevel) {
    auto& logger = Logger::instance();
    logger.setLevel(LogLevel::DEBUG);
    logger.info("Test info message", "LoggerTest");
    logger.error("Test error message", "LoggerTest");

    std::string content = readLog();
    EXPECT_NE(content.find("[INFO] [LoggerTest] Test info message"), std::string::npos);
    EXPECT_NE(content.find("[ERROR] [LoggerTest] Test error message"), std::string::npos);
}

TEST_F(LoggerTest, FiltersBelowLevel) {
    auto& logger = Logger::instance();
    logger.setLevel(LogLevel::WARN);
    logger.debug("hidden debug", "LoggerTest");
    logger.info("hidden info", "LoggerTest");
    logger.warn("visible warn", "LoggerTest");

    std::string content = readLog();
    EXPECT_EQ(content.find("hidden"), std::string::npos);
    EXPECT_NE(content.find("visible warn"), std::string::npos);
    EXPECT_FALSE(logger.isDebugEnabled());
    EXPECT_FALSE(logger.isInfoEnabled());
}

TEST_F(LoggerTest, ParseLevel) {
    EXPECT_EQ(Logger::parseLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::parseLevel("WARNING"), LogLevel::WARN);
    EXPECT_EQ(Logger::parseLevel("Error"), LogLevel::ERROR);
    EXPECT_EQ(Logger::parseLevel("critical"), LogLevel::CRITICAL);
    EXPECT_EQ(Logger::parseLevel("bogus"), LogLevel::INFO);
}
