/**
 * @file test_logger.cpp
 * @brief Unit tests for the spdlog wrapper
 */

#include <gtest/gtest.h>
#include <person/common/logger.h>
#include <person/exception/ConfigException.hpp>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

using person::common::ConfigManager;
using person::common::Logger;
using person::exception::ConfigException;

class LoggerTest : public ::testing::Test {
protected:
    std::shared_ptr<spdlog::logger> previous_;

    void SetUp() override {
        previous_ = spdlog::default_logger();
    }

    void TearDown() override {
        auto& config = ConfigManager::getInstance();
        config.unset(ConfigManager::LOG_NAME);
        config.unset(ConfigManager::LOG_LEVEL);
        config.unset(ConfigManager::LOG_TO_FILE);
        config.unset(ConfigManager::LOG_FILE);
        spdlog::set_default_logger(previous_);
    }
};

TEST_F(LoggerTest, ParseLevel_KnownNames) {
    EXPECT_EQ(Logger::parseLevel("trace"), spdlog::level::trace);
    EXPECT_EQ(Logger::parseLevel("debug"), spdlog::level::debug);
    EXPECT_EQ(Logger::parseLevel("info"), spdlog::level::info);
    EXPECT_EQ(Logger::parseLevel("warn"), spdlog::level::warn);
    EXPECT_EQ(Logger::parseLevel("error"), spdlog::level::err);
    EXPECT_EQ(Logger::parseLevel("critical"), spdlog::level::critical);
    EXPECT_EQ(Logger::parseLevel("off"), spdlog::level::off);
}

TEST_F(LoggerTest, ParseLevel_UnknownIsInfo) {
    EXPECT_EQ(Logger::parseLevel("verbose"), spdlog::level::info);
}

TEST_F(LoggerTest, Initialize_InstallsDefaultLogger) {
    Logger::initialize("logger-test", "debug");
    EXPECT_EQ(spdlog::default_logger()->name(), "logger-test");
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::debug);
}

TEST_F(LoggerTest, Initialize_FileWithoutPathThrows) {
    person::common::LogSettings settings;
    settings.logToFile = true;
    EXPECT_THROW(Logger::initialize(settings), ConfigException);
}

TEST_F(LoggerTest, Initialize_WritesToFile) {
    std::string path = ::testing::TempDir() + "person_validation_logger_test.log";
    std::remove(path.c_str());

    person::common::LogSettings settings;
    settings.name = "file-test";
    settings.logToFile = true;
    settings.logFile = path;
    Logger::initialize(settings);
    spdlog::warn("written to file");
    Logger::flush();

    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_NE(content.str().find("written to file"), std::string::npos);
    EXPECT_NE(content.str().find("[file-test]"), std::string::npos);

    spdlog::set_default_logger(previous_);
    std::remove(path.c_str());
}

TEST_F(LoggerTest, InitializeFromConfig_UsesConfiguredValues) {
    auto& config = ConfigManager::getInstance();
    config.set(ConfigManager::LOG_NAME, "configured");
    config.set(ConfigManager::LOG_LEVEL, "error");
    config.set(ConfigManager::LOG_TO_FILE, "false");

    Logger::initializeFromConfig(config);
    EXPECT_EQ(spdlog::default_logger()->name(), "configured");
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::err);
}

TEST_F(LoggerTest, SetLevel_ChangesDefaultLoggerLevel) {
    Logger::initialize("level-test", "info");
    Logger::setLevel("critical");
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::critical);
}
