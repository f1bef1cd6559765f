#include <gtest/gtest.h>
#include "logger.h"
#include "fs.h"

using namespace peerdrop;

class LoggerTest : public ::testing::Test {
protected:
    const std::string log_file = "test_peerdrop.log";

    void SetUp() override {
        delete_file(log_file);
        Logger& logger = Logger::getInstance();
        saved_level_ = logger.get_log_level();
        saved_console_ = logger.is_console_logging_enabled();
        logger.set_console_logging_enabled(false);
        logger.set_timestamps_enabled(false);
    }

    void TearDown() override {
        Logger& logger = Logger::getInstance();
        logger.set_log_file_path("");
        logger.set_log_level(saved_level_);
        logger.set_console_logging_enabled(saved_console_);
        logger.set_timestamps_enabled(true);
        delete_file(log_file);
    }

    LogLevel saved_level_;
    bool saved_console_;
};

TEST_F(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("INFO"), LogLevel::INFO);
    EXPECT_EQ(parse_log_level("Warn"), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("error"), LogLevel::ERROR);
    EXPECT_EQ(parse_log_level("verbose"), LogLevel::INFO);
    EXPECT_EQ(parse_log_level("verbose", LogLevel::ERROR), LogLevel::ERROR);

    EXPECT_EQ(log_level_to_string(LogLevel::WARN), "warn");
}

TEST_F(LoggerTest, FileReceivesModuleTaggedLines) {
    Logger& logger = Logger::getInstance();
    logger.set_log_level(LogLevel::DEBUG);
    ASSERT_TRUE(logger.set_log_file_path(log_file));
    EXPECT_EQ(logger.get_log_file_path(), log_file);

    LOG_INFO("session", "Channel open with " << 2 << " peers");
    LOG_ERROR("tcp", "Connection reset");
    logger.set_log_file_path("");

    std::string content = read_file_text_cpp(log_file);
    EXPECT_NE(content.find("[INFO ] [session] Channel open with 2 peers\n"), std::string::npos) << content;
    EXPECT_NE(content.find("[ERROR] [tcp] Connection reset\n"), std::string::npos) << content;
}

TEST_F(LoggerTest, MessagesBelowLevelAreDropped) {
    Logger& logger = Logger::getInstance();
    logger.set_log_level(LogLevel::WARN);
    ASSERT_TRUE(logger.set_log_file_path(log_file));

    LOG_DEBUG("protocol", "hidden debug");
    LOG_INFO("protocol", "hidden info");
    LOG_WARN("protocol", "visible warning");
    logger.set_log_file_path("");

    std::string content = read_file_text_cpp(log_file);
    EXPECT_EQ(content.find("hidden"), std::string::npos);
    EXPECT_NE(content.find("visible warning"), std::string::npos);
}

TEST_F(LoggerTest, UnwritableFileIsReported) {
    Logger& logger = Logger::getInstance();
    EXPECT_FALSE(logger.set_log_file_path("no_such_directory/at/all/peerdrop.log"));
    EXPECT_TRUE(logger.get_log_file_path().empty());
}
