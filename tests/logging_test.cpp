#include <gtest/gtest.h>

#include <string>

#include "test_helpers.h"
#include "utils/logging.h"

using utils::LogLevel;
using utils::Logger;

TEST(LoggingTest, ParseLevel) {
    EXPECT_EQ(utils::parse_log_level("TRACE"), LogLevel::Trace);
    EXPECT_EQ(utils::parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(utils::parse_log_level("Warning"), LogLevel::Warn);
    EXPECT_EQ(utils::parse_log_level("error"), LogLevel::Error);
    EXPECT_EQ(utils::parse_log_level("loud"), LogLevel::Info);
}

TEST(LoggingTest, FileReceivesLinesAtOrAboveLevel) {
    testutil::TempDir dir;
    auto& log = Logger::instance();
    const LogLevel saved = log.level();

    ASSERT_TRUE(log.set_log_file(dir.file("extcheck.log")));
    log.set_level(LogLevel::Warn);
    EXPECT_FALSE(log.enabled(LogLevel::Info));
    EXTCHECK_LOG_INFO("hidden line");
    EXTCHECK_LOG_WARN("visible line");
    ASSERT_TRUE(log.set_log_file(""));
    log.set_level(saved);

    std::string text = testutil::read_file(dir.file("extcheck.log"));
    EXPECT_EQ(text.find("hidden line"), std::string::npos);
    EXPECT_NE(text.find("[WARN]"), std::string::npos);
    EXPECT_NE(text.find("visible line"), std::string::npos);
}
