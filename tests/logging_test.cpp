#include <gtest/gtest.h>
#include "chronicle/errors.hpp"
#include "chronicle/logging.hpp"
#include "test_support.hpp"

using namespace chronicle;
using chronicle::testing_support::LogCapture;

TEST(LoggingTest, Log_ShouldEmitStructuredJsonLine) {
    LogCapture capture;
    log_info("projection", "checkpoint_saved", {{"projection", "orders"}, {"position", 42}});

    auto lines = capture.with_message("checkpoint_saved");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0]["level"], "info");
    EXPECT_EQ(lines[0]["component"], "projection");
    EXPECT_EQ(lines[0]["projection"], "orders");
    EXPECT_EQ(lines[0]["position"], 42);
    EXPECT_TRUE(lines[0].contains("timestamp"));
}

TEST(LoggingTest, Log_BelowLevel_ShouldBeDropped) {
    LogCapture capture(LogLevel::Warn);
    log_debug("test", "hidden_debug");
    log_info("test", "hidden_info");
    log_warn("test", "shown_warn");
    log_error("test", "shown_error");

    EXPECT_FALSE(capture.contains("hidden_debug"));
    EXPECT_FALSE(capture.contains("hidden_info"));
    EXPECT_TRUE(capture.contains("shown_warn"));
    EXPECT_TRUE(capture.contains("shown_error"));
}

TEST(LoggingTest, ParseLogLevel_ShouldAcceptKnownNames) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("info"), LogLevel::Info);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("error"), LogLevel::Error);
    EXPECT_THROW(parse_log_level("verbose"), ValidationError);
}

TEST(LoggingTest, LogLevelName_ShouldRoundTripThroughParse) {
    for (auto level : {LogLevel::Debug, LogLevel::Info, LogLevel::Warn, LogLevel::Error}) {
        EXPECT_EQ(parse_log_level(log_level_name(level)), level);
    }
}
