#include "chronicle/core/Log.hh"
#include <gtest/gtest.h>

namespace chronicle {
namespace Tests {

class LogTest : public ::testing::Test {};

TEST_F(LogTest, ChannelLoggersExist) {
    EXPECT_NE(log::logger(), nullptr);
    EXPECT_NE(log::parserLogger(), nullptr);
    EXPECT_NE(log::timelineLogger(), nullptr);
    EXPECT_NE(log::storeLogger(), nullptr);
    EXPECT_NE(log::parserLogger(), log::logger());
}

TEST_F(LogTest, MacrosAcceptFormatArgs) {
    CHRONICLE_LOG_INFO("Imported {} snapshots", 3);
    CHRONICLE_PARSER_LOG_DEBUG("Parsed {} in {} ms", "autosave.sav", 12);
    CHRONICLE_TIMELINE_LOG_WARN("{} {}: dependency {} has no output", "game_1", "2200.01.01", "systems");
    CHRONICLE_STORE_LOG_INFO("Saved series {}", "game_1");
    SUCCEED();
}

TEST_F(LogTest, LevelFromString) {
    EXPECT_EQ(log::levelFromString("trace"), quill::LogLevel::TraceL1);
    EXPECT_EQ(log::levelFromString("debug"), quill::LogLevel::Debug);
    EXPECT_EQ(log::levelFromString("info"), quill::LogLevel::Info);
    EXPECT_EQ(log::levelFromString("warn"), quill::LogLevel::Warning);
    EXPECT_EQ(log::levelFromString("warning"), quill::LogLevel::Warning);
    EXPECT_EQ(log::levelFromString("error"), quill::LogLevel::Error);
    EXPECT_EQ(log::levelFromString("critical"), quill::LogLevel::Critical);
    EXPECT_FALSE(log::levelFromString("loud").has_value());
    EXPECT_FALSE(log::levelFromString("").has_value());
}

TEST_F(LogTest, SetLevels) {
    auto rootLevel = log::logger()->get_log_level();
    auto timelineLevel = log::timelineLogger()->get_log_level();

    log::setTimelineLevel(quill::LogLevel::Warning);
    EXPECT_EQ(log::timelineLogger()->get_log_level(), quill::LogLevel::Warning);
    log::setLevel(quill::LogLevel::Error);
    EXPECT_EQ(log::logger()->get_log_level(), quill::LogLevel::Error);

    log::setTimelineLevel(timelineLevel);
    log::setLevel(rootLevel);
}

} // namespace Tests
} // namespace chronicle
