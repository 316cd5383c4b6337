/**
 * @file test_log.cpp
 * @brief Unit tests for Platform/Log.h
 */

#include <VxTrace/Platform/Log.h>
#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

using namespace Vx::Trace::Platform;

class LogTest : public ::testing::Test {
protected:
    void SetUp() override {
        previous_ = Log::Level();
        Log::SetSink([this](LogLevel level, const std::string& message) {
            captured_.emplace_back(level, message);
        });
    }

    void TearDown() override {
        Log::SetSink(nullptr);
        Log::SetLevel(previous_);
    }

    LogLevel previous_ = LogLevel::Warning;
    std::vector<std::pair<LogLevel, std::string>> captured_;
};

TEST_F(LogTest, FormatsThroughFmt) {
    Log::SetLevel(LogLevel::Debug);
    Log::Info("traced {} paths in {:.1f} ms", 12, 3.5);
    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].first, LogLevel::Info);
    EXPECT_EQ(captured_[0].second, "traced 12 paths in 3.5 ms");
}

TEST_F(LogTest, LevelFiltersMessages) {
    Log::SetLevel(LogLevel::Warning);
    Log::Debug("hidden");
    Log::Info("hidden");
    Log::Warning("shown");
    Log::Error("shown too");
    ASSERT_EQ(captured_.size(), 2u);
    EXPECT_EQ(captured_[1].first, LogLevel::Error);
}

TEST_F(LogTest, OffSilencesEverything) {
    Log::SetLevel(LogLevel::Off);
    Log::Error("nothing");
    EXPECT_TRUE(captured_.empty());
    EXPECT_FALSE(Log::IsEnabled(LogLevel::Off));
}

TEST_F(LogTest, LevelNames) {
    EXPECT_STREQ(LogLevelName(LogLevel::Warning), "WARNING");
    EXPECT_STREQ(LogLevelName(LogLevel::Debug), "DEBUG");
}
