#include <gtest/gtest.h>
#include <string>
#include "test_utils.hpp"
#include "util/Expected.hpp"
#include "util/Logger.hpp"

using namespace oops;

namespace {

/// Restores the suite-wide level after each test
class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override { saved = Logger::instance().level(); }
    void TearDown() override { Logger::instance().setLevel(saved); }

    LogLevel saved{LogLevel::Error};
};

}

// Test: Level names and numbers both parse
TEST_F(LoggerTest, ParseLevel) {
    EXPECT_EQ(Logger::parseLevel("error"), LogLevel::Error);
    EXPECT_EQ(Logger::parseLevel("1"), LogLevel::Warn);
    EXPECT_EQ(Logger::parseLevel("info"), LogLevel::Info);
    EXPECT_EQ(Logger::parseLevel("3"), LogLevel::Debug);
    EXPECT_FALSE(Logger::parseLevel("verbose").has_value());
    EXPECT_FALSE(Logger::parseLevel("").has_value());
}

// Test: Messages above the current level are dropped
TEST_F(LoggerTest, LevelFiltersOutput) {
    Logger::instance().setLevel(LogLevel::Warn);
    {
        test::utils::CoutCapture capture;
        Logger::instance().info("hidden info");
        Logger::instance().debug("hidden debug");
        EXPECT_EQ(capture.str(), "");
    }

    ::testing::internal::CaptureStderr();
    Logger::instance().warn("careful");
    Logger::instance().error("broken");
    EXPECT_EQ(::testing::internal::GetCapturedStderr(), "oops: warning: careful\noops: error: broken\n");
}

// Test: Debug output goes to stdout when enabled
TEST_F(LoggerTest, DebugToStdout) {
    Logger::instance().setLevel(LogLevel::Debug);
    test::utils::CoutCapture capture;
    Logger::instance().debug("details");
    EXPECT_EQ(capture.str(), "[debug] details\n");
    EXPECT_TRUE(Logger::instance().enabled(LogLevel::Info));
}

// Test: Error codes have readable names
TEST(ErrorCodeTest, Names) {
    EXPECT_STREQ(errorCodeName(ErrorCode::NotARepository), "not a repository");
    EXPECT_STREQ(errorCodeName(ErrorCode::FileNotTracked), "file not tracked");
    EXPECT_STREQ(errorCodeName(ErrorCode::NoCommits), "no commits");
}
