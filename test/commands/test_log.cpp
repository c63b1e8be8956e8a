#include <gtest/gtest.h>
#include <filesystem>
#include <string>
#include <vector>
#include "test_utils.hpp"
#include "cli/commands/LogCommand.hpp"
#include "core/History.hpp"
#include "core/ObjectStore.hpp"

namespace fs = std::filesystem;

using namespace oops;
using namespace oops::test::utils;

namespace {

size_t countOccurrences(const std::string& text, const std::string& needle) {
    size_t n = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
        ++n;
    }
    return n;
}

}

class LogCommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
        originalCwd = getCwd();
        setCwd(tempDir);
        initTestRepo(tempDir);
    }

    void TearDown() override {
        setCwd(originalCwd);
        removeDir(tempDir);
    }

    void makeCommits(int count) {
        ObjectStore store(tempDir);
        for (int i = 1; i <= count; ++i) {
            auto res = History::commit(tempDir, store, {}, "commit " + std::to_string(i), {}, "logger",
                                       1700000000 + i);
            ASSERT_TRUE(res.has_value()) << res.error().message;
        }
    }

    std::string run(const std::vector<std::string>& args) {
        CoutCapture capture;
        auto res = LogCommand().execute(ctx, args);
        EXPECT_TRUE(res.has_value()) << res.error().message;
        return capture.str();
    }

    fs::path tempDir;
    fs::path originalCwd;
    AppContext ctx;
};

// Test: Default page shows up to ten newest commits
TEST_F(LogCommandTest, DefaultPage) {
    makeCommits(12);
    std::string out = run({});
    EXPECT_EQ(countOccurrences(out, "Commit: "), 10u);
    EXPECT_NE(out.find("commit 12\n"), std::string::npos);
    EXPECT_EQ(out.find("commit 2\n"), std::string::npos);
    EXPECT_NE(out.find("Author: logger\n"), std::string::npos);
    EXPECT_NE(out.find("Page 1 of 2\n"), std::string::npos);
}

// Test: Explicit page and size
TEST_F(LogCommandTest, PageAndSize) {
    makeCommits(25);
    std::string out = run({"--page-size", "10", "--page", "3"});
    EXPECT_EQ(countOccurrences(out, "Commit: "), 5u);
    EXPECT_NE(out.find("commit 5\n"), std::string::npos);
    EXPECT_NE(out.find("commit 1\n"), std::string::npos);
    EXPECT_EQ(out.find("commit 6\n"), std::string::npos);
    EXPECT_NE(out.find("Page 3 of 3\n"), std::string::npos);
}

// Test: Dates are printed in UTC
TEST_F(LogCommandTest, DateFormat) {
    makeCommits(1);
    std::string out = run({});
    EXPECT_NE(out.find("Date: 2023-11-14 22:13:21\n"), std::string::npos);
}

// Test: Empty history
TEST_F(LogCommandTest, NoCommits) {
    auto res = LogCommand().execute(ctx, {});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::NoCommits);
}

// Test: Bad numbers
TEST_F(LogCommandTest, InvalidArguments) {
    makeCommits(1);
    for (const std::vector<std::string>& args : {std::vector<std::string>{"--page", "0"},
                                                 std::vector<std::string>{"--page-size", "-3"},
                                                 std::vector<std::string>{"--page-size", "ten"},
                                                 std::vector<std::string>{"--page"},
                                                 std::vector<std::string>{"--oneline"}}) {
        auto res = LogCommand().execute(ctx, args);
        ASSERT_FALSE(res.has_value());
        EXPECT_EQ(res.error().code, ErrorCode::InvalidArgs);
    }
}
