#include <gtest/gtest.h>
#include <filesystem>
#include <string>
#include <vector>
#include "test_utils.hpp"
#include "cli/commands/AddCommand.hpp"
#include "cli/commands/CommitCommand.hpp"
#include "cli/commands/RestoreCommand.hpp"
#include "core/Repository.hpp"

namespace fs = std::filesystem;

using namespace oops;
using namespace oops::test::utils;

class RestoreCommandTest : public ::testing::Test {
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

    std::string addAndCommit(const std::string& path, const std::string& message) {
        CoutCapture capture;
        EXPECT_TRUE(AddCommand().execute(ctx, {path}).has_value());
        EXPECT_TRUE(CommitCommand().execute(ctx, {"-m", message}).has_value());
        return Repository::resolveHEAD(tempDir).value();
    }

    fs::path tempDir;
    fs::path originalCwd;
    AppContext ctx;
};

// Test: Discard working-tree edits
TEST_F(RestoreCommandTest, RestoreFromHead) {
    createFile(tempDir, "file.txt", "original");
    addAndCommit("file.txt", "first");
    modifyFile(tempDir / "file.txt", "edited");

    ASSERT_TRUE(RestoreCommand().execute(ctx, {"file.txt"}).has_value());
    EXPECT_TRUE(fileHasContent(tempDir / "file.txt", "original"));
}

// Test: --source=<commit>
TEST_F(RestoreCommandTest, RestoreFromSource) {
    createFile(tempDir, "file.txt", "v1");
    std::string first = addAndCommit("file.txt", "first");
    modifyFile(tempDir / "file.txt", "v2");
    addAndCommit("file.txt", "second");

    ASSERT_TRUE(RestoreCommand().execute(ctx, {"--source=" + first, "file.txt"}).has_value());
    EXPECT_TRUE(fileHasContent(tempDir / "file.txt", "v1"));
}

// Test: --staged
TEST_F(RestoreCommandTest, RestoreStaged) {
    createFile(tempDir, "file.txt", "v1");
    addAndCommit("file.txt", "first");
    modifyFile(tempDir / "file.txt", "v2");
    {
        CoutCapture capture;
        ASSERT_TRUE(AddCommand().execute(ctx, {"file.txt"}).has_value());
    }
    modifyFile(tempDir / "file.txt", "v3");

    ASSERT_TRUE(RestoreCommand().execute(ctx, {"--staged", "file.txt"}).has_value());
    EXPECT_TRUE(fileHasContent(tempDir / "file.txt", "v2"));
}

// Test: Path relative to a subdirectory
TEST_F(RestoreCommandTest, RestoreFromSubdirectory) {
    createFile(tempDir, "src/a.cpp", "a");
    addAndCommit("src/a.cpp", "first");
    modifyFile(tempDir / "src" / "a.cpp", "b");
    setCwd(tempDir / "src");

    ASSERT_TRUE(RestoreCommand().execute(ctx, {"a.cpp"}).has_value());
    EXPECT_TRUE(fileHasContent(tempDir / "src" / "a.cpp", "a"));
}

// Test: Errors
TEST_F(RestoreCommandTest, Errors) {
    createFile(tempDir, "loose.txt", "x");
    EXPECT_EQ(RestoreCommand().execute(ctx, {"loose.txt"}).error().code, ErrorCode::FileNotTracked);
    EXPECT_EQ(RestoreCommand().execute(ctx, {}).error().code, ErrorCode::InvalidArgs);
    EXPECT_EQ(RestoreCommand().execute(ctx, {"--worktree", "x"}).error().code, ErrorCode::InvalidArgs);
}
