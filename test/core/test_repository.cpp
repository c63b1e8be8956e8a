#include <gtest/gtest.h>
#include <filesystem>
#include <string>
#include <vector>
#include "test_utils.hpp"
#include "core/History.hpp"
#include "core/ObjectStore.hpp"
#include "core/Repository.hpp"

namespace fs = std::filesystem;

using namespace oops;
using namespace oops::test::utils;

class RepositoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
    }

    void TearDown() override {
        removeDir(tempDir);
    }

    std::string makeCommit(const std::string& message, int64_t timestamp = 1700000000) {
        ObjectStore store(tempDir);
        auto res = History::commit(tempDir, store, {}, message, {}, "tester", timestamp);
        EXPECT_TRUE(res.has_value()) << res.error().message;
        return res.has_value() ? res.value() : std::string();
    }

    fs::path tempDir;
};

// Test: init creates the layout
TEST_F(RepositoryTest, InitCreatesLayout) {
    auto res = Repository::instance().init(tempDir);
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_TRUE(fs::is_directory(tempDir / ".oops" / "objects"));
    EXPECT_TRUE(fs::is_directory(tempDir / ".oops" / "refs"));
    EXPECT_EQ(readFile(tempDir / ".oops" / "branch"), "main");
    EXPECT_FALSE(fs::exists(tempDir / ".oops" / "refs" / "HEAD"));
}

// Test: Second init fails
TEST_F(RepositoryTest, InitTwiceFails) {
    ASSERT_TRUE(Repository::instance().init(tempDir).has_value());
    auto again = Repository::instance().init(tempDir);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::AlreadyInitialized);
}

// Test: Discover repository root in current directory
TEST_F(RepositoryTest, DiscoverRootCurrentDirectory) {
    initTestRepo(tempDir);
    auto result = Repository::instance().discoverRoot(tempDir);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result.value(), tempDir);
}

// Test: Discover repository root from subdirectory
TEST_F(RepositoryTest, DiscoverRootFromSubdirectory) {
    initTestRepo(tempDir);
    fs::path subdir = tempDir / "src" / "util";
    fs::create_directories(subdir);

    auto result = Repository::instance().discoverRoot(subdir);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result.value(), tempDir);
}

// Test: Discover fails when not in repository
TEST_F(RepositoryTest, DiscoverFailsNotInRepository) {
    auto result = Repository::instance().discoverRoot(tempDir);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NotARepository);
}

// Test: HEAD before and after the first commit
TEST_F(RepositoryTest, ResolveHeadEmptyThenSet) {
    initTestRepo(tempDir);
    auto empty = Repository::resolveHEAD(tempDir);
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty.value().empty());

    std::string hash = makeCommit("first");
    auto head = Repository::resolveHEAD(tempDir);
    ASSERT_TRUE(head.has_value());
    EXPECT_EQ(head.value(), hash);
}

// Test: Pointer files tolerate surrounding whitespace
TEST_F(RepositoryTest, PointerFilesAreTrimmed) {
    initTestRepo(tempDir);
    createFile(tempDir, ".oops/refs/HEAD", "  abc123\n");
    createFile(tempDir, ".oops/branch", "dev\n");
    EXPECT_EQ(Repository::resolveHEAD(tempDir).value(), "abc123");
    EXPECT_EQ(Repository::getCurrentBranch(tempDir).value(), "dev");
}

// Test: Branch creation
TEST_F(RepositoryTest, CreateBranch) {
    initTestRepo(tempDir);
    auto early = Repository::createBranch(tempDir, "feature");
    ASSERT_FALSE(early.has_value());
    EXPECT_EQ(early.error().code, ErrorCode::NoCommits);

    std::string hash = makeCommit("first");
    ASSERT_TRUE(Repository::createBranch(tempDir, "feature").has_value());
    EXPECT_EQ(readFile(tempDir / ".oops" / "refs" / "feature"), hash);

    auto branches = Repository::listBranches(tempDir);
    ASSERT_TRUE(branches.has_value());
    std::vector<std::string> expected{"feature", "main"};
    EXPECT_EQ(branches.value(), expected);
}

// Test: Names that cannot be refs
TEST_F(RepositoryTest, CreateBranchRejectsBadNames) {
    initTestRepo(tempDir);
    makeCommit("first");
    for (const std::string& bad : {std::string(""), std::string("HEAD"), std::string("a/b"),
                                   std::string("has space"), std::string("..")}) {
        auto res = Repository::createBranch(tempDir, bad);
        ASSERT_FALSE(res.has_value()) << bad;
        EXPECT_EQ(res.error().code, ErrorCode::InvalidArgs);
    }
}

// Test: Checkout a branch moves HEAD to its commit
TEST_F(RepositoryTest, CheckoutBranch) {
    initTestRepo(tempDir);
    std::string first = makeCommit("first");
    ASSERT_TRUE(Repository::createBranch(tempDir, "feature").has_value());
    std::string second = makeCommit("second", 1700000001);

    ObjectStore store(tempDir);
    auto res = Repository::checkout(tempDir, store, "feature");
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_EQ(res.value(), first);
    EXPECT_EQ(Repository::resolveHEAD(tempDir).value(), first);
    EXPECT_EQ(Repository::getCurrentBranch(tempDir).value(), "feature");
    EXPECT_FALSE(Repository::isDetached(tempDir).value());

    // Commits on the branch advance it, leaving main alone
    std::string third = makeCommit("third", 1700000002);
    EXPECT_EQ(Repository::getBranchCommit(tempDir, "feature").value(), third);
    EXPECT_EQ(Repository::getBranchCommit(tempDir, "main").value(), second);
}

// Test: Checkout of a raw hash detaches HEAD
TEST_F(RepositoryTest, CheckoutHashDetaches) {
    initTestRepo(tempDir);
    std::string first = makeCommit("first");
    makeCommit("second", 1700000001);

    ObjectStore store(tempDir);
    auto res = Repository::checkout(tempDir, store, first);
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_EQ(Repository::resolveHEAD(tempDir).value(), first);
    EXPECT_EQ(Repository::getCurrentBranch(tempDir).value(), first);
    EXPECT_TRUE(Repository::isDetached(tempDir).value());
}

// Test: HEAD never points at something that is not a commit
TEST_F(RepositoryTest, CheckoutUnknownTargetLeavesHead) {
    initTestRepo(tempDir);
    std::string first = makeCommit("first");

    ObjectStore store(tempDir);
    auto missing = Repository::checkout(tempDir, store, "nosuchbranch");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::ObjectNotFound);

    auto blob = store.write("just a blob");
    ASSERT_TRUE(blob.has_value());
    auto notCommit = Repository::checkout(tempDir, store, blob.value());
    ASSERT_FALSE(notCommit.has_value());
    EXPECT_EQ(notCommit.error().code, ErrorCode::InvalidCommit);

    EXPECT_EQ(Repository::resolveHEAD(tempDir).value(), first);
    EXPECT_EQ(Repository::getCurrentBranch(tempDir).value(), "main");
}

// Test: Fresh repository is not detached
TEST_F(RepositoryTest, FreshRepositoryNotDetached) {
    initTestRepo(tempDir);
    auto detached = Repository::isDetached(tempDir);
    ASSERT_TRUE(detached.has_value());
    EXPECT_FALSE(detached.value());
}

// Test: Command-line paths relative to a subdirectory
TEST_F(RepositoryTest, ToRepoRelative) {
    initTestRepo(tempDir);
    fs::create_directories(tempDir / "src" / "util");

    EXPECT_EQ(Repository::toRepoRelative(tempDir, tempDir, "file.txt"), "file.txt");
    EXPECT_EQ(Repository::toRepoRelative(tempDir, tempDir, "./a/b"), "a/b");
    EXPECT_EQ(Repository::toRepoRelative(tempDir, tempDir / "src", "main.cpp"), "src/main.cpp");
    EXPECT_EQ(Repository::toRepoRelative(tempDir, tempDir / "src", "."), "src");
    EXPECT_EQ(Repository::toRepoRelative(tempDir, tempDir / "src" / "util", "../x.cpp"), "src/x.cpp");
    EXPECT_EQ(Repository::toRepoRelative(tempDir, tempDir / "src", "*.cpp"), "src/*.cpp");
}
