#include <gtest/gtest.h>
#include <filesystem>
#include <string>
#include <vector>
#include "test_utils.hpp"
#include "core/Diff.hpp"
#include "core/ObjectStore.hpp"

namespace fs = std::filesystem;

using namespace oops;
using namespace oops::test::utils;

namespace {

using Lines = std::vector<std::string>;

bool strictlyAscendingWithin(const std::vector<size_t>& idx, size_t limit) {
    for (size_t i = 0; i < idx.size(); ++i) {
        if (idx[i] >= limit) return false;
        if (i > 0 && idx[i] <= idx[i - 1]) return false;
    }
    return true;
}

}

// Test: LCS of a sequence with itself is every index
TEST(DiffTest, LcsWithSelf) {
    Lines a{"x", "y", "x", "z", "y"};
    std::vector<size_t> expected{0, 1, 2, 3, 4};
    EXPECT_EQ(Diff::longestCommonSubsequence(a, a), expected);
}

// Test: LCS against an empty sequence is empty
TEST(DiffTest, LcsWithEmpty) {
    Lines a{"x", "y"};
    EXPECT_TRUE(Diff::longestCommonSubsequence(a, {}).empty());
    EXPECT_TRUE(Diff::longestCommonSubsequence({}, a).empty());
}

// Test: Indices are valid, ascending and of maximal length
TEST(DiffTest, LcsIndicesAscendingAndMaximal) {
    Lines a{"a", "b", "c", "d", "e", "f"};
    Lines b{"b", "x", "d", "f", "a"};
    auto idx = Diff::longestCommonSubsequence(a, b);
    EXPECT_TRUE(strictlyAscendingWithin(idx, a.size()));
    ASSERT_EQ(idx.size(), 3u);  // b d f
    EXPECT_EQ(a[idx[0]], "b");
    EXPECT_EQ(a[idx[1]], "d");
    EXPECT_EQ(a[idx[2]], "f");
}

// Test: Ties drop the later element of a, keeping the earlier match
TEST(DiffTest, LcsTieBreakPrefersConsumingA) {
    Lines a{"p", "q"};
    Lines b{"q", "p"};
    auto idx = Diff::longestCommonSubsequence(a, b);
    ASSERT_EQ(idx.size(), 1u);
    EXPECT_EQ(idx[0], 0u);
    EXPECT_TRUE(strictlyAscendingWithin(idx, a.size()));
}

// Test: Pairs describe the same subsequence on both sides
TEST(DiffTest, PairsMatchBothSides) {
    Lines a{"one", "two", "three", "four"};
    Lines b{"zero", "two", "four", "five"};
    auto pairs = Diff::commonSubsequencePairs(a, b);
    ASSERT_EQ(pairs.size(), 2u);
    for (const auto& [i, j] : pairs) {
        EXPECT_EQ(a[i], b[j]);
    }
}

// Test: Line splitting
TEST(DiffTest, SplitLines) {
    EXPECT_EQ(Diff::splitLines("a\nb\n"), (Lines{"a", "b", ""}));
    EXPECT_EQ(Diff::splitLines("a\nb"), (Lines{"a", "b"}));
    EXPECT_EQ(Diff::splitLines("a\n\nb\n"), (Lines{"a", "", "b", ""}));
    EXPECT_EQ(Diff::splitLines(""), (Lines{""}));
}

// Test: Edit script turns a into b
TEST(DiffTest, CompareLinesProducesEditScript) {
    Lines a{"keep", "old", "tail"};
    Lines b{"keep", "new", "tail", "extra"};
    auto lines = Diff::compareLines(a, b);

    Lines rebuiltA;
    Lines rebuiltB;
    for (const auto& l : lines) {
        if (l.kind != LineKind::Added) rebuiltA.push_back(l.text);
        if (l.kind != LineKind::Removed) rebuiltB.push_back(l.text);
    }
    EXPECT_EQ(rebuiltA, a);
    EXPECT_EQ(rebuiltB, b);

    ASSERT_EQ(lines.size(), 5u);
    EXPECT_EQ(lines[1].kind, LineKind::Removed);  // Removal before addition
    EXPECT_EQ(lines[1].text, "old");
    EXPECT_EQ(lines[2].kind, LineKind::Added);
    EXPECT_EQ(lines[2].text, "new");
    EXPECT_EQ(lines[4].kind, LineKind::Added);
    EXPECT_EQ(lines[4].text, "extra");
}

// Test: Rendering without and with patch mode
TEST(DiffTest, RenderModes) {
    std::vector<DiffLine> lines{{LineKind::Context, "same"}, {LineKind::Removed, "gone"}, {LineKind::Added, "new"}};

    DiffOptions plain;
    EXPECT_EQ(Diff::render(lines, "h1", "h2", plain), "-gone\n+new\n");

    DiffOptions patch;
    patch.generatePatch = true;
    EXPECT_EQ(Diff::render(lines, "h1", "h2", patch), " same\n-gone\n+new\n--- h1\n+++ h2\n");
}

// Test: contextLines never narrows the output
TEST(DiffTest, ContextLinesDoesNotNarrow) {
    Lines a{"1", "2", "3", "4", "5", "6", "7", "8", "9"};
    Lines b{"1", "2", "3", "4", "X", "6", "7", "8", "9"};
    auto lines = Diff::compareLines(a, b);

    DiffOptions narrow;
    narrow.generatePatch = true;
    narrow.contextLines = 0;
    DiffOptions wide = narrow;
    wide.contextLines = 100;
    EXPECT_EQ(Diff::render(lines, "a", "b", narrow), Diff::render(lines, "a", "b", wide));
}

// Test: Diff of two stored objects
TEST(DiffTest, DiffObjects) {
    fs::path dir = createTempDir();
    initTestRepo(dir);
    ObjectStore store(dir);
    auto h1 = store.write("alpha\nbeta\ngamma\n");
    auto h2 = store.write("alpha\ndelta\ngamma\n");
    ASSERT_TRUE(h1.has_value());
    ASSERT_TRUE(h2.has_value());

    auto out = Diff::diffObjects(store, h1.value(), h2.value(), DiffOptions{});
    ASSERT_TRUE(out.has_value()) << out.error().message;
    EXPECT_EQ(out.value(), "-beta\n+delta\n");

    auto same = Diff::diffObjects(store, h1.value(), h1.value(), DiffOptions{});
    ASSERT_TRUE(same.has_value());
    EXPECT_TRUE(same.value().empty());

    DiffOptions patch;
    patch.generatePatch = true;
    auto full = Diff::diffObjects(store, h1.value(), h2.value(), patch);
    ASSERT_TRUE(full.has_value());
    EXPECT_EQ(full.value(), " alpha\n-beta\n+delta\n gamma\n \n--- " + h1.value() + "\n+++ " + h2.value() + "\n");

    auto missing = Diff::diffObjects(store, h1.value(), std::string(40, '0'), DiffOptions{});
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::ObjectNotFound);
    removeDir(dir);
}

// Test: A missing final newline is a difference
TEST(DiffTest, TrailingNewlineDiffers) {
    fs::path dir = createTempDir();
    initTestRepo(dir);
    ObjectStore store(dir);
    auto withNewline = store.write("a\n");
    auto without = store.write("a");
    ASSERT_TRUE(withNewline.has_value());
    ASSERT_TRUE(without.has_value());
    ASSERT_NE(withNewline.value(), without.value());

    auto out = Diff::diffObjects(store, withNewline.value(), without.value(), DiffOptions{});
    ASSERT_TRUE(out.has_value()) << out.error().message;
    EXPECT_EQ(out.value(), "-\n");

    auto back = Diff::diffObjects(store, without.value(), withNewline.value(), DiffOptions{});
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back.value(), "+\n");
    removeDir(dir);
}
