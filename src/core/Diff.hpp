#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "util/Expected.hpp"

namespace oops {

class ObjectStore;

struct DiffOptions {
    size_t contextLines{3};     // Accepted for compatibility; output is never narrowed
    bool generatePatch{false};  // Include unchanged lines and the ---/+++ footer
};

enum class LineKind { Context, Removed, Added };

struct DiffLine {
    LineKind kind;
    std::string text;
};

/**
 * @brief Line diff built on a longest-common-subsequence table
 */
namespace Diff {

/**
 * @brief Split text on every '\n'
 *
 * A trailing newline yields a final empty line, so "a\n" and "a" differ.
 * Empty text is a single empty line.
 */
std::vector<std::string> splitLines(const std::string& text);

/**
 * @brief Indices into a of one longest common subsequence of a and b
 *
 * O(|a|*|b|) table where cell [i][j] is the LCS length of a[0..i) and
 * b[0..j). Backtracking from [m][n] takes the diagonal on equal
 * elements, otherwise moves toward the larger neighbour, preferring to
 * drop an element of a on ties. Result is strictly ascending.
 */
std::vector<size_t> longestCommonSubsequence(const std::vector<std::string>& a, const std::vector<std::string>& b);

/// Matched (a index, b index) pairs of the same subsequence
std::vector<std::pair<size_t, size_t>> commonSubsequencePairs(const std::vector<std::string>& a, const std::vector<std::string>& b);

/**
 * @brief Edit script turning a into b
 *
 * Between two matched lines, removals from a come before additions
 * from b.
 */
std::vector<DiffLine> compareLines(const std::vector<std::string>& a, const std::vector<std::string>& b);

/**
 * @brief Text rendering: " ctx", "-old", "+new", one per line
 *
 * Context lines are only written with generatePatch, which also appends
 * "--- <fromLabel>" and "+++ <toLabel>" after the body.
 */
std::string render(const std::vector<DiffLine>& lines, const std::string& fromLabel,
                   const std::string& toLabel, const DiffOptions& options);

/// Diff two stored objects line by line
Expected<std::string> diffObjects(const ObjectStore& store, const std::string& hash1,
                                  const std::string& hash2, const DiffOptions& options);

}

}
