#pragma once

#include <string>
#include <vector>

namespace oops {

struct IndexEntry;

/**
 * @brief Glob matching for pathspecs, rm patterns and ignore rules
 *
 * Supported wildcards:
 *   ? -> exactly one character
 *   * -> zero or more characters, '/' included
 *
 * Every other character matches itself. There are no character classes
 * and no escape character.
 *
 * Examples:
 *   *.txt   matches "notes.txt" and "docs/notes.txt"
 *   a/*     matches "a/b" but not "ab"
 *   a?c     matches "abc" but not "ac"
 */
namespace PatternMatcher {

/**
 * @brief Match a whole string against a glob pattern
 *
 * Backtracking two-pointer scan: on '*' the pattern and string positions
 * are remembered; on a later mismatch the scan resumes one character
 * further into the string from the last '*'. Trailing '*' characters are
 * consumed at the end.
 */
bool globMatch(const std::string& pattern, const std::string& str);

/// True if the string contains '*' or '?'
bool isPattern(const std::string& str);

/// Index paths matching pattern, in index order
std::vector<std::string> matchPathsInIndex(const std::string& pattern, const std::vector<IndexEntry>& entries);

}  // namespace PatternMatcher

}  // namespace oops
