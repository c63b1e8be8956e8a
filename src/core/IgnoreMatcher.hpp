#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "util/Expected.hpp"

namespace oops {

/**
 * @brief Decides which working-tree paths are excluded from tracking
 *
 * Patterns come from .oopsignore (one per line, blank and '#' lines
 * skipped) plus the implicit ".oops".
 *
 * Two matching modes exist:
 *   Glob     - the pattern is a glob matched against the whole path.
 *   Segment  - "name" matches any path component equal to it,
 *              "/name" anchors at the start of the path,
 *              "a/b" matches consecutive components a then b anywhere.
 *
 * isIgnored() applies glob mode to patterns containing '*' or '?'
 * (against the full path and against its last component) and segment
 * mode to every other pattern.
 */
class IgnoreMatcher {
public:
    IgnoreMatcher() = default;
    explicit IgnoreMatcher(std::vector<std::string> patterns);

    /// Read .oopsignore under root; a missing file yields just ".oops"
    static Expected<IgnoreMatcher> load(const std::filesystem::path& root);

    /// Parse ignore file text (without the implicit ".oops")
    static std::vector<std::string> parsePatterns(const std::string& text);

    bool isIgnored(const std::string& path) const;

    const std::vector<std::string>& patterns() const { return pats; }

    static bool matchGlob(const std::string& pattern, const std::string& path);
    static bool matchSegments(const std::string& pattern, const std::string& path);

private:
    std::vector<std::string> pats;
};

}
