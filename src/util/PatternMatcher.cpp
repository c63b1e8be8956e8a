#include "util/PatternMatcher.hpp"

#include "core/Index.hpp"

namespace oops {
namespace PatternMatcher {

bool globMatch(const std::string& pattern, const std::string& str) {
    size_t p = 0;
    size_t s = 0;
    size_t starP = std::string::npos;
    size_t starS = 0;

    while (s < str.size()) {
        if (p < pattern.size() && pattern[p] == '*') {
            starP = p;
            starS = s;
            ++p;
        } else if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == str[s])) {
            ++p;
            ++s;
        } else if (starP != std::string::npos) {
            // Let the last '*' swallow one more character
            p = starP + 1;
            s = ++starS;
        } else {
            return false;
        }
    }

    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

bool isPattern(const std::string& str) {
    return str.find('*') != std::string::npos ||
           str.find('?') != std::string::npos;
}

std::vector<std::string> matchPathsInIndex(const std::string& pattern, const std::vector<IndexEntry>& entries) {
    std::vector<std::string> matches;
    if (pattern.empty()) {
        return matches;
    }
    for (const auto& e : entries) {
        if (globMatch(pattern, e.path)) {
            matches.push_back(e.path);
        }
    }
    return matches;
}

}  // namespace PatternMatcher
}  // namespace oops
