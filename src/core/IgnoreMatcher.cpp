#include "core/IgnoreMatcher.hpp"

#include <fstream>
#include <iterator>
#include <sstream>

#include "core/Constants.hpp"
#include "util/PatternMatcher.hpp"

namespace fs = std::filesystem;

namespace oops {

namespace {

std::vector<std::string> splitComponents(const std::string& path) {
    std::vector<std::string> parts;
    std::string cur;
    for (char c : path) {
        if (c == '/') {
            if (!cur.empty()) parts.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) parts.push_back(cur);
    return parts;
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

}

IgnoreMatcher::IgnoreMatcher(std::vector<std::string> patterns) : pats(std::move(patterns)) {}

std::vector<std::string> IgnoreMatcher::parsePatterns(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        std::string t = trim(line);
        if (t.empty() || t[0] == '#') continue;
        out.push_back(t);
    }
    return out;
}

Expected<IgnoreMatcher> IgnoreMatcher::load(const fs::path& root) {
    std::vector<std::string> patterns{Constants::REPO_DIR};

    fs::path ignorePath = root / Constants::IGNORE_FILE;
    std::error_code ec;
    if (!fs::exists(ignorePath, ec)) {
        return IgnoreMatcher(std::move(patterns));
    }
    std::ifstream in(ignorePath, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, std::string("Failed to read ") + Constants::IGNORE_FILE};
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    for (auto& p : parsePatterns(text)) {
        patterns.push_back(std::move(p));
    }
    return IgnoreMatcher(std::move(patterns));
}

bool IgnoreMatcher::matchGlob(const std::string& pattern, const std::string& path) {
    return PatternMatcher::globMatch(pattern, path);
}

bool IgnoreMatcher::matchSegments(const std::string& pattern, const std::string& path) {
    if (pattern.empty()) return false;

    if (pattern[0] == '/') {
        std::string anchored = pattern.substr(1);
        return !anchored.empty() && path.compare(0, anchored.size(), anchored) == 0;
    }

    std::vector<std::string> pathParts = splitComponents(path);
    if (pattern.find('/') == std::string::npos) {
        for (const auto& part : pathParts) {
            if (part == pattern) return true;
        }
        return false;
    }

    std::vector<std::string> patParts = splitComponents(pattern);
    if (patParts.empty()) return false;
    for (size_t start = 0; start < pathParts.size(); ++start) {
        if (pathParts[start] != patParts[0]) continue;
        size_t k = 1;
        while (k < patParts.size() && start + k < pathParts.size() &&
               pathParts[start + k] == patParts[k]) {
            ++k;
        }
        if (k == patParts.size()) return true;
    }
    return false;
}

bool IgnoreMatcher::isIgnored(const std::string& path) const {
    std::string leaf = path;
    size_t slash = path.find_last_of('/');
    if (slash != std::string::npos) leaf = path.substr(slash + 1);

    for (const auto& p : pats) {
        if (PatternMatcher::isPattern(p)) {
            if (matchGlob(p, path) || matchGlob(p, leaf)) return true;
        } else if (matchSegments(p, path)) {
            return true;
        }
    }
    return false;
}

}
