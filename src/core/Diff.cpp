#include "core/Diff.hpp"

#include <algorithm>
#include <sstream>

#include "core/ObjectStore.hpp"

namespace oops {
namespace Diff {

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    size_t pos = 0;
    while (true) {
        size_t eol = text.find('\n', pos);
        if (eol == std::string::npos) {
            lines.push_back(text.substr(pos));
            return lines;
        }
        lines.push_back(text.substr(pos, eol - pos));
        pos = eol + 1;
    }
}

std::vector<std::pair<size_t, size_t>> commonSubsequencePairs(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    const size_t m = a.size();
    const size_t n = b.size();
    std::vector<std::vector<size_t>> dp(m + 1, std::vector<size_t>(n + 1, 0));

    for (size_t i = 1; i <= m; ++i) {
        for (size_t j = 1; j <= n; ++j) {
            if (a[i - 1] == b[j - 1]) {
                dp[i][j] = dp[i - 1][j - 1] + 1;
            } else {
                dp[i][j] = std::max(dp[i - 1][j], dp[i][j - 1]);
            }
        }
    }

    std::vector<std::pair<size_t, size_t>> pairs;
    size_t i = m;
    size_t j = n;
    while (i > 0 && j > 0) {
        if (a[i - 1] == b[j - 1]) {
            pairs.emplace_back(i - 1, j - 1);
            --i;
            --j;
        } else if (dp[i - 1][j] >= dp[i][j - 1]) {
            --i;
        } else {
            --j;
        }
    }
    std::reverse(pairs.begin(), pairs.end());
    return pairs;
}

std::vector<size_t> longestCommonSubsequence(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    std::vector<size_t> indices;
    for (const auto& p : commonSubsequencePairs(a, b)) {
        indices.push_back(p.first);
    }
    return indices;
}

std::vector<DiffLine> compareLines(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    std::vector<DiffLine> out;
    size_t i = 0;
    size_t j = 0;
    for (const auto& anchor : commonSubsequencePairs(a, b)) {
        for (; i < anchor.first; ++i) out.push_back({LineKind::Removed, a[i]});
        for (; j < anchor.second; ++j) out.push_back({LineKind::Added, b[j]});
        out.push_back({LineKind::Context, a[i]});
        ++i;
        ++j;
    }
    for (; i < a.size(); ++i) out.push_back({LineKind::Removed, a[i]});
    for (; j < b.size(); ++j) out.push_back({LineKind::Added, b[j]});
    return out;
}

std::string render(const std::vector<DiffLine>& lines, const std::string& fromLabel,
                   const std::string& toLabel, const DiffOptions& options) {
    std::ostringstream out;
    for (const auto& line : lines) {
        switch (line.kind) {
            case LineKind::Context:
                if (options.generatePatch) out << ' ' << line.text << '\n';
                break;
            case LineKind::Removed:
                out << '-' << line.text << '\n';
                break;
            case LineKind::Added:
                out << '+' << line.text << '\n';
                break;
        }
    }
    if (options.generatePatch) {
        out << "--- " << fromLabel << '\n';
        out << "+++ " << toLabel << '\n';
    }
    return out.str();
}

Expected<std::string> diffObjects(const ObjectStore& store, const std::string& hash1,
                                  const std::string& hash2, const DiffOptions& options) {
    auto first = store.read(hash1);
    if (!first) return first.error();
    auto second = store.read(hash2);
    if (!second) return second.error();

    auto lines = compareLines(splitLines(first.value()), splitLines(second.value()));
    return render(lines, hash1, hash2, options);
}

}
}
