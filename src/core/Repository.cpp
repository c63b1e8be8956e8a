#include "core/Repository.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <vector>

#include "core/Constants.hpp"
#include "core/History.hpp"
#include "core/Index.hpp"
#include "core/ObjectStore.hpp"

namespace fs = std::filesystem;

namespace oops {

namespace {

fs::path refsDir(const fs::path& root) {
    return root / Constants::REPO_DIR / Constants::REFS_DIR;
}

/// First line of a small pointer file with surrounding whitespace removed
Expected<std::string> readPointerFile(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::string();
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "Failed to read " + path.string()};
    }
    std::string value;
    std::getline(in, value);
    if (in.bad()) {
        return Error{ErrorCode::IoError, "Failed to read " + path.string()};
    }
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.pop_back();
    }
    size_t first = 0;
    while (first < value.size() && std::isspace(static_cast<unsigned char>(value[first]))) {
        ++first;
    }
    return value.substr(first);
}

Expected<void> writePointerFile(const fs::path& path, const std::string& value) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return Error{ErrorCode::IoError, "Failed to create " + path.parent_path().string() + ": " + ec.message()};
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::IoError, "Failed to open " + path.string() + " for writing"};
    }
    out << value;
    out.flush();
    if (!out || !out.good()) {
        return Error{ErrorCode::IoError, "Failed to write " + path.string()};
    }
    return {};
}

}

Repository& Repository::instance() {
    static Repository repo;
    return repo;
}

fs::path Repository::repoDir(const fs::path& root) {
    return root / Constants::REPO_DIR;
}

Expected<void> Repository::init(const fs::path& path) {
    fs::path root = fs::absolute(path);
    fs::path rd = repoDir(root);
    std::error_code ec;
    if (fs::exists(rd, ec)) {
        return Error{ErrorCode::AlreadyInitialized, std::string(Constants::REPO_DIR) + " already exists"};
    }
    fs::create_directories(rd / Constants::OBJECTS_DIR, ec);
    if (ec) return Error{ErrorCode::IoError, std::string("Failed to create directories: ") + ec.message()};
    fs::create_directories(rd / Constants::REFS_DIR, ec);
    if (ec) return Error{ErrorCode::IoError, std::string("Failed to create refs: ") + ec.message()};

    return setCurrentBranch(root, Constants::DEFAULT_BRANCH);
}

Expected<fs::path> Repository::discoverRoot(const fs::path& start) const {
    fs::path cur = fs::absolute(start);
    std::error_code ec;
    while (true) {
        fs::path rd = repoDir(cur);
        if (fs::exists(rd, ec) && fs::is_directory(rd, ec)) {
            return cur;
        }
        if (!cur.has_parent_path() || cur == cur.parent_path()) {
            return Error{ErrorCode::NotARepository, "Not inside an oops repository"};
        }
        cur = cur.parent_path();
    }
}

Expected<std::string> Repository::resolveHEAD(const fs::path& root) {
    return readPointerFile(refsDir(root) / Constants::HEAD_REF);
}

Expected<void> Repository::updateHEAD(const fs::path& root, const std::string& commitHash) {
    return writePointerFile(refsDir(root) / Constants::HEAD_REF, commitHash);
}

bool Repository::isValidBranchName(const std::string& name) {
    if (name.empty() || name == Constants::HEAD_REF || name == "." || name == "..") return false;
    return std::none_of(name.begin(), name.end(), [](char c) {
        return c == '/' || c == '\\' || std::isspace(static_cast<unsigned char>(c));
    });
}

Expected<bool> Repository::branchExists(const fs::path& root, const std::string& branchName) {
    if (!isValidBranchName(branchName)) return false;
    fs::path refPath = refsDir(root) / branchName;
    std::error_code ec;
    bool exists = fs::is_regular_file(refPath, ec);
    return exists;
}

Expected<std::vector<std::string>> Repository::listBranches(const fs::path& root) {
    fs::path dir = refsDir(root);
    std::vector<std::string> branches;

    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        return branches;
    }
    for (fs::directory_iterator it(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (name != Constants::HEAD_REF && it->is_regular_file()) {
            branches.push_back(name);
        }
    }
    if (ec) {
        return Error{ErrorCode::IoError, "Failed to read refs directory: " + ec.message()};
    }
    std::sort(branches.begin(), branches.end());
    return branches;
}

Expected<std::string> Repository::getCurrentBranch(const fs::path& root) {
    auto name = readPointerFile(repoDir(root) / Constants::BRANCH_FILE);
    if (!name) return name;
    if (name.value().empty()) return std::string(Constants::DEFAULT_BRANCH);
    return name;
}

Expected<void> Repository::setCurrentBranch(const fs::path& root, const std::string& name) {
    return writePointerFile(repoDir(root) / Constants::BRANCH_FILE, name);
}

Expected<void> Repository::writeRef(const fs::path& root, const std::string& name, const std::string& commitHash) {
    if (!isValidBranchName(name)) {
        return Error{ErrorCode::InvalidArgs, "Invalid branch name '" + name + "'"};
    }
    return writePointerFile(refsDir(root) / name, commitHash);
}

Expected<void> Repository::createBranch(const fs::path& root, const std::string& branchName) {
    if (!isValidBranchName(branchName)) {
        return Error{ErrorCode::InvalidArgs, "Invalid branch name '" + branchName + "'"};
    }
    auto head = resolveHEAD(root);
    if (!head) return head.error();
    if (head.value().empty()) {
        return Error{ErrorCode::NoCommits, "Cannot create branch '" + branchName + "': no commits yet"};
    }
    return writeRef(root, branchName, head.value());
}

Expected<std::string> Repository::getBranchCommit(const fs::path& root, const std::string& branchName) {
    if (!isValidBranchName(branchName)) {
        return std::string();
    }
    return readPointerFile(refsDir(root) / branchName);
}

Expected<std::string> Repository::checkout(const fs::path& root, const ObjectStore& store, const std::string& name) {
    auto exists = branchExists(root, name);
    if (!exists) return exists.error();

    std::string target;
    if (exists.value()) {
        auto ref = getBranchCommit(root, name);
        if (!ref) return ref.error();
        target = ref.value();
    } else {
        target = name;
    }

    // HEAD may only ever name a commit
    auto commit = History::readCommit(store, target);
    if (!commit) return commit.error();

    auto head = updateHEAD(root, target);
    if (!head) return head.error();
    auto branch = setCurrentBranch(root, name);
    if (!branch) return branch.error();
    return target;
}

Expected<bool> Repository::isDetached(const fs::path& root) {
    auto head = resolveHEAD(root);
    if (!head) return head.error();
    if (head.value().empty()) return false;
    auto name = getCurrentBranch(root);
    if (!name) return name.error();
    auto exists = branchExists(root, name.value());
    if (!exists) return exists.error();
    return !exists.value();
}

std::string Repository::toRepoRelative(const fs::path& root, const fs::path& cwd, const std::string& arg) {
    std::error_code ec;
    fs::path base = fs::weakly_canonical(cwd, ec);
    if (ec) base = cwd;
    fs::path top = fs::weakly_canonical(root, ec);
    if (ec) top = root;

    fs::path prefix = base.lexically_relative(top);
    std::string prefixStr = prefix.generic_string();
    if (prefixStr.empty() || prefixStr == "." || prefixStr.rfind("..", 0) == 0) {
        return normalizePath(arg);
    }
    std::string joined = (prefix / arg).lexically_normal().generic_string();
    return normalizePath(joined);
}

}
