#include "core/Restore.hpp"

#include "core/History.hpp"
#include "core/Repository.hpp"
#include "core/WorkingTree.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace oops {

namespace {

Expected<IndexEntry> entryFromCommit(const ObjectStore& store, const std::string& commitHash, const std::string& path) {
    auto commit = History::readCommit(store, commitHash);
    if (!commit) return commit.error();
    auto snapshot = History::readSnapshot(store, commit.value());
    if (!snapshot) return snapshot.error();
    for (const auto& e : snapshot.value()) {
        if (e.path == path) return e;
    }
    return Error{ErrorCode::FileNotTracked, "Path '" + path + "' is not recorded in commit " + commitHash};
}

}

Expected<void> restorePath(const fs::path& root, const ObjectStore& store,
                           const Index& index, const std::string& relPath, const RestoreOptions& options) {
    std::string path = normalizePath(relPath);
    const IndexEntry* tracked = index.find(path);
    if (!tracked) {
        return Error{ErrorCode::FileNotTracked, "Path '" + path + "' is not tracked"};
    }

    IndexEntry source = *tracked;
    if (!options.source.empty()) {
        auto e = entryFromCommit(store, options.source, path);
        if (!e) return e.error();
        source = e.value();
    } else if (!options.staged) {
        auto head = Repository::resolveHEAD(root);
        if (!head) return head.error();
        if (head.value().empty()) {
            return Error{ErrorCode::NoCommits, "No commits yet"};
        }
        auto e = entryFromCommit(store, head.value(), path);
        if (!e) return e.error();
        source = e.value();
    }

    auto content = store.read(source.hashHex);
    if (!content) return content.error();

    auto res = WorkingTree::writeContent(root / path, source.fileType, content.value());
    if (!res) return res;

    Logger::instance().debug("Restored " + path + " from " + source.hashHex);
    return {};
}

}
