#include "core/Status.hpp"

#include <sstream>
#include <unordered_map>

#include "core/History.hpp"
#include "core/Repository.hpp"
#include "core/WorkingTree.hpp"
#include "util/FileMetadata.hpp"

namespace fs = std::filesystem;

namespace oops {

const char* fileStatusName(FileStatus status) {
    switch (status) {
        case FileStatus::Unmodified: return "unmodified";
        case FileStatus::Modified: return "modified";
        case FileStatus::Deleted: return "deleted";
        case FileStatus::Untracked: return "untracked";
        case FileStatus::Directory: return "directory";
    }
    return "unknown";
}

namespace Status {

Expected<FileStatus> getFileStatus(const fs::path& root, const ObjectStore& store,
                                   const std::string& relPath, const IndexEntry* entry) {
    fs::path abs = root / relPath;
    std::error_code ec;
    FileMetadata meta = getFileMetadata(abs, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "Cannot stat " + relPath + ": " + ec.message()};
    }
    if (!meta.exists) {
        return entry ? FileStatus::Deleted : FileStatus::Untracked;
    }
    if (meta.type == FileType::Directory) {
        return FileStatus::Directory;
    }
    if (!entry) {
        return FileStatus::Untracked;
    }
    if (meta.mtimeNs == entry->mtimeNs) {
        return FileStatus::Unmodified;
    }

    auto content = WorkingTree::readContent(abs, meta.type);
    if (!content) return content.error();
    return store.hashContent(content.value()) == entry->hashHex ? FileStatus::Unmodified : FileStatus::Modified;
}

namespace {

Expected<std::vector<StagedChange>> stagedChanges(const fs::path& root, const ObjectStore& store, const Index& index) {
    std::vector<StagedChange> changes;

    auto head = Repository::resolveHEAD(root);
    if (!head) return head.error();

    std::unordered_map<std::string, std::string> committed;  // path -> hash
    std::vector<std::string> committedOrder;
    if (!head.value().empty()) {
        auto commit = History::readCommit(store, head.value());
        if (!commit) return commit.error();
        auto snapshot = History::readSnapshot(store, commit.value());
        if (!snapshot) return snapshot.error();
        for (const auto& e : snapshot.value()) {
            committed[e.path] = e.hashHex;
            committedOrder.push_back(e.path);
        }
    }

    for (const auto& e : index.entries()) {
        auto it = committed.find(e.path);
        if (it == committed.end()) {
            changes.push_back({StagedChange::Kind::Added, e.path});
        } else if (it->second != e.hashHex) {
            changes.push_back({StagedChange::Kind::Modified, e.path});
        }
    }
    for (const auto& path : committedOrder) {
        if (!index.find(path)) {
            changes.push_back({StagedChange::Kind::Deleted, path});
        }
    }
    return changes;
}

}

Expected<StatusReport> collect(const fs::path& root, const ObjectStore& store,
                               const Index& index, const IgnoreMatcher& ignore) {
    StatusReport report;

    auto branch = Repository::getCurrentBranch(root);
    if (!branch) return branch.error();
    report.branch = branch.value();
    auto detached = Repository::isDetached(root);
    if (!detached) return detached.error();
    report.detached = detached.value();

    auto staged = stagedChanges(root, store, index);
    if (!staged) return staged.error();
    report.staged = std::move(staged.value());

    for (const auto& e : index.entries()) {
        auto st = getFileStatus(root, store, e.path, &e);
        if (!st) return st.error();
        if (st.value() == FileStatus::Modified) {
            report.modified.push_back(e.path);
        } else if (st.value() == FileStatus::Deleted) {
            report.deleted.push_back(e.path);
        }
    }

    Expected<void> failure;
    WorkingTree::walkDirectory(root, "", false, [&](const WalkEntry& entry) {
        if (!failure) return false;
        if (ignore.isIgnored(entry.path)) return false;
        if (index.find(entry.path)) return false;
        auto st = getFileStatus(root, store, entry.path, nullptr);
        if (!st) {
            failure = st.error();
            return false;
        }
        if (st.value() == FileStatus::Untracked) {
            report.untracked.push_back(entry.path);
        }
        return false;
    });
    if (!failure) return failure.error();

    return report;
}

std::string format(const StatusReport& report) {
    std::ostringstream out;
    if (report.detached) {
        out << "HEAD detached at " << report.branch << "\n\n";
    } else {
        out << "On branch " << report.branch << "\n\n";
    }

    if (report.clean()) {
        out << "nothing to commit, working tree clean\n";
        return out.str();
    }

    if (!report.staged.empty()) {
        out << "Changes to be committed:\n";
        for (const auto& c : report.staged) {
            switch (c.kind) {
                case StagedChange::Kind::Added: out << "  new file: " << c.path << "\n"; break;
                case StagedChange::Kind::Modified: out << "  modified: " << c.path << "\n"; break;
                case StagedChange::Kind::Deleted: out << "  deleted:  " << c.path << "\n"; break;
            }
        }
        out << "\n";
    }

    if (!report.modified.empty() || !report.deleted.empty()) {
        out << "Changes not staged for commit:\n";
        for (const auto& p : report.modified) {
            out << "  modified: " << p << "\n";
        }
        for (const auto& p : report.deleted) {
            out << "  deleted:  " << p << "\n";
        }
        out << "\n";
    }

    if (!report.untracked.empty()) {
        out << "Untracked files:\n";
        for (const auto& p : report.untracked) {
            out << "  " << p << "\n";
        }
        out << "\n";
    }
    return out.str();
}

}

}
