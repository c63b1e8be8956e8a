#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "core/IgnoreMatcher.hpp"
#include "core/Index.hpp"
#include "core/ObjectStore.hpp"
#include "util/Expected.hpp"

namespace oops {

enum class FileStatus {
    Unmodified,
    Modified,
    Deleted,
    Untracked,
    Directory
};

const char* fileStatusName(FileStatus status);

/// Index entry that differs from the HEAD commit's snapshot
struct StagedChange {
    enum class Kind { Added, Modified, Deleted };
    Kind kind;
    std::string path;
};

struct StatusReport {
    std::string branch;          // Branch pointer, or the checked-out hash when detached
    bool detached{false};
    std::vector<StagedChange> staged;
    std::vector<std::string> modified;
    std::vector<std::string> deleted;
    std::vector<std::string> untracked;

    bool clean() const {
        return staged.empty() && modified.empty() && deleted.empty() && untracked.empty();
    }
};

/**
 * @brief Working tree state compared against the index
 */
namespace Status {

/**
 * @brief Classify one path
 *
 * Missing paths are Deleted when indexed, Untracked otherwise. Directories
 * are Directory. For an indexed path an unchanged mtime means Unmodified
 * without reading the content; a changed mtime triggers a re-hash.
 */
Expected<FileStatus> getFileStatus(const std::filesystem::path& root, const ObjectStore& store,
                                   const std::string& relPath, const IndexEntry* entry);

/**
 * @brief Full status
 *
 * Every index entry is checked for modification or deletion, then the
 * top level of the working tree (not recursively, skipping ignored
 * names) is scanned for untracked entries. Staged changes compare the
 * index with the HEAD commit's snapshot.
 */
Expected<StatusReport> collect(const std::filesystem::path& root, const ObjectStore& store,
                               const Index& index, const IgnoreMatcher& ignore);

/// Human-readable rendering, starting with "On branch <name>"
std::string format(const StatusReport& report);

}

}
