#pragma once

#include <cstddef>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

#include "core/IgnoreMatcher.hpp"
#include "core/Index.hpp"
#include "core/ObjectStore.hpp"
#include "util/Expected.hpp"

namespace oops {

struct RmOptions {
    bool cached{false};      // Keep the working-tree copy
    bool recursive{false};   // Allow removing directory entries
    bool dryRun{false};      // Report only; touch neither disk nor index
};

/**
 * @brief Staging operations: add paths to the index and remove them
 *
 * Works on a loaded Index and writes content through the ObjectStore.
 * Every mutating call persists the index before returning.
 * Paths are relative to the repository root.
 */
class StagingArea {
public:
    StagingArea(const std::filesystem::path& root, ObjectStore& store, Index& index);

    /**
     * @brief Stage one path and persist the index
     *
     * Stores the path's content (file bytes, symlink target, or nothing
     * for directories and special files) and records hash, mtime, mode
     * and type. An existing entry for the path is updated in place.
     */
    Expected<void> stage(const std::string& relPath);

    /**
     * @brief Stage a pathspec
     *
     * "." stages every non-ignored file under the root. Anything else is
     * a glob matched against every path of a recursive walk; matched
     * directories are staged recursively. Ignored matches are reported
     * and skipped, ignored directories are never entered.
     *
     * @return Paths staged, in walk order
     */
    Expected<std::vector<std::string>> addTree(const std::string& pathspec, const IgnoreMatcher& ignore);

    /**
     * @brief Remove index entries matching a glob
     *
     * Directory entries need options.recursive. Unless cached, the
     * working-tree path is deleted too; a delete failure is logged and
     * that entry is kept. Nothing is written in dry-run mode.
     *
     * @return Number of entries removed (or that would be removed);
     *         FileNotTracked if the pattern matches no entry
     */
    Expected<size_t> remove(const std::string& pattern, const RmOptions& options);

private:
    /// Stage without persisting
    Expected<void> stageEntry(const std::string& relPath);

    Expected<void> stageDirectory(const std::string& relDir, const IgnoreMatcher& ignore,
                                  std::set<std::string>& seen, std::vector<std::string>& staged);

    std::filesystem::path root;
    ObjectStore& store;
    Index& index;
};

}
