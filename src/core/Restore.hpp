#pragma once

#include <filesystem>
#include <string>

#include "core/Index.hpp"
#include "core/ObjectStore.hpp"
#include "util/Expected.hpp"

namespace oops {

struct RestoreOptions {
    bool staged{false};    // Take the content recorded in the index
    std::string source;    // Commit hash to take the content from; wins over staged
};

/**
 * @brief Overwrite a tracked working-tree path with recorded content
 *
 * The path must be in the index (FileNotTracked otherwise). Content comes
 * from options.source if set, else from the index entry when
 * options.staged, else from the HEAD commit (NoCommits before the first
 * commit). Commits are read through their snapshot; a path the snapshot
 * does not list is FileNotTracked. The index itself is left unchanged.
 */
Expected<void> restorePath(const std::filesystem::path& root, const ObjectStore& store,
                           const Index& index, const std::string& relPath, const RestoreOptions& options);

}
