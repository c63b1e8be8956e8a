#pragma once

#include <filesystem>
#include <functional>
#include <string>

#include "util/Expected.hpp"
#include "util/FileMetadata.hpp"

namespace oops {

struct WalkEntry {
    std::string path;   // Relative to the walk root, forward slashes
    FileType type{FileType::Other};
};

/// Visitor for walkDirectory; return false to keep the walk out of a directory
using WalkVisitor = std::function<bool(const WalkEntry&)>;

/**
 * @brief Working tree access shared by staging, status and restore
 */
namespace WorkingTree {

/**
 * @brief Visit entries of root/relDir in name order
 *
 * Symlinks are reported as symlinks and never followed. With recursive
 * set, a directory is entered after it has been visited unless the
 * visitor returned false for it. Directories that cannot be opened are
 * logged and skipped.
 */
void walkDirectory(const std::filesystem::path& root, const std::string& relDir, bool recursive, const WalkVisitor& visit);

/**
 * @brief Content recorded for a path of the given type
 *
 * Regular file: its bytes. Symlink: the link target. Anything else: empty.
 */
Expected<std::string> readContent(const std::filesystem::path& absPath, FileType type);

/**
 * @brief Materialize content at a path
 *
 * Regular file: overwrite. Symlink: replace with a link to content.
 * Directory: create. Other: UnexpectedError.
 */
Expected<void> writeContent(const std::filesystem::path& absPath, FileType type, const std::string& content);

}

}
