#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "util/Expected.hpp"
#include "util/FileMetadata.hpp"

namespace oops {

/**
 * @brief Staging area entry for a single path
 *
 * The cached mtime lets status skip re-hashing files whose timestamp has
 * not moved since they were staged.
 */
struct IndexEntry {
    std::string path;        // Path relative to repo root (e.g., "src/main.cpp")
    std::string hashHex;     // SHA-1 of the staged content (40 hex chars)
    int64_t mtimeNs{0};      // Modification time when staged, nanoseconds
    uint32_t mode{0};        // st_mode when staged (written in octal)
    FileType fileType{FileType::Regular};
};

/**
 * @brief Staging area (index) manager
 *
 * Entries keep insertion order; the path is the unique key, so adding an
 * existing path updates that entry in place.
 *
 * On-disk format (.oops/index), one entry per line:
 *   path<TAB>hash<TAB>mtime<TAB>mode(octal)<TAB>type
 *   Example: "src/main.cpp<TAB>a3b2c1...<TAB>1700000000123456789<TAB>100644<TAB>0"
 *
 * Type codes: 0 regular, 1 symlink, 2 directory, 3 other.
 * Commit snapshots use the same text format.
 */
class Index {
public:
    /// Load .oops/index; a missing file yields an empty index
    Expected<void> load(const std::filesystem::path& repoRoot);

    /// Rewrite .oops/index with every entry
    Expected<void> save(const std::filesystem::path& repoRoot) const;

    /// Parse index text; fails with IoError on a malformed line
    static Expected<std::vector<IndexEntry>> parse(const std::string& text);

    /// Serialize entries in index file format
    static std::string serialize(const std::vector<IndexEntry>& entries);

    /// Add or update an entry in the index (updates in place if path exists)
    void addOrUpdate(const IndexEntry& entry);

    /// Remove an entry by path; returns false if it was not present
    bool remove(const std::string& path);

    /// Entry for a path, or nullptr
    const IndexEntry* find(const std::string& path) const;

    void clear() { items.clear(); }

    const std::vector<IndexEntry>& entries() const { return items; }

    /// Path of the index file for a repository root
    static std::filesystem::path indexPath(const std::filesystem::path& repoRoot);

private:
    std::vector<IndexEntry> items;
};

/// Normalize a repo-relative path: forward slashes, no "./" prefix
std::string normalizePath(const std::string& path);

/// Decode a persisted file-type code; false when out of range
bool decodeFileType(unsigned long code, FileType& out);

}
