#pragma once

#include <cstdint>
#include <filesystem>

namespace oops {

/// On-disk kind of a path, as recorded in the index (codes are persisted)
enum class FileType : uint8_t {
    Regular = 0,
    Symlink = 1,
    Directory = 2,
    Other = 3
};

/**
 * @brief Metadata the index caches for change detection
 *
 * Taken with lstat, so a symlink describes the link itself.
 */
struct FileMetadata {
    bool exists{false};
    FileType type{FileType::Other};
    int64_t mtimeNs{0};      // Last modification time, nanoseconds since the epoch
    uint32_t mode{0};        // Full st_mode (type and permission bits)
    uint64_t sizeBytes{0};
};

/**
 * @brief Read file metadata without following symlinks
 *
 * @param filePath Path to inspect
 * @param ec Set when the path exists but cannot be statted
 * @return Metadata; exists=false when the path is missing
 */
FileMetadata getFileMetadata(const std::filesystem::path& filePath, std::error_code& ec);

}
