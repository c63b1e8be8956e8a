#include "util/FileMetadata.hpp"

#include <cerrno>
#include <sys/stat.h>

namespace oops {

FileMetadata getFileMetadata(const std::filesystem::path& filePath, std::error_code& ec) {
    FileMetadata metadata;
    ec.clear();

    struct stat st{};
    if (::lstat(filePath.c_str(), &st) != 0) {
        if (errno != ENOENT && errno != ENOTDIR) {
            ec = std::error_code(errno, std::generic_category());
        }
        return metadata;
    }

    metadata.exists = true;
    metadata.mode = static_cast<uint32_t>(st.st_mode);
    metadata.sizeBytes = static_cast<uint64_t>(st.st_size);
    metadata.mtimeNs = static_cast<int64_t>(st.st_mtim.tv_sec) * 1000000000LL +
                       static_cast<int64_t>(st.st_mtim.tv_nsec);

    if (S_ISREG(st.st_mode)) {
        metadata.type = FileType::Regular;
    } else if (S_ISLNK(st.st_mode)) {
        metadata.type = FileType::Symlink;
    } else if (S_ISDIR(st.st_mode)) {
        metadata.type = FileType::Directory;
    } else {
        metadata.type = FileType::Other;
    }
    return metadata;
}

}
