#include "core/WorkingTree.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <vector>

#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace oops {
namespace WorkingTree {

namespace {

FileType typeOf(const fs::file_status& st) {
    switch (st.type()) {
        case fs::file_type::regular: return FileType::Regular;
        case fs::file_type::symlink: return FileType::Symlink;
        case fs::file_type::directory: return FileType::Directory;
        default: return FileType::Other;
    }
}

}

void walkDirectory(const fs::path& root, const std::string& relDir, bool recursive, const WalkVisitor& visit) {
    fs::path dir = relDir.empty() ? root : root / relDir;

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        Logger::instance().warn("Skipping unreadable directory " + dir.string() + ": " + ec.message());
        return;
    }

    std::vector<WalkEntry> children;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            Logger::instance().warn("Stopped reading " + dir.string() + ": " + ec.message());
            break;
        }
        std::error_code stEc;
        fs::file_status st = it->symlink_status(stEc);
        if (stEc) {
            Logger::instance().warn("Skipping " + it->path().string() + ": " + stEc.message());
            continue;
        }
        std::string name = it->path().filename().generic_string();
        children.push_back(WalkEntry{relDir.empty() ? name : relDir + "/" + name, typeOf(st)});
    }
    std::sort(children.begin(), children.end(),
              [](const WalkEntry& a, const WalkEntry& b) { return a.path < b.path; });

    for (const auto& child : children) {
        bool descend = visit(child);
        if (recursive && descend && child.type == FileType::Directory) {
            walkDirectory(root, child.path, recursive, visit);
        }
    }
}

Expected<std::string> readContent(const fs::path& absPath, FileType type) {
    switch (type) {
        case FileType::Regular: {
            std::ifstream in(absPath, std::ios::binary);
            if (!in) {
                return Error{ErrorCode::IoError, "Failed to open " + absPath.string()};
            }
            std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
            if (in.bad()) {
                return Error{ErrorCode::IoError, "Failed to read " + absPath.string()};
            }
            return data;
        }
        case FileType::Symlink: {
            std::error_code ec;
            fs::path target = fs::read_symlink(absPath, ec);
            if (ec) {
                return Error{ErrorCode::IoError, "Failed to read link " + absPath.string() + ": " + ec.message()};
            }
            return target.string();
        }
        case FileType::Directory:
        case FileType::Other:
            break;
    }
    return std::string();
}

Expected<void> writeContent(const fs::path& absPath, FileType type, const std::string& content) {
    std::error_code ec;
    switch (type) {
        case FileType::Regular: {
            if (absPath.has_parent_path()) {
                fs::create_directories(absPath.parent_path(), ec);
                if (ec) return Error{ErrorCode::IoError, "Failed to create " + absPath.parent_path().string()};
            }
            // A symlink at the path would redirect the write
            if (fs::is_symlink(fs::symlink_status(absPath, ec))) {
                fs::remove(absPath, ec);
            }
            std::ofstream out(absPath, std::ios::binary | std::ios::trunc);
            if (!out) {
                return Error{ErrorCode::IoError, "Failed to open " + absPath.string() + " for writing"};
            }
            out.write(content.data(), static_cast<std::streamsize>(content.size()));
            out.flush();
            if (!out || !out.good()) {
                return Error{ErrorCode::IoError, "Failed to write " + absPath.string()};
            }
            return {};
        }
        case FileType::Symlink: {
            fs::file_status st = fs::symlink_status(absPath, ec);
            if (fs::exists(st) || fs::is_symlink(st)) {
                fs::remove(absPath, ec);
                if (ec) return Error{ErrorCode::IoError, "Failed to replace " + absPath.string() + ": " + ec.message()};
            }
            fs::create_symlink(content, absPath, ec);
            if (ec) {
                return Error{ErrorCode::IoError, "Failed to create link " + absPath.string() + ": " + ec.message()};
            }
            return {};
        }
        case FileType::Directory:
            fs::create_directories(absPath, ec);
            if (ec) {
                return Error{ErrorCode::IoError, "Failed to create directory " + absPath.string() + ": " + ec.message()};
            }
            return {};
        case FileType::Other:
            break;
    }
    return Error{ErrorCode::UnexpectedError, "Cannot restore " + absPath.string() + ": unsupported file type"};
}

}
}
