#include "core/StagingArea.hpp"

#include <iostream>

#include "core/WorkingTree.hpp"
#include "util/FileMetadata.hpp"
#include "util/Logger.hpp"
#include "util/PatternMatcher.hpp"

namespace fs = std::filesystem;

namespace oops {

StagingArea::StagingArea(const fs::path& root, ObjectStore& store, Index& index)
    : root(root), store(store), index(index) {}

Expected<void> StagingArea::stageEntry(const std::string& relPath) {
    std::string path = normalizePath(relPath);
    fs::path abs = root / path;

    std::error_code ec;
    FileMetadata meta = getFileMetadata(abs, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "Cannot stat " + path + ": " + ec.message()};
    }
    if (!meta.exists) {
        return Error{ErrorCode::IoError, "Cannot stat " + path + ": no such file or directory"};
    }

    auto content = WorkingTree::readContent(abs, meta.type);
    if (!content) return content.error();

    auto hash = store.write(content.value());
    if (!hash) return hash.error();

    bool update = index.find(path) != nullptr;
    IndexEntry e;
    e.path = path;
    e.hashHex = hash.value();
    e.mtimeNs = meta.mtimeNs;
    e.mode = meta.mode;
    e.fileType = meta.type;
    index.addOrUpdate(e);

    Logger::instance().debug(std::string(update ? "Updated " : "Added ") + path + " (" + hash.value() + ")");
    return {};
}

Expected<void> StagingArea::stage(const std::string& relPath) {
    auto res = stageEntry(relPath);
    if (!res) return res;
    return index.save(root);
}

Expected<void> StagingArea::stageDirectory(const std::string& relDir, const IgnoreMatcher& ignore,
                                           std::set<std::string>& seen, std::vector<std::string>& staged) {
    Expected<void> failure;
    WorkingTree::walkDirectory(root, relDir, true, [&](const WalkEntry& entry) {
        if (!failure) return false;
        if (ignore.isIgnored(entry.path)) {
            Logger::instance().debug("Ignoring " + entry.path + " (matched ignore pattern)");
            return false;
        }
        if (entry.type == FileType::Directory) return true;
        if (!seen.insert(entry.path).second) return false;

        auto res = stageEntry(entry.path);
        if (!res) {
            failure = res;
            return false;
        }
        staged.push_back(entry.path);
        return false;
    });
    return failure;
}

Expected<std::vector<std::string>> StagingArea::addTree(const std::string& pathspec, const IgnoreMatcher& ignore) {
    std::vector<std::string> staged;
    std::set<std::string> seen;

    if (pathspec == ".") {
        auto res = stageDirectory("", ignore, seen, staged);
        if (!res) return res.error();
    } else {
        std::string pattern = PatternMatcher::isPattern(pathspec) ? pathspec : normalizePath(pathspec);
        Expected<void> failure;
        bool matchedAny = false;

        WorkingTree::walkDirectory(root, "", true, [&](const WalkEntry& entry) {
            if (!failure) return false;
            bool matches = PatternMatcher::globMatch(pattern, entry.path);
            if (ignore.isIgnored(entry.path)) {
                if (matches) {
                    matchedAny = true;
                    Logger::instance().warn("Ignoring " + std::string(entry.type == FileType::Directory ? "directory " : "file ") +
                                            entry.path + " (matched ignore pattern)");
                }
                return false;
            }
            if (!matches) return true;

            matchedAny = true;
            if (entry.type == FileType::Directory) {
                auto res = stageDirectory(entry.path, ignore, seen, staged);
                if (!res) failure = res;
                return false;
            }
            if (seen.insert(entry.path).second) {
                auto res = stageEntry(entry.path);
                if (!res) {
                    failure = res;
                    return false;
                }
                staged.push_back(entry.path);
            }
            return true;
        });
        if (!failure) return failure.error();
        if (!matchedAny) {
            Logger::instance().warn("pathspec '" + pathspec + "' did not match any files");
        }
    }

    auto saved = index.save(root);
    if (!saved) return saved.error();
    return staged;
}

Expected<size_t> StagingArea::remove(const std::string& pattern, const RmOptions& options) {
    std::vector<std::string> matches = PatternMatcher::matchPathsInIndex(pattern, index.entries());
    if (matches.empty()) {
        return Error{ErrorCode::FileNotTracked, "pathspec '" + pattern + "' did not match any tracked files"};
    }

    size_t affected = 0;
    for (const auto& path : matches) {
        const IndexEntry* entry = index.find(path);
        if (!entry) continue;
        bool isDir = entry->fileType == FileType::Directory;

        if (isDir && !options.recursive) {
            Logger::instance().warn("Skipping directory " + path + " (use --recursive to remove)");
            continue;
        }
        if (options.dryRun) {
            std::cout << "Would remove: " << path << "\n";
            ++affected;
            continue;
        }
        if (!options.cached) {
            std::error_code ec;
            fs::path abs = root / path;
            if (isDir) {
                fs::remove_all(abs, ec);
            } else {
                fs::remove(abs, ec);
            }
            if (ec) {
                Logger::instance().error("Failed to remove " + path + ": " + ec.message());
                continue;
            }
        }
        index.remove(path);
        ++affected;
    }

    if (!options.dryRun) {
        auto saved = index.save(root);
        if (!saved) return saved.error();
    }
    return affected;
}

}
