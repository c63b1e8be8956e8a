#include "core/Index.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>

#include "core/Constants.hpp"
#include "core/ObjectStore.hpp"

namespace fs = std::filesystem;

namespace oops {

fs::path Index::indexPath(const fs::path& repoRoot) {
    return repoRoot / Constants::REPO_DIR / Constants::INDEX_FILE;
}

std::string normalizePath(const std::string& path) {
    fs::path p(path);
    std::string normalized = p.lexically_normal().generic_string();

    while (normalized.length() >= 2 && normalized.compare(0, 2, "./") == 0) {
        normalized = normalized.substr(2);
    }
    // lexically_normal keeps a trailing separator for directories
    if (normalized.size() > 1 && normalized.back() == '/') {
        normalized.pop_back();
    }
    return normalized;
}

bool decodeFileType(unsigned long code, FileType& out) {
    switch (code) {
        case 0: out = FileType::Regular; return true;
        case 1: out = FileType::Symlink; return true;
        case 2: out = FileType::Directory; return true;
        case 3: out = FileType::Other; return true;
        default: return false;
    }
}

Expected<std::vector<IndexEntry>> Index::parse(const std::string& text) {
    std::vector<IndexEntry> out;
    std::istringstream in(text);
    std::string line;
    size_t lineNo = 0;

    while (std::getline(in, line)) {
        ++lineNo;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        std::vector<std::string> fields;
        std::istringstream iss(line);
        std::string field;
        while (std::getline(iss, field, '\t')) {
            fields.push_back(field);
        }
        auto bad = [&](const std::string& why) {
            return Error{ErrorCode::IoError, "Corrupt index line " + std::to_string(lineNo) + ": " + why};
        };
        if (fields.size() != 5) {
            return bad("expected 5 fields, found " + std::to_string(fields.size()));
        }
        if (!ObjectStore::isValidHash(fields[1])) {
            return bad("invalid hash '" + fields[1] + "'");
        }

        IndexEntry e;
        e.path = normalizePath(fields[0]);
        e.hashHex = fields[1];
        unsigned long typeCode = 0;
        try {
            size_t used = 0;
            e.mtimeNs = static_cast<int64_t>(std::stoll(fields[2], &used, 10));
            if (used != fields[2].size()) return bad("invalid mtime");
            e.mode = static_cast<uint32_t>(std::stoul(fields[3], &used, 8));
            if (used != fields[3].size()) return bad("invalid mode");
            typeCode = std::stoul(fields[4], &used, 10);
            if (used != fields[4].size()) return bad("invalid file type");
        } catch (const std::exception&) {
            return bad("non-numeric field");
        }
        if (!decodeFileType(typeCode, e.fileType)) {
            return bad("unknown file type code " + fields[4]);
        }
        out.push_back(std::move(e));
    }
    return out;
}

std::string Index::serialize(const std::vector<IndexEntry>& entries) {
    std::ostringstream out;
    for (const auto& e : entries) {
        out << e.path << '\t' << e.hashHex << '\t' << std::dec << e.mtimeNs << '\t'
            << std::oct << e.mode << std::dec << '\t'
            << static_cast<unsigned>(e.fileType) << '\n';
    }
    return out.str();
}

Expected<void> Index::load(const fs::path& repoRoot) {
    items.clear();
    std::ifstream in(indexPath(repoRoot), std::ios::binary);
    if (!in) {
        // Treat missing index as empty (first time use)
        return {};
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Error{ErrorCode::IoError, "Failed to read index"};
    }

    auto parsed = parse(text);
    if (!parsed) return parsed.error();
    for (const auto& e : parsed.value()) {
        addOrUpdate(e);
    }
    return {};
}

Expected<void> Index::save(const fs::path& repoRoot) const {
    fs::path target = indexPath(repoRoot);
    fs::path tempPath = target.string() + ".tmp";

    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        return Error{ErrorCode::IoError, "Failed to create repository directory: " + ec.message()};
    }

    // Write to temporary file first (atomic write pattern)
    {
        std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::IoError, "Failed to open index for writing"};
        }
        out << serialize(items);
        out.flush();
        if (!out || !out.good()) {
            out.close();
            fs::remove(tempPath, ec);
            return Error{ErrorCode::IoError, "Failed to write index"};
        }
    }

    fs::rename(tempPath, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tempPath, ignored);
        return Error{ErrorCode::IoError, "Failed to replace index: " + ec.message()};
    }
    return {};
}

void Index::addOrUpdate(const IndexEntry& entry) {
    IndexEntry normalizedEntry = entry;
    normalizedEntry.path = normalizePath(entry.path);

    if (!ObjectStore::isValidHash(normalizedEntry.hashHex)) {
        throw std::invalid_argument("Invalid hash format: " + normalizedEntry.hashHex);
    }

    for (auto& e : items) {
        if (e.path == normalizedEntry.path) {
            e = normalizedEntry;
            return;
        }
    }
    items.push_back(normalizedEntry);
}

bool Index::remove(const std::string& path) {
    std::string normalizedPath = normalizePath(path);
    for (auto it = items.begin(); it != items.end(); ++it) {
        if (it->path == normalizedPath) {
            items.erase(it);
            return true;
        }
    }
    return false;
}

const IndexEntry* Index::find(const std::string& path) const {
    std::string normalizedPath = normalizePath(path);
    for (const auto& e : items) {
        if (e.path == normalizedPath) return &e;
    }
    return nullptr;
}

}
