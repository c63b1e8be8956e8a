#include "core/ObjectStore.hpp"

#include <filesystem>
#include <fstream>
#include <algorithm>
#include <cctype>
#include <iterator>
#include <sstream>
#include <string>

#include "core/Constants.hpp"
#include "util/IHasher.hpp"

namespace fs = std::filesystem;

namespace oops {

ObjectStore::ObjectStore(const fs::path& repoRoot, std::unique_ptr<IHasher> hasher)
    : root(repoRoot), hasher(hasher ? std::move(hasher) : HasherFactory::createDefault()) {}

ObjectStore::~ObjectStore() = default;

ObjectStore::ObjectStore(ObjectStore&&) noexcept = default;
ObjectStore& ObjectStore::operator=(ObjectStore&&) noexcept = default;

fs::path ObjectStore::objectsDir() const {
    return root / Constants::REPO_DIR / Constants::OBJECTS_DIR;
}

fs::path ObjectStore::objectPath(const std::string& hash) const {
    return objectsDir() / hash;
}

bool ObjectStore::isValidHash(const std::string& hash) {
    return hash.length() == Constants::SHA1_HEX_LENGTH &&
           std::all_of(hash.begin(), hash.end(),
                      [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); });
}

std::string ObjectStore::hashContent(const std::string& bytes) const {
    return hasher->hexDigestOf(bytes);
}

bool ObjectStore::exists(const std::string& hash) const {
    if (!isValidHash(hash)) return false;
    std::error_code ec;
    return fs::is_regular_file(objectPath(hash), ec);
}

Expected<std::string> ObjectStore::write(const std::string& bytes) {
    std::string hash = hashContent(bytes);
    fs::path objPath = objectPath(hash);

    std::error_code ec;
    fs::create_directories(objPath.parent_path(), ec);
    if (ec) {
        return Error{ErrorCode::IoError, "Failed to create object directory: " + ec.message()};
    }

    std::ofstream out(objPath, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::IoError, "Failed to open object file for writing: " + hash};
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out || !out.good()) {
        out.close();
        fs::remove(objPath, ec);  // Clean up partial write
        return Error{ErrorCode::IoError, "Failed to write object: " + hash};
    }
    return hash;
}

Expected<std::string> ObjectStore::read(const std::string& hash) const {
    // Anything but a digest could name a path outside objects/
    if (!isValidHash(hash)) {
        return Error{ErrorCode::ObjectNotFound, "Not an object hash: " + hash};
    }
    fs::path objPath = objectPath(hash);
    std::error_code ec;
    if (!fs::is_regular_file(objPath, ec)) {
        return Error{ErrorCode::ObjectNotFound, "Object not found: " + hash};
    }

    std::ifstream in(objPath, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "Failed to open object: " + hash};
    }
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Error{ErrorCode::IoError, "Failed to read object: " + hash};
    }
    return data;
}

}
