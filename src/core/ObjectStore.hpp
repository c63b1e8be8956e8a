#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "util/Expected.hpp"
#include "util/IHasher.hpp"

namespace oops {

/**
 * @brief Content-addressed object storage
 *
 * Manages .oops/objects/, where every object is stored under the hex
 * SHA-1 of its bytes:
 *   .oops/objects/<40-hex-digest>
 *
 * Objects are raw bytes: no header and no compression. Writing identical
 * bytes twice resolves to the same file. There is no cache; every call
 * goes to disk.
 */
class ObjectStore {
public:
    /**
     * @param repoRoot Working tree root (the directory containing .oops)
     * @param hasher Hash algorithm to use (SHA-1 if nullptr)
     */
    explicit ObjectStore(const std::filesystem::path& repoRoot, std::unique_ptr<IHasher> hasher = nullptr);

    ~ObjectStore();

    ObjectStore(const ObjectStore&) = delete;
    ObjectStore& operator=(const ObjectStore&) = delete;

    ObjectStore(ObjectStore&&) noexcept;
    ObjectStore& operator=(ObjectStore&&) noexcept;

    /// Returns path to .oops/objects directory
    std::filesystem::path objectsDir() const;

    /// Path an object with this hash lives at
    std::filesystem::path objectPath(const std::string& hash) const;

    /**
     * @brief Store bytes and return their hex digest
     *
     * Creates .oops/objects if needed. Re-writing existing content is a
     * harmless overwrite with identical bytes.
     */
    Expected<std::string> write(const std::string& bytes);

    /**
     * @brief Read an object's bytes
     * @return Bytes, or ObjectNotFound / IoError
     */
    Expected<std::string> read(const std::string& hash) const;

    /// Digest the bytes would be stored under, without writing
    std::string hashContent(const std::string& bytes) const;

    bool exists(const std::string& hash) const;

    /// True for a 40-character hex string
    static bool isValidHash(const std::string& hash);

private:
    std::filesystem::path root;
    std::unique_ptr<IHasher> hasher;
};

}
