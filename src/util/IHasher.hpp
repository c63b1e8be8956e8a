#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace oops {

/**
 * @brief Strategy interface for content digests
 *
 * The object store only depends on this interface. The repository
 * format is fixed to SHA-1, so the factory hands out a Sha1Hasher.
 */
class IHasher {
public:
    virtual ~IHasher() = default;

    /// Reset hasher to initial state
    virtual void reset() = 0;

    /// Update hash with raw bytes
    virtual void update(const uint8_t* data, size_t len) = 0;

    /// Update hash with string
    virtual void update(const std::string& data) = 0;

    /// Finalize and return digest bytes (state is reset afterwards)
    virtual std::vector<uint8_t> digest() = 0;

    /// Hash algorithm name
    virtual const char* name() const = 0;

    /// Digest size in bytes
    virtual size_t digestSize() const = 0;

    /// Convert binary digest to lowercase hex string
    static std::string toHex(const std::vector<uint8_t>& bytes);

    /// One-shot helper: reset, feed data, return hex digest
    std::string hexDigestOf(const std::string& data);
};

class HasherFactory {
public:
    /// SHA-1, the repository's object naming scheme
    static std::unique_ptr<IHasher> createDefault();

    /// Create a hasher by name; nullptr for unsupported algorithms
    static std::unique_ptr<IHasher> create(const std::string& algorithm);
};

}
