#pragma once

#include "util/IHasher.hpp"
#include <cstdint>

namespace oops {

/**
 * @brief Streaming SHA-1 (FIPS 180-1)
 *
 * Produces the 160-bit digests that name every object in .oops/objects.
 */
class Sha1Hasher : public IHasher {
public:
    Sha1Hasher();

    void reset() override;
    void update(const uint8_t* data, size_t len) override;
    void update(const std::string& data) override;
    std::vector<uint8_t> digest() override;
    const char* name() const override { return "sha1"; }
    size_t digestSize() const override { return 20; }

private:
    void transform(const uint8_t* block);

    uint32_t h[5];          // A..E chaining values
    uint64_t totalBytes;    // Bytes fed so far (excluding pending)
    uint8_t pending[64];    // Partial block
    size_t pendingLen;
};

}
