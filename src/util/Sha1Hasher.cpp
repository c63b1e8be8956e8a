#include "util/Sha1Hasher.hpp"
#include <cstring>

namespace oops {

namespace {

inline uint32_t rotl(uint32_t x, uint32_t n) { return (x << n) | (x >> (32 - n)); }

inline uint32_t loadBigEndian(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

}

Sha1Hasher::Sha1Hasher() { reset(); }

void Sha1Hasher::reset() {
    h[0] = 0x67452301;
    h[1] = 0xEFCDAB89;
    h[2] = 0x98BADCFE;
    h[3] = 0x10325476;
    h[4] = 0xC3D2E1F0;
    totalBytes = 0;
    pendingLen = 0;
    std::memset(pending, 0, sizeof(pending));
}

void Sha1Hasher::update(const uint8_t* data, size_t len) {
    // Fill a partial block first, then consume whole blocks in place
    while (len > 0 && pendingLen > 0) {
        pending[pendingLen++] = *data++;
        --len;
        if (pendingLen == 64) {
            transform(pending);
            totalBytes += 64;
            pendingLen = 0;
        }
    }
    while (len >= 64) {
        transform(data);
        totalBytes += 64;
        data += 64;
        len -= 64;
    }
    if (len > 0) {
        std::memcpy(pending, data, len);
        pendingLen = len;
    }
}

void Sha1Hasher::update(const std::string& data) {
    update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

std::vector<uint8_t> Sha1Hasher::digest() {
    const uint64_t bitLength = (totalBytes + pendingLen) * 8ULL;

    pending[pendingLen++] = 0x80;
    if (pendingLen > 56) {
        while (pendingLen < 64) pending[pendingLen++] = 0;
        transform(pending);
        pendingLen = 0;
    }
    while (pendingLen < 56) pending[pendingLen++] = 0;
    for (int i = 7; i >= 0; --i) {
        pending[pendingLen++] = static_cast<uint8_t>((bitLength >> (i * 8)) & 0xff);
    }
    transform(pending);

    std::vector<uint8_t> out(20);
    for (int i = 0; i < 5; ++i) {
        out[i * 4 + 0] = static_cast<uint8_t>((h[i] >> 24) & 0xff);
        out[i * 4 + 1] = static_cast<uint8_t>((h[i] >> 16) & 0xff);
        out[i * 4 + 2] = static_cast<uint8_t>((h[i] >> 8) & 0xff);
        out[i * 4 + 3] = static_cast<uint8_t>(h[i] & 0xff);
    }

    reset();
    return out;
}

void Sha1Hasher::transform(const uint8_t* block) {
    uint32_t w[80];
    for (int i = 0; i < 16; ++i) {
        w[i] = loadBigEndian(block + i * 4);
    }
    for (int i = 16; i < 80; ++i) {
        w[i] = rotl(w[i - 3] ^ w[i - 8] ^ w[i - 14] ^ w[i - 16], 1);
    }

    uint32_t a = h[0], b = h[1], c = h[2], d = h[3], e = h[4];

    for (int i = 0; i < 80; ++i) {
        uint32_t f, k;
        if (i < 20) {
            f = (b & c) | ((~b) & d);
            k = 0x5A827999;
        } else if (i < 40) {
            f = b ^ c ^ d;
            k = 0x6ED9EBA1;
        } else if (i < 60) {
            f = (b & c) | (b & d) | (c & d);
            k = 0x8F1BBCDC;
        } else {
            f = b ^ c ^ d;
            k = 0xCA62C1D6;
        }
        uint32_t t = rotl(a, 5) + f + e + k + w[i];
        e = d;
        d = c;
        c = rotl(b, 30);
        b = a;
        a = t;
    }

    h[0] += a;
    h[1] += b;
    h[2] += c;
    h[3] += d;
    h[4] += e;
}

}
