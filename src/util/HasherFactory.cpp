#include "util/IHasher.hpp"
#include "util/Sha1Hasher.hpp"

namespace oops {

std::string IHasher::toHex(const std::vector<uint8_t>& bytes) {
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.resize(bytes.size() * 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        out[2*i] = hex[(bytes[i] >> 4) & 0xF];
        out[2*i+1] = hex[bytes[i] & 0xF];
    }
    return out;
}

std::string IHasher::hexDigestOf(const std::string& data) {
    reset();
    update(data);
    return toHex(digest());
}

std::unique_ptr<IHasher> HasherFactory::createDefault() {
    return std::make_unique<Sha1Hasher>();
}

std::unique_ptr<IHasher> HasherFactory::create(const std::string& algorithm) {
    if (algorithm == "sha1") {
        return std::make_unique<Sha1Hasher>();
    }
    return nullptr;
}

}
