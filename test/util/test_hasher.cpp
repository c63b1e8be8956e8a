#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "util/IHasher.hpp"
#include "util/Sha1Hasher.hpp"

using namespace oops;

// Test: SHA-1 known test vectors (FIPS 180-1)
TEST(HasherTest, Sha1KnownVectors) {
    Sha1Hasher hasher;

    // Empty string
    hasher.update("");
    auto digest = hasher.digest();
    EXPECT_EQ(IHasher::toHex(digest), "da39a3ee5e6b4b0d3255bfef95601890afd80709");

    // "abc"
    hasher.reset();
    hasher.update("abc");
    EXPECT_EQ(IHasher::toHex(hasher.digest()), "a9993e364706816aba3e25717850c26c9cd0d89d");

    // Two-block message
    hasher.reset();
    hasher.update("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq");
    EXPECT_EQ(IHasher::toHex(hasher.digest()), "84983e441c3bd26ebaae4aa1f95129e5e54670f1");
}

// Test: One million 'a' characters, fed in uneven chunks
TEST(HasherTest, Sha1MillionA) {
    Sha1Hasher hasher;
    std::string chunk(997, 'a');
    size_t remaining = 1000000;
    while (remaining > 0) {
        size_t n = remaining < chunk.size() ? remaining : chunk.size();
        hasher.update(reinterpret_cast<const uint8_t*>(chunk.data()), n);
        remaining -= n;
    }
    EXPECT_EQ(IHasher::toHex(hasher.digest()), "34aa973cd4c4daa4f61eeb2bdbad27316534016f");
}

// Test: Exactly one block of padding boundary (55 and 56 bytes)
TEST(HasherTest, Sha1PaddingBoundaries) {
    Sha1Hasher a;
    Sha1Hasher b;
    std::string s55(55, 'x');
    std::string s56(56, 'x');
    a.update(s55);
    b.update(s56);
    auto d55 = IHasher::toHex(a.digest());
    auto d56 = IHasher::toHex(b.digest());
    EXPECT_EQ(d55.size(), 40u);
    EXPECT_EQ(d56.size(), 40u);
    EXPECT_NE(d55, d56);
}

// Test: SHA-1 digest size
TEST(HasherTest, Sha1DigestSize) {
    Sha1Hasher hasher;
    EXPECT_EQ(hasher.digestSize(), 20u);
    EXPECT_STREQ(hasher.name(), "sha1");
    hasher.update("abc");
    EXPECT_EQ(hasher.digest().size(), 20u);
}

// Test: digest() resets state
TEST(HasherTest, DigestResetsState) {
    Sha1Hasher hasher;
    hasher.update("abc");
    auto first = IHasher::toHex(hasher.digest());
    hasher.update("abc");
    auto second = IHasher::toHex(hasher.digest());
    EXPECT_EQ(first, second);
}

// Test: Streaming in pieces equals one-shot
TEST(HasherTest, IncrementalMatchesOneShot) {
    Sha1Hasher streamed;
    streamed.update("hello ");
    streamed.update("wor");
    streamed.update("ld");

    Sha1Hasher oneShot;
    EXPECT_EQ(IHasher::toHex(streamed.digest()), oneShot.hexDigestOf("hello world"));
}

// Test: Hasher factory creates SHA-1 by default
TEST(HasherTest, FactoryCreatesDefault) {
    auto hasher = HasherFactory::createDefault();
    ASSERT_NE(hasher, nullptr);
    EXPECT_EQ(hasher->digestSize(), 20u);
    EXPECT_STREQ(hasher->name(), "sha1");
}

// Test: Hasher factory by name
TEST(HasherTest, FactoryCreatesByName) {
    auto sha1 = HasherFactory::create("sha1");
    ASSERT_NE(sha1, nullptr);
    EXPECT_STREQ(sha1->name(), "sha1");

    EXPECT_EQ(HasherFactory::create("sha256"), nullptr);
    EXPECT_EQ(HasherFactory::create(""), nullptr);
}

// Test: toHex formatting
TEST(HasherTest, ToHexLowercasePadded) {
    std::vector<uint8_t> bytes{0x00, 0x0f, 0xab, 0xff};
    EXPECT_EQ(IHasher::toHex(bytes), "000fabff");
}
