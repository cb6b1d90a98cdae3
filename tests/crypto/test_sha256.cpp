// SEEDFORGE - SHA256, HMAC-SHA512 and PBKDF2 Tests
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License

#include <gtest/gtest.h>
#include "seedforge/crypto/hmac.h"
#include "seedforge/crypto/sha256.h"
#include "../test_helpers.h"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace seedforge {
namespace test {

namespace {

const Byte* AsBytes(const std::string& s) {
    return reinterpret_cast<const Byte*>(s.data());
}

} // namespace

// ============================================================================
// SHA256 Tests
// ============================================================================

TEST(SHA256Test, OutputSizeIs32Bytes) {
    EXPECT_EQ(SHA256::OUTPUT_SIZE, 32u);
}

TEST(SHA256Test, EmptyString) {
    EXPECT_EQ(SHA256Hash(nullptr, 0).ToHex(),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(SHA256Test, Abc) {
    std::string msg = "abc";
    EXPECT_EQ(SHA256Hash(AsBytes(msg), msg.size()).ToHex(),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(SHA256Test, TwoBlockMessage) {
    std::string msg = "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq";
    EXPECT_EQ(SHA256Hash(AsBytes(msg), msg.size()).ToHex(),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(SHA256Test, IncrementalMatchesOneShot) {
    std::string msg = "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq";

    SHA256 hasher;
    hasher.Write(AsBytes(msg), 10).Write(AsBytes(msg) + 10, msg.size() - 10);
    Hash256 incremental;
    hasher.Finalize(incremental.data());

    EXPECT_EQ(incremental, SHA256Hash(AsBytes(msg), msg.size()));
}

TEST(SHA256Test, ResetStartsOver) {
    std::string junk = "junk";
    std::string msg = "abc";

    SHA256 hasher;
    hasher.Write(AsBytes(junk), junk.size());
    hasher.Reset();
    hasher.Write(AsBytes(msg), msg.size());
    Hash256 hash;
    hasher.Finalize(hash.data());

    EXPECT_EQ(hash.ToHex(),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

// ============================================================================
// HMAC-SHA512 Tests (RFC 4231)
// ============================================================================

TEST(HMACSHA512Test, RFC4231Case1) {
    Bytes key(20, 0x0b);
    std::string data = "Hi There";

    Hash512 mac = ComputeHMAC_SHA512(key.data(), key.size(), AsBytes(data), data.size());
    EXPECT_EQ(mac.ToHex(),
              "87aa7cdea5ef619d4ff0b4241a1d6cb02379f4e2ce4ec2787ad0b30545e17cde"
              "daa833b7d6b8a702038b274eaea3f4e4be9d914eeb61f1702e696c203a126854");
}

TEST(HMACSHA512Test, RFC4231Case2) {
    std::string key = "Jefe";
    std::string data = "what do ya want for nothing?";

    Hash512 mac = ComputeHMAC_SHA512(AsBytes(key), key.size(), AsBytes(data), data.size());
    EXPECT_EQ(mac.ToHex(),
              "164b7a7bfcf819e2e395fbe73b56e0a387bd64222e831fd610270cd7ea250554"
              "9758bf75c05a994a6d034f65f8f0e6fdcaeab1a34d4a6b4b636e070a38bce737");
}

TEST(HMACSHA512Test, EmptyKeyAndMessage) {
    Hash512 mac = ComputeHMAC_SHA512(nullptr, 0, nullptr, 0);
    EXPECT_EQ(mac.ToHex(),
              "b936cee86c9f87aa5d3c6f2e84cb5a4239a5fe50480a6ec66b70ab5b1f4ac673"
              "0c6c515421b327ec1d69402e53dfb49ad7381eb067b338fd7b0cb22247225d47");
}

TEST(HMACSHA512Test, IncrementalMatchesOneShot) {
    std::string key = "Jefe";
    std::string data = "what do ya want for nothing?";

    HMAC_SHA512 mac(AsBytes(key), key.size());
    mac.Write(AsBytes(data), 4);
    mac.Write(static_cast<Byte>(data[4]));
    mac.Write(AsBytes(data) + 5, data.size() - 5);

    EXPECT_EQ(mac.Finalize(),
              ComputeHMAC_SHA512(AsBytes(key), key.size(), AsBytes(data), data.size()));
}

// ============================================================================
// PBKDF2-HMAC-SHA512 Tests
// ============================================================================

TEST(PBKDF2Test, OneIteration) {
    auto key = PBKDF2_SHA512("password", "salt", 1, 64);
    EXPECT_EQ(ToHex(key),
              "867f70cf1ade02cff3752599a3a53dc4af34c7a669815ae5d513554e1c8cf252"
              "c02d470a285a0501bad999bfe943c08f050235d7d68b1da55e63f73b60a57fce");
}

TEST(PBKDF2Test, TwoIterations) {
    auto key = PBKDF2_SHA512("password", "salt", 2, 64);
    EXPECT_EQ(ToHex(key),
              "e1d9c16aa681708a45f5c7c4e215ceb66e011a2e9f0040713f18aefdb866d53c"
              "f76cab2868a39b9f7840edce4fef5a82be67335c77a6068e04112754f27ccf4e");
}

TEST(PBKDF2Test, ShortOutputIsPrefix) {
    auto full = PBKDF2_SHA512("password", "salt", 2, 64);
    auto shortKey = PBKDF2_SHA512("password", "salt", 2, 16);
    ASSERT_EQ(shortKey.size(), 16u);
    EXPECT_TRUE(std::equal(shortKey.begin(), shortKey.end(), full.begin()));
}

// ============================================================================
// Constant-Time Compare
// ============================================================================

TEST(ConstantTimeCompareTest, EqualAndDifferent) {
    Bytes a = {1, 2, 3, 4};
    Bytes b = {1, 2, 3, 4};
    Bytes c = {1, 2, 3, 5};
    EXPECT_TRUE(ConstantTimeCompare(a.data(), b.data(), a.size()));
    EXPECT_FALSE(ConstantTimeCompare(a.data(), c.data(), a.size()));
}

} // namespace test
} // namespace seedforge
