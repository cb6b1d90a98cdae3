// SEEDFORGE - Address Encoding Tests
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License

#include <gtest/gtest.h>
#include "seedforge/wallet/address.h"
#include "seedforge/wallet/mnemonic.h"
#include "seedforge/wallet/slip10.h"
#include "seedforge/wallet/wordlist.h"
#include "../test_helpers.h"

#include <algorithm>
#include <cctype>
#include <string>

namespace seedforge {
namespace wallet {
namespace test {

using seedforge::test::FromHex;
using seedforge::test::ToHex;

class AddressTest : public ::testing::Test {
protected:
    const Bytes zeroKey_ = Bytes(32, 0);
};

// ============================================================================
// Encoding
// ============================================================================

TEST_F(AddressTest, ZeroKeyMainnet) {
    std::string address = AddressFromPublicKey(MAINNET_PREFIX, Ed25519(), zeroKey_);
    EXPECT_EQ(address, "iota1qzy7krt23f53mt3v690dqd5ex88q49y7eta9c0unlqfpsvmydc2uxagz0wd");
    EXPECT_EQ(address.size(), 64u);
    EXPECT_EQ(address.compare(0, 6, "iota1q"), 0);
}

TEST_F(AddressTest, ZeroKeyTestnet) {
    EXPECT_EQ(AddressFromPublicKey(TESTNET_PREFIX, Ed25519(), zeroKey_),
              "atoi1qzy7krt23f53mt3v690dqd5ex88q49y7eta9c0unlqfpsvmydc2ux6xnw5q");
}

TEST_F(AddressTest, PayloadLayout) {
    AddressPayload payload = AddressPayloadFromPublicKey(Ed25519(), zeroKey_);
    EXPECT_EQ(payload[0], 0x00);
    EXPECT_EQ(ToHex(payload),
              "0089eb0d6a8a691dae2cd15ed0369931ce0a949ecafa5c3f93f8121833646e15c3");
}

TEST_F(AddressTest, EncodingIsStable) {
    EXPECT_EQ(AddressFromPublicKey(MAINNET_PREFIX, Ed25519(), zeroKey_),
              AddressFromPublicKey(MAINNET_PREFIX, Ed25519(), zeroKey_));
    EXPECT_NE(AddressFromPublicKey(MAINNET_PREFIX, Ed25519(), zeroKey_),
              AddressFromPublicKey(SHIMMER_PREFIX, Ed25519(), zeroKey_));
}

TEST_F(AddressTest, MnemonicToAddress) {
    Mnemonic mnemonic = EntropyToMnemonic(Bytes(16, 0), English());
    Seed seed = MnemonicToSeed(mnemonic, "", English());
    ExtendedKey key = DeriveKeyFromPath(seed, Ed25519(),
                                        DerivationPath::Parse("44'/4218'/0'/0'"));
    EXPECT_EQ(AddressFromKey(MAINNET_PREFIX, key),
              "iota1qqhlacr9p28t2cjv9u7cf7f7wcntt34zzvx5m8jfzkd58nrj82ud606c7r5");
}

TEST_F(AddressTest, Secp256k1MasterAddress) {
    ExtendedKey master = Secp256k1().DeriveMaster(FromHex("000102030405060708090a0b0c0d0e0f"));
    std::string address = AddressFromKey(MAINNET_PREFIX, master);
    EXPECT_EQ(address, "iota1q9mhzmh6lxyj6snfwr60mqr3gff6aumkyh34cvpz9575v80g6hjt6qfpumw");
    EXPECT_EQ(DecodeAddress(address).version, 0x01);
}

TEST_F(AddressTest, RejectsWrongKeySize) {
    EXPECT_SEEDFORGE_ERROR(AddressFromPublicKey(MAINNET_PREFIX, Ed25519(), Bytes(33, 2)),
                           InvalidKey);
    EXPECT_SEEDFORGE_ERROR(AddressFromPublicKey(MAINNET_PREFIX, Secp256k1(), zeroKey_),
                           InvalidKey);
    EXPECT_SEEDFORGE_ERROR(AddressFromPublicKey(MAINNET_PREFIX, Ed25519(), Bytes()),
                           InvalidKey);
}

TEST_F(AddressTest, RejectsBadPrefix) {
    EXPECT_SEEDFORGE_ERROR(AddressFromPublicKey("", Ed25519(), zeroKey_), InvalidPrefix);
    EXPECT_SEEDFORGE_ERROR(AddressFromPublicKey("IoTa", Ed25519(), zeroKey_), InvalidPrefix);
    EXPECT_SEEDFORGE_ERROR(AddressFromPublicKey("io ta", Ed25519(), zeroKey_), InvalidPrefix);
}

TEST_F(AddressTest, EmptyPayload) {
    EXPECT_SEEDFORGE_ERROR(EncodeAddress(MAINNET_PREFIX, Bytes()), EncodingError);
}

TEST_F(AddressTest, KnownPrefixes) {
    EXPECT_TRUE(IsKnownPrefix("iota"));
    EXPECT_TRUE(IsKnownPrefix("atoi"));
    EXPECT_TRUE(IsKnownPrefix("smr"));
    EXPECT_TRUE(IsKnownPrefix("rms"));
    EXPECT_FALSE(IsKnownPrefix("bc"));
    EXPECT_FALSE(IsKnownPrefix("IOTA"));

    // Unknown but well-formed prefixes still encode
    EXPECT_NO_THROW(AddressFromPublicKey("bc", Ed25519(), zeroKey_));
}

TEST_F(AddressTest, ParsePrefixAcceptsNetworks) {
    EXPECT_EQ(ParsePrefix("iota"), MAINNET_PREFIX);
    EXPECT_EQ(ParsePrefix("atoi"), TESTNET_PREFIX);
    EXPECT_EQ(ParsePrefix("smr"), SHIMMER_PREFIX);
    EXPECT_EQ(ParsePrefix("rms"), SHIMMER_TESTNET_PREFIX);
}

TEST_F(AddressTest, ParsePrefixRejectsOthers) {
    EXPECT_SEEDFORGE_ERROR(ParsePrefix("bc"), InvalidPrefix);
    EXPECT_SEEDFORGE_ERROR(ParsePrefix("IOTA"), InvalidPrefix);
    EXPECT_SEEDFORGE_ERROR(ParsePrefix("iota "), InvalidPrefix);
    EXPECT_SEEDFORGE_ERROR(ParsePrefix(""), InvalidPrefix);

    try {
        ParsePrefix("tst");
        FAIL() << "expected InvalidPrefix";
    } catch (const Error& e) {
        EXPECT_NE(std::string(e.what()).find("invalid network prefix"), std::string::npos);
    }
}

// ============================================================================
// Decoding
// ============================================================================

TEST_F(AddressTest, DecodeRoundTrip) {
    std::string address = AddressFromPublicKey(TESTNET_PREFIX, Ed25519(), zeroKey_);
    DecodedAddress decoded = DecodeAddress(address);
    EXPECT_EQ(decoded.prefix, "atoi");
    EXPECT_EQ(decoded.version, 0x00);
    EXPECT_EQ(decoded.digest.ToHex(),
              "89eb0d6a8a691dae2cd15ed0369931ce0a949ecafa5c3f93f8121833646e15c3");
}

TEST_F(AddressTest, DecodeUppercase) {
    std::string address = AddressFromPublicKey(MAINNET_PREFIX, Ed25519(), zeroKey_);
    std::string upper = address;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    EXPECT_EQ(DecodeAddress(upper).digest, DecodeAddress(address).digest);
    EXPECT_EQ(DecodeAddress(upper).prefix, "iota");
}

TEST_F(AddressTest, DecodeRejectsCorruption) {
    std::string address = AddressFromPublicKey(MAINNET_PREFIX, Ed25519(), zeroKey_);
    std::string corrupted = address;
    corrupted[10] = corrupted[10] == 'q' ? 'p' : 'q';
    EXPECT_SEEDFORGE_ERROR(DecodeAddress(corrupted), EncodingError);

    std::string truncated = address.substr(0, address.size() - 1);
    EXPECT_SEEDFORGE_ERROR(DecodeAddress(truncated), EncodingError);
}

TEST_F(AddressTest, DecodeRejectsWrongPayloadLength) {
    std::string address = EncodeAddress(MAINNET_PREFIX, Bytes(20, 0xab));
    EXPECT_SEEDFORGE_ERROR(DecodeAddress(address), EncodingError);
}

} // namespace test
} // namespace wallet
} // namespace seedforge
