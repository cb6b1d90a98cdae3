// SEEDFORGE - BIP-39 Mnemonic Tests
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License

#include <gtest/gtest.h>
#include "seedforge/core/unicode.h"
#include "seedforge/wallet/mnemonic.h"
#include "seedforge/wallet/wordlist.h"
#include "../test_helpers.h"

#include <cstdint>
#include <string>
#include <vector>

namespace seedforge {
namespace wallet {
namespace test {

using seedforge::test::FromHex;
using seedforge::test::ToHex;

namespace {

struct Bip39Vector {
    const char* entropy;
    const char* mnemonic;
    const char* seed;
};

// Published BIP-39 English vectors, passphrase "TREZOR"
const Bip39Vector BIP39_VECTORS[] = {
    {"00000000000000000000000000000000",
     "abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon about",
     "c55257c360c07c72029aebc1b53c05ed0362ada38ead3e3e9efa3708e5349553"
     "1f09a6987599d18264c1e1c92f2cf141630c7a3c4ab7c81b2f001698e7463b04"},
    {"7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f",
     "legal winner thank year wave sausage worth useful legal winner thank yellow",
     "2e8905819b8723fe2c1d161860e5ee1830318dbf49a83bd451cfb8440c28bd6f"
     "a457fe1296106559a3c80937a1c1069be3a3a5bd381ee6260e8d9739fce1f607"},
    {"80808080808080808080808080808080",
     "letter advice cage absurd amount doctor acoustic avoid letter advice cage above",
     "d71de856f81a8acc65e6fc851a38d4d7ec216fd0796d0a6827a3ad6ed5511a30"
     "fa280f12eb2e47ed2ac03b5c462a0358d18d69fe4f985ec81778c1b370b652a8"},
    {"ffffffffffffffffffffffffffffffff",
     "zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo wrong",
     "ac27495480225222079d7be181583751e86f571027b0497b5b5d11218e0a8a13"
     "332572917f0f8e5a589620c6f15b11c61dee327651a14c34e18231052e48c069"},
    {"000000000000000000000000000000000000000000000000",
     "abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon agent",
     "035895f2f481b1b0f01fcf8c289c794660b289981a78f8106447707fdd9666ca"
     "06da5a9a565181599b79f53b844d8a71dd9f439c52a3d7b3e8a79c906ac845fa"},
    {"7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f",
     "legal winner thank year wave sausage worth useful legal winner thank year wave sausage worth useful legal will",
     "f2b94508732bcbacbcc020faefecfc89feafa6649a5491b8c952cede496c214a"
     "0c7b3c392d168748f2d4a612bada0753b52a1c7ac53c1e93abd5c6320b9e95dd"},
    {"808080808080808080808080808080808080808080808080",
     "letter advice cage absurd amount doctor acoustic avoid letter advice cage absurd amount doctor acoustic avoid letter always",
     "107d7c02a5aa6f38c58083ff74f04c607c2d2c0ecc55501dadd72d025b751bc2"
     "7fe913ffb796f841c49b1d33b610cf0e91d3aa239027f5e99fe4ce9e5088cd65"},
    {"ffffffffffffffffffffffffffffffffffffffffffffffff",
     "zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo when",
     "0cd6e5d827bb62eb8fc1e262254223817fd068a74b5b449cc2f667c3f1f985a7"
     "6379b43348d952e2265b4cd129090758b3e3c2c49103b5051aac2eaeb890a528"},
    {"0000000000000000000000000000000000000000000000000000000000000000",
     "abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon art",
     "bda85446c68413707090a52022edd26a1c9462295029f2e60cd7c4f2bbd30971"
     "70af7a4d73245cafa9c3cca8d561a7c3de6f5d4a10be8ed2a5e608d68f92fcc8"},
    {"7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f",
     "legal winner thank year wave sausage worth useful legal winner thank year wave sausage worth useful legal winner thank year wave sausage worth title",
     "bc09fca1804f7e69da93c2f2028eb238c227f2e9dda30cd63699232578480a40"
     "21b146ad717fbb7e451ce9eb835f43620bf5c514db0f8add49f5d121449d3e87"},
    {"8080808080808080808080808080808080808080808080808080808080808080",
     "letter advice cage absurd amount doctor acoustic avoid letter advice cage absurd amount doctor acoustic avoid letter advice cage absurd amount doctor acoustic bless",
     "c0c519bd0e91a2ed54357d9d1ebef6f5af218a153624cf4f2da911a0ed8f7a09"
     "e2ef61af0aca007096df430022f7a2b6fb91661a9589097069720d015e4e982f"},
    {"ffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff",
     "zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo vote",
     "dd48c104698c30cfe2b6142103248622fb7bb0ff692eebb00089b32d22484e16"
     "13912f0a5b694407be899ffd31ed3992c456cdf60f5d4564b8ba3f05a69890ad"},
    {"9e885d952ad362caeb4efe34a8e91bd2",
     "ozone drill grab fiber curtain grace pudding thank cruise elder eight picnic",
     "274ddc525802f7c828d8ef7ddbcdc5304e87ac3535913611fbbfa986d0c9e547"
     "6c91689f9c8a54fd55bd38606aa6a8595ad213d4c9c9f9aca3fb217069a41028"},
    {"6610b25967cdcca9d59875f5cb50b0ea75433311869e930b",
     "gravity machine north sort system female filter attitude volume fold club stay feature office ecology stable narrow fog",
     "628c3827a8823298ee685db84f55caa34b5cc195a778e52d45f59bcf75aba68e"
     "4d7590e101dc414bc1bbd5737666fbbef35d1f1903953b66624f910feef245ac"},
    {"68a79eaca2324873eacc50cb9c6eca8cc68ea5d936f98787c60c7ebc74e6ce7c",
     "hamster diagram private dutch cause delay private meat slide toddler razor book happy fancy gospel tennis maple dilemma loan word shrug inflict delay length",
     "64c87cde7e12ecf6704ab95bb1408bef047c22db4cc7491c4271d170a1b213d2"
     "0b385bc1588d9c7b38f1b39d415665b8a9030c9ec653d75e65f847d8fc1fc440"},
    {"c0ba5a8e914111210f2bd131f3d5e08d",
     "scheme spot photo card baby mountain device kick cradle pact join borrow",
     "ea725895aaae8d4c1cf682c1bfd2d358d52ed9f0f0591131b559e2724bb234fc"
     "a05aa9c02c57407e04ee9dc3b454aa63fbff483a8b11de949624b9f1831a9612"},
    {"6d9be1ee6ebd27a258115aad99b7317b9c8d28b6d76431c3",
     "horn tenant knee talent sponsor spell gate clip pulse soap slush warm silver nephew swap uncle crack brave",
     "fd579828af3da1d32544ce4db5c73d53fc8acc4ddb1e3b251a31179cdb71e853"
     "c56d2fcb11aed39898ce6c34b10b5382772db8796e52837b54468aeb312cfc3d"},
    {"9f6a2878b2520799a44ef18bc7df394e7061a224d2c33cd015b157d746869863",
     "panda eyebrow bullet gorilla call smoke muffin taste mesh discover soft ostrich alcohol speed nation flash devote level hobby quick inner drive ghost inside",
     "72be8e052fc4919d2adf28d5306b5474b0069df35b02303de8c1729c9538dbb6"
     "fc2d731d5f832193cd9fb6aeecbc469594a70e3dd50811b5067f3b88b28c3e8d"},
    {"23db8160a31d3e97dca3688e0ba4c8a8",
     "cat swing flag economy stadium episode income home mix frog cram expire",
     "41b5da0487d0c735d84aa38fe01732df195ee90d4b6d6a6bba9fdd89f56d5ba6"
     "dcfab61c742ecdaffc4aac9620376bcfd7e71d98ee08e2b472360a603daad9f8"},
    {"8197a4a47f0425faeaa69deebc05ca29c0a5b5cc76ceacc0",
     "light rule cinnamon wrap drastic word pride squirrel upgrade then income fatal apart sustain crack supply proud access",
     "4cbdff1ca2db800fd61cae72a57475fdc6bab03e441fd63f96dabd1f183ef5b7"
     "82925f00105f318309a7e9c3ea6967c7801e46c8a58082674c860a37b93eda02"},
    {"066dca1a2bb7e8a1db2832148ce9933eea0f3ac9548d793112d9a95c9407efad",
     "all hour make first leader extend hole alien behind guard gospel lava path output census museum junior mass reopen famous sing advance salt reform",
     "26e975ec644423f4a4c4f4215ef09b4bd7ef924e85d1d17c4cf3f136c2863cf6"
     "df0a475045652c57eb5fb41513ca2a2d67722b77e954b4b3fc11f7590449191d"},
    {"f30f8c1da665478f49b001d94c5fc452",
     "vessel ladder alter error federal sibling chat ability sun glass valve picture",
     "2aaa9242daafcee6aa9d7269f17d4efe271e1b9a529178d7dc139cd18747090b"
     "f9d60295d0ce74309a78852a9caadf0af48aae1c6253839624076224374bc63f"},
    {"c10ec20dc3cd9f652c7fac2f1230f7a3c828389a14392f05",
     "scissors invite lock maple supreme raw rapid void congress muscle digital elegant little brisk hair mango congress clump",
     "7b4a10be9d98e6cba265566db7f136718e1398c71cb581e1b2f464cac1ceedf4"
     "f3e274dc270003c670ad8d02c4558b2f8e39edea2775c9e232c7cb798b069e88"},
    {"f585c11aec520db57dd353c69554b21a89b20fb0650966fa0a9d6f74fd989d8f",
     "void come effort suffer camp survey warrior heavy shoot primary clutch crush open amazing screen patrol group space point ten exist slush involve unfold",
     "01f5bced59dec48e362f2c45b5de68b9fd6c92c6634f44d6d40aab69056506f0"
     "e35524a518034ddc1192e1dacd32c1ed3eaa3c3b131c88ed8e7e54c49a5d0998"},
};

const char* const ABANDON_ABOUT =
    "abandon abandon abandon abandon abandon abandon "
    "abandon abandon abandon abandon abandon about";

} // namespace

class MnemonicTest : public ::testing::Test {
protected:
    const WordList& english_ = English();
};

// ============================================================================
// Known Vectors
// ============================================================================

TEST_F(MnemonicTest, EntropyToMnemonicVectors) {
    for (const auto& v : BIP39_VECTORS) {
        SCOPED_TRACE(v.entropy);
        Mnemonic mnemonic = EntropyToMnemonic(FromHex(v.entropy), english_);
        EXPECT_EQ(mnemonic.ToString(), v.mnemonic);
    }
}

TEST_F(MnemonicTest, MnemonicToEntropyVectors) {
    for (const auto& v : BIP39_VECTORS) {
        SCOPED_TRACE(v.mnemonic);
        Entropy entropy = MnemonicToEntropy(Mnemonic::Parse(v.mnemonic), english_);
        EXPECT_EQ(ToHex(entropy), v.entropy);
    }
}

TEST_F(MnemonicTest, MnemonicToSeedVectors) {
    for (const auto& v : BIP39_VECTORS) {
        SCOPED_TRACE(v.mnemonic);
        Seed seed = MnemonicToSeed(Mnemonic::Parse(v.mnemonic), "TREZOR", english_);
        EXPECT_EQ(ToHex(seed), v.seed);
    }
}

TEST_F(MnemonicTest, ZeroEntropyWithEmptyPassphrase) {
    Bytes entropy(16, 0);
    Mnemonic mnemonic = EntropyToMnemonic(entropy, english_);
    EXPECT_EQ(mnemonic.ToString(), ABANDON_ABOUT);

    Seed seed = MnemonicToSeed(mnemonic, "", english_);
    EXPECT_EQ(ToHex(seed),
              "5eb00bbddcf069084889a8ab9155568165f5c453ccb85e70811aaed6f6da5fc1"
              "9a5ac40b389cd370d086206dec8aa6c43daea6690f20ad3d8d48b2d2ce9e38e4");
}

// ============================================================================
// Entropy Size
// ============================================================================

TEST_F(MnemonicTest, EntropySizeRules) {
    EXPECT_FALSE(IsValidEntropySize(0));
    EXPECT_FALSE(IsValidEntropySize(12));
    EXPECT_TRUE(IsValidEntropySize(16));
    EXPECT_FALSE(IsValidEntropySize(17));
    EXPECT_TRUE(IsValidEntropySize(20));
    EXPECT_TRUE(IsValidEntropySize(32));
    EXPECT_TRUE(IsValidEntropySize(64));
    EXPECT_FALSE(IsValidEntropySize(68));
}

TEST_F(MnemonicTest, RejectsBadEntropySize) {
    EXPECT_SEEDFORGE_ERROR(EntropyToMnemonic(Bytes(15, 0), english_), InvalidEntropySize);
    EXPECT_SEEDFORGE_ERROR(EntropyToMnemonic(Bytes(18, 0), english_), InvalidEntropySize);
    EXPECT_SEEDFORGE_ERROR(EntropyToMnemonic(Bytes(68, 0), english_), InvalidEntropySize);
    EXPECT_SEEDFORGE_ERROR(EntropyToMnemonic(Bytes(), english_), InvalidEntropySize);
}

TEST_F(MnemonicTest, WordCountFollowsEntropySize) {
    // (ENT + ENT/32) / 11 words
    EXPECT_EQ(EntropyToMnemonic(Bytes(16, 0x42), english_).WordCount(), 12u);
    EXPECT_EQ(EntropyToMnemonic(Bytes(20, 0x42), english_).WordCount(), 15u);
    EXPECT_EQ(EntropyToMnemonic(Bytes(28, 0x42), english_).WordCount(), 21u);
    EXPECT_EQ(EntropyToMnemonic(Bytes(64, 0x42), english_).WordCount(), 48u);
}

TEST_F(MnemonicTest, RoundTripAllStandardSizes) {
    for (size_t size = 16; size <= 32; size += 4) {
        SCOPED_TRACE(size);
        Entropy entropy = GenerateEntropy(size);
        Mnemonic mnemonic = EntropyToMnemonic(entropy, english_);
        EXPECT_EQ(MnemonicToEntropy(mnemonic, english_), entropy);
    }
}

// ============================================================================
// Decoding Errors
// ============================================================================

TEST_F(MnemonicTest, RejectsNonStandardWordCount) {
    EXPECT_SEEDFORGE_ERROR(MnemonicToEntropy(Mnemonic(), english_), InvalidMnemonic);
    EXPECT_SEEDFORGE_ERROR(
        MnemonicToEntropy(Mnemonic::Parse("abandon abandon abandon abandon abandon abandon "
                                          "abandon abandon abandon abandon about"),
                          english_),
        InvalidMnemonic);

    // 48 words encode fine but are not accepted for decoding
    Mnemonic longMnemonic = EntropyToMnemonic(Bytes(64, 0), english_);
    EXPECT_SEEDFORGE_ERROR(MnemonicToEntropy(longMnemonic, english_), InvalidMnemonic);
}

TEST_F(MnemonicTest, RejectsUnknownWord) {
    std::string sentence =
        "abandon abandon abandon abandon abandon abandon "
        "abandon abandon abandon abandon abandon bitcoin";
    EXPECT_SEEDFORGE_ERROR(MnemonicToEntropy(Mnemonic::Parse(sentence), english_),
                           InvalidMnemonic);
}

TEST_F(MnemonicTest, WordsAreCaseSensitive) {
    std::string sentence =
        "Abandon abandon abandon abandon abandon abandon "
        "abandon abandon abandon abandon abandon about";
    EXPECT_SEEDFORGE_ERROR(MnemonicToEntropy(Mnemonic::Parse(sentence), english_),
                           InvalidMnemonic);
}

TEST_F(MnemonicTest, RejectsBadChecksum) {
    // "abandon" x12 carries checksum bits 0000 instead of 0011
    std::vector<std::string> words(12, "abandon");
    EXPECT_SEEDFORGE_ERROR(MnemonicToEntropy(Mnemonic(words), english_), InvalidChecksum);
}

TEST_F(MnemonicTest, FlippedLastWordFailsChecksum) {
    // "zoo" x24 is not a valid sentence; "vote" ends the ff.. vector
    std::vector<std::string> words(24, "zoo");
    EXPECT_SEEDFORGE_ERROR(MnemonicToEntropy(Mnemonic(words), english_), InvalidChecksum);
    words.back() = "vote";
    EXPECT_NO_THROW(MnemonicToEntropy(Mnemonic(words), english_));
}

TEST_F(MnemonicTest, EverySingleBitFlipFailsChecksum) {
    // One entropy per size. For these, no single flipped entropy bit
    // happens to reproduce the same checksum bits.
    const char* entropies[] = {
        "de1377e33e1485970c558acd55c28973",
        "b7d5d9260e415437b91cc313b4584613464d5d57",
        "1fb3f19f2d195bf83629a29cd331c2bcbdf9dc240fec8b4d",
        "cfdf4cca64afa0be55f4be0f82eb19ae4810ec3c40044db0f736353a",
        "b4fe2ad648759457693f08101bdc731ac5a87487737e5dfc10a9a5648600a6dd",
    };

    for (const char* hex : entropies) {
        SCOPED_TRACE(hex);
        Bytes entropy = FromHex(hex);
        Mnemonic valid = EntropyToMnemonic(entropy, english_);
        ASSERT_EQ(ToHex(MnemonicToEntropy(valid, english_)), hex);

        // 11 bits per word, most significant first
        std::vector<bool> bits;
        for (const auto& word : valid.Words()) {
            uint16_t index = english_.Index(word).value();
            for (int b = 10; b >= 0; --b) {
                bits.push_back(((index >> b) & 1) != 0);
            }
        }

        const size_t entropyBits = entropy.size() * 8;
        ASSERT_EQ(bits.size(), entropyBits + entropyBits / 32);

        for (size_t flip = 0; flip < bits.size(); ++flip) {
            std::vector<bool> changed = bits;
            changed[flip] = !changed[flip];

            std::vector<std::string> words;
            for (size_t w = 0; w < changed.size(); w += 11) {
                uint32_t index = 0;
                for (size_t b = 0; b < 11; ++b) {
                    index = (index << 1) | (changed[w + b] ? 1u : 0u);
                }
                words.push_back(english_.Word(index));
            }
            EXPECT_SEEDFORGE_ERROR(MnemonicToEntropy(Mnemonic(words), english_),
                                   InvalidChecksum);
        }
    }
}

TEST_F(MnemonicTest, SeedRequiresValidMnemonic) {
    std::vector<std::string> words(12, "abandon");
    EXPECT_SEEDFORGE_ERROR(MnemonicToSeed(Mnemonic(words), "", english_), InvalidChecksum);
}

// ============================================================================
// Ideographic Separator
// ============================================================================

namespace {

/// "GA" (U+304C) followed by a 4-digit index; NFKD splits the kana into
/// KA + combining voiced mark
std::vector<std::string> KanaWords() {
    std::vector<std::string> words;
    for (size_t i = 0; i < WordList::SIZE; ++i) {
        std::string num = std::to_string(i);
        words.push_back(std::string("\xE3\x81\x8C") + std::string(4 - num.size(), '0') + num);
    }
    return words;
}

size_t CountOf(const std::string& text, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos;
         pos = text.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

} // namespace

TEST_F(MnemonicTest, JapaneseSentenceUsesIdeographicSpace) {
    WordListRegistry registry;
    registry.Register("japanese", KanaWords(), SeparatorFor("japanese"));
    auto kana = registry.Select("japanese");

    Bytes entropy(16, 0);
    Mnemonic mnemonic = EntropyToMnemonic(entropy, *kana);
    std::string sentence = mnemonic.ToString(kana->Separator());

    EXPECT_EQ(CountOf(sentence, JAPANESE_SEPARATOR), 11u);
    EXPECT_EQ(sentence.find(' '), std::string::npos);

    // NFKD turns U+3000 into U+0020, so the joined sentence parses back
    Mnemonic parsed = Mnemonic::Parse(sentence);
    EXPECT_EQ(parsed, mnemonic);
    EXPECT_EQ(ToHex(MnemonicToEntropy(parsed, *kana)), ToHex(entropy));
}

TEST_F(MnemonicTest, JapaneseSeedNormalizesSentenceAndPassphrase) {
    WordListRegistry registry;
    registry.Register("japanese", KanaWords(), SeparatorFor("japanese"));
    registry.Register("kana-spaced", KanaWords(), " ");

    // U+334D U+30AC U+30D0 U+30F4 U+30A1 U+3071 U+3070 U+3050 U+309E
    // U+3061 U+3062 U+5341 U+4EBA U+5341 U+8272
    Bytes raw = FromHex("e38d8de382ace38390e383b4e382a1e381b1e381b0e38190e3829e"
                        "e381a1e381a2e58d81e4babae58d81e889b2");
    const std::string passphrase(raw.begin(), raw.end());

    Mnemonic mnemonic = EntropyToMnemonic(Bytes(16, 0), *registry.Select("japanese"));
    ASSERT_EQ(mnemonic.Words().back(), NormalizeNFKD(KanaWords()[3]));

    Seed seed = MnemonicToSeed(mnemonic, passphrase, *registry.Select("japanese"));
    EXPECT_EQ(ToHex(seed),
              "844fd00e09b527d81b46b20f007f0002397710d75227be62c66a4b7bf0abee54"
              "8993ed9f79b476969f4c17cb7ff7f487226914965f10d8848528d9902bc9a367");

    // Same words joined by a plain space stretch to the same seed
    Seed spaced = MnemonicToSeed(mnemonic, passphrase, *registry.Select("kana-spaced"));
    EXPECT_EQ(ToHex(spaced), ToHex(seed));
}

// ============================================================================
// Parsing and Normalization
// ============================================================================

TEST_F(MnemonicTest, ParseCollapsesWhitespace) {
    Mnemonic mnemonic = Mnemonic::Parse(
        "  abandon\tabandon abandon  abandon abandon abandon\n"
        "abandon abandon abandon abandon abandon   about ");
    EXPECT_EQ(mnemonic.WordCount(), 12u);
    EXPECT_EQ(mnemonic.ToString(), ABANDON_ABOUT);
}

TEST_F(MnemonicTest, ToStringUsesSeparator) {
    Mnemonic mnemonic({"legal", "winner"});
    EXPECT_EQ(mnemonic.ToString("-"), "legal-winner");
}

TEST_F(MnemonicTest, PassphraseIsNormalized) {
    // Precomposed and decomposed forms of the same passphrase
    Mnemonic mnemonic = Mnemonic::Parse(ABANDON_ABOUT);
    Seed composed = MnemonicToSeed(mnemonic, "caf\xC3\xA9", english_);
    Seed decomposed = MnemonicToSeed(mnemonic, "cafe\xCC\x81", english_);
    EXPECT_EQ(composed, decomposed);
    EXPECT_NE(composed, MnemonicToSeed(mnemonic, "cafe", english_));
}

TEST_F(MnemonicTest, CompatibilityCharactersAreNormalized) {
    // Fullwidth letters decompose to ASCII under NFKD
    Mnemonic fullwidth = Mnemonic::Parse(
        "abandon abandon abandon abandon abandon abandon "
        "abandon abandon abandon abandon abandon \xEF\xBD\x81\xEF\xBD\x82out");
    EXPECT_EQ(fullwidth.ToString(), ABANDON_ABOUT);
}

// ============================================================================
// Generation
// ============================================================================

TEST_F(MnemonicTest, GenerateEntropyRejectsBadSize) {
    EXPECT_SEEDFORGE_ERROR(GenerateEntropy(10), InvalidEntropySize);
}

TEST_F(MnemonicTest, GenerateEntropyIsFresh) {
    Entropy a = GenerateEntropy(32);
    Entropy b = GenerateEntropy(32);
    EXPECT_EQ(a.size(), 32u);
    EXPECT_NE(a, b);
}

} // namespace test
} // namespace wallet
} // namespace seedforge
