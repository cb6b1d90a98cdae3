// SEEDFORGE - BIP-39 Mnemonic Codec Implementation
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License

#include "seedforge/wallet/mnemonic.h"
#include "seedforge/core/error.h"
#include "seedforge/core/random.h"
#include "seedforge/core/unicode.h"
#include "seedforge/crypto/hmac.h"
#include "seedforge/crypto/sha256.h"
#include "seedforge/util/logging.h"

#include <openssl/crypto.h>

#include <algorithm>

namespace seedforge {
namespace wallet {

namespace {

/// MSB-first writer of fixed-width fields into a byte buffer
class BitWriter {
public:
    explicit BitWriter(size_t totalBits) : buffer_((totalBits + 7) / 8, 0) {}

    void Write(uint32_t value, int bits) {
        for (int i = bits - 1; i >= 0; --i) {
            if ((value >> i) & 1) {
                buffer_[pos_ / 8] |= static_cast<Byte>(0x80 >> (pos_ % 8));
            }
            ++pos_;
        }
    }

    const std::vector<Byte>& Buffer() const { return buffer_; }

private:
    std::vector<Byte> buffer_;
    size_t pos_{0};
};

/// MSB-first reader of fixed-width fields from a byte buffer
class BitReader {
public:
    BitReader(const Byte* data, size_t len) : data_(data), len_(len) {}

    uint32_t Read(int bits) {
        uint32_t value = 0;
        for (int i = 0; i < bits; ++i) {
            if (pos_ / 8 >= len_) {
                throw Error(ErrorCode::InvalidMnemonic, "Bit buffer exhausted");
            }
            uint32_t bit = (data_[pos_ / 8] >> (7 - pos_ % 8)) & 1;
            value = (value << 1) | bit;
            ++pos_;
        }
        return value;
    }

    void Seek(size_t bitPos) { pos_ = bitPos; }

private:
    const Byte* data_;
    size_t len_;
    size_t pos_{0};
};

/// Leading checksumBits bits of SHA-256(entropy); checksumBits <= 16
uint32_t ComputeChecksum(const Byte* entropy, size_t len, int checksumBits) {
    Hash256 hash = SHA256Hash(entropy, len);
    BitReader reader(hash.data(), hash.size());
    return reader.Read(checksumBits);
}

} // namespace

// ============================================================================
// Mnemonic Implementation
// ============================================================================

Mnemonic::Mnemonic(const std::vector<std::string>& words) {
    words_.reserve(words.size());
    for (const auto& word : words) {
        words_.push_back(NormalizeNFKD(word));
    }
}

Mnemonic Mnemonic::Parse(const std::string& sentence) {
    Mnemonic result;
    result.words_ = SplitWhitespace(NormalizeNFKD(sentence));
    return result;
}

std::string Mnemonic::ToString(const std::string& separator) const {
    std::string result;
    for (size_t i = 0; i < words_.size(); ++i) {
        if (i > 0) result += separator;
        result += words_[i];
    }
    return result;
}

// ============================================================================
// Codec Implementation
// ============================================================================

bool IsValidWordCount(size_t count) {
    return count >= 12 && count <= 24 && count % 3 == 0;
}

bool IsValidEntropySize(size_t size) {
    return size >= MIN_ENTROPY_SIZE && size <= MAX_ENTROPY_SIZE &&
           size % ENTROPY_MULTIPLE == 0;
}

Mnemonic EntropyToMnemonic(ByteSpan entropy, const WordList& wordList) {
    if (!IsValidEntropySize(entropy.size())) {
        throw Error(ErrorCode::InvalidEntropySize,
                    "Entropy must be 16 to 64 bytes in steps of 4, got " +
                    std::to_string(entropy.size()));
    }

    const size_t entropyBits = entropy.size() * 8;
    const int checksumBits = static_cast<int>(entropyBits / 32);
    const size_t totalBits = entropyBits + checksumBits;
    const size_t wordCount = totalBits / WordList::INDEX_BITS;

    BitWriter writer(totalBits);
    for (Byte b : entropy) {
        writer.Write(b, 8);
    }
    writer.Write(ComputeChecksum(entropy.data(), entropy.size(), checksumBits), checksumBits);

    const auto& buffer = writer.Buffer();
    BitReader reader(buffer.data(), buffer.size());

    std::vector<std::string> words;
    words.reserve(wordCount);
    for (size_t i = 0; i < wordCount; ++i) {
        words.push_back(wordList.Word(reader.Read(WordList::INDEX_BITS)));
    }

    LOG_DEBUG(util::LogCategory::MNEMONIC) << "Encoded " << entropy.size()
        << "-byte entropy as " << wordCount << " " << wordList.Name() << " words";
    return Mnemonic(words);
}

Entropy MnemonicToEntropy(const Mnemonic& mnemonic, const WordList& wordList) {
    const size_t wordCount = mnemonic.WordCount();
    if (!IsValidWordCount(wordCount)) {
        throw Error(ErrorCode::InvalidMnemonic,
                    "Mnemonic must have 12, 15, 18, 21 or 24 words, got " +
                    std::to_string(wordCount));
    }

    const size_t entropyBits = 32 * wordCount / 3;
    const int checksumBits = static_cast<int>(entropyBits / 32);

    BitWriter writer(wordCount * WordList::INDEX_BITS);
    const auto& words = mnemonic.Words();
    for (size_t i = 0; i < wordCount; ++i) {
        auto index = wordList.Index(words[i]);
        if (!index) {
            throw Error(ErrorCode::InvalidMnemonic,
                        "Word " + std::to_string(i + 1) + " is not in the " +
                        wordList.Name() + " word list");
        }
        writer.Write(*index, WordList::INDEX_BITS);
    }

    const auto& buffer = writer.Buffer();
    Entropy entropy(buffer.begin(), buffer.begin() + entropyBits / 8);

    BitReader reader(buffer.data(), buffer.size());
    reader.Seek(entropyBits);
    uint32_t checksum = reader.Read(checksumBits);

    if (checksum != ComputeChecksum(entropy.data(), entropy.size(), checksumBits)) {
        OPENSSL_cleanse(entropy.data(), entropy.size());
        throw Error(ErrorCode::InvalidChecksum, "Mnemonic checksum mismatch");
    }
    return entropy;
}

Seed MnemonicToSeed(const Mnemonic& mnemonic, const std::string& passphrase,
                    const WordList& wordList) {
    Entropy entropy = MnemonicToEntropy(mnemonic, wordList);
    OPENSSL_cleanse(entropy.data(), entropy.size());

    SEEDFORGE_LOG_TIMER(util::LogCategory::MNEMONIC, "mnemonic seed stretching");

    std::string sentence = NormalizeNFKD(mnemonic.ToString(wordList.Separator()));
    std::string salt = std::string(SEED_SALT_PREFIX) + NormalizeNFKD(passphrase);

    std::vector<Byte> key = PBKDF2_SHA512(sentence, salt, PBKDF2_ROUNDS, SEED_SIZE);
    Seed seed;
    std::copy(key.begin(), key.end(), seed.begin());

    OPENSSL_cleanse(key.data(), key.size());
    OPENSSL_cleanse(&sentence[0], sentence.size());
    OPENSSL_cleanse(&salt[0], salt.size());
    return seed;
}

Entropy GenerateEntropy(size_t size) {
    if (!IsValidEntropySize(size)) {
        throw Error(ErrorCode::InvalidEntropySize,
                    "Entropy must be 16 to 64 bytes in steps of 4, got " +
                    std::to_string(size));
    }
    return GetRandBytes(size);
}

} // namespace wallet
} // namespace seedforge
