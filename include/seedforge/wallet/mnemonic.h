// SEEDFORGE - BIP-39 Mnemonic Codec
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License
//
// Entropy <-> mnemonic sentence conversion with SHA-256 checksum, and
// PBKDF2-HMAC-SHA512 stretching of a mnemonic plus passphrase into a
// 64-byte seed. Every operation takes the word list explicitly.
//
// Entropy of ENT bits carries ENT/32 checksum bits; the (ENT + ENT/32)-bit
// buffer is cut into 11-bit word indices, most significant first.

#ifndef SEEDFORGE_WALLET_MNEMONIC_H
#define SEEDFORGE_WALLET_MNEMONIC_H

#include "seedforge/core/types.h"
#include "seedforge/wallet/wordlist.h"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace seedforge {
namespace wallet {

// ============================================================================
// Constants
// ============================================================================

/// Entropy bounds in bytes; length must also be a multiple of ENTROPY_MULTIPLE
constexpr size_t MIN_ENTROPY_SIZE = 16;
constexpr size_t MAX_ENTROPY_SIZE = 64;
constexpr size_t ENTROPY_MULTIPLE = 4;

/// Stretched seed size
constexpr size_t SEED_SIZE = 64;

/// PBKDF2 iteration count fixed by BIP-39
constexpr uint32_t PBKDF2_ROUNDS = 2048;

/// Salt prefix prepended to the passphrase
constexpr const char* SEED_SALT_PREFIX = "mnemonic";

using Entropy = std::vector<Byte>;
using Seed = std::array<Byte, SEED_SIZE>;

// ============================================================================
// Mnemonic
// ============================================================================

/**
 * Ordered word sequence. Words are stored NFKD-normalized; membership in
 * a word list is checked by the codec, not here.
 */
class Mnemonic {
public:
    Mnemonic() = default;

    explicit Mnemonic(const std::vector<std::string>& words);

    /// NFKD-normalize a sentence and split it on whitespace
    static Mnemonic Parse(const std::string& sentence);

    const std::vector<std::string>& Words() const { return words_; }
    size_t WordCount() const { return words_.size(); }
    bool IsEmpty() const { return words_.empty(); }

    /// Join the words with separator
    std::string ToString(const std::string& separator = " ") const;

    bool operator==(const Mnemonic& other) const { return words_ == other.words_; }
    bool operator!=(const Mnemonic& other) const { return !(*this == other); }

private:
    std::vector<std::string> words_;
};

// ============================================================================
// Codec
// ============================================================================

/// True for the word counts BIP-39 defines: 12, 15, 18, 21, 24
bool IsValidWordCount(size_t count);

/// True if 16 <= size <= 64 and size % 4 == 0
bool IsValidEntropySize(size_t size);

/**
 * Encode entropy as a mnemonic.
 *
 * @throws Error(InvalidEntropySize)
 */
Mnemonic EntropyToMnemonic(ByteSpan entropy, const WordList& wordList);

/**
 * Decode a mnemonic back to its entropy and verify the checksum.
 *
 * @throws Error(InvalidMnemonic) for a bad word count or unknown word,
 *         Error(InvalidChecksum) if the checksum bits do not match
 */
Entropy MnemonicToEntropy(const Mnemonic& mnemonic, const WordList& wordList);

/**
 * Stretch a validated mnemonic and passphrase into a seed:
 * PBKDF2-HMAC-SHA512(NFKD(sentence), "mnemonic" + NFKD(passphrase), 2048, 64).
 *
 * The mnemonic is decoded first and any codec error propagates.
 */
Seed MnemonicToSeed(const Mnemonic& mnemonic, const std::string& passphrase,
                    const WordList& wordList);

/**
 * Fresh entropy from the OS source.
 *
 * @throws Error(InvalidEntropySize), Error(RandomSourceFailure)
 */
Entropy GenerateEntropy(size_t size);

} // namespace wallet
} // namespace seedforge

#endif // SEEDFORGE_WALLET_MNEMONIC_H
