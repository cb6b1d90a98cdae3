// SEEDFORGE - BLAKE2b Hash Function
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License
//
// Unkeyed BLAKE2b following RFC 7693, with a digest length chosen at
// construction (1..64 bytes). BLAKE2b-256 hashes public keys into
// address payloads.

#ifndef SEEDFORGE_CRYPTO_BLAKE2B_H
#define SEEDFORGE_CRYPTO_BLAKE2B_H

#include <cstdint>
#include <cstddef>
#include "seedforge/core/types.h"

namespace seedforge {

/// BLAKE2b hasher class
class BLAKE2b {
public:
    /// Largest digest length in bytes
    static constexpr size_t MAX_OUTPUT_SIZE = 64;

    /// Block size in bytes
    static constexpr size_t BLOCK_SIZE = 128;

    /// @param outputSize Digest length in bytes, 1..MAX_OUTPUT_SIZE
    /// @throws std::invalid_argument for any other length
    explicit BLAKE2b(size_t outputSize = MAX_OUTPUT_SIZE);

    /// Write data to the hasher
    /// @return Reference to this hasher (for chaining)
    BLAKE2b& Write(const Byte* data, size_t len);

    /// Finalize the hash
    /// @param hash Output buffer of at least OutputSize() bytes
    void Finalize(Byte* hash);

    /// Reset hasher to initial state, keeping the digest length
    BLAKE2b& Reset();

    size_t OutputSize() const { return outputSize_; }

private:
    /// Chained state (8 x 64-bit words)
    uint64_t state_[8];

    /// 128-bit byte counter, low word first
    uint64_t counter_[2];

    /// Buffer for partial block; a full block is held back until more input
    /// arrives so the final block can be flagged
    Byte buffer_[BLOCK_SIZE];
    size_t bufferLen_;

    size_t outputSize_;

    void IncrementCounter(uint64_t n);

    /// Compress one 128-byte block
    void Compress(const Byte block[BLOCK_SIZE], bool last);
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// BLAKE2b with a 32-byte digest
Hash256 BLAKE2b256(const Byte* data, size_t len);

inline Hash256 BLAKE2b256(ByteSpan data) {
    return BLAKE2b256(data.data(), data.size());
}

/// BLAKE2b with a 64-byte digest
Hash512 BLAKE2b512(const Byte* data, size_t len);

inline Hash512 BLAKE2b512(ByteSpan data) {
    return BLAKE2b512(data.data(), data.size());
}

} // namespace seedforge

#endif // SEEDFORGE_CRYPTO_BLAKE2B_H
