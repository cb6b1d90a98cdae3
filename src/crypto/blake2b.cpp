// SEEDFORGE - BLAKE2b Implementation
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License
//
// BLAKE2b following RFC 7693
// Reference: https://www.rfc-editor.org/rfc/rfc7693

#include "seedforge/crypto/blake2b.h"

#include <cstring>
#include <stdexcept>

namespace seedforge {

// ============================================================================
// BLAKE2b Constants
// ============================================================================

namespace {

/// Initialization vector (same as the SHA-512 initial hash values)
constexpr uint64_t BLAKE2B_IV[8] = {
    0x6a09e667f3bcc908ULL, 0xbb67ae8584caa73bULL,
    0x3c6ef372fe94f82bULL, 0xa54ff53a5f1d36f1ULL,
    0x510e527fade682d1ULL, 0x9b05688c2b3e6c1fULL,
    0x1f83d9abfb41bd6bULL, 0x5be0cd19137e2179ULL
};

/// Message word permutations, one row per round (rounds 10 and 11 reuse 0 and 1)
constexpr uint8_t SIGMA[10][16] = {
    { 0,  1,  2,  3,  4,  5,  6,  7,  8,  9, 10, 11, 12, 13, 14, 15},
    {14, 10,  4,  8,  9, 15, 13,  6,  1, 12,  0,  2, 11,  7,  5,  3},
    {11,  8, 12,  0,  5,  2, 15, 13, 10, 14,  3,  6,  7,  1,  9,  4},
    { 7,  9,  3,  1, 13, 12, 11, 14,  2,  6,  5, 10,  4,  0, 15,  8},
    { 9,  0,  5,  7,  2,  4, 10, 15, 14,  1, 11, 12,  6,  8,  3, 13},
    { 2, 12,  6, 10,  0, 11,  8,  3,  4, 13,  7,  5, 15, 14,  1,  9},
    {12,  5,  1, 15, 14, 13,  4, 10,  0,  7,  6,  3,  9,  2,  8, 11},
    {13, 11,  7, 14, 12,  1,  3,  9,  5,  0, 15,  4,  8,  6,  2, 10},
    { 6, 15, 14,  9, 11,  3,  0,  8, 12,  2, 13,  7,  1,  4, 10,  5},
    {10,  2,  8,  4,  7,  6,  1,  5, 15, 11,  9, 14,  3, 12, 13,  0}
};

constexpr int ROUNDS = 12;

// ============================================================================
// Helper Functions
// ============================================================================

/// Right rotate a 64-bit word
inline uint64_t ROTR64(uint64_t x, int n) {
    return (x >> n) | (x << (64 - n));
}

/// Read a 64-bit little-endian word from byte array
inline uint64_t ReadLE64(const Byte* ptr) {
    uint64_t v = 0;
    for (int i = 7; i >= 0; --i) {
        v = (v << 8) | ptr[i];
    }
    return v;
}

/// Write a 64-bit little-endian word to byte array
inline void WriteLE64(Byte* ptr, uint64_t val) {
    for (int i = 0; i < 8; ++i) {
        ptr[i] = static_cast<Byte>(val >> (8 * i));
    }
}

/// Mixing function G
inline void G(uint64_t v[16], int a, int b, int c, int d, uint64_t x, uint64_t y) {
    v[a] = v[a] + v[b] + x;
    v[d] = ROTR64(v[d] ^ v[a], 32);
    v[c] = v[c] + v[d];
    v[b] = ROTR64(v[b] ^ v[c], 24);
    v[a] = v[a] + v[b] + y;
    v[d] = ROTR64(v[d] ^ v[a], 16);
    v[c] = v[c] + v[d];
    v[b] = ROTR64(v[b] ^ v[c], 63);
}

} // anonymous namespace

// ============================================================================
// BLAKE2b Implementation
// ============================================================================

BLAKE2b::BLAKE2b(size_t outputSize) : outputSize_(outputSize) {
    if (outputSize == 0 || outputSize > MAX_OUTPUT_SIZE) {
        throw std::invalid_argument("BLAKE2b digest length must be 1..64 bytes");
    }
    Reset();
}

BLAKE2b& BLAKE2b::Reset() {
    std::memcpy(state_, BLAKE2B_IV, sizeof(state_));
    // Parameter block: digest length, key length 0, fanout 1, depth 1
    state_[0] ^= 0x01010000ULL ^ static_cast<uint64_t>(outputSize_);
    counter_[0] = 0;
    counter_[1] = 0;
    bufferLen_ = 0;
    return *this;
}

void BLAKE2b::IncrementCounter(uint64_t n) {
    counter_[0] += n;
    if (counter_[0] < n) {
        ++counter_[1];
    }
}

void BLAKE2b::Compress(const Byte block[BLOCK_SIZE], bool last) {
    uint64_t m[16];
    uint64_t v[16];

    for (int i = 0; i < 16; ++i) {
        m[i] = ReadLE64(block + i * 8);
    }

    for (int i = 0; i < 8; ++i) {
        v[i] = state_[i];
        v[i + 8] = BLAKE2B_IV[i];
    }

    v[12] ^= counter_[0];
    v[13] ^= counter_[1];
    if (last) {
        v[14] = ~v[14];
    }

    for (int r = 0; r < ROUNDS; ++r) {
        const uint8_t* s = SIGMA[r % 10];
        G(v, 0, 4,  8, 12, m[s[0]],  m[s[1]]);
        G(v, 1, 5,  9, 13, m[s[2]],  m[s[3]]);
        G(v, 2, 6, 10, 14, m[s[4]],  m[s[5]]);
        G(v, 3, 7, 11, 15, m[s[6]],  m[s[7]]);
        G(v, 0, 5, 10, 15, m[s[8]],  m[s[9]]);
        G(v, 1, 6, 11, 12, m[s[10]], m[s[11]]);
        G(v, 2, 7,  8, 13, m[s[12]], m[s[13]]);
        G(v, 3, 4,  9, 14, m[s[14]], m[s[15]]);
    }

    for (int i = 0; i < 8; ++i) {
        state_[i] ^= v[i] ^ v[i + 8];
    }
}

BLAKE2b& BLAKE2b::Write(const Byte* data, size_t len) {
    while (len > 0) {
        if (bufferLen_ == BLOCK_SIZE) {
            IncrementCounter(BLOCK_SIZE);
            Compress(buffer_, false);
            bufferLen_ = 0;
        }

        size_t toCopy = BLOCK_SIZE - bufferLen_;
        if (toCopy > len) toCopy = len;
        std::memcpy(buffer_ + bufferLen_, data, toCopy);
        bufferLen_ += toCopy;
        data += toCopy;
        len -= toCopy;
    }
    return *this;
}

void BLAKE2b::Finalize(Byte* hash) {
    IncrementCounter(bufferLen_);
    std::memset(buffer_ + bufferLen_, 0, BLOCK_SIZE - bufferLen_);
    Compress(buffer_, true);

    Byte out[MAX_OUTPUT_SIZE];
    for (int i = 0; i < 8; ++i) {
        WriteLE64(out + i * 8, state_[i]);
    }
    std::memcpy(hash, out, outputSize_);
}

// ============================================================================
// Convenience Functions
// ============================================================================

Hash256 BLAKE2b256(const Byte* data, size_t len) {
    Hash256 result;
    BLAKE2b(Hash256::SIZE).Write(data, len).Finalize(result.data());
    return result;
}

Hash512 BLAKE2b512(const Byte* data, size_t len) {
    Hash512 result;
    BLAKE2b(Hash512::SIZE).Write(data, len).Finalize(result.data());
    return result;
}

} // namespace seedforge
