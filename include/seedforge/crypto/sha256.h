// SEEDFORGE - SHA256 Hash Function
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License
//
// SHA-256 (FIPS 180-4) on top of the OpenSSL EVP digest interface.

#ifndef SEEDFORGE_CRYPTO_SHA256_H
#define SEEDFORGE_CRYPTO_SHA256_H

#include <cstdint>
#include <cstddef>
#include <memory>
#include "seedforge/core/types.h"

namespace seedforge {

/// SHA-256 hasher class
/// Provides incremental hashing capability
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    /// Block size in bytes
    static constexpr size_t BLOCK_SIZE = 64;

    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    /// Write data to the hasher
    /// @return Reference to this hasher (for chaining)
    SHA256& Write(const Byte* data, size_t len);

    /// Finalize the hash and write to output
    /// @param hash Output buffer of at least OUTPUT_SIZE bytes
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Reset hasher to initial state
    SHA256& Reset();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Compute SHA256 hash of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(ByteSpan data) {
    return SHA256Hash(data.data(), data.size());
}

} // namespace seedforge

#endif // SEEDFORGE_CRYPTO_SHA256_H
