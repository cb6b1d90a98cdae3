// SEEDFORGE - Prime-Order Elliptic Curve Groups
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License
//
// Scalar and point helpers for the short-Weierstrass curves used by
// SLIP-10 public-point derivation (secp256k1, NIST P-256), backed by the
// OpenSSL EC and BIGNUM interfaces.

#ifndef SEEDFORGE_CRYPTO_ECGROUP_H
#define SEEDFORGE_CRYPTO_ECGROUP_H

#include <array>
#include <cstddef>
#include <memory>
#include <string>
#include "seedforge/core/types.h"

namespace seedforge {

class ECGroup {
public:
    /// Private key (scalar) size in bytes
    static constexpr size_t PRIVATE_KEY_SIZE = 32;

    /// Compressed SEC1 point size in bytes
    static constexpr size_t COMPRESSED_SIZE = 33;

    using CompressedPoint = std::array<Byte, COMPRESSED_SIZE>;

    /// Build the group for an OpenSSL curve NID
    /// @throws std::runtime_error if OpenSSL does not know the curve
    ECGroup(int nid, std::string name);
    ~ECGroup();

    ECGroup(const ECGroup&) = delete;
    ECGroup& operator=(const ECGroup&) = delete;

    /// Shared instances
    static const ECGroup& Secp256k1();
    static const ECGroup& Nist256p1();

    const std::string& Name() const { return name_; }

    /// True if the 32-byte big-endian scalar satisfies 0 < key < n
    bool IsValidPrivateKey(const Byte* key) const;

    /**
     * result = (key + tweak) mod n.
     *
     * @return false if tweak >= n or the sum is zero; result is left
     *         untouched in that case
     */
    bool PrivateKeyTweakAdd(const Byte* key, const Byte* tweak, Byte* result) const;

    /**
     * Compressed public point key * G.
     *
     * @throws Error(InvalidKey) if key is not a valid private key
     */
    CompressedPoint GetPublicKey(const Byte* key) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    std::string name_;
};

} // namespace seedforge

#endif // SEEDFORGE_CRYPTO_ECGROUP_H
