// SEEDFORGE - Derivation Curves
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License
//
// SLIP-10 master and child key rules for each supported signature curve.
//
// Seed-only curves (Ed25519) use the 32-byte private key directly as the
// signing seed and allow hardened derivation only. Public-point curves
// (secp256k1, NIST P-256) treat the key as a scalar modulo the group order
// and allow both hardened and normal derivation.

#ifndef SEEDFORGE_WALLET_CURVE_H
#define SEEDFORGE_WALLET_CURVE_H

#include "seedforge/core/types.h"
#include "seedforge/wallet/path.h"

#include <array>
#include <cstdint>
#include <string>

namespace seedforge {

class ECGroup;

namespace wallet {

// ============================================================================
// Constants
// ============================================================================

/// Private key and chain code sizes
constexpr size_t KEY_SIZE = 32;
constexpr size_t CHAIN_CODE_SIZE = 32;

/// HMAC domain-separation keys for master derivation
constexpr const char* ED25519_SEED_KEY = "ed25519 seed";
constexpr const char* SECP256K1_SEED_KEY = "Bitcoin seed";
constexpr const char* NIST256P1_SEED_KEY = "Nist256p1 seed";

enum class CurveKind : uint8_t {
    Ed25519,
    Secp256k1,
    Nist256p1,
};

const char* CurveKindToString(CurveKind kind);

// ============================================================================
// Extended Key
// ============================================================================

/**
 * Private key plus chain code at some node of the derivation tree.
 * Key material is wiped on destruction.
 */
class ExtendedKey {
public:
    using KeyBytes = std::array<Byte, KEY_SIZE>;
    using ChainCode = std::array<Byte, CHAIN_CODE_SIZE>;

    ExtendedKey(CurveKind curve, const KeyBytes& key, const ChainCode& chainCode,
                uint32_t depth = 0, uint32_t childIndex = 0);

    ExtendedKey(const ExtendedKey&) = default;
    ExtendedKey& operator=(const ExtendedKey&) = default;

    ~ExtendedKey();

    CurveKind Curve() const { return curve_; }
    const KeyBytes& Key() const { return key_; }
    const ChainCode& GetChainCode() const { return chainCode_; }

    /// 0 for the master key
    uint32_t Depth() const { return depth_; }

    /// Full index (hardened flag included) of the last step, 0 for the master
    uint32_t ChildIndex() const { return childIndex_; }

    bool operator==(const ExtendedKey& other) const;
    bool operator!=(const ExtendedKey& other) const { return !(*this == other); }

private:
    CurveKind curve_;
    KeyBytes key_;
    ChainCode chainCode_;
    uint32_t depth_;
    uint32_t childIndex_;
};

// ============================================================================
// Curve Interface
// ============================================================================

class Curve {
public:
    virtual ~Curve() = default;

    /// Lowercase curve name ("ed25519", "secp256k1", "nist256p1")
    virtual const char* Name() const = 0;

    virtual CurveKind Kind() const = 0;

    /// Master HMAC key ("ed25519 seed", ...)
    virtual const char* HmacKey() const = 0;

    /// False for seed-only curves
    virtual bool SupportsNormalDerivation() const = 0;

    /// Leading byte of an address payload built from this curve's keys
    virtual Byte AddressVersion() const = 0;

    /// Master key from a seed of any length
    virtual ExtendedKey DeriveMaster(ByteSpan seed) const = 0;

    /**
     * One derivation step.
     *
     * @throws Error(UnsupportedDerivation) for a normal step on a seed-only
     *         curve, Error(InvalidChildKey) for a degenerate child scalar,
     *         Error(InvalidKey) if parent belongs to another curve
     */
    virtual ExtendedKey DeriveChild(const ExtendedKey& parent,
                                    const PathComponent& step) const = 0;

    /// Encoded public key (32 bytes for Ed25519, 33-byte compressed point otherwise)
    virtual Bytes PublicKey(const ExtendedKey& key) const = 0;

protected:
    /// Throws Error(InvalidKey) unless key was derived on this curve
    void CheckKey(const ExtendedKey& key) const;
};

// ============================================================================
// Ed25519
// ============================================================================

class Ed25519Curve : public Curve {
public:
    const char* Name() const override { return "ed25519"; }
    CurveKind Kind() const override { return CurveKind::Ed25519; }
    const char* HmacKey() const override { return ED25519_SEED_KEY; }
    bool SupportsNormalDerivation() const override { return false; }
    Byte AddressVersion() const override { return 0x00; }

    ExtendedKey DeriveMaster(ByteSpan seed) const override;
    ExtendedKey DeriveChild(const ExtendedKey& parent,
                            const PathComponent& step) const override;
    Bytes PublicKey(const ExtendedKey& key) const override;
};

// ============================================================================
// Short Weierstrass Curves
// ============================================================================

class EllipticCurve : public Curve {
public:
    EllipticCurve(const ECGroup& group, CurveKind kind, const char* hmacKey,
                  Byte addressVersion);

    const char* Name() const override;
    CurveKind Kind() const override { return kind_; }
    const char* HmacKey() const override { return hmacKey_; }
    bool SupportsNormalDerivation() const override { return true; }
    Byte AddressVersion() const override { return addressVersion_; }

    /// Repeats HMAC over I until IL is a valid scalar
    ExtendedKey DeriveMaster(ByteSpan seed) const override;
    ExtendedKey DeriveChild(const ExtendedKey& parent,
                            const PathComponent& step) const override;
    Bytes PublicKey(const ExtendedKey& key) const override;

private:
    const ECGroup& group_;
    CurveKind kind_;
    const char* hmacKey_;
    Byte addressVersion_;
};

// ============================================================================
// Registry
// ============================================================================

const Curve& Ed25519();
const Curve& Secp256k1();
const Curve& Nist256p1();

/// Curve for a kind
const Curve& GetCurve(CurveKind kind);

/**
 * Resolve a curve by name, case-insensitive. "p256" and "secp256r1" are
 * accepted for nist256p1.
 *
 * @throws std::invalid_argument for an unknown name
 */
const Curve& CurveFromName(const std::string& name);

} // namespace wallet
} // namespace seedforge

#endif // SEEDFORGE_WALLET_CURVE_H
