// SEEDFORGE - Derivation Curves Implementation
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License

#include "seedforge/wallet/curve.h"
#include "seedforge/core/error.h"
#include "seedforge/core/unicode.h"
#include "seedforge/crypto/ecgroup.h"
#include "seedforge/crypto/ed25519.h"
#include "seedforge/crypto/hmac.h"

#include <openssl/crypto.h>

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace seedforge {
namespace wallet {

namespace {

/// Append ser32(i), big-endian
void WriteBE32(HMAC_SHA512& mac, uint32_t i) {
    Byte buf[4] = {
        static_cast<Byte>(i >> 24), static_cast<Byte>(i >> 16),
        static_cast<Byte>(i >> 8), static_cast<Byte>(i)
    };
    mac.Write(buf, sizeof(buf));
}

/// Split I into IL (key) and IR (chain code)
void SplitDigest(const Hash512& digest, ExtendedKey::KeyBytes& left,
                 ExtendedKey::ChainCode& right) {
    std::copy(digest.begin(), digest.begin() + KEY_SIZE, left.begin());
    std::copy(digest.begin() + KEY_SIZE, digest.end(), right.begin());
}

Hash512 HmacWithTextKey(const char* key, const Byte* data, size_t len) {
    return ComputeHMAC_SHA512(reinterpret_cast<const Byte*>(key), std::strlen(key),
                              data, len);
}

} // namespace

const char* CurveKindToString(CurveKind kind) {
    switch (kind) {
        case CurveKind::Ed25519:   return "ed25519";
        case CurveKind::Secp256k1: return "secp256k1";
        case CurveKind::Nist256p1: return "nist256p1";
        default:                   return "unknown";
    }
}

// ============================================================================
// ExtendedKey Implementation
// ============================================================================

ExtendedKey::ExtendedKey(CurveKind curve, const KeyBytes& key,
                         const ChainCode& chainCode, uint32_t depth,
                         uint32_t childIndex)
    : curve_(curve)
    , key_(key)
    , chainCode_(chainCode)
    , depth_(depth)
    , childIndex_(childIndex) {}

ExtendedKey::~ExtendedKey() {
    OPENSSL_cleanse(key_.data(), key_.size());
    OPENSSL_cleanse(chainCode_.data(), chainCode_.size());
}

bool ExtendedKey::operator==(const ExtendedKey& other) const {
    return curve_ == other.curve_ &&
           depth_ == other.depth_ &&
           childIndex_ == other.childIndex_ &&
           ConstantTimeCompare(key_.data(), other.key_.data(), KEY_SIZE) &&
           ConstantTimeCompare(chainCode_.data(), other.chainCode_.data(),
                               CHAIN_CODE_SIZE);
}

// ============================================================================
// Curve Implementation
// ============================================================================

void Curve::CheckKey(const ExtendedKey& key) const {
    if (key.Curve() != Kind()) {
        throw Error(ErrorCode::InvalidKey,
                    std::string("Key belongs to ") + CurveKindToString(key.Curve()) +
                    ", not " + Name());
    }
}

// ============================================================================
// Ed25519Curve Implementation
// ============================================================================

ExtendedKey Ed25519Curve::DeriveMaster(ByteSpan seed) const {
    Hash512 digest = HmacWithTextKey(HmacKey(), seed.data(), seed.size());

    ExtendedKey::KeyBytes key;
    ExtendedKey::ChainCode chainCode;
    SplitDigest(digest, key, chainCode);

    ExtendedKey master(Kind(), key, chainCode);
    OPENSSL_cleanse(digest.data(), digest.size());
    OPENSSL_cleanse(key.data(), key.size());
    OPENSSL_cleanse(chainCode.data(), chainCode.size());
    return master;
}

ExtendedKey Ed25519Curve::DeriveChild(const ExtendedKey& parent,
                                      const PathComponent& step) const {
    CheckKey(parent);
    if (!step.hardened) {
        throw Error(ErrorCode::UnsupportedDerivation,
                    "ed25519 supports hardened derivation only, got " + step.ToString());
    }

    // I = HMAC-SHA512(c, 0x00 || k || ser32(i))
    HMAC_SHA512 mac(parent.GetChainCode().data(), CHAIN_CODE_SIZE);
    mac.Write(static_cast<Byte>(0x00));
    mac.Write(parent.Key().data(), KEY_SIZE);
    WriteBE32(mac, step.GetFullIndex());
    Hash512 digest = mac.Finalize();

    ExtendedKey::KeyBytes key;
    ExtendedKey::ChainCode chainCode;
    SplitDigest(digest, key, chainCode);

    ExtendedKey child(Kind(), key, chainCode, parent.Depth() + 1, step.GetFullIndex());
    OPENSSL_cleanse(digest.data(), digest.size());
    OPENSSL_cleanse(key.data(), key.size());
    OPENSSL_cleanse(chainCode.data(), chainCode.size());
    return child;
}

Bytes Ed25519Curve::PublicKey(const ExtendedKey& key) const {
    CheckKey(key);
    ed25519::PublicKey pub = ed25519::PublicKeyFromSeed(key.Key().data());
    return Bytes(pub.begin(), pub.end());
}

// ============================================================================
// EllipticCurve Implementation
// ============================================================================

EllipticCurve::EllipticCurve(const ECGroup& group, CurveKind kind,
                             const char* hmacKey, Byte addressVersion)
    : group_(group)
    , kind_(kind)
    , hmacKey_(hmacKey)
    , addressVersion_(addressVersion) {}

const char* EllipticCurve::Name() const {
    return group_.Name().c_str();
}

ExtendedKey EllipticCurve::DeriveMaster(ByteSpan seed) const {
    Hash512 digest = HmacWithTextKey(HmacKey(), seed.data(), seed.size());

    // IL must satisfy 0 < IL < n; otherwise feed I back in as the seed
    while (!group_.IsValidPrivateKey(digest.data())) {
        Hash512 next = HmacWithTextKey(HmacKey(), digest.data(), digest.size());
        digest = next;
        OPENSSL_cleanse(next.data(), next.size());
    }

    ExtendedKey::KeyBytes key;
    ExtendedKey::ChainCode chainCode;
    SplitDigest(digest, key, chainCode);

    ExtendedKey master(Kind(), key, chainCode);
    OPENSSL_cleanse(digest.data(), digest.size());
    OPENSSL_cleanse(key.data(), key.size());
    OPENSSL_cleanse(chainCode.data(), chainCode.size());
    return master;
}

ExtendedKey EllipticCurve::DeriveChild(const ExtendedKey& parent,
                                       const PathComponent& step) const {
    CheckKey(parent);

    HMAC_SHA512 mac(parent.GetChainCode().data(), CHAIN_CODE_SIZE);
    if (step.hardened) {
        // 0x00 || k || ser32(i)
        mac.Write(static_cast<Byte>(0x00));
        mac.Write(parent.Key().data(), KEY_SIZE);
    } else {
        // serP(k * G) || ser32(i)
        ECGroup::CompressedPoint point = group_.GetPublicKey(parent.Key().data());
        mac.Write(point.data(), point.size());
    }
    WriteBE32(mac, step.GetFullIndex());
    Hash512 digest = mac.Finalize();

    ExtendedKey::KeyBytes key;
    ExtendedKey::ChainCode chainCode;
    SplitDigest(digest, key, chainCode);

    // k_i = (IL + k) mod n
    ExtendedKey::KeyBytes childKey;
    bool ok = group_.PrivateKeyTweakAdd(parent.Key().data(), key.data(), childKey.data());
    OPENSSL_cleanse(key.data(), key.size());
    OPENSSL_cleanse(digest.data(), digest.size());
    if (!ok) {
        OPENSSL_cleanse(chainCode.data(), chainCode.size());
        throw Error(ErrorCode::InvalidChildKey,
                    std::string("Degenerate child key on ") + Name() +
                    " at index " + step.ToString());
    }

    ExtendedKey child(Kind(), childKey, chainCode, parent.Depth() + 1, step.GetFullIndex());
    OPENSSL_cleanse(childKey.data(), childKey.size());
    OPENSSL_cleanse(chainCode.data(), chainCode.size());
    return child;
}

Bytes EllipticCurve::PublicKey(const ExtendedKey& key) const {
    CheckKey(key);
    ECGroup::CompressedPoint point = group_.GetPublicKey(key.Key().data());
    return Bytes(point.begin(), point.end());
}

// ============================================================================
// Registry
// ============================================================================

const Curve& Ed25519() {
    static const Ed25519Curve instance;
    return instance;
}

const Curve& Secp256k1() {
    static const EllipticCurve instance(ECGroup::Secp256k1(), CurveKind::Secp256k1,
                                        SECP256K1_SEED_KEY, 0x01);
    return instance;
}

const Curve& Nist256p1() {
    static const EllipticCurve instance(ECGroup::Nist256p1(), CurveKind::Nist256p1,
                                        NIST256P1_SEED_KEY, 0x02);
    return instance;
}

const Curve& GetCurve(CurveKind kind) {
    switch (kind) {
        case CurveKind::Ed25519:   return Ed25519();
        case CurveKind::Secp256k1: return Secp256k1();
        case CurveKind::Nist256p1: return Nist256p1();
    }
    throw std::invalid_argument("Unknown curve kind");
}

const Curve& CurveFromName(const std::string& name) {
    std::string lower = ToLowerASCII(name);
    if (lower == "ed25519") {
        return Ed25519();
    }
    if (lower == "secp256k1") {
        return Secp256k1();
    }
    if (lower == "nist256p1" || lower == "p256" || lower == "secp256r1") {
        return Nist256p1();
    }
    throw std::invalid_argument("Unknown curve: " + name);
}

} // namespace wallet
} // namespace seedforge
