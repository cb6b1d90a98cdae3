// SEEDFORGE - Address Encoding
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License
//
// Address payload = version byte || BLAKE2b-256(public key), encoded with
// Bech32 under a network prefix. The version byte is the curve's address
// type (Ed25519 = 0x00).

#ifndef SEEDFORGE_WALLET_ADDRESS_H
#define SEEDFORGE_WALLET_ADDRESS_H

#include "seedforge/core/types.h"
#include "seedforge/wallet/curve.h"

#include <array>
#include <string>

namespace seedforge {
namespace wallet {

// ============================================================================
// Constants
// ============================================================================

/// Network prefixes
constexpr const char* MAINNET_PREFIX = "iota";
constexpr const char* TESTNET_PREFIX = "atoi";
constexpr const char* SHIMMER_PREFIX = "smr";
constexpr const char* SHIMMER_TESTNET_PREFIX = "rms";

/// Digest part of the payload
constexpr size_t ADDRESS_DIGEST_SIZE = 32;

/// Version byte plus digest
constexpr size_t ADDRESS_PAYLOAD_SIZE = 1 + ADDRESS_DIGEST_SIZE;

using AddressPayload = std::array<Byte, ADDRESS_PAYLOAD_SIZE>;

/// True for the four network prefixes above
bool IsKnownPrefix(const std::string& prefix);

/**
 * Accept one of the known network prefixes.
 *
 * @throws Error(InvalidPrefix) for any other string, including case variants
 */
std::string ParsePrefix(const std::string& text);

// ============================================================================
// Encoding
// ============================================================================

/**
 * Build the payload for a public key of the given curve.
 *
 * @throws Error(InvalidKey) if the key size does not match the curve
 */
AddressPayload AddressPayloadFromPublicKey(const Curve& curve, ByteSpan publicKey);

/**
 * Bech32-encode an arbitrary payload under prefix.
 *
 * @throws Error(InvalidPrefix), Error(EncodingError) if the result would
 *         exceed bech32::MAX_LENGTH
 */
std::string EncodeAddress(const std::string& prefix, ByteSpan payload);

/// Payload from the public key, then EncodeAddress
std::string AddressFromPublicKey(const std::string& prefix, const Curve& curve,
                                 ByteSpan publicKey);

/// Address of a derived key
std::string AddressFromKey(const std::string& prefix, const ExtendedKey& key);

// ============================================================================
// Decoding
// ============================================================================

struct DecodedAddress {
    /// Lowercase prefix
    std::string prefix;

    /// Version byte (curve address type)
    Byte version{0};

    /// BLAKE2b-256 of the public key
    Hash256 digest;
};

/**
 * Decode and verify an address.
 *
 * @throws Error(InvalidPrefix) for a malformed prefix, Error(EncodingError)
 *         for a bad checksum, alphabet or payload length
 */
DecodedAddress DecodeAddress(const std::string& address);

} // namespace wallet
} // namespace seedforge

#endif // SEEDFORGE_WALLET_ADDRESS_H
