// SEEDFORGE - Address Encoding Implementation
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License

#include "seedforge/wallet/address.h"
#include "seedforge/core/error.h"
#include "seedforge/crypto/bech32.h"
#include "seedforge/crypto/blake2b.h"
#include "seedforge/crypto/ecgroup.h"
#include "seedforge/crypto/ed25519.h"
#include "seedforge/util/logging.h"

#include <algorithm>
#include <vector>

namespace seedforge {
namespace wallet {

bool IsKnownPrefix(const std::string& prefix) {
    return prefix == MAINNET_PREFIX || prefix == TESTNET_PREFIX ||
           prefix == SHIMMER_PREFIX || prefix == SHIMMER_TESTNET_PREFIX;
}

std::string ParsePrefix(const std::string& text) {
    if (!IsKnownPrefix(text)) {
        throw Error(ErrorCode::InvalidPrefix, "invalid network prefix '" + text + "'");
    }
    return text;
}

AddressPayload AddressPayloadFromPublicKey(const Curve& curve, ByteSpan publicKey) {
    size_t expected = curve.Kind() == CurveKind::Ed25519
                          ? ed25519::PUBLIC_KEY_SIZE
                          : ECGroup::COMPRESSED_SIZE;
    if (publicKey.size() != expected) {
        throw Error(ErrorCode::InvalidKey,
                    std::string("Public key for ") + curve.Name() + " must be " +
                    std::to_string(expected) + " bytes, got " +
                    std::to_string(publicKey.size()));
    }

    Hash256 digest = BLAKE2b256(publicKey);

    AddressPayload payload;
    payload[0] = curve.AddressVersion();
    std::copy(digest.begin(), digest.end(), payload.begin() + 1);
    return payload;
}

std::string EncodeAddress(const std::string& prefix, ByteSpan payload) {
    if (payload.empty()) {
        throw Error(ErrorCode::EncodingError, "Empty address payload");
    }

    std::vector<uint8_t> bytes(payload.begin(), payload.end());
    std::vector<uint8_t> symbols = bech32::ConvertBits(bytes, 8, 5, true);
    std::string address = bech32::Encode(prefix, symbols);

    LOG_DEBUG(util::LogCategory::ADDRESS) << "Encoded " << payload.size()
                                          << "-byte payload under prefix " << prefix;
    return address;
}

std::string AddressFromPublicKey(const std::string& prefix, const Curve& curve,
                                 ByteSpan publicKey) {
    AddressPayload payload = AddressPayloadFromPublicKey(curve, publicKey);
    return EncodeAddress(prefix, payload);
}

std::string AddressFromKey(const std::string& prefix, const ExtendedKey& key) {
    const Curve& curve = GetCurve(key.Curve());
    Bytes publicKey = curve.PublicKey(key);
    return AddressFromPublicKey(prefix, curve, publicKey);
}

DecodedAddress DecodeAddress(const std::string& address) {
    bech32::DecodeResult decoded = bech32::Decode(address);
    std::vector<uint8_t> payload = bech32::ConvertBits(decoded.data, 5, 8, false);

    if (payload.size() != ADDRESS_PAYLOAD_SIZE) {
        throw Error(ErrorCode::EncodingError,
                    "Address payload must be " + std::to_string(ADDRESS_PAYLOAD_SIZE) +
                    " bytes, got " + std::to_string(payload.size()));
    }

    DecodedAddress result;
    result.prefix = decoded.hrp;
    result.version = payload[0];
    result.digest = Hash256(payload.data() + 1);
    return result;
}

} // namespace wallet
} // namespace seedforge
