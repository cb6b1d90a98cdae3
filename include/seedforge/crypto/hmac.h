// SEEDFORGE - HMAC-SHA512 and PBKDF2
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License
//
// Both run on OpenSSL: HMAC through EVP_MAC, PBKDF2 through
// PKCS5_PBKDF2_HMAC. Together they cover mnemonic seed stretching and
// every SLIP-10 step.

#ifndef SEEDFORGE_CRYPTO_HMAC_H
#define SEEDFORGE_CRYPTO_HMAC_H

#include "seedforge/core/types.h"

#include <cstdint>
#include <memory>
#include <string>

namespace seedforge {

/**
 * Streaming HMAC-SHA512. The OpenSSL context holding the key is freed
 * with the object.
 */
class HMAC_SHA512 {
public:
    static constexpr size_t OUTPUT_SIZE = 64;

    HMAC_SHA512(const Byte* key, size_t keyLen);
    ~HMAC_SHA512();

    HMAC_SHA512(const HMAC_SHA512&) = delete;
    HMAC_SHA512& operator=(const HMAC_SHA512&) = delete;

    HMAC_SHA512& Write(const Byte* data, size_t len);
    HMAC_SHA512& Write(Byte b) { return Write(&b, 1); }

    /// Only valid once
    Hash512 Finalize();

private:
    struct Context;
    std::unique_ptr<Context> ctx_;
};

Hash512 ComputeHMAC_SHA512(const Byte* key, size_t keyLen,
                           const Byte* data, size_t dataLen);

/// PBKDF2-HMAC-SHA512; password and salt bytes are used as given
Bytes PBKDF2_SHA512(const std::string& password, const std::string& salt,
                    uint32_t iterations, size_t keyLen);

/// CRYPTO_memcmp over len bytes
bool ConstantTimeCompare(const Byte* a, const Byte* b, size_t len);

} // namespace seedforge

#endif // SEEDFORGE_CRYPTO_HMAC_H
