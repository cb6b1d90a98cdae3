// SEEDFORGE - HMAC-SHA512 and PBKDF2 Implementation
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License

#include "seedforge/crypto/hmac.h"

#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/params.h>

#include <stdexcept>

namespace seedforge {

struct HMAC_SHA512::Context {
    std::unique_ptr<EVP_MAC, decltype(&EVP_MAC_free)> mac{nullptr, &EVP_MAC_free};
    std::unique_ptr<EVP_MAC_CTX, decltype(&EVP_MAC_CTX_free)> ctx{nullptr, &EVP_MAC_CTX_free};
};

HMAC_SHA512::HMAC_SHA512(const Byte* key, size_t keyLen)
    : ctx_(std::make_unique<Context>()) {
    ctx_->mac.reset(EVP_MAC_fetch(nullptr, OSSL_MAC_NAME_HMAC, nullptr));
    if (ctx_->mac) {
        ctx_->ctx.reset(EVP_MAC_CTX_new(ctx_->mac.get()));
    }
    if (!ctx_->ctx) {
        throw std::runtime_error("HMAC-SHA512 unavailable in OpenSSL");
    }

    char digest[] = "SHA512";
    OSSL_PARAM params[] = {
        OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, digest, 0),
        OSSL_PARAM_construct_end()
    };

    // EVP_MAC_init needs a non-null key pointer even when keyLen is 0
    static const Byte NO_KEY = 0;
    if (EVP_MAC_init(ctx_->ctx.get(), keyLen ? key : &NO_KEY, keyLen, params) != 1) {
        throw std::runtime_error("HMAC-SHA512 key setup failed");
    }
}

HMAC_SHA512::~HMAC_SHA512() = default;

HMAC_SHA512& HMAC_SHA512::Write(const Byte* data, size_t len) {
    if (len != 0 && EVP_MAC_update(ctx_->ctx.get(), data, len) != 1) {
        throw std::runtime_error("HMAC-SHA512 update failed");
    }
    return *this;
}

Hash512 HMAC_SHA512::Finalize() {
    Hash512 out;
    size_t written = 0;
    if (EVP_MAC_final(ctx_->ctx.get(), out.data(), &written, out.size()) != 1 ||
        written != OUTPUT_SIZE) {
        throw std::runtime_error("HMAC-SHA512 final failed");
    }
    return out;
}

Hash512 ComputeHMAC_SHA512(const Byte* key, size_t keyLen,
                           const Byte* data, size_t dataLen) {
    return HMAC_SHA512(key, keyLen).Write(data, dataLen).Finalize();
}

Bytes PBKDF2_SHA512(const std::string& password, const std::string& salt,
                    uint32_t iterations, size_t keyLen) {
    if (iterations == 0) {
        throw std::invalid_argument("PBKDF2 needs at least one iteration");
    }

    Bytes out(keyLen);
    if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                          reinterpret_cast<const unsigned char*>(salt.data()),
                          static_cast<int>(salt.size()), static_cast<int>(iterations),
                          EVP_sha512(), static_cast<int>(keyLen), out.data()) != 1) {
        throw std::runtime_error("PBKDF2-HMAC-SHA512 failed");
    }
    return out;
}

bool ConstantTimeCompare(const Byte* a, const Byte* b, size_t len) {
    return CRYPTO_memcmp(a, b, len) == 0;
}

} // namespace seedforge
