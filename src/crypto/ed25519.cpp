// SEEDFORGE - Ed25519 Public Keys Implementation
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License

#include "seedforge/crypto/ed25519.h"

#include <openssl/evp.h>
#include <stdexcept>

namespace seedforge {
namespace ed25519 {

PublicKey PublicKeyFromSeed(const Byte* seed) {
    EVP_PKEY* pkey = EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                                  seed, SEED_SIZE);
    if (!pkey) {
        throw std::runtime_error("Ed25519 key import failed");
    }

    PublicKey pub{};
    size_t len = pub.size();
    int ok = EVP_PKEY_get_raw_public_key(pkey, pub.data(), &len);
    EVP_PKEY_free(pkey);

    if (ok != 1 || len != PUBLIC_KEY_SIZE) {
        throw std::runtime_error("Ed25519 public key export failed");
    }
    return pub;
}

} // namespace ed25519
} // namespace seedforge
