// SEEDFORGE - Ed25519 Public Keys
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License

#ifndef SEEDFORGE_CRYPTO_ED25519_H
#define SEEDFORGE_CRYPTO_ED25519_H

#include <array>
#include <cstddef>
#include "seedforge/core/types.h"

namespace seedforge {
namespace ed25519 {

/// Private seed length (RFC 8032 secret key)
constexpr size_t SEED_SIZE = 32;

/// Encoded public key length
constexpr size_t PUBLIC_KEY_SIZE = 32;

using PublicKey = std::array<Byte, PUBLIC_KEY_SIZE>;

/// Compute the RFC 8032 public key A for a 32-byte private seed
PublicKey PublicKeyFromSeed(const Byte* seed);

} // namespace ed25519
} // namespace seedforge

#endif // SEEDFORGE_CRYPTO_ED25519_H
