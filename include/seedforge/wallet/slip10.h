// SEEDFORGE - SLIP-10 Hierarchical Derivation
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License

#ifndef SEEDFORGE_WALLET_SLIP10_H
#define SEEDFORGE_WALLET_SLIP10_H

#include "seedforge/core/types.h"
#include "seedforge/wallet/curve.h"
#include "seedforge/wallet/path.h"

namespace seedforge {
namespace wallet {

/**
 * Derive the key at path from a seed: the curve's master key, then one
 * DeriveChild per path step, root first.
 *
 * Nothing is cached; the first failing step's error propagates.
 */
ExtendedKey DeriveKeyFromPath(ByteSpan seed, const Curve& curve,
                              const DerivationPath& path);

/// Continue derivation from an intermediate key
ExtendedKey DerivePath(const Curve& curve, const ExtendedKey& key,
                       const DerivationPath& path);

} // namespace wallet
} // namespace seedforge

#endif // SEEDFORGE_WALLET_SLIP10_H
