// SEEDFORGE - SLIP-10 Hierarchical Derivation Implementation
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License

#include "seedforge/wallet/slip10.h"
#include "seedforge/util/logging.h"

namespace seedforge {
namespace wallet {

ExtendedKey DeriveKeyFromPath(ByteSpan seed, const Curve& curve,
                              const DerivationPath& path) {
    LOG_DEBUG(util::LogCategory::DERIVE) << "Deriving " << curve.Name()
                                         << " key at path " << path.ToString();

    ExtendedKey master = curve.DeriveMaster(seed);
    return DerivePath(curve, master, path);
}

ExtendedKey DerivePath(const Curve& curve, const ExtendedKey& key,
                       const DerivationPath& path) {
    ExtendedKey acc = key;
    for (const auto& step : path.GetComponents()) {
        acc = curve.DeriveChild(acc, step);
    }
    return acc;
}

} // namespace wallet
} // namespace seedforge
