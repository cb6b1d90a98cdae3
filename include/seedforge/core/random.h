// SEEDFORGE - Secure Random Number Generation Header
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License
//
// Cryptographically secure random bytes from the OS entropy source.

#ifndef SEEDFORGE_CORE_RANDOM_H
#define SEEDFORGE_CORE_RANDOM_H

#include "seedforge/core/types.h"
#include <cstdint>
#include <cstddef>

namespace seedforge {

/// Fill buffer with cryptographically secure random bytes
/// Uses OS entropy source (getrandom on Linux, arc4random on macOS/BSD)
/// @throws Error(RandomSourceFailure) if the source fails; never retried
void GetRandBytes(uint8_t* buf, size_t len);

/// Fill buffer with random bytes (Span version)
inline void GetRandBytes(Span<uint8_t> buf) {
    GetRandBytes(buf.data(), buf.size());
}

/// Return len fresh random bytes
Bytes GetRandBytes(size_t len);

namespace detail {

/// Get entropy from OS - implementation is platform-specific
/// Returns true on success, false on failure
bool GetOSEntropy(uint8_t* buf, size_t len);

} // namespace detail

} // namespace seedforge

#endif // SEEDFORGE_CORE_RANDOM_H
