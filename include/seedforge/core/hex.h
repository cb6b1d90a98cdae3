// SEEDFORGE - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License

#ifndef SEEDFORGE_CORE_HEX_H
#define SEEDFORGE_CORE_HEX_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <array>

namespace seedforge {

// Use uint8_t directly to avoid circular dependency with types.h
using HexByte = uint8_t;

/// Convert bytes to fixed-width lowercase hex, no separators
std::string BytesToHex(const HexByte* data, size_t len);
std::string BytesToHex(const std::vector<HexByte>& data);

template<size_t N>
std::string BytesToHex(const std::array<HexByte, N>& data) {
    return BytesToHex(data.data(), N);
}

/// Convert hex string to bytes.
/// Accepts upper and lower case digits and an optional "0x" prefix.
/// @throws std::invalid_argument on odd length or a non-hex character
std::vector<HexByte> HexToBytes(const std::string& hex);

/// Check if string is valid, non-empty hex
bool IsValidHex(const std::string& str);

} // namespace seedforge

#endif // SEEDFORGE_CORE_HEX_H
