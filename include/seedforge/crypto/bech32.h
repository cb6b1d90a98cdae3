// SEEDFORGE - Bech32 Encoding
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License
//
// Bech32 (BIP-173) checksummed base32 encoding of 5-bit symbol strings
// under a human-readable part (HRP).

#ifndef SEEDFORGE_CRYPTO_BECH32_H
#define SEEDFORGE_CRYPTO_BECH32_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace seedforge {
namespace bech32 {

/// Longest encoded string accepted or produced
constexpr size_t MAX_LENGTH = 90;

/// Number of checksum symbols
constexpr size_t CHECKSUM_LENGTH = 6;

/// Separator between HRP and data part
constexpr char SEPARATOR = '1';

/// Decoded string: lowercase HRP and 5-bit data symbols (checksum removed)
struct DecodeResult {
    std::string hrp;
    std::vector<uint8_t> data;
};

/**
 * Validate a human-readable part.
 *
 * Must be 1..83 characters in the range 33..126 and not mix upper and
 * lower case.
 *
 * @throws Error(InvalidPrefix)
 */
void ValidateHrp(const std::string& hrp);

/**
 * Encode 5-bit symbols under an HRP.
 *
 * The HRP is validated and lower-cased; the output is always lowercase.
 *
 * @param hrp Human-readable part
 * @param values Data symbols, each < 32
 * @return hrp + "1" + data symbols + 6 checksum symbols
 * @throws Error(InvalidPrefix) for a bad HRP, Error(EncodingError) for a
 *         symbol >= 32 or a result longer than MAX_LENGTH
 */
std::string Encode(const std::string& hrp, const std::vector<uint8_t>& values);

/**
 * Decode and verify a Bech32 string.
 *
 * Accepts all-lowercase or all-uppercase input.
 *
 * @throws Error(InvalidPrefix) for a bad HRP, Error(EncodingError) for
 *         anything else (length, separator, alphabet, checksum)
 */
DecodeResult Decode(const std::string& str);

/**
 * Regroup a bit stream from fromBits-wide to toBits-wide values, MSB first.
 *
 * With pad, a trailing partial group is zero-filled. Without pad, leftover
 * bits must be fewer than fromBits and all zero.
 *
 * @throws Error(EncodingError) on an out-of-range input value or bad padding
 */
std::vector<uint8_t> ConvertBits(const std::vector<uint8_t>& in,
                                 int fromBits, int toBits, bool pad);

} // namespace bech32
} // namespace seedforge

#endif // SEEDFORGE_CRYPTO_BECH32_H
