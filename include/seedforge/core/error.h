// SEEDFORGE - Error Reporting
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License
//
// Every failing operation in the library throws seedforge::Error carrying
// one of the ErrorCode kinds below. Nothing is recovered locally.

#ifndef SEEDFORGE_CORE_ERROR_H
#define SEEDFORGE_CORE_ERROR_H

#include <stdexcept>
#include <string>

namespace seedforge {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    InvalidEntropySize,     ///< Entropy not 16..64 bytes or not a multiple of 4
    InvalidMnemonic,        ///< Bad word count or unknown word
    InvalidChecksum,        ///< Mnemonic checksum bits do not match
    InvalidPath,            ///< Malformed derivation path or index out of range
    UnsupportedDerivation,  ///< Non-hardened step on a seed-only curve
    InvalidChildKey,        ///< Derived scalar is zero or not below the curve order
    InvalidPrefix,          ///< Bech32 human-readable part rejected
    EncodingError,          ///< Bech32 payload or string malformed
    WordListNotFound,       ///< No word list registered under that name
    InvalidWordList,        ///< Word list is not 2048 unique words
    InvalidKey,             ///< Key material of the wrong size for its curve
    RandomSourceFailure,    ///< OS entropy source failed
};

/// Stable kind name ("InvalidChecksum", ...)
const char* ErrorCodeToString(ErrorCode code);

// ============================================================================
// Error Exception
// ============================================================================

class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode Code() const noexcept { return code_; }

    /// "<kind>: <message>"
    std::string ToString() const;

private:
    ErrorCode code_;
};

} // namespace seedforge

#endif // SEEDFORGE_CORE_ERROR_H
