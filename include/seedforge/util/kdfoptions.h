// SEEDFORGE - Key Derivation Tool Options
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License

#ifndef SEEDFORGE_UTIL_KDFOPTIONS_H
#define SEEDFORGE_UTIL_KDFOPTIONS_H

#include "seedforge/util/config.h"
#include "seedforge/util/logging.h"

#include <cstddef>
#include <string>

namespace seedforge {
namespace util {

/// Mnemonic used when none is configured
constexpr const char* DEFAULT_MNEMONIC =
    "abandon abandon abandon abandon abandon abandon "
    "abandon abandon abandon abandon abandon about";

/// Default path: purpose 44', coin type 4218', account 0', address 0'
constexpr const char* DEFAULT_PATH = "44'/4218'/0'/0'";

constexpr const char* DEFAULT_CURVE = "ed25519";

/// Entropy size used when the mnemonic is empty
constexpr size_t DEFAULT_ENTROPY_BITS = 256;

/**
 * Settings of the seedforge-kdf tool.
 */
struct KdfOptions {
    /// Mnemonic sentence; empty means generate fresh entropy
    std::string mnemonic{DEFAULT_MNEMONIC};

    std::string language{"english"};

    /// Optional word list file registered under language before use
    std::string wordlistFile;
    std::string passphrase;
    std::string path{DEFAULT_PATH};
    std::string prefix{"iota"};
    std::string curve{DEFAULT_CURVE};
    size_t entropyBits{DEFAULT_ENTROPY_BITS};
    LogLevel logLevel{LogLevel::Warn};
    bool help{false};
};

/// Declare the tool's keys and their defaults on config
void RegisterKdfOptions(ConfigManager& config);

/**
 * Read options from config.
 *
 * @throws std::invalid_argument for unknown keys or malformed values,
 *         Error(InvalidEntropySize) for an entropy size BIP-39 does not allow
 */
KdfOptions LoadKdfOptions(const ConfigManager& config);

} // namespace util
} // namespace seedforge

#endif // SEEDFORGE_UTIL_KDFOPTIONS_H
