// SEEDFORGE - Key Derivation Tool Options Implementation
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License

#include "seedforge/util/kdfoptions.h"
#include "seedforge/core/error.h"
#include "seedforge/wallet/mnemonic.h"

#include <stdexcept>

namespace seedforge {
namespace util {

void RegisterKdfOptions(ConfigManager& config) {
    const KdfOptions defaults;

    config.AllowKey(ConfigKeys::MNEMONIC);
    config.AllowKey(ConfigKeys::LANGUAGE);
    config.AllowKey(ConfigKeys::WORDLIST_FILE);
    config.AllowKey(ConfigKeys::PASSPHRASE);
    config.AllowKey(ConfigKeys::PATH);
    config.AllowKey(ConfigKeys::PREFIX);
    config.AllowKey(ConfigKeys::CURVE);
    config.AllowKey(ConfigKeys::ENTROPY_BITS);
    config.AllowKey(ConfigKeys::LOGLEVEL);
    config.AllowKey(ConfigKeys::CONF);
    config.AllowKey(ConfigKeys::HELP);

    config.SetDefault(ConfigKeys::MNEMONIC, defaults.mnemonic);
    config.SetDefault(ConfigKeys::LANGUAGE, defaults.language);
    config.SetDefault(ConfigKeys::WORDLIST_FILE, defaults.wordlistFile);
    config.SetDefault(ConfigKeys::PASSPHRASE, defaults.passphrase);
    config.SetDefault(ConfigKeys::PATH, defaults.path);
    config.SetDefault(ConfigKeys::PREFIX, defaults.prefix);
    config.SetDefault(ConfigKeys::CURVE, defaults.curve);
    config.SetDefault(ConfigKeys::ENTROPY_BITS, std::to_string(defaults.entropyBits));
    config.SetDefault(ConfigKeys::LOGLEVEL, LogLevelToString(defaults.logLevel));
}

KdfOptions LoadKdfOptions(const ConfigManager& config) {
    auto errors = config.Validate();
    if (!errors.empty()) {
        throw std::invalid_argument(errors.front());
    }

    KdfOptions opts;
    opts.mnemonic = config.GetString(ConfigKeys::MNEMONIC, opts.mnemonic);
    opts.language = config.GetString(ConfigKeys::LANGUAGE, opts.language);
    opts.wordlistFile = config.GetString(ConfigKeys::WORDLIST_FILE, opts.wordlistFile);
    opts.passphrase = config.GetString(ConfigKeys::PASSPHRASE, opts.passphrase);
    opts.path = config.GetString(ConfigKeys::PATH, opts.path);
    opts.prefix = config.GetString(ConfigKeys::PREFIX, opts.prefix);
    opts.curve = config.GetString(ConfigKeys::CURVE, opts.curve);

    if (config.HasKey(ConfigKeys::ENTROPY_BITS)) {
        auto bits = config.TryGetInt(ConfigKeys::ENTROPY_BITS);
        if (!bits || *bits <= 0 || *bits % 8 != 0) {
            throw std::invalid_argument(
                "entropy-bits must be a positive multiple of 8, got '" +
                config.GetString(ConfigKeys::ENTROPY_BITS) + "'");
        }
        opts.entropyBits = static_cast<size_t>(*bits);
    }
    if (!wallet::IsValidEntropySize(opts.entropyBits / 8)) {
        throw Error(ErrorCode::InvalidEntropySize,
                    "entropy-bits must be 128..512 in steps of 32, got " +
                    std::to_string(opts.entropyBits));
    }

    if (config.HasKey(ConfigKeys::LOGLEVEL)) {
        std::string levelName = config.GetString(ConfigKeys::LOGLEVEL);
        auto level = LogLevelFromString(levelName);
        if (!level) {
            throw std::invalid_argument("Unknown log level: " + levelName);
        }
        opts.logLevel = *level;
    }

    if (config.HasKey(ConfigKeys::HELP)) {
        auto help = config.TryGetBool(ConfigKeys::HELP);
        if (!help) {
            throw std::invalid_argument("help takes no value");
        }
        opts.help = *help;
    }

    return opts;
}

} // namespace util
} // namespace seedforge
