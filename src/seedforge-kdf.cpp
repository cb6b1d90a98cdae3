// SEEDFORGE Key Derivation Tool
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License
//
// Walks one mnemonic through the whole pipeline and prints every
// intermediate value:
// - Mnemonic decoding (or fresh entropy when the mnemonic is empty)
// - Seed stretching with an optional passphrase
// - SLIP-10 derivation along a path on the selected curve
// - Bech32 address of the derived key
//
// The output contains secrets. It is meant for test vectors and
// demonstrations, not for real funds.

#include <seedforge/core/cleanse.h>
#include <seedforge/core/error.h>
#include <seedforge/core/hex.h>
#include <seedforge/util/config.h>
#include <seedforge/util/kdfoptions.h>
#include <seedforge/util/logging.h>
#include <seedforge/wallet/address.h>
#include <seedforge/wallet/curve.h>
#include <seedforge/wallet/mnemonic.h>
#include <seedforge/wallet/path.h>
#include <seedforge/wallet/slip10.h>
#include <seedforge/wallet/wordlist.h>

#include <iostream>

using namespace seedforge;
using namespace seedforge::wallet;

// ============================================================================
// Constants
// ============================================================================

constexpr const char* VERSION = "0.1.0";

// ============================================================================
// Usage
// ============================================================================

void PrintUsage() {
    std::cout << "SEEDFORGE Key Derivation Tool v" << VERSION << "\n";
    std::cout << "\n";
    std::cout << "Usage: seedforge-kdf [options]\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  --mnemonic=<words>    BIP-39 sentence; empty generates fresh entropy\n";
    std::cout << "                        (default: abandon x11 about)\n";
    std::cout << "  --language=<name>     Word list (default: " << DEFAULT_LANGUAGE << ")\n";
    std::cout << "  --wordlist-file=<f>   Register <f> (one word per line) as --language\n";
    std::cout << "  --passphrase=<text>   Optional seed passphrase (default: empty)\n";
    std::cout << "  --path=<path>         Derivation path (default: " << util::DEFAULT_PATH << ")\n";
    std::cout << "  --curve=<name>        ed25519, secp256k1 or nist256p1 (default: "
              << util::DEFAULT_CURVE << ")\n";
    std::cout << "  --prefix=<hrp>        iota, atoi, smr or rms (default: " << MAINNET_PREFIX << ")\n";
    std::cout << "  --entropy-bits=<n>    Size of generated entropy (default: "
              << util::DEFAULT_ENTROPY_BITS << ")\n";
    std::cout << "  --loglevel=<level>    trace, debug, info, warn, error, off (default: warn)\n";
    std::cout << "  --conf=<file>         Read options from a configuration file\n";
    std::cout << "  --help                Show this help message\n";
}

// ============================================================================
// Derivation
// ============================================================================

int Run(const util::KdfOptions& opts) {
    if (!opts.wordlistFile.empty()) {
        WordListRegistry::Default().RegisterFile(opts.language, opts.wordlistFile,
                                                 SeparatorFor(opts.language));
        LOG_INFO(util::LogCategory::MNEMONIC) << "Registered " << opts.language
                                              << " word list from " << opts.wordlistFile;
    }
    auto wordList = WordListRegistry::Default().Select(opts.language);
    const std::string prefix = ParsePrefix(opts.prefix);

    Entropy entropy;
    Seed seed{};
    CleanseOnExit<Entropy> wipeEntropy(entropy);
    CleanseOnExit<Seed> wipeSeed(seed);

    Mnemonic mnemonic;
    if (opts.mnemonic.empty()) {
        entropy = GenerateEntropy(opts.entropyBits / 8);
        mnemonic = EntropyToMnemonic(entropy, *wordList);
    } else {
        mnemonic = Mnemonic::Parse(opts.mnemonic);
        entropy = MnemonicToEntropy(mnemonic, *wordList);
    }

    seed = MnemonicToSeed(mnemonic, opts.passphrase, *wordList);
    DerivationPath path = DerivationPath::Parse(opts.path);
    const Curve& curve = CurveFromName(opts.curve);

    ExtendedKey key = DeriveKeyFromPath(seed, curve, path);
    Bytes publicKey = curve.PublicKey(key);
    std::string address = AddressFromPublicKey(prefix, curve, publicKey);

    std::cout << "==> Key Derivation Parameters\n";
    std::cout << " entropy (" << entropy.size() << "-byte):\t"
              << BytesToHex(entropy) << "\n";
    std::cout << " mnemonic (" << mnemonic.WordCount() << "-word):\t"
              << mnemonic.ToString(wordList->Separator()) << "\n";
    std::cout << " optional passphrase:\t\"" << opts.passphrase << "\"\n";
    std::cout << " master seed (" << seed.size() << "-byte):\t"
              << BytesToHex(seed) << "\n";

    std::cout << "\n==> " << curve.Name() << " Private Key Derivation\n";
    std::cout << " SLIP-10 curve seed:\t" << curve.HmacKey() << "\n";
    std::cout << " SLIP-10 address path:\t" << path.ToString() << "\n";
    std::cout << " private key (" << KEY_SIZE << "-byte):\t"
              << BytesToHex(key.Key()) << "\n";
    std::cout << " chain code (" << CHAIN_CODE_SIZE << "-byte):\t"
              << BytesToHex(key.GetChainCode()) << "\n";
    std::cout << " public key (" << publicKey.size() << "-byte):\t"
              << BytesToHex(publicKey) << "\n";
    std::cout << " address (" << address.size() << "-char):\t" << address << "\n";
    return 0;
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    util::ConfigManager config;

    auto cmdResult = config.ParseCommandLine(argc, argv);
    if (!cmdResult.ok) {
        std::cerr << "Error: " << cmdResult.message << "\n";
        return 1;
    }
    if (!config.GetPositional().empty()) {
        std::cerr << "Error: unexpected argument '" << config.GetPositional().front() << "'\n";
        std::cerr << "Run 'seedforge-kdf --help' for usage.\n";
        return 1;
    }

    auto confFile = config.TryGetString(util::ConfigKeys::CONF);
    if (confFile) {
        auto fileResult = config.ParseFile(*confFile);
        if (!fileResult.ok) {
            std::cerr << "Error: " << fileResult.message << "\n";
            return 1;
        }
    }

    util::RegisterKdfOptions(config);

    try {
        util::KdfOptions opts = util::LoadKdfOptions(config);
        if (opts.help) {
            PrintUsage();
            return 0;
        }

        util::LoggingSession logging(opts.logLevel);
        if (confFile) {
            LOG_INFO(util::LogCategory::CONFIG) << "Loaded options from " << *confFile;
        }
        return Run(opts);
    } catch (const Error& e) {
        std::cerr << "Error: " << e.ToString() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
    }
    return 1;
}
