// SEEDFORGE - Configuration
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License
//
// Option store for seedforge-kdf, filled from the command line and an
// optional configuration file.
//
// File format, one option per line:
//   # comment            (also ';')
//   key=value            value may be wrapped in "..." or '...'
//   key                  same as key=true
//
// Values are taken literally. No escape processing and no variable
// expansion happens, so a passphrase reaches the KDF byte for byte.

#ifndef SEEDFORGE_UTIL_CONFIG_H
#define SEEDFORGE_UTIL_CONFIG_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace seedforge {
namespace util {

/// Largest configuration file accepted (64 KiB)
constexpr size_t MAX_CONFIG_FILE_SIZE = 64 * 1024;

/// Outcome of reading one configuration source
struct ParseStatus {
    bool ok{true};
    std::string message;

    static ParseStatus Fail(const std::string& source, int line, const std::string& what);
};

/**
 * Keyed option values with source precedence.
 *
 * The first source to set a key keeps it: parse the command line, then the
 * file, then register defaults with SetDefault().
 */
class ConfigManager {
public:
    ParseStatus ParseCommandLine(int argc, const char* const argv[]);
    ParseStatus ParseFile(const std::string& path);
    ParseStatus ParseString(const std::string& text, const std::string& source = "<string>");

    bool HasKey(const std::string& key) const;
    std::optional<std::string> TryGetString(const std::string& key) const;
    std::string GetString(const std::string& key, const std::string& fallback = "") const;

    /// Whole-string decimal integer; nullopt if missing or malformed
    std::optional<int64_t> TryGetInt(const std::string& key) const;

    /// true/yes/on/1 or false/no/off/0; nullopt otherwise
    std::optional<bool> TryGetBool(const std::string& key) const;

    /// Command-line arguments that were not options
    const std::vector<std::string>& GetPositional() const { return positional_; }

    /// Set key only if no source has set it
    void SetDefault(const std::string& key, const std::string& value);

    /// Declare a key; once any key is declared, Validate() rejects the rest
    void AllowKey(const std::string& key);

    /// One message per undeclared key; empty when valid
    std::vector<std::string> Validate() const;

private:
    struct Value {
        std::string text;
        std::string origin;
    };

    /// Adds key unless some source already set it
    bool Insert(const std::string& key, std::string text, std::string origin);

    std::map<std::string, Value> values_;
    std::set<std::string> allowed_;
    std::vector<std::string> positional_;
};

// ============================================================================
// Option Names
// ============================================================================

namespace ConfigKeys {
    constexpr const char* MNEMONIC = "mnemonic";
    constexpr const char* LANGUAGE = "language";
    constexpr const char* WORDLIST_FILE = "wordlist-file";
    constexpr const char* PASSPHRASE = "passphrase";
    constexpr const char* PATH = "path";
    constexpr const char* PREFIX = "prefix";
    constexpr const char* CURVE = "curve";
    constexpr const char* ENTROPY_BITS = "entropy-bits";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* CONF = "conf";
    constexpr const char* HELP = "help";
}

} // namespace util
} // namespace seedforge

#endif // SEEDFORGE_UTIL_CONFIG_H
