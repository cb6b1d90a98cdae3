// SEEDFORGE - Derivation Path
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License

#ifndef SEEDFORGE_WALLET_PATH_H
#define SEEDFORGE_WALLET_PATH_H

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace seedforge {
namespace wallet {

// ============================================================================
// Constants
// ============================================================================

/// Hardened key derivation threshold
constexpr uint32_t HARDENED_FLAG = 0x80000000;

/// Marker suffix of a hardened component
constexpr char HARDENED_MARKER = '\'';

// ============================================================================
// Key Derivation Path
// ============================================================================

/**
 * One step of a derivation path. index is always below HARDENED_FLAG;
 * hardening is carried in the flag.
 */
struct PathComponent {
    uint32_t index;
    bool hardened;

    PathComponent(uint32_t idx = 0, bool hard = false)
        : index(idx), hardened(hard) {}

    /// Get the full index value (with hardened flag if applicable)
    uint32_t GetFullIndex() const {
        return hardened ? (index | HARDENED_FLAG) : index;
    }

    /// Parse "44'" or "0" (throws Error(InvalidPath))
    static PathComponent FromString(const std::string& str);

    /// "44'" or "0"
    std::string ToString() const;

    bool operator==(const PathComponent& other) const {
        return index == other.index && hardened == other.hardened;
    }
    bool operator!=(const PathComponent& other) const { return !(*this == other); }
};

/**
 * Ordered derivation steps, root first.
 *
 * Example paths:
 * - 44'/4218'/0'/0'   (Ed25519 account key)
 * - m/0'/1/2'         (leading "m/" is accepted and dropped)
 */
class DerivationPath {
public:
    /// Empty path (the master key itself)
    DerivationPath() = default;

    explicit DerivationPath(std::vector<PathComponent> components)
        : components_(std::move(components)) {}

    /**
     * Parse a slash-separated path.
     *
     * @throws Error(InvalidPath) on an empty path, an empty or non-numeric
     *         component, an index >= 2^31 or a malformed hardened suffix
     */
    static DerivationPath Parse(const std::string& path);

    const std::vector<PathComponent>& GetComponents() const { return components_; }

    /// Number of steps
    size_t Depth() const { return components_.size(); }

    bool IsEmpty() const { return components_.empty(); }

    /// Append a step
    DerivationPath Child(uint32_t index, bool hardened = false) const;

    /// Steps [0, count)
    DerivationPath Prefix(size_t count) const;

    /// Steps [count, Depth())
    DerivationPath Suffix(size_t count) const;

    /// Components joined by '/', without a leading "m/"
    std::string ToString() const;

    bool operator==(const DerivationPath& other) const {
        return components_ == other.components_;
    }
    bool operator!=(const DerivationPath& other) const { return !(*this == other); }

private:
    std::vector<PathComponent> components_;
};

} // namespace wallet
} // namespace seedforge

#endif // SEEDFORGE_WALLET_PATH_H
