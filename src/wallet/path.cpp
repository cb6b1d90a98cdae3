// SEEDFORGE - Derivation Path Implementation
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License

#include "seedforge/wallet/path.h"
#include "seedforge/core/error.h"

#include <algorithm>

namespace seedforge {
namespace wallet {

// ============================================================================
// PathComponent Implementation
// ============================================================================

PathComponent PathComponent::FromString(const std::string& str) {
    if (str.empty()) {
        throw Error(ErrorCode::InvalidPath, "Empty path component");
    }

    bool hardened = false;
    std::string numStr = str;

    if (str.back() == HARDENED_MARKER) {
        hardened = true;
        numStr = str.substr(0, str.size() - 1);
    }

    // Digits only: rejects signs, whitespace, doubled markers and 'h'
    if (numStr.empty() ||
        !std::all_of(numStr.begin(), numStr.end(),
                     [](char c) { return c >= '0' && c <= '9'; })) {
        throw Error(ErrorCode::InvalidPath, "Malformed path component: " + str);
    }

    uint64_t index = 0;
    for (char c : numStr) {
        index = index * 10 + static_cast<uint64_t>(c - '0');
        if (index >= HARDENED_FLAG) {
            throw Error(ErrorCode::InvalidPath,
                        "Path index out of range: " + str);
        }
    }

    return PathComponent(static_cast<uint32_t>(index), hardened);
}

std::string PathComponent::ToString() const {
    std::string result = std::to_string(index);
    if (hardened) {
        result += HARDENED_MARKER;
    }
    return result;
}

// ============================================================================
// DerivationPath Implementation
// ============================================================================

DerivationPath DerivationPath::Parse(const std::string& path) {
    std::string p = path;

    if (p.size() >= 2 && (p[0] == 'm' || p[0] == 'M') && p[1] == '/') {
        p = p.substr(2);
    }

    if (p.empty()) {
        throw Error(ErrorCode::InvalidPath, "Empty derivation path");
    }

    std::vector<PathComponent> components;
    size_t start = 0;
    while (true) {
        size_t slash = p.find('/', start);
        std::string token = p.substr(start, slash == std::string::npos
                                                ? std::string::npos
                                                : slash - start);
        components.push_back(PathComponent::FromString(token));
        if (slash == std::string::npos) {
            break;
        }
        start = slash + 1;
    }

    return DerivationPath(std::move(components));
}

DerivationPath DerivationPath::Child(uint32_t index, bool hardened) const {
    if (index >= HARDENED_FLAG) {
        throw Error(ErrorCode::InvalidPath,
                    "Path index out of range: " + std::to_string(index));
    }
    std::vector<PathComponent> newComponents = components_;
    newComponents.emplace_back(index, hardened);
    return DerivationPath(std::move(newComponents));
}

DerivationPath DerivationPath::Prefix(size_t count) const {
    count = std::min(count, components_.size());
    return DerivationPath(std::vector<PathComponent>(
        components_.begin(), components_.begin() + count));
}

DerivationPath DerivationPath::Suffix(size_t count) const {
    count = std::min(count, components_.size());
    return DerivationPath(std::vector<PathComponent>(
        components_.begin() + count, components_.end()));
}

std::string DerivationPath::ToString() const {
    std::string result;
    for (size_t i = 0; i < components_.size(); ++i) {
        if (i > 0) {
            result += '/';
        }
        result += components_[i].ToString();
    }
    return result;
}

} // namespace wallet
} // namespace seedforge
