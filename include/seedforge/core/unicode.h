// SEEDFORGE - Unicode Normalization
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License

#ifndef SEEDFORGE_CORE_UNICODE_H
#define SEEDFORGE_CORE_UNICODE_H

#include <string>
#include <vector>

namespace seedforge {

/// Compatibility decomposition (NFKD) of a UTF-8 string, via ICU.
/// Ill-formed UTF-8 sequences become U+FFFD.
std::string NormalizeNFKD(const std::string& utf8);

/// Split on ASCII whitespace, dropping empty fields
std::vector<std::string> SplitWhitespace(const std::string& str);

/// ASCII lower-case copy
std::string ToLowerASCII(const std::string& str);

} // namespace seedforge

#endif // SEEDFORGE_CORE_UNICODE_H
