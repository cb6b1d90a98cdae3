// SEEDFORGE - Unicode Normalization Implementation
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License

#include "seedforge/core/unicode.h"

#include <unicode/normalizer2.h>
#include <unicode/unistr.h>
#include <unicode/utypes.h>

#include <stdexcept>

namespace seedforge {

std::string NormalizeNFKD(const std::string& utf8) {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* nfkd = icu::Normalizer2::getNFKDInstance(status);
    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string("ICU NFKD unavailable: ") + u_errorName(status));
    }

    icu::UnicodeString source = icu::UnicodeString::fromUTF8(utf8);
    icu::UnicodeString normalized = nfkd->normalize(source, status);
    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string("NFKD normalization failed: ") + u_errorName(status));
    }

    std::string out;
    normalized.toUTF8String(out);
    return out;
}

std::vector<std::string> SplitWhitespace(const std::string& str) {
    std::vector<std::string> fields;
    std::string current;
    for (char c : str) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v') {
            if (!current.empty()) {
                fields.push_back(std::move(current));
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        fields.push_back(std::move(current));
    }
    return fields;
}

std::string ToLowerASCII(const std::string& str) {
    std::string out = str;
    for (char& c : out) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return out;
}

} // namespace seedforge
