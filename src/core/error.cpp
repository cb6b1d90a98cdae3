// SEEDFORGE - Error Reporting Implementation
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License

#include "seedforge/core/error.h"

namespace seedforge {

const char* ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidEntropySize: return "InvalidEntropySize";
        case ErrorCode::InvalidMnemonic: return "InvalidMnemonic";
        case ErrorCode::InvalidChecksum: return "InvalidChecksum";
        case ErrorCode::InvalidPath: return "InvalidPath";
        case ErrorCode::UnsupportedDerivation: return "UnsupportedDerivation";
        case ErrorCode::InvalidChildKey: return "InvalidChildKey";
        case ErrorCode::InvalidPrefix: return "InvalidPrefix";
        case ErrorCode::EncodingError: return "EncodingError";
        case ErrorCode::WordListNotFound: return "WordListNotFound";
        case ErrorCode::InvalidWordList: return "InvalidWordList";
        case ErrorCode::InvalidKey: return "InvalidKey";
        case ErrorCode::RandomSourceFailure: return "RandomSourceFailure";
        default: return "Unknown";
    }
}

std::string Error::ToString() const {
    return std::string(ErrorCodeToString(code_)) + ": " + what();
}

} // namespace seedforge
