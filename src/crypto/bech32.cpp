// SEEDFORGE - Bech32 Implementation
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License

#include "seedforge/crypto/bech32.h"
#include "seedforge/core/error.h"

namespace seedforge {
namespace bech32 {

namespace {

const char* BECH32_ALPHABET = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";

const int8_t BECH32_MAP[128] = {
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
    15,-1,10,17,21,20,26,30,  7, 5,-1,-1,-1,-1,-1,-1,
    -1,29,-1,24,13,25, 9, 8, 23,-1,18,22,31,27,19,-1,
     1, 0, 3,16,11,28,12,14,  6, 4, 2,-1,-1,-1,-1,-1,
    -1,29,-1,24,13,25, 9, 8, 23,-1,18,22,31,27,19,-1,
     1, 0, 3,16,11,28,12,14,  6, 4, 2,-1,-1,-1,-1,-1,
};

/// Residue a valid Bech32 string leaves in the polymod
constexpr uint32_t BECH32_CONST = 1;

constexpr size_t MAX_HRP_LENGTH = 83;

uint32_t Polymod(const std::vector<uint8_t>& values) {
    uint32_t chk = 1;
    for (uint8_t v : values) {
        uint8_t top = chk >> 25;
        chk = ((chk & 0x1ffffff) << 5) ^ v;
        if (top & 1) chk ^= 0x3b6a57b2;
        if (top & 2) chk ^= 0x26508e6d;
        if (top & 4) chk ^= 0x1ea119fa;
        if (top & 8) chk ^= 0x3d4233dd;
        if (top & 16) chk ^= 0x2a1462b3;
    }
    return chk;
}

/// High bits of each HRP character, a zero, then the low bits
std::vector<uint8_t> HrpExpand(const std::string& hrp) {
    std::vector<uint8_t> ret;
    ret.reserve(hrp.size() * 2 + 1);
    for (char c : hrp) {
        ret.push_back(static_cast<uint8_t>(c) >> 5);
    }
    ret.push_back(0);
    for (char c : hrp) {
        ret.push_back(static_cast<uint8_t>(c) & 31);
    }
    return ret;
}

bool VerifyChecksum(const std::string& hrp, const std::vector<uint8_t>& values) {
    auto hrpExp = HrpExpand(hrp);
    hrpExp.insert(hrpExp.end(), values.begin(), values.end());
    return Polymod(hrpExp) == BECH32_CONST;
}

std::vector<uint8_t> CreateChecksum(const std::string& hrp,
                                    const std::vector<uint8_t>& values) {
    auto hrpExp = HrpExpand(hrp);
    hrpExp.insert(hrpExp.end(), values.begin(), values.end());
    hrpExp.resize(hrpExp.size() + CHECKSUM_LENGTH);
    uint32_t mod = Polymod(hrpExp) ^ BECH32_CONST;
    std::vector<uint8_t> ret(CHECKSUM_LENGTH);
    for (size_t i = 0; i < CHECKSUM_LENGTH; ++i) {
        ret[i] = (mod >> (5 * (5 - i))) & 31;
    }
    return ret;
}

std::string ToLower(const std::string& str) {
    std::string out = str;
    for (char& c : out) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return out;
}

} // namespace

void ValidateHrp(const std::string& hrp) {
    if (hrp.empty() || hrp.size() > MAX_HRP_LENGTH) {
        throw Error(ErrorCode::InvalidPrefix,
                    "Prefix must be 1 to 83 characters, got " + std::to_string(hrp.size()));
    }

    bool hasLower = false;
    bool hasUpper = false;
    for (char c : hrp) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 33 || uc > 126) {
            throw Error(ErrorCode::InvalidPrefix, "Prefix contains a disallowed character");
        }
        if (c >= 'a' && c <= 'z') hasLower = true;
        if (c >= 'A' && c <= 'Z') hasUpper = true;
    }
    if (hasLower && hasUpper) {
        throw Error(ErrorCode::InvalidPrefix, "Prefix mixes upper and lower case: " + hrp);
    }
}

std::string Encode(const std::string& hrp, const std::vector<uint8_t>& values) {
    ValidateHrp(hrp);
    std::string lowerHrp = ToLower(hrp);

    if (lowerHrp.size() + 1 + values.size() + CHECKSUM_LENGTH > MAX_LENGTH) {
        throw Error(ErrorCode::EncodingError,
                    "Encoded length exceeds " + std::to_string(MAX_LENGTH) + " characters");
    }
    for (uint8_t v : values) {
        if (v >= 32) {
            throw Error(ErrorCode::EncodingError, "Data symbol out of 5-bit range");
        }
    }

    auto checksum = CreateChecksum(lowerHrp, values);

    std::string result = lowerHrp + SEPARATOR;
    result.reserve(result.size() + values.size() + CHECKSUM_LENGTH);
    for (uint8_t v : values) {
        result += BECH32_ALPHABET[v];
    }
    for (uint8_t v : checksum) {
        result += BECH32_ALPHABET[v];
    }
    return result;
}

DecodeResult Decode(const std::string& str) {
    if (str.size() > MAX_LENGTH) {
        throw Error(ErrorCode::EncodingError,
                    "Bech32 string longer than " + std::to_string(MAX_LENGTH) + " characters");
    }

    bool hasLower = false;
    bool hasUpper = false;
    for (char c : str) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 33 || uc > 126) {
            throw Error(ErrorCode::EncodingError, "Bech32 string contains a disallowed character");
        }
        if (c >= 'a' && c <= 'z') hasLower = true;
        if (c >= 'A' && c <= 'Z') hasUpper = true;
    }
    if (hasLower && hasUpper) {
        throw Error(ErrorCode::EncodingError, "Bech32 string mixes upper and lower case");
    }

    std::string lower = ToLower(str);

    // Find separator
    size_t pos = lower.rfind(SEPARATOR);
    if (pos == std::string::npos) {
        throw Error(ErrorCode::EncodingError, "Missing Bech32 separator");
    }
    if (pos + 1 + CHECKSUM_LENGTH > lower.size()) {
        throw Error(ErrorCode::EncodingError, "Bech32 data part shorter than checksum");
    }

    DecodeResult result;
    result.hrp = lower.substr(0, pos);
    ValidateHrp(result.hrp);

    std::vector<uint8_t> values;
    values.reserve(lower.size() - pos - 1);
    for (size_t i = pos + 1; i < lower.size(); ++i) {
        int8_t val = BECH32_MAP[static_cast<uint8_t>(lower[i])];
        if (val < 0) {
            throw Error(ErrorCode::EncodingError,
                        std::string("Invalid Bech32 character '") + lower[i] + "'");
        }
        values.push_back(static_cast<uint8_t>(val));
    }

    if (!VerifyChecksum(result.hrp, values)) {
        throw Error(ErrorCode::EncodingError, "Bech32 checksum mismatch");
    }

    values.resize(values.size() - CHECKSUM_LENGTH);
    result.data = std::move(values);
    return result;
}

std::vector<uint8_t> ConvertBits(const std::vector<uint8_t>& in,
                                 int fromBits, int toBits, bool pad) {
    uint32_t acc = 0;
    int bits = 0;
    const uint32_t maxv = (1u << toBits) - 1;
    const uint32_t maxAcc = (1u << (fromBits + toBits - 1)) - 1;

    std::vector<uint8_t> out;
    out.reserve((in.size() * fromBits + toBits - 1) / toBits);

    for (uint8_t value : in) {
        if ((value >> fromBits) != 0) {
            throw Error(ErrorCode::EncodingError, "Input value exceeds bit width");
        }
        acc = ((acc << fromBits) | value) & maxAcc;
        bits += fromBits;
        while (bits >= toBits) {
            bits -= toBits;
            out.push_back(static_cast<uint8_t>((acc >> bits) & maxv));
        }
    }

    if (pad) {
        if (bits > 0) {
            out.push_back(static_cast<uint8_t>((acc << (toBits - bits)) & maxv));
        }
    } else if (bits >= fromBits || ((acc << (toBits - bits)) & maxv) != 0) {
        throw Error(ErrorCode::EncodingError, "Invalid padding in bit conversion");
    }

    return out;
}

} // namespace bech32
} // namespace seedforge
