// STARDUST - Bech32 Implementation
// Copyright (c) 2024 STARDUST Developers
// MIT License

#include "stardust/core/bech32.h"

#include <cctype>

namespace stardust {

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

constexpr size_t CHECKSUM_LENGTH = 6;

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
    return Polymod(hrpExp) == 1;
}

std::vector<uint8_t> CreateChecksum(const std::string& hrp,
                                    const std::vector<uint8_t>& values) {
    auto hrpExp = HrpExpand(hrp);
    hrpExp.insert(hrpExp.end(), values.begin(), values.end());
    hrpExp.resize(hrpExp.size() + CHECKSUM_LENGTH);
    uint32_t mod = Polymod(hrpExp) ^ 1;
    std::vector<uint8_t> ret(CHECKSUM_LENGTH);
    for (size_t i = 0; i < CHECKSUM_LENGTH; ++i) {
        ret[i] = (mod >> (5 * (5 - i))) & 31;
    }
    return ret;
}

void ConvertBits8to5(const std::vector<uint8_t>& in, std::vector<uint8_t>& out) {
    int acc = 0;
    int bits = 0;
    for (uint8_t value : in) {
        acc = ((acc << 8) | value) & 0xfff;
        bits += 8;
        while (bits >= 5) {
            bits -= 5;
            out.push_back((acc >> bits) & 31);
        }
    }
    if (bits > 0) {
        out.push_back((acc << (5 - bits)) & 31);
    }
}

bool ConvertBits5to8(const std::vector<uint8_t>& in, std::vector<uint8_t>& out) {
    int acc = 0;
    int bits = 0;
    for (uint8_t value : in) {
        if (value >= 32) return false;
        acc = ((acc << 5) | value) & 0xfff;
        bits += 5;
        while (bits >= 8) {
            bits -= 8;
            out.push_back((acc >> bits) & 255);
        }
    }
    // Padding must be shorter than 5 bits and all zero
    if (bits >= 5 || ((acc << (8 - bits)) & 255)) {
        return false;
    }
    return true;
}

bool IsValidHrp(const std::string& hrp) {
    if (hrp.empty() || hrp.size() > 83) return false;
    for (char c : hrp) {
        if (c < 33 || c > 126) return false;
        if (c >= 'A' && c <= 'Z') return false;
    }
    return true;
}

} // namespace

std::string EncodeBech32(const std::string& hrp, const std::vector<uint8_t>& data) {
    if (!IsValidHrp(hrp)) {
        return "";
    }
    
    std::vector<uint8_t> values;
    values.reserve((data.size() * 8 + 4) / 5 + CHECKSUM_LENGTH);
    ConvertBits8to5(data, values);
    
    auto checksum = CreateChecksum(hrp, values);
    values.insert(values.end(), checksum.begin(), checksum.end());
    
    std::string result = hrp + "1";
    for (uint8_t v : values) {
        result += BECH32_ALPHABET[v];
    }
    return result;
}

std::optional<std::pair<std::string, std::vector<uint8_t>>>
DecodeBech32(const std::string& str) {
    if (str.size() > BECH32_MAX_LENGTH) {
        return std::nullopt;
    }
    
    bool hasLower = false;
    bool hasUpper = false;
    for (char c : str) {
        if (c >= 'a' && c <= 'z') hasLower = true;
        if (c >= 'A' && c <= 'Z') hasUpper = true;
    }
    if (hasLower && hasUpper) {
        return std::nullopt;
    }
    
    // Find separator
    size_t pos = str.rfind('1');
    if (pos == std::string::npos || pos < 1 || pos + CHECKSUM_LENGTH + 1 > str.size()) {
        return std::nullopt;
    }
    
    std::string hrp;
    for (size_t i = 0; i < pos; ++i) {
        hrp.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(str[i]))));
    }
    if (!IsValidHrp(hrp)) {
        return std::nullopt;
    }
    
    std::vector<uint8_t> values;
    for (size_t i = pos + 1; i < str.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(str[i]);
        if (c >= sizeof(BECH32_MAP)) {
            return std::nullopt;
        }
        int8_t val = BECH32_MAP[c];
        if (val < 0) {
            return std::nullopt;
        }
        values.push_back(static_cast<uint8_t>(val));
    }
    
    if (!VerifyChecksum(hrp, values)) {
        return std::nullopt;
    }
    
    values.resize(values.size() - CHECKSUM_LENGTH);
    
    std::vector<uint8_t> data;
    if (!ConvertBits5to8(values, data)) {
        return std::nullopt;
    }
    
    return std::make_pair(hrp, data);
}

} // namespace stardust
