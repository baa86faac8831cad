// STARDUST - Hex Encoding/Decoding Implementation
// Copyright (c) 2024 STARDUST Developers
// MIT License

#include "stardust/core/hex.h"

namespace stardust {

namespace {
    constexpr char HEX_CHARS[] = "0123456789abcdef";
    
    inline int HexCharToNibble(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
}

std::string BytesToHex(const HexByte* data, size_t len) {
    std::string result;
    result.reserve(len * 2);
    
    for (size_t i = 0; i < len; ++i) {
        result.push_back(HEX_CHARS[data[i] >> 4]);
        result.push_back(HEX_CHARS[data[i] & 0x0F]);
    }
    
    return result;
}

std::string BytesToHex(const std::vector<HexByte>& data) {
    return BytesToHex(data.data(), data.size());
}

std::vector<HexByte> HexToBytes(const std::string& hex) {
    auto parsed = TryParseHex(hex);
    if (!parsed) {
        throw std::invalid_argument("Invalid hex string: " + hex);
    }
    return std::move(*parsed);
}

std::optional<std::vector<HexByte>> TryParseHex(const std::string& hex) {
    std::string digits = StripHexPrefix(hex);
    if (digits.length() % 2 != 0) {
        return std::nullopt;
    }
    
    std::vector<HexByte> result;
    result.reserve(digits.length() / 2);
    
    for (size_t i = 0; i < digits.length(); i += 2) {
        int high = HexCharToNibble(digits[i]);
        int low = HexCharToNibble(digits[i + 1]);
        
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        
        result.push_back(static_cast<HexByte>((high << 4) | low));
    }
    
    return result;
}

std::string StripHexPrefix(const std::string& hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        return hex.substr(2);
    }
    return hex;
}

bool IsValidHex(const std::string& str) {
    if (str.empty() || str.length() % 2 != 0) {
        return false;
    }
    
    for (char c : str) {
        if (HexCharToNibble(c) < 0) {
            return false;
        }
    }
    
    return true;
}

} // namespace stardust
