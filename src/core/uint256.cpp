// STARDUST - Unsigned 256-bit Integer Implementation
// Copyright (c) 2024 STARDUST Developers
// MIT License

#include "stardust/core/uint256.h"

#include <algorithm>

namespace stardust {

U256 U256::Max() noexcept {
    U256 result;
    result.limbs_.fill(~uint64_t{0});
    return result;
}

bool U256::IsZero() const noexcept {
    for (auto limb : limbs_) {
        if (limb != 0) return false;
    }
    return true;
}

bool U256::FitsUint64() const noexcept {
    return limbs_[1] == 0 && limbs_[2] == 0 && limbs_[3] == 0;
}

bool U256::CheckedAdd(const U256& other, U256& result) const noexcept {
    U256 sum;
    uint64_t carry = 0;
    for (size_t i = 0; i < LIMBS; ++i) {
        uint64_t a = limbs_[i];
        uint64_t s = a + other.limbs_[i];
        uint64_t c1 = s < a ? 1 : 0;
        uint64_t s2 = s + carry;
        uint64_t c2 = s2 < s ? 1 : 0;
        sum.limbs_[i] = s2;
        carry = c1 | c2;
    }
    if (carry != 0) {
        return false;
    }
    result = sum;
    return true;
}

bool U256::CheckedSub(const U256& other, U256& result) const noexcept {
    if (*this < other) {
        return false;
    }
    U256 diff;
    uint64_t borrow = 0;
    for (size_t i = 0; i < LIMBS; ++i) {
        uint64_t a = limbs_[i];
        uint64_t d = a - other.limbs_[i];
        uint64_t b1 = a < other.limbs_[i] ? 1 : 0;
        uint64_t d2 = d - borrow;
        uint64_t b2 = d < borrow ? 1 : 0;
        diff.limbs_[i] = d2;
        borrow = b1 | b2;
    }
    result = diff;
    return true;
}

int U256::Compare(const U256& other) const noexcept {
    for (size_t i = LIMBS; i-- > 0;) {
        if (limbs_[i] < other.limbs_[i]) return -1;
        if (limbs_[i] > other.limbs_[i]) return 1;
    }
    return 0;
}

bool U256::MulAddSmall(uint32_t mul, uint32_t add) noexcept {
    unsigned __int128 carry = add;
    for (size_t i = 0; i < LIMBS; ++i) {
        unsigned __int128 cur = static_cast<unsigned __int128>(limbs_[i]) * mul + carry;
        limbs_[i] = static_cast<uint64_t>(cur);
        carry = cur >> 64;
    }
    return carry == 0;
}

uint32_t U256::DivSmall(uint32_t divisor) noexcept {
    unsigned __int128 rem = 0;
    for (size_t i = LIMBS; i-- > 0;) {
        unsigned __int128 cur = (rem << 64) | limbs_[i];
        limbs_[i] = static_cast<uint64_t>(cur / divisor);
        rem = cur % divisor;
    }
    return static_cast<uint32_t>(rem);
}

std::string U256::ToHex() const {
    static const char hexChars[] = "0123456789abcdef";
    std::string digits;
    for (size_t i = LIMBS; i-- > 0;) {
        for (int shift = 60; shift >= 0; shift -= 4) {
            char c = hexChars[(limbs_[i] >> shift) & 0x0F];
            if (digits.empty() && c == '0') continue;
            digits.push_back(c);
        }
    }
    if (digits.empty()) digits = "0";
    return "0x" + digits;
}

std::string U256::ToString() const {
    if (IsZero()) return "0";
    U256 tmp = *this;
    std::string digits;
    while (!tmp.IsZero()) {
        digits.push_back(static_cast<char>('0' + tmp.DivSmall(10)));
    }
    std::reverse(digits.begin(), digits.end());
    return digits;
}

std::optional<U256> U256::FromHex(const std::string& hex) {
    if (hex.size() < 3 || hex[0] != '0' || (hex[1] != 'x' && hex[1] != 'X')) {
        return std::nullopt;
    }
    if (hex.size() - 2 > 64) {
        return std::nullopt;
    }
    U256 result;
    for (size_t i = 2; i < hex.size(); ++i) {
        char c = hex[i];
        uint32_t nibble;
        if (c >= '0' && c <= '9') nibble = c - '0';
        else if (c >= 'a' && c <= 'f') nibble = c - 'a' + 10;
        else if (c >= 'A' && c <= 'F') nibble = c - 'A' + 10;
        else return std::nullopt;
        if (!result.MulAddSmall(16, nibble)) {
            return std::nullopt;
        }
    }
    return result;
}

std::optional<U256> U256::FromString(const std::string& dec) {
    if (dec.empty()) {
        return std::nullopt;
    }
    U256 result;
    for (char c : dec) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        if (!result.MulAddSmall(10, static_cast<uint32_t>(c - '0'))) {
            return std::nullopt;
        }
    }
    return result;
}

std::array<uint8_t, U256::SIZE> U256::ToLittleEndian() const noexcept {
    std::array<uint8_t, SIZE> out{};
    for (size_t i = 0; i < LIMBS; ++i) {
        for (size_t b = 0; b < 8; ++b) {
            out[i * 8 + b] = static_cast<uint8_t>(limbs_[i] >> (8 * b));
        }
    }
    return out;
}

U256 U256::FromLittleEndian(const std::array<uint8_t, SIZE>& bytes) noexcept {
    U256 result;
    for (size_t i = 0; i < LIMBS; ++i) {
        uint64_t limb = 0;
        for (size_t b = 0; b < 8; ++b) {
            limb |= static_cast<uint64_t>(bytes[i * 8 + b]) << (8 * b);
        }
        result.limbs_[i] = limb;
    }
    return result;
}

} // namespace stardust
