// STARDUST - Unsigned 256-bit Integer
// Copyright (c) 2024 STARDUST Developers
// MIT License
//
// Native token quantities are unsigned 256-bit integers. Arithmetic is
// checked: callers learn about overflow instead of getting a wrapped value.

#ifndef STARDUST_CORE_UINT256_H
#define STARDUST_CORE_UINT256_H

#include "stardust/core/serialize.h"

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace stardust {

class U256 {
public:
    static constexpr size_t SIZE = 32;
    static constexpr size_t LIMBS = 4;
    
    U256() noexcept { limbs_.fill(0); }
    
    U256(uint64_t value) noexcept {
        limbs_.fill(0);
        limbs_[0] = value;
    }
    
    /// Largest representable value
    static U256 Max() noexcept;
    
    bool IsZero() const noexcept;
    
    /// True if the value fits into 64 bits
    bool FitsUint64() const noexcept;
    
    /// Low 64 bits
    uint64_t Low64() const noexcept { return limbs_[0]; }
    
    /// Add with overflow detection. Returns false (and leaves result
    /// untouched) on overflow.
    bool CheckedAdd(const U256& other, U256& result) const noexcept;
    
    /// Subtract with underflow detection. Returns false on underflow.
    bool CheckedSub(const U256& other, U256& result) const noexcept;
    
    /// Comparison
    int Compare(const U256& other) const noexcept;
    bool operator==(const U256& other) const noexcept { return limbs_ == other.limbs_; }
    bool operator!=(const U256& other) const noexcept { return !(*this == other); }
    bool operator<(const U256& other) const noexcept { return Compare(other) < 0; }
    bool operator>(const U256& other) const noexcept { return Compare(other) > 0; }
    bool operator<=(const U256& other) const noexcept { return Compare(other) <= 0; }
    bool operator>=(const U256& other) const noexcept { return Compare(other) >= 0; }
    
    /// "0x"-prefixed big-endian hex without leading zeros ("0x0" for zero)
    std::string ToHex() const;
    
    /// Base-10 representation
    std::string ToString() const;
    
    /// Parse "0x"-prefixed hex (at most 64 digits)
    static std::optional<U256> FromHex(const std::string& hex);
    
    /// Parse decimal digits
    static std::optional<U256> FromString(const std::string& dec);
    
    /// Little-endian 32-byte wire form
    std::array<uint8_t, SIZE> ToLittleEndian() const noexcept;
    static U256 FromLittleEndian(const std::array<uint8_t, SIZE>& bytes) noexcept;

private:
    /// Multiply by a small factor and add a digit; false on overflow
    bool MulAddSmall(uint32_t mul, uint32_t add) noexcept;
    
    /// Divide by a small divisor in place, returning the remainder
    uint32_t DivSmall(uint32_t divisor) noexcept;
    
    /// Little-endian limbs
    std::array<uint64_t, LIMBS> limbs_;
};

template<typename Stream>
void Serialize(Stream& s, const U256& value) {
    auto bytes = value.ToLittleEndian();
    s.Write(bytes.data(), bytes.size());
}

template<typename Stream>
void Unserialize(Stream& s, U256& value) {
    std::array<uint8_t, U256::SIZE> bytes;
    s.Read(bytes.data(), bytes.size());
    value = U256::FromLittleEndian(bytes);
}

} // namespace stardust

#endif // STARDUST_CORE_UINT256_H
