// STARDUST - Native Tokens
// Copyright (c) 2024 STARDUST Developers
// MIT License
//
// A native token is a foundry-minted fungible asset carried alongside the
// base amount of an output. Its id is the 38-byte foundry id:
//   alias address (33) || serial number (u32 LE) || token scheme type (1)

#ifndef STARDUST_CORE_NATIVE_TOKEN_H
#define STARDUST_CORE_NATIVE_TOKEN_H

#include "stardust/core/address.h"
#include "stardust/core/serialize.h"
#include "stardust/core/types.h"
#include "stardust/core/uint256.h"

#include <array>
#include <optional>
#include <string>

namespace stardust {

/// Maximum number of distinct native tokens in one output
constexpr size_t MAX_NATIVE_TOKENS_COUNT = 64;

class NativeTokenId {
public:
    static constexpr size_t SIZE = 38;
    
    NativeTokenId() { data_.fill(0); }
    explicit NativeTokenId(const std::array<Byte, SIZE>& data) : data_(data) {}
    
    /// Id of the tokens minted by a foundry
    static NativeTokenId FromFoundry(const Address& aliasAddress,
                                     uint32_t serialNumber,
                                     uint8_t tokenSchemeType);
    
    /// Parse "0x" + 76 hex digits
    static std::optional<NativeTokenId> FromHex(const std::string& hex);
    
    std::string ToHex() const;
    
    /// Controlling alias address encoded in the id
    std::optional<Address> GetAliasAddress() const;
    
    /// Foundry serial number encoded in the id
    uint32_t GetSerialNumber() const;
    
    const Byte* data() const { return data_.data(); }
    Byte* data() { return data_.data(); }
    constexpr size_t size() const { return SIZE; }
    
    bool operator==(const NativeTokenId& other) const { return data_ == other.data_; }
    bool operator!=(const NativeTokenId& other) const { return data_ != other.data_; }
    bool operator<(const NativeTokenId& other) const { return data_ < other.data_; }

private:
    std::array<Byte, SIZE> data_;
};

/// A quantity of one native token
struct NativeToken {
    NativeTokenId id;
    U256 amount;
    
    NativeToken() = default;
    NativeToken(const NativeTokenId& idIn, const U256& amountIn)
        : id(idIn), amount(amountIn) {}
    
    bool operator==(const NativeToken& other) const {
        return id == other.id && amount == other.amount;
    }
    bool operator!=(const NativeToken& other) const { return !(*this == other); }
};

template<typename Stream>
void Serialize(Stream& s, const NativeTokenId& id) {
    s.Write(id.data(), NativeTokenId::SIZE);
}

template<typename Stream>
void Unserialize(Stream& s, NativeTokenId& id) {
    s.Read(id.data(), NativeTokenId::SIZE);
}

template<typename Stream>
void Serialize(Stream& s, const NativeToken& token) {
    Serialize(s, token.id);
    Serialize(s, token.amount);
}

template<typename Stream>
void Unserialize(Stream& s, NativeToken& token) {
    Unserialize(s, token.id);
    Unserialize(s, token.amount);
}

} // namespace stardust

#endif // STARDUST_CORE_NATIVE_TOKEN_H
