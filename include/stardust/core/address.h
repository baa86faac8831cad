// STARDUST - Ledger Addresses
// Copyright (c) 2024 STARDUST Developers
// MIT License
//
// An address is a typed 32-byte identity. Ed25519 addresses commit to a
// public key; Alias and NFT addresses name the chain output with that id.
// Human-readable form is Bech32 over (type byte || 32-byte hash).

#ifndef STARDUST_CORE_ADDRESS_H
#define STARDUST_CORE_ADDRESS_H

#include "stardust/core/types.h"
#include "stardust/core/serialize.h"

#include <array>
#include <optional>
#include <string>

namespace stardust {

/// Address kinds, valued by their wire discriminant
enum class AddressType : uint8_t {
    Ed25519 = 0,
    Alias = 8,
    Nft = 16,
};

const char* AddressTypeToString(AddressType type);

/// Check that a byte is a known address discriminant
bool IsValidAddressType(uint8_t type);

class Address {
public:
    static constexpr size_t HASH_SIZE = 32;
    static constexpr size_t SERIALIZED_SIZE = 1 + HASH_SIZE;
    
    /// Null Ed25519 address
    Address() : type_(AddressType::Ed25519) {}
    
    Address(AddressType type, const Hash256& hash) : type_(type), hash_(hash) {}
    
    static Address Ed25519(const Hash256& hash) { return Address(AddressType::Ed25519, hash); }
    static Address Alias(const Hash256& aliasId) { return Address(AddressType::Alias, aliasId); }
    static Address Nft(const Hash256& nftId) { return Address(AddressType::Nft, nftId); }
    
    /// Ed25519 address committing to a public key
    static Address FromPublicKey(const std::array<Byte, 32>& publicKey);
    
    AddressType GetType() const { return type_; }
    const Hash256& GetHash() const { return hash_; }
    
    bool IsEd25519() const { return type_ == AddressType::Ed25519; }
    bool IsAlias() const { return type_ == AddressType::Alias; }
    bool IsNft() const { return type_ == AddressType::Nft; }
    bool IsNull() const { return hash_.IsNull(); }
    
    /// Bech32 form under the given network prefix
    std::string ToBech32(const std::string& hrp) const;
    
    /// Parse a Bech32 address. The decoded prefix is written to hrpOut.
    static std::optional<Address> FromBech32(const std::string& str,
                                             std::string* hrpOut = nullptr);
    
    /// "0x"-prefixed hex of the 32-byte hash
    std::string ToHex() const { return hash_.ToHex(); }
    
    /// Parse the hex form of a hash for a known address kind
    static std::optional<Address> FromHex(AddressType type, const std::string& hex);
    
    bool operator==(const Address& other) const {
        return type_ == other.type_ && hash_ == other.hash_;
    }
    bool operator!=(const Address& other) const { return !(*this == other); }
    bool operator<(const Address& other) const {
        if (type_ != other.type_) return type_ < other.type_;
        return hash_ < other.hash_;
    }
    
    std::string ToString() const;

private:
    AddressType type_;
    Hash256 hash_;
};

template<typename Stream>
void Serialize(Stream& s, const Address& address) {
    ser_writedata8(s, static_cast<uint8_t>(address.GetType()));
    Serialize(s, address.GetHash());
}

template<typename Stream>
void Unserialize(Stream& s, Address& address) {
    uint8_t type = ser_readdata8(s);
    if (!IsValidAddressType(type)) {
        throw std::ios_base::failure("Unknown address type");
    }
    Hash256 hash;
    Unserialize(s, hash);
    address = Address(static_cast<AddressType>(type), hash);
}

} // namespace stardust

#endif // STARDUST_CORE_ADDRESS_H
