// STARDUST - Ledger Address Implementation
// Copyright (c) 2024 STARDUST Developers
// MIT License

#include "stardust/core/address.h"
#include "stardust/core/bech32.h"
#include "stardust/core/hex.h"
#include "stardust/crypto/sha256.h"

namespace stardust {

const char* AddressTypeToString(AddressType type) {
    switch (type) {
        case AddressType::Ed25519: return "Ed25519";
        case AddressType::Alias: return "Alias";
        case AddressType::Nft: return "Nft";
        default: return "Unknown";
    }
}

bool IsValidAddressType(uint8_t type) {
    return type == static_cast<uint8_t>(AddressType::Ed25519) ||
           type == static_cast<uint8_t>(AddressType::Alias) ||
           type == static_cast<uint8_t>(AddressType::Nft);
}

Address Address::FromPublicKey(const std::array<Byte, 32>& publicKey) {
    return Ed25519(SHA256Hash(publicKey.data(), publicKey.size()));
}

std::string Address::ToBech32(const std::string& hrp) const {
    std::vector<uint8_t> payload;
    payload.reserve(SERIALIZED_SIZE);
    payload.push_back(static_cast<uint8_t>(type_));
    payload.insert(payload.end(), hash_.begin(), hash_.end());
    return EncodeBech32(hrp, payload);
}

std::optional<Address> Address::FromBech32(const std::string& str, std::string* hrpOut) {
    auto decoded = DecodeBech32(str);
    if (!decoded) {
        return std::nullopt;
    }
    
    const auto& payload = decoded->second;
    if (payload.size() != SERIALIZED_SIZE || !IsValidAddressType(payload[0])) {
        return std::nullopt;
    }
    
    if (hrpOut) {
        *hrpOut = decoded->first;
    }
    return Address(static_cast<AddressType>(payload[0]),
                   Hash256(payload.data() + 1, HASH_SIZE));
}

std::optional<Address> Address::FromHex(AddressType type, const std::string& hex) {
    auto bytes = TryParseHex(hex);
    if (!bytes || bytes->size() != HASH_SIZE) {
        return std::nullopt;
    }
    return Address(type, Hash256(bytes->data(), bytes->size()));
}

std::string Address::ToString() const {
    return std::string(AddressTypeToString(type_)) + "(" + hash_.ToHex() + ")";
}

} // namespace stardust
