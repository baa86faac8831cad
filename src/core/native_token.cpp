// STARDUST - Native Token Implementation
// Copyright (c) 2024 STARDUST Developers
// MIT License

#include "stardust/core/native_token.h"
#include "stardust/core/hex.h"

namespace stardust {

NativeTokenId NativeTokenId::FromFoundry(const Address& aliasAddress,
                                         uint32_t serialNumber,
                                         uint8_t tokenSchemeType) {
    DataStream ss;
    Serialize(ss, aliasAddress);
    ser_writedata32(ss, serialNumber);
    ser_writedata8(ss, tokenSchemeType);
    
    std::array<Byte, SIZE> data{};
    std::copy(ss.Data().begin(), ss.Data().end(), data.begin());
    return NativeTokenId(data);
}

std::optional<NativeTokenId> NativeTokenId::FromHex(const std::string& hex) {
    auto bytes = TryParseHex(hex);
    if (!bytes || bytes->size() != SIZE) {
        return std::nullopt;
    }
    std::array<Byte, SIZE> data{};
    std::copy(bytes->begin(), bytes->end(), data.begin());
    return NativeTokenId(data);
}

std::string NativeTokenId::ToHex() const {
    return "0x" + BytesToHex(data_.data(), SIZE);
}

std::optional<Address> NativeTokenId::GetAliasAddress() const {
    if (!IsValidAddressType(data_[0])) {
        return std::nullopt;
    }
    return Address(static_cast<AddressType>(data_[0]),
                   Hash256(data_.data() + 1, Address::HASH_SIZE));
}

uint32_t NativeTokenId::GetSerialNumber() const {
    DataStream ss(data_.data() + Address::SERIALIZED_SIZE, 4);
    return ser_readdata32(ss);
}

} // namespace stardust
