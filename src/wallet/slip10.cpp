// STARDUST - SLIP-10 Ed25519 Key Derivation Implementation
// Copyright (c) 2024 STARDUST Developers
// MIT License

#include "stardust/wallet/slip10.h"
#include "stardust/crypto/hmac.h"

#include <openssl/crypto.h>

#include <cstring>
#include <sstream>

namespace stardust {
namespace wallet {

// ============================================================================
// DerivationPath
// ============================================================================

std::optional<DerivationPath> DerivationPath::FromString(const std::string& path) {
    std::string p = path;
    if (p.empty() || (p[0] != 'm' && p[0] != 'M')) {
        return std::nullopt;
    }
    p = p.substr(1);
    
    std::vector<uint32_t> indexes;
    std::istringstream stream(p);
    std::string token;
    bool first = true;
    while (std::getline(stream, token, '/')) {
        if (first) {
            first = false;
            if (token.empty()) continue;
            return std::nullopt;
        }
        if (token.size() < 2) {
            return std::nullopt;
        }
        char mark = token.back();
        if (mark != '\'' && mark != 'h' && mark != 'H') {
            return std::nullopt;
        }
        token.pop_back();
        
        uint64_t value = 0;
        for (char c : token) {
            if (c < '0' || c > '9') {
                return std::nullopt;
            }
            value = value * 10 + static_cast<uint64_t>(c - '0');
            if (value >= HARDENED_FLAG) {
                return std::nullopt;
            }
        }
        indexes.push_back(static_cast<uint32_t>(value));
    }
    return DerivationPath(std::move(indexes));
}

DerivationPath DerivationPath::Bip44(uint32_t account, uint32_t change, uint32_t index) {
    return DerivationPath({BIP44_PURPOSE, STARDUST_COIN_TYPE, account, change, index});
}

std::string DerivationPath::ToString() const {
    std::string result = "m";
    for (uint32_t index : indexes_) {
        result += "/" + std::to_string(index) + "'";
    }
    return result;
}

// ============================================================================
// Slip10Key
// ============================================================================

Slip10Key::~Slip10Key() {
    OPENSSL_cleanse(key_.data(), key_.size());
}

Slip10Key Slip10Key::FromSeed(const Byte* seed, size_t seedLen) {
    static const char* CURVE_KEY = "ed25519 seed";
    
    auto digest = HmacSha512(reinterpret_cast<const Byte*>(CURVE_KEY),
                             std::strlen(CURVE_KEY), seed, seedLen);
    
    Slip10Key master;
    std::memcpy(master.key_.data(), digest.data(), KEY_SIZE);
    std::memcpy(master.chainCode_.data(), digest.data() + KEY_SIZE, CHAIN_CODE_SIZE);
    OPENSSL_cleanse(digest.data(), digest.size());
    return master;
}

Slip10Key Slip10Key::DeriveChild(uint32_t index) const {
    uint32_t hardened = index | HARDENED_FLAG;
    
    // 0x00 || key || ser32(index)
    std::array<Byte, 1 + KEY_SIZE + 4> data{};
    data[0] = 0x00;
    std::memcpy(data.data() + 1, key_.data(), KEY_SIZE);
    data[33] = static_cast<Byte>(hardened >> 24);
    data[34] = static_cast<Byte>(hardened >> 16);
    data[35] = static_cast<Byte>(hardened >> 8);
    data[36] = static_cast<Byte>(hardened);
    
    auto digest = HmacSha512(chainCode_.data(), chainCode_.size(), data.data(), data.size());
    OPENSSL_cleanse(data.data(), data.size());
    
    Slip10Key child;
    std::memcpy(child.key_.data(), digest.data(), KEY_SIZE);
    std::memcpy(child.chainCode_.data(), digest.data() + KEY_SIZE, CHAIN_CODE_SIZE);
    child.depth_ = static_cast<uint8_t>(depth_ + 1);
    OPENSSL_cleanse(digest.data(), digest.size());
    return child;
}

Slip10Key Slip10Key::DerivePath(const DerivationPath& path) const {
    Slip10Key key = *this;
    for (uint32_t index : path.GetIndexes()) {
        key = key.DeriveChild(index);
    }
    return key;
}

std::optional<Ed25519PublicKey> Slip10Key::GetPublicKey() const {
    return Ed25519GetPublicKey(key_.data());
}

std::optional<Address> Slip10Key::GetAddress() const {
    auto pub = GetPublicKey();
    if (!pub) {
        return std::nullopt;
    }
    return Address::FromPublicKey(*pub);
}

std::optional<Ed25519SignatureBytes> Slip10Key::Sign(const Byte* msg, size_t msgLen) const {
    return Ed25519Sign(key_.data(), msg, msgLen);
}

} // namespace wallet
} // namespace stardust
