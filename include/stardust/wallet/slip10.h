// STARDUST - SLIP-10 Ed25519 Key Derivation
// Copyright (c) 2024 STARDUST Developers
// MIT License
//
// Hierarchical deterministic Ed25519 keys as defined by SLIP-0010.
// Ed25519 only supports hardened derivation, so every path component is
// hardened.
//
// Path: m/44'/4219'/account'/change'/index'

#ifndef STARDUST_WALLET_SLIP10_H
#define STARDUST_WALLET_SLIP10_H

#include "stardust/core/address.h"
#include "stardust/core/types.h"
#include "stardust/crypto/ed25519.h"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace stardust {
namespace wallet {

/// SLIP-44 coin type of the Shimmer network
constexpr uint32_t STARDUST_COIN_TYPE = 4219;

constexpr uint32_t BIP44_PURPOSE = 44;

constexpr uint32_t HARDENED_FLAG = 0x80000000;

/// Master seed length kept by the signer
constexpr size_t MASTER_SEED_SIZE = 64;

/**
 * A derivation path. Components are stored without the hardened flag;
 * all of them are derived hardened.
 */
class DerivationPath {
public:
    DerivationPath() = default;
    explicit DerivationPath(std::vector<uint32_t> indexes)
        : indexes_(std::move(indexes)) {}
    
    /// Parse "m/44'/4219'/0'/0'/0'". Non-hardened components are rejected.
    static std::optional<DerivationPath> FromString(const std::string& path);
    
    /// m/44'/4219'/account'/change'/index'
    static DerivationPath Bip44(uint32_t account, uint32_t change, uint32_t index);
    
    const std::vector<uint32_t>& GetIndexes() const { return indexes_; }
    size_t Depth() const { return indexes_.size(); }
    
    std::string ToString() const;
    
    bool operator==(const DerivationPath& other) const { return indexes_ == other.indexes_; }
    bool operator!=(const DerivationPath& other) const { return !(*this == other); }

private:
    std::vector<uint32_t> indexes_;
};

/**
 * Extended Ed25519 private key (key + chain code).
 *
 * Key material stays inside the object: callers get the public key, the
 * address and signatures. Destruction wipes the secret bytes.
 */
class Slip10Key {
public:
    static constexpr size_t KEY_SIZE = 32;
    static constexpr size_t CHAIN_CODE_SIZE = 32;
    
    ~Slip10Key();
    Slip10Key(const Slip10Key& other) = default;
    Slip10Key& operator=(const Slip10Key& other) = default;
    
    /// Master key: HMAC-SHA512(key = "ed25519 seed", data = seed)
    static Slip10Key FromSeed(const Byte* seed, size_t seedLen);
    
    /// Hardened child; `index` must not carry the hardened flag
    Slip10Key DeriveChild(uint32_t index) const;
    
    Slip10Key DerivePath(const DerivationPath& path) const;
    
    std::optional<Ed25519PublicKey> GetPublicKey() const;
    
    /// Ed25519 address of the public key
    std::optional<Address> GetAddress() const;
    
    std::optional<Ed25519SignatureBytes> Sign(const Byte* msg, size_t msgLen) const;
    
    /// Chain code (public derivation context, not secret on its own)
    const std::array<Byte, CHAIN_CODE_SIZE>& GetChainCode() const { return chainCode_; }
    
    uint8_t GetDepth() const { return depth_; }

private:
    Slip10Key() = default;
    
    std::array<Byte, KEY_SIZE> key_{};
    std::array<Byte, CHAIN_CODE_SIZE> chainCode_{};
    uint8_t depth_{0};
};

} // namespace wallet
} // namespace stardust

#endif // STARDUST_WALLET_SLIP10_H
