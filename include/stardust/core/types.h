// STARDUST - Core Types Header
// Copyright (c) 2024 STARDUST Developers
// MIT License
//
// This file defines fundamental types used throughout STARDUST.

#ifndef STARDUST_CORE_TYPES_H
#define STARDUST_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <algorithm>
#include <stdexcept>
#include <cstring>

namespace stardust {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Amount of base tokens (glow)
using Amount = uint64_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// Total base token supply of the network
constexpr Amount TOKEN_SUPPLY = 1813620509061365ULL;

/// Check if amount is in valid range
inline bool AmountInRange(Amount value) {
    return value <= TOKEN_SUPPLY;
}

// ============================================================================
// Hash Templates
// ============================================================================

/// Generic fixed-size byte identifier
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;
    
    /// Default constructor - creates null hash
    BaseHash() noexcept {
        data_.fill(0);
    }
    
    /// Construct from byte array
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept 
        : data_(data) {}
    
    /// Construct from raw bytes
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, std::min(len, SIZE));
        }
    }
    
    /// Check if hash is all zeros
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }
    
    void SetNull() noexcept {
        data_.fill(0);
    }
    
    constexpr size_t size() const noexcept { return SIZE; }
    
    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }
    
    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }
    
    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }
    
    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }
    
    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }
    
    /// Lexicographic byte order (matches the order of the hex form)
    bool operator<(const BaseHash& other) const noexcept {
        return data_ < other.data_;
    }
    
    /// Convert to "0x"-prefixed hex string in storage order
    std::string ToHex() const;
    
    /// Parse from hex string, with or without "0x" prefix.
    /// Throws std::invalid_argument on malformed input.
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Specific Hash Types
// ============================================================================

/// 256-bit hash (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    Hash256(const BaseHash<256>& base) : BaseHash<256>(base) {}
    
    static Hash256 FromHex(const std::string& hex) {
        return Hash256(BaseHash<256>::FromHex(hex));
    }
};

/// Transaction identifier (hash of the serialized transaction payload)
class TransactionId : public Hash256 {
public:
    using Hash256::Hash256;
    TransactionId() = default;
    explicit TransactionId(const Hash256& h) : Hash256(h) {}
    
    static TransactionId FromHex(const std::string& hex) {
        return TransactionId(Hash256::FromHex(hex));
    }
};

/// Block identifier assigned by the node
class BlockId : public Hash256 {
public:
    using Hash256::Hash256;
    BlockId() = default;
    explicit BlockId(const Hash256& h) : Hash256(h) {}
    
    static BlockId FromHex(const std::string& hex) {
        return BlockId(Hash256::FromHex(hex));
    }
};

// ============================================================================
// Error Codes
// ============================================================================

/// Wallet engine error codes
enum class ErrorCode {
    None = 0,
    
    // Construction errors
    InvalidOutput,
    InvalidEncoding,
    
    // Selection errors
    InsufficientFunds,
    
    // Invariant violations
    Overflow,
    IncompleteSignatures,
    
    // Signer errors
    WrongPassphrase,
    SignerLocked,
    
    // Network errors
    NetworkError,
    Rejected,
    
    // Confirmation errors
    ConflictingTransaction,
    Timeout,
    Cancelled,
};

/// Convert error to string
const char* ErrorCodeToString(ErrorCode code);

/**
 * Exception for unrecoverable invariant violations (Overflow,
 * IncompleteSignatures). Recoverable errors are returned in result types.
 */
class WalletError : public std::runtime_error {
public:
    WalletError(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}
    
    ErrorCode GetCode() const { return code_; }

private:
    ErrorCode code_;
};

} // namespace stardust

#endif // STARDUST_CORE_TYPES_H
