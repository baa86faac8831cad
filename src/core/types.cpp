// STARDUST - Core Types Implementation
// Copyright (c) 2024 STARDUST Developers
// MIT License

#include "stardust/core/types.h"
#include "stardust/core/hex.h"

namespace stardust {

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return "0x" + BytesToHex(data_.data(), SIZE);
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    auto bytes = HexToBytes(StripHexPrefix(hex));
    if (bytes.size() != SIZE) {
        throw std::invalid_argument("Invalid hex string length for hash");
    }
    return BaseHash(bytes.data(), bytes.size());
}

// Explicit template instantiations
template class BaseHash<256>;

// ============================================================================
// ErrorCode Implementation
// ============================================================================

const char* ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::InvalidOutput: return "InvalidOutput";
        case ErrorCode::InvalidEncoding: return "InvalidEncoding";
        case ErrorCode::InsufficientFunds: return "InsufficientFunds";
        case ErrorCode::Overflow: return "Overflow";
        case ErrorCode::IncompleteSignatures: return "IncompleteSignatures";
        case ErrorCode::WrongPassphrase: return "WrongPassphrase";
        case ErrorCode::SignerLocked: return "SignerLocked";
        case ErrorCode::NetworkError: return "NetworkError";
        case ErrorCode::Rejected: return "Rejected";
        case ErrorCode::ConflictingTransaction: return "ConflictingTransaction";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::Cancelled: return "Cancelled";
        default: return "Unknown error";
    }
}

} // namespace stardust
