// STARDUST - HMAC-SHA512
// Copyright (c) 2024 STARDUST Developers
// MIT License
//
// HMAC-SHA512 (RFC 2104) as used by SLIP-10 key derivation.

#ifndef STARDUST_CRYPTO_HMAC_H
#define STARDUST_CRYPTO_HMAC_H

#include <array>
#include <cstddef>
#include <cstdint>
#include "stardust/core/types.h"

namespace stardust {

namespace hmac {
    /// HMAC-SHA512 output size
    constexpr size_t SHA512_SIZE = 64;
}

/// Compute HMAC-SHA512(key, data).
/// Throws std::runtime_error if the MAC cannot be computed.
std::array<Byte, hmac::SHA512_SIZE> HmacSha512(const Byte* key, size_t keyLen,
                                               const Byte* data, size_t dataLen);

} // namespace stardust

#endif // STARDUST_CRYPTO_HMAC_H
