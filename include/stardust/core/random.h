// STARDUST - Secure Random Number Generation Header
// Copyright (c) 2024 STARDUST Developers
// MIT License
//
// Cryptographically secure random bytes backed by the OpenSSL DRBG.

#ifndef STARDUST_CORE_RANDOM_H
#define STARDUST_CORE_RANDOM_H

#include "stardust/core/types.h"
#include <cstdint>
#include <cstddef>

namespace stardust {

/// Fill buffer with cryptographically secure random bytes.
/// Throws std::runtime_error if the generator cannot be seeded.
void GetRandBytes(uint8_t* buf, size_t len);

/// Generate random 64-bit unsigned integer
uint64_t GetRandUint64();

/// Generate random 256-bit hash
Hash256 GetRandHash256();

} // namespace stardust

#endif // STARDUST_CORE_RANDOM_H
