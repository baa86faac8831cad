// STARDUST - Secure Random Number Generation Implementation
// Copyright (c) 2024 STARDUST Developers
// MIT License

#include "stardust/core/random.h"

#include <openssl/rand.h>

#include <stdexcept>

namespace stardust {

void GetRandBytes(uint8_t* buf, size_t len) {
    if (len == 0) return;
    if (RAND_bytes(buf, static_cast<int>(len)) != 1) {
        throw std::runtime_error("Failed to get random bytes");
    }
}

uint64_t GetRandUint64() {
    uint64_t result;
    GetRandBytes(reinterpret_cast<uint8_t*>(&result), sizeof(result));
    return result;
}

Hash256 GetRandHash256() {
    Hash256 hash;
    GetRandBytes(hash.data(), Hash256::SIZE);
    return hash;
}

} // namespace stardust
