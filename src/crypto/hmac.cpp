// STARDUST - HMAC-SHA512 Implementation
// Copyright (c) 2024 STARDUST Developers
// MIT License

#include "stardust/crypto/hmac.h"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <stdexcept>

namespace stardust {

std::array<Byte, hmac::SHA512_SIZE> HmacSha512(const Byte* key, size_t keyLen,
                                               const Byte* data, size_t dataLen) {
    std::array<Byte, hmac::SHA512_SIZE> result{};
    unsigned int resultLen = 0;
    if (HMAC(EVP_sha512(), key, static_cast<int>(keyLen),
             data, dataLen, result.data(), &resultLen) == nullptr ||
        resultLen != hmac::SHA512_SIZE) {
        throw std::runtime_error("HMAC-SHA512 computation failed");
    }
    return result;
}

} // namespace stardust
