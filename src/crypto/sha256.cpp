// STARDUST - SHA256 Implementation
// Copyright (c) 2024 STARDUST Developers
// MIT License

#include "stardust/crypto/sha256.h"

#include <openssl/evp.h>

#include <stdexcept>

namespace stardust {

SHA256::SHA256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("SHA256: failed to allocate digest context");
    }
    Reset();
}

SHA256::~SHA256() {
    EVP_MD_CTX_free(ctx_);
}

SHA256& SHA256::Write(const Byte* data, size_t len) {
    if (len > 0 && EVP_DigestUpdate(ctx_, data, len) != 1) {
        throw std::runtime_error("SHA256: digest update failed");
    }
    return *this;
}

void SHA256::Finalize(Byte hash[OUTPUT_SIZE]) {
    unsigned int outLen = 0;
    if (EVP_DigestFinal_ex(ctx_, hash, &outLen) != 1 || outLen != OUTPUT_SIZE) {
        throw std::runtime_error("SHA256: digest finalization failed");
    }
}

SHA256& SHA256::Reset() {
    if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA256: digest initialization failed");
    }
    return *this;
}

Hash256 SHA256Hash(const Byte* data, size_t len) {
    Hash256 result;
    SHA256().Write(data, len).Finalize(result.data());
    return result;
}

} // namespace stardust
