// STARDUST - Ed25519 Implementation
// Copyright (c) 2024 STARDUST Developers
// MIT License

#include "stardust/crypto/ed25519.h"

#include <openssl/evp.h>

#include <memory>

namespace stardust {

namespace {

struct PKeyDeleter {
    void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};

struct MDCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using PKeyPtr = std::unique_ptr<EVP_PKEY, PKeyDeleter>;
using MDCtxPtr = std::unique_ptr<EVP_MD_CTX, MDCtxDeleter>;

} // namespace

std::optional<Ed25519PublicKey> Ed25519GetPublicKey(const Byte* seed) {
    PKeyPtr key(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                             seed, ed25519::SEED_SIZE));
    if (!key) {
        return std::nullopt;
    }
    
    Ed25519PublicKey publicKey{};
    size_t len = publicKey.size();
    if (EVP_PKEY_get_raw_public_key(key.get(), publicKey.data(), &len) != 1 ||
        len != publicKey.size()) {
        return std::nullopt;
    }
    return publicKey;
}

std::optional<Ed25519SignatureBytes> Ed25519Sign(const Byte* seed,
                                                 const Byte* msg, size_t msgLen) {
    PKeyPtr key(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                             seed, ed25519::SEED_SIZE));
    MDCtxPtr ctx(EVP_MD_CTX_new());
    if (!key || !ctx) {
        return std::nullopt;
    }
    
    // Ed25519 is a one-shot scheme: no digest is configured
    if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
        return std::nullopt;
    }
    
    Ed25519SignatureBytes signature{};
    size_t sigLen = signature.size();
    if (EVP_DigestSign(ctx.get(), signature.data(), &sigLen, msg, msgLen) != 1 ||
        sigLen != signature.size()) {
        return std::nullopt;
    }
    return signature;
}

bool Ed25519Verify(const Ed25519PublicKey& publicKey,
                   const Byte* msg, size_t msgLen,
                   const Ed25519SignatureBytes& signature) {
    PKeyPtr key(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                            publicKey.data(), publicKey.size()));
    MDCtxPtr ctx(EVP_MD_CTX_new());
    if (!key || !ctx) {
        return false;
    }
    if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
        return false;
    }
    return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                            msg, msgLen) == 1;
}

} // namespace stardust
