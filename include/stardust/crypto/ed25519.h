// STARDUST - Ed25519 Signatures
// Copyright (c) 2024 STARDUST Developers
// MIT License
//
// Thin wrappers over the OpenSSL Ed25519 implementation. Private keys are
// the 32-byte RFC 8032 seeds produced by SLIP-10 derivation.

#ifndef STARDUST_CRYPTO_ED25519_H
#define STARDUST_CRYPTO_ED25519_H

#include <array>
#include <cstddef>
#include <optional>
#include "stardust/core/types.h"

namespace stardust {

namespace ed25519 {
    constexpr size_t SEED_SIZE = 32;
    constexpr size_t PUBLIC_KEY_SIZE = 32;
    constexpr size_t SIGNATURE_SIZE = 64;
}

using Ed25519PublicKey = std::array<Byte, ed25519::PUBLIC_KEY_SIZE>;
using Ed25519SignatureBytes = std::array<Byte, ed25519::SIGNATURE_SIZE>;

/// Derive the public key for a private seed
std::optional<Ed25519PublicKey> Ed25519GetPublicKey(const Byte* seed);

/// Sign a message with a private seed
std::optional<Ed25519SignatureBytes> Ed25519Sign(const Byte* seed,
                                                 const Byte* msg, size_t msgLen);

/// Verify a signature
bool Ed25519Verify(const Ed25519PublicKey& publicKey,
                   const Byte* msg, size_t msgLen,
                   const Ed25519SignatureBytes& signature);

} // namespace stardust

#endif // STARDUST_CRYPTO_ED25519_H
