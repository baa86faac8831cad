// STARDUST - Bech32 Encoding
// Copyright (c) 2024 STARDUST Developers
// MIT License
//
// BIP-173 Bech32 over an arbitrary byte payload. Stardust addresses encode
// the address type byte followed by the 32-byte address hash.

#ifndef STARDUST_CORE_BECH32_H
#define STARDUST_CORE_BECH32_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace stardust {

/// Human-readable parts of the known networks
namespace Bech32HRP {
    constexpr const char* SHIMMER = "smr";
    constexpr const char* SHIMMER_TESTNET = "rms";
    constexpr const char* IOTA = "iota";
    constexpr const char* IOTA_TESTNET = "atoi";
}

/// Maximum length of an encoded string
constexpr size_t BECH32_MAX_LENGTH = 90;

/**
 * Encode bytes as Bech32 under the given human-readable part.
 * The HRP must be non-empty lowercase ASCII in [33, 126].
 * Returns an empty string if the HRP is invalid.
 */
std::string EncodeBech32(const std::string& hrp, const std::vector<uint8_t>& data);

/**
 * Decode a Bech32 string into (hrp, bytes).
 * Rejects mixed case, bad checksums, non-zero padding and overlong input.
 */
std::optional<std::pair<std::string, std::vector<uint8_t>>>
DecodeBech32(const std::string& str);

} // namespace stardust

#endif // STARDUST_CORE_BECH32_H
