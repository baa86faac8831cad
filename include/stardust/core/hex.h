// STARDUST - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 STARDUST Developers
// MIT License

#ifndef STARDUST_CORE_HEX_H
#define STARDUST_CORE_HEX_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <array>
#include <optional>
#include <stdexcept>

namespace stardust {

// Use uint8_t directly to avoid circular dependency with types.h
using HexByte = uint8_t;

/// Convert bytes to lowercase hex string (no prefix)
std::string BytesToHex(const HexByte* data, size_t len);
std::string BytesToHex(const std::vector<HexByte>& data);

template<size_t N>
std::string BytesToHex(const std::array<HexByte, N>& data) {
    return BytesToHex(data.data(), N);
}

/// Convert hex string to bytes. Throws std::invalid_argument.
std::vector<HexByte> HexToBytes(const std::string& hex);

/// Non-throwing variant of HexToBytes; accepts an optional "0x" prefix
std::optional<std::vector<HexByte>> TryParseHex(const std::string& hex);

/// Remove a leading "0x" or "0X"
std::string StripHexPrefix(const std::string& hex);

/// Check if string is valid hex
bool IsValidHex(const std::string& str);

} // namespace stardust

#endif // STARDUST_CORE_HEX_H
