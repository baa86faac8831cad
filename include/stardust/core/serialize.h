// STARDUST - Serialization Header
// Copyright (c) 2024 STARDUST Developers
// MIT License
//
// Serialization primitives for the Stardust binary format. All integers
// are little-endian; collections carry fixed-width length prefixes.

#ifndef STARDUST_CORE_SERIALIZE_H
#define STARDUST_CORE_SERIALIZE_H

#include "stardust/core/types.h"
#include "stardust/core/hex.h"
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <vector>
#include <string>
#include <array>
#include <stdexcept>
#include <ios>
#include <type_traits>
#include <limits>

namespace stardust {

// ============================================================================
// Endianness Helpers (Always Little-Endian for serialization)
// ============================================================================

// glibc's <endian.h> defines these names as macros; drop them so the
// helpers below are declared as ordinary functions.
#undef htole16
#undef htole32
#undef htole64
#undef le16toh
#undef le32toh
#undef le64toh

namespace detail {

inline uint16_t htole16(uint16_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap16(host);
#else
    return host;
#endif
}

inline uint32_t htole32(uint32_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap32(host);
#else
    return host;
#endif
}

inline uint64_t htole64(uint64_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap64(host);
#else
    return host;
#endif
}

inline uint16_t le16toh(uint16_t little) { return htole16(little); }
inline uint32_t le32toh(uint32_t little) { return htole32(little); }
inline uint64_t le64toh(uint64_t little) { return htole64(little); }

} // namespace detail

// ============================================================================
// DataStream - In-memory byte buffer for serialization
// ============================================================================

class DataStream {
public:
    using value_type = uint8_t;
    using size_type = std::size_t;

private:
    std::vector<uint8_t> data_;
    size_type read_pos_ = 0;

public:
    DataStream() = default;
    
    explicit DataStream(const std::vector<uint8_t>& data) : data_(data), read_pos_(0) {}
    
    explicit DataStream(std::vector<uint8_t>&& data) : data_(std::move(data)), read_pos_(0) {}
    
    DataStream(const uint8_t* data, size_type len) : data_(data, data + len), read_pos_(0) {}
    
    /// Returns unread bytes remaining
    size_type size() const noexcept { return data_.size() - read_pos_; }
    
    bool empty() const noexcept { return size() == 0; }
    
    void reserve(size_type n) { data_.reserve(n + read_pos_); }
    
    void clear() {
        data_.clear();
        read_pos_ = 0;
    }
    
    /// Get pointer to unread data
    const uint8_t* data() const noexcept { return data_.data() + read_pos_; }
    
    /// Full underlying buffer (including already read bytes)
    const std::vector<uint8_t>& Data() const noexcept { return data_; }
    
    void Write(const uint8_t* src, size_type len) {
        data_.insert(data_.end(), src, src + len);
    }
    
    void Write(const char* src, size_type len) {
        Write(reinterpret_cast<const uint8_t*>(src), len);
    }
    
    void Read(uint8_t* dst, size_type len) {
        if (len > size()) {
            throw std::ios_base::failure("DataStream::Read(): end of data");
        }
        std::memcpy(dst, data_.data() + read_pos_, len);
        read_pos_ += len;
    }
    
    void Read(char* dst, size_type len) {
        Read(reinterpret_cast<uint8_t*>(dst), len);
    }
    
    /// Rewind read position to beginning
    void Rewind() {
        read_pos_ = 0;
    }
    
    std::string ToHex() const;
    
    template<typename T>
    DataStream& operator<<(const T& obj);
    
    template<typename T>
    DataStream& operator>>(T& obj);
};

// ============================================================================
// Low-Level Serialization Functions
// ============================================================================

template<typename Stream>
inline void ser_writedata8(Stream& s, uint8_t obj) {
    s.Write(&obj, 1);
}

template<typename Stream>
inline void ser_writedata16(Stream& s, uint16_t obj) {
    obj = detail::htole16(obj);
    s.Write(reinterpret_cast<const uint8_t*>(&obj), 2);
}

template<typename Stream>
inline void ser_writedata32(Stream& s, uint32_t obj) {
    obj = detail::htole32(obj);
    s.Write(reinterpret_cast<const uint8_t*>(&obj), 4);
}

template<typename Stream>
inline void ser_writedata64(Stream& s, uint64_t obj) {
    obj = detail::htole64(obj);
    s.Write(reinterpret_cast<const uint8_t*>(&obj), 8);
}

template<typename Stream>
inline uint8_t ser_readdata8(Stream& s) {
    uint8_t obj;
    s.Read(&obj, 1);
    return obj;
}

template<typename Stream>
inline uint16_t ser_readdata16(Stream& s) {
    uint16_t obj;
    s.Read(reinterpret_cast<uint8_t*>(&obj), 2);
    return detail::le16toh(obj);
}

template<typename Stream>
inline uint32_t ser_readdata32(Stream& s) {
    uint32_t obj;
    s.Read(reinterpret_cast<uint8_t*>(&obj), 4);
    return detail::le32toh(obj);
}

template<typename Stream>
inline uint64_t ser_readdata64(Stream& s) {
    uint64_t obj;
    s.Read(reinterpret_cast<uint8_t*>(&obj), 8);
    return detail::le64toh(obj);
}

// ============================================================================
// Length-Prefixed Byte Strings
// ============================================================================
// Stardust prefixes variable-length fields with a fixed-width length
// (u8, u16 or u32) instead of a compact size.

template<typename Stream>
void WriteBytesPrefix8(Stream& s, const std::vector<uint8_t>& v) {
    if (v.size() > std::numeric_limits<uint8_t>::max()) {
        throw std::ios_base::failure("WriteBytesPrefix8(): too long");
    }
    ser_writedata8(s, static_cast<uint8_t>(v.size()));
    if (!v.empty()) s.Write(v.data(), v.size());
}

template<typename Stream>
void WriteBytesPrefix16(Stream& s, const std::vector<uint8_t>& v) {
    if (v.size() > std::numeric_limits<uint16_t>::max()) {
        throw std::ios_base::failure("WriteBytesPrefix16(): too long");
    }
    ser_writedata16(s, static_cast<uint16_t>(v.size()));
    if (!v.empty()) s.Write(v.data(), v.size());
}

template<typename Stream>
std::vector<uint8_t> ReadBytesPrefix8(Stream& s) {
    std::vector<uint8_t> v(ser_readdata8(s));
    if (!v.empty()) s.Read(v.data(), v.size());
    return v;
}

template<typename Stream>
std::vector<uint8_t> ReadBytesPrefix16(Stream& s, size_t maxLen) {
    uint16_t len = ser_readdata16(s);
    if (len > maxLen) {
        throw std::ios_base::failure("ReadBytesPrefix16(): size too large");
    }
    std::vector<uint8_t> v(len);
    if (!v.empty()) s.Read(v.data(), v.size());
    return v;
}

// ============================================================================
// Serialize/Unserialize for Basic Types
// ============================================================================

template<typename Stream>
inline void Serialize(Stream& s, uint8_t a) { ser_writedata8(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint8_t& a) { a = ser_readdata8(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint16_t a) { ser_writedata16(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint16_t& a) { a = ser_readdata16(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint32_t a) { ser_writedata32(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint32_t& a) { a = ser_readdata32(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint64_t a) { ser_writedata64(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint64_t& a) { a = ser_readdata64(s); }

// ============================================================================
// Serialize/Unserialize for Fixed-Size Byte Arrays and Hashes
// ============================================================================

template<typename Stream, size_t N>
void Serialize(Stream& s, const std::array<uint8_t, N>& arr) {
    s.Write(arr.data(), N);
}

template<typename Stream, size_t N>
void Unserialize(Stream& s, std::array<uint8_t, N>& arr) {
    s.Read(arr.data(), N);
}

template<typename Stream, size_t BITS>
void Serialize(Stream& s, const BaseHash<BITS>& hash) {
    s.Write(hash.data(), BaseHash<BITS>::SIZE);
}

template<typename Stream, size_t BITS>
void Unserialize(Stream& s, BaseHash<BITS>& hash) {
    s.Read(hash.data(), BaseHash<BITS>::SIZE);
}

// ============================================================================
// GetSerializeSize - Calculate serialized size without serializing
// ============================================================================

// Size calculator stream - just counts bytes
class SizeComputer {
private:
    size_t size_ = 0;

public:
    void Write(const uint8_t*, size_t len) { size_ += len; }
    void Write(const char*, size_t len) { size_ += len; }
    size_t size() const noexcept { return size_; }
};

template<typename T>
size_t GetSerializeSize(const T& obj) {
    SizeComputer sc;
    Serialize(sc, obj);
    return sc.size();
}

// ============================================================================
// DataStream Stream Operators Implementation
// ============================================================================

template<typename T>
DataStream& DataStream::operator<<(const T& obj) {
    Serialize(*this, obj);
    return *this;
}

template<typename T>
DataStream& DataStream::operator>>(T& obj) {
    Unserialize(*this, obj);
    return *this;
}

} // namespace stardust

#endif // STARDUST_CORE_SERIALIZE_H
