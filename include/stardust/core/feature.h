// STARDUST - Output Features
// Copyright (c) 2024 STARDUST Developers
// MIT License
//
// Features carry data that does not affect who can spend an output.
// Like unlock conditions, the variant index equals the wire discriminant.

#ifndef STARDUST_CORE_FEATURE_H
#define STARDUST_CORE_FEATURE_H

#include "stardust/core/address.h"
#include "stardust/core/serialize.h"
#include "stardust/core/types.h"

#include <string>
#include <variant>
#include <vector>

namespace stardust {

/// Maximum metadata payload in bytes
constexpr size_t MAX_METADATA_LENGTH = 8192;

/// Maximum tag length in bytes
constexpr size_t MAX_TAG_LENGTH = 64;

enum class FeatureType : uint8_t {
    Sender = 0,
    Issuer = 1,
    Metadata = 2,
    Tag = 3,
};

const char* FeatureTypeToString(FeatureType type);

/// Sender identity, validated against the unlocked input addresses
struct SenderFeature {
    static constexpr FeatureType TYPE = FeatureType::Sender;
    Address address;
    
    bool operator==(const SenderFeature& o) const { return address == o.address; }
};

/// Issuer of an Alias or NFT (immutable feature only)
struct IssuerFeature {
    static constexpr FeatureType TYPE = FeatureType::Issuer;
    Address address;
    
    bool operator==(const IssuerFeature& o) const { return address == o.address; }
};

/// Opaque payload of 1..MAX_METADATA_LENGTH bytes
struct MetadataFeature {
    static constexpr FeatureType TYPE = FeatureType::Metadata;
    std::vector<Byte> data;
    
    bool operator==(const MetadataFeature& o) const { return data == o.data; }
};

/// Indexation tag of 1..MAX_TAG_LENGTH bytes
struct TagFeature {
    static constexpr FeatureType TYPE = FeatureType::Tag;
    std::vector<Byte> tag;
    
    bool operator==(const TagFeature& o) const { return tag == o.tag; }
};

class Feature {
public:
    using Variant = std::variant<SenderFeature, IssuerFeature, MetadataFeature, TagFeature>;
    
    Feature() = default;
    Feature(const SenderFeature& f) : value_(f) {}
    Feature(const IssuerFeature& f) : value_(f) {}
    Feature(const MetadataFeature& f) : value_(f) {}
    Feature(const TagFeature& f) : value_(f) {}
    
    FeatureType GetType() const { return static_cast<FeatureType>(value_.index()); }
    
    template<typename T>
    bool Is() const { return std::holds_alternative<T>(value_); }
    
    template<typename T>
    const T& As() const { return std::get<T>(value_); }
    
    template<typename T>
    const T* TryAs() const { return std::get_if<T>(&value_); }
    
    const Variant& Get() const { return value_; }
    
    bool operator==(const Feature& other) const { return value_ == other.value_; }
    bool operator!=(const Feature& other) const { return !(*this == other); }
    bool operator<(const Feature& other) const { return GetType() < other.GetType(); }
    
    std::string ToString() const;

private:
    Variant value_;
};

template<typename Stream>
void Serialize(Stream& s, const Feature& feature) {
    ser_writedata8(s, static_cast<uint8_t>(feature.GetType()));
    std::visit([&s](const auto& f) {
        using T = std::decay_t<decltype(f)>;
        if constexpr (std::is_same_v<T, MetadataFeature>) {
            WriteBytesPrefix16(s, f.data);
        } else if constexpr (std::is_same_v<T, TagFeature>) {
            WriteBytesPrefix8(s, f.tag);
        } else {
            Serialize(s, f.address);
        }
    }, feature.Get());
}

template<typename Stream>
void Unserialize(Stream& s, Feature& feature) {
    uint8_t type = ser_readdata8(s);
    switch (static_cast<FeatureType>(type)) {
        case FeatureType::Sender: {
            SenderFeature f;
            Unserialize(s, f.address);
            feature = f;
            break;
        }
        case FeatureType::Issuer: {
            IssuerFeature f;
            Unserialize(s, f.address);
            feature = f;
            break;
        }
        case FeatureType::Metadata: {
            MetadataFeature f;
            f.data = ReadBytesPrefix16(s, MAX_METADATA_LENGTH);
            feature = f;
            break;
        }
        case FeatureType::Tag: {
            TagFeature f;
            f.tag = ReadBytesPrefix8(s);
            feature = f;
            break;
        }
        default:
            throw std::ios_base::failure("Unknown feature type");
    }
}

} // namespace stardust

#endif // STARDUST_CORE_FEATURE_H
