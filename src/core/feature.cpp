// STARDUST - Feature Implementation
// Copyright (c) 2024 STARDUST Developers
// MIT License

#include "stardust/core/feature.h"
#include "stardust/core/hex.h"

namespace stardust {

const char* FeatureTypeToString(FeatureType type) {
    switch (type) {
        case FeatureType::Sender: return "Sender";
        case FeatureType::Issuer: return "Issuer";
        case FeatureType::Metadata: return "Metadata";
        case FeatureType::Tag: return "Tag";
        default: return "Unknown";
    }
}

std::string Feature::ToString() const {
    std::string body = std::visit([](const auto& f) -> std::string {
        using T = std::decay_t<decltype(f)>;
        if constexpr (std::is_same_v<T, MetadataFeature>) {
            return "0x" + BytesToHex(f.data);
        } else if constexpr (std::is_same_v<T, TagFeature>) {
            return "0x" + BytesToHex(f.tag);
        } else {
            return f.address.ToString();
        }
    }, value_);
    return std::string(FeatureTypeToString(GetType())) + "(" + body + ")";
}

} // namespace stardust
