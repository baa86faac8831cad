// STARDUST - Outputs
// Copyright (c) 2024 STARDUST Developers
// MIT License
//
// An output is the unit of ledger value: a base token amount, a set of
// native tokens, unlock conditions and features. Outputs are immutable;
// they are produced by OutputBuilder or decoded from their wire form.

#ifndef STARDUST_CORE_OUTPUT_H
#define STARDUST_CORE_OUTPUT_H

#include "stardust/core/address.h"
#include "stardust/core/feature.h"
#include "stardust/core/native_token.h"
#include "stardust/core/protocol.h"
#include "stardust/core/serialize.h"
#include "stardust/core/types.h"
#include "stardust/core/uint256.h"
#include "stardust/core/unlock_condition.h"

#include <optional>
#include <string>
#include <vector>

namespace stardust {

// ============================================================================
// Output Types
// ============================================================================

enum class OutputType : uint8_t {
    Basic = 3,
    Alias = 4,
    Foundry = 5,
    Nft = 6,
};

const char* OutputTypeToString(OutputType type);

/// Maximum state metadata of an alias output
constexpr size_t MAX_STATE_METADATA_LENGTH = 8192;

/// Supply accounting of a foundry
struct SimpleTokenScheme {
    static constexpr uint8_t TYPE = 0;
    
    U256 mintedTokens;
    U256 meltedTokens;
    U256 maximumSupply;
    
    bool operator==(const SimpleTokenScheme& o) const {
        return mintedTokens == o.mintedTokens && meltedTokens == o.meltedTokens &&
               maximumSupply == o.maximumSupply;
    }
    bool operator!=(const SimpleTokenScheme& o) const { return !(*this == o); }
};

// ============================================================================
// Output Validation Rules
// ============================================================================

/// The rule an invalid output violates
enum class OutputRule {
    None = 0,
    AmountBelowStorageDeposit,
    AmountExceedsSupply,
    MissingUnlockCondition,
    UnlockConditionNotAllowed,
    DuplicateUnlockCondition,
    UnorderedUnlockConditions,
    FeatureNotAllowed,
    DuplicateFeature,
    UnorderedFeatures,
    ImmutableFeatureNotAllowed,
    DuplicateImmutableFeature,
    UnorderedImmutableFeatures,
    DuplicateNativeToken,
    UnorderedNativeTokens,
    TooManyNativeTokens,
    ZeroNativeTokenAmount,
    MetadataLength,
    TagLength,
    StateMetadataLength,
    InvalidTimestamp,
    InvalidStorageDepositReturn,
    InvalidAliasAddress,
    InvalidTokenScheme,
};

const char* OutputRuleToString(OutputRule rule);

// ============================================================================
// Output
// ============================================================================

class Output {
public:
    /// Empty basic output
    Output() = default;
    
    OutputType GetType() const { return type_; }
    Amount GetAmount() const { return amount_; }
    const std::vector<NativeToken>& GetNativeTokens() const { return nativeTokens_; }
    const std::vector<UnlockCondition>& GetUnlockConditions() const { return unlockConditions_; }
    const std::vector<Feature>& GetFeatures() const { return features_; }
    const std::vector<Feature>& GetImmutableFeatures() const { return immutableFeatures_; }
    
    /// Alias id or NFT id (null for a chain output that is being created)
    const Hash256& GetChainId() const { return chainId_; }
    
    // Alias fields
    uint32_t GetStateIndex() const { return stateIndex_; }
    const std::vector<Byte>& GetStateMetadata() const { return stateMetadata_; }
    uint32_t GetFoundryCounter() const { return foundryCounter_; }
    
    // Foundry fields
    uint32_t GetSerialNumber() const { return serialNumber_; }
    const SimpleTokenScheme& GetTokenScheme() const { return tokenScheme_; }
    
    bool IsBasic() const { return type_ == OutputType::Basic; }
    
    template<typename T>
    const T* FindUnlockCondition() const {
        for (const auto& c : unlockConditions_) {
            if (const T* found = c.TryAs<T>()) return found;
        }
        return nullptr;
    }
    
    template<typename T>
    const T* FindFeature() const {
        for (const auto& f : features_) {
            if (const T* found = f.TryAs<T>()) return found;
        }
        return nullptr;
    }
    
    /// Address that has to sign for this output when consumed at `now`.
    /// Honors expiration: after the deadline the return address owns it.
    Address GetUnlockAddress(uint32_t now) const;
    
    /// True while a timelock prevents consumption
    bool IsTimelocked(uint32_t now) const;
    
    /// Canonical wire encoding
    std::vector<Byte> ToBytes() const;
    
    /// Decode and structurally validate. Deposit rules are not checked.
    static std::optional<Output> FromBytes(const std::vector<Byte>& bytes);
    
    size_t GetSerializedSize() const;
    
    /// SHA-256 of the wire encoding
    Hash256 GetHash() const;
    
    bool operator==(const Output& other) const;
    bool operator!=(const Output& other) const { return !(*this == other); }
    
    std::string ToString() const;

private:
    friend class OutputBuilder;
    friend Amount MinimumBasicDeposit(const Address& address, const ProtocolParameters& params);
    
    template<typename Stream>
    friend void Unserialize(Stream& s, Output& output);
    
    OutputType type_{OutputType::Basic};
    Amount amount_{0};
    std::vector<NativeToken> nativeTokens_;
    std::vector<UnlockCondition> unlockConditions_;
    std::vector<Feature> features_;
    std::vector<Feature> immutableFeatures_;
    Hash256 chainId_;
    uint32_t stateIndex_{0};
    std::vector<Byte> stateMetadata_;
    uint32_t foundryCounter_{0};
    uint32_t serialNumber_{0};
    SimpleTokenScheme tokenScheme_;
};

/// Result of checking an output's structure
struct OutputCheck {
    OutputRule rule{OutputRule::None};
    std::string message;
    
    bool IsValid() const { return rule == OutputRule::None; }
};

/**
 * Check the rules that do not depend on protocol parameters: allow-lists,
 * canonical ordering without duplicates, payload bounds, timestamps and
 * token scheme consistency.
 */
OutputCheck CheckOutputStructure(const Output& output);

// ============================================================================
// Serialization
// ============================================================================

namespace detail {

template<typename Stream, typename T>
void SerializeList8(Stream& s, const std::vector<T>& items) {
    if (items.size() > 0xFF) {
        throw std::ios_base::failure("List too long");
    }
    ser_writedata8(s, static_cast<uint8_t>(items.size()));
    for (const auto& item : items) {
        Serialize(s, item);
    }
}

template<typename Stream, typename T>
void UnserializeList8(Stream& s, std::vector<T>& items) {
    uint8_t count = ser_readdata8(s);
    items.clear();
    items.reserve(count);
    for (uint8_t i = 0; i < count; ++i) {
        T item;
        Unserialize(s, item);
        items.push_back(std::move(item));
    }
}

} // namespace detail

template<typename Stream>
void Serialize(Stream& s, const SimpleTokenScheme& scheme) {
    ser_writedata8(s, SimpleTokenScheme::TYPE);
    Serialize(s, scheme.mintedTokens);
    Serialize(s, scheme.meltedTokens);
    Serialize(s, scheme.maximumSupply);
}

template<typename Stream>
void Unserialize(Stream& s, SimpleTokenScheme& scheme) {
    if (ser_readdata8(s) != SimpleTokenScheme::TYPE) {
        throw std::ios_base::failure("Unknown token scheme type");
    }
    Unserialize(s, scheme.mintedTokens);
    Unserialize(s, scheme.meltedTokens);
    Unserialize(s, scheme.maximumSupply);
}

template<typename Stream>
void Serialize(Stream& s, const Output& output) {
    ser_writedata8(s, static_cast<uint8_t>(output.GetType()));
    ser_writedata64(s, output.GetAmount());
    detail::SerializeList8(s, output.GetNativeTokens());
    
    switch (output.GetType()) {
        case OutputType::Alias:
            Serialize(s, output.GetChainId());
            ser_writedata32(s, output.GetStateIndex());
            WriteBytesPrefix16(s, output.GetStateMetadata());
            ser_writedata32(s, output.GetFoundryCounter());
            break;
        case OutputType::Foundry:
            ser_writedata32(s, output.GetSerialNumber());
            Serialize(s, output.GetTokenScheme());
            break;
        case OutputType::Nft:
            Serialize(s, output.GetChainId());
            break;
        case OutputType::Basic:
            break;
    }
    
    detail::SerializeList8(s, output.GetUnlockConditions());
    detail::SerializeList8(s, output.GetFeatures());
    if (output.GetType() != OutputType::Basic) {
        detail::SerializeList8(s, output.GetImmutableFeatures());
    }
}

template<typename Stream>
void Unserialize(Stream& s, Output& output) {
    Output result;
    uint8_t type = ser_readdata8(s);
    if (type < static_cast<uint8_t>(OutputType::Basic) ||
        type > static_cast<uint8_t>(OutputType::Nft)) {
        throw std::ios_base::failure("Unknown output type");
    }
    result.type_ = static_cast<OutputType>(type);
    result.amount_ = ser_readdata64(s);
    detail::UnserializeList8(s, result.nativeTokens_);
    
    switch (result.type_) {
        case OutputType::Alias:
            Unserialize(s, result.chainId_);
            result.stateIndex_ = ser_readdata32(s);
            result.stateMetadata_ = ReadBytesPrefix16(s, MAX_STATE_METADATA_LENGTH);
            result.foundryCounter_ = ser_readdata32(s);
            break;
        case OutputType::Foundry:
            result.serialNumber_ = ser_readdata32(s);
            Unserialize(s, result.tokenScheme_);
            break;
        case OutputType::Nft:
            Unserialize(s, result.chainId_);
            break;
        case OutputType::Basic:
            break;
    }
    
    detail::UnserializeList8(s, result.unlockConditions_);
    detail::UnserializeList8(s, result.features_);
    if (result.type_ != OutputType::Basic) {
        detail::UnserializeList8(s, result.immutableFeatures_);
    }
    output = std::move(result);
}

// ============================================================================
// Output Builder
// ============================================================================

/// Result of building an output
struct OutputBuildResult {
    bool success{false};
    Output output;
    OutputRule rule{OutputRule::None};
    std::string error;
    
    /// Always InvalidOutput on failure
    ErrorCode GetErrorCode() const {
        return success ? ErrorCode::None : ErrorCode::InvalidOutput;
    }
    
    static OutputBuildResult Success(Output out) {
        OutputBuildResult r;
        r.success = true;
        r.output = std::move(out);
        return r;
    }
    
    static OutputBuildResult Failure(OutputRule rule, const std::string& msg) {
        OutputBuildResult r;
        r.rule = rule;
        r.error = msg;
        return r;
    }
};

/**
 * Builds validated outputs.
 *
 * Unlock conditions, features and native tokens may be added in any order;
 * Build() sorts them into canonical order before validating, so the same
 * logical input always yields the same bytes.
 *
 * Example:
 *   auto result = OutputBuilder::Basic()
 *       .SetAmount(100000)
 *       .AddUnlockCondition(AddressUnlockCondition{owner})
 *       .AddFeature(MetadataFeature{data})
 *       .Build(params);
 */
class OutputBuilder {
public:
    explicit OutputBuilder(OutputType type = OutputType::Basic);
    
    static OutputBuilder Basic() { return OutputBuilder(OutputType::Basic); }
    static OutputBuilder Alias(const Hash256& aliasId);
    static OutputBuilder Foundry(uint32_t serialNumber, const SimpleTokenScheme& scheme);
    static OutputBuilder Nft(const Hash256& nftId);
    
    /// Start from an existing output, e.g. to change its amount
    static OutputBuilder From(const Output& output);
    
    OutputBuilder& SetAmount(Amount amount);
    
    /// Use the minimum storage deposit as amount
    OutputBuilder& SetMinimumAmount();
    
    OutputBuilder& AddNativeToken(const NativeToken& token);
    OutputBuilder& AddNativeToken(const NativeTokenId& id, const U256& amount) {
        return AddNativeToken(NativeToken(id, amount));
    }
    OutputBuilder& SetNativeTokens(std::vector<NativeToken> tokens);
    
    OutputBuilder& AddUnlockCondition(const UnlockCondition& condition);
    OutputBuilder& AddFeature(const Feature& feature);
    OutputBuilder& AddImmutableFeature(const Feature& feature);
    
    OutputBuilder& SetStateIndex(uint32_t index);
    OutputBuilder& SetStateMetadata(std::vector<Byte> metadata);
    OutputBuilder& SetFoundryCounter(uint32_t counter);
    
    /// Canonicalize and validate
    OutputBuildResult Build(const ProtocolParameters& params) const;

private:
    Output output_;
    bool useMinimumAmount_{false};
};

/// Functional form of OutputBuilder. Caller ordering of the collections is irrelevant.
OutputBuildResult BuildOutput(OutputType type,
                              Amount amount,
                              const std::vector<NativeToken>& nativeTokens,
                              const std::vector<UnlockCondition>& unlockConditions,
                              const std::vector<Feature>& features,
                              const ProtocolParameters& params);

/// Minimum deposit of a basic output owned by `address` with nothing else
Amount MinimumBasicDeposit(const Address& address, const ProtocolParameters& params);

} // namespace stardust

#endif // STARDUST_CORE_OUTPUT_H
