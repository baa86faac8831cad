// STARDUST - Output Implementation
// Copyright (c) 2024 STARDUST Developers
// MIT License

#include "stardust/core/output.h"
#include "stardust/crypto/sha256.h"

#include <algorithm>
#include <sstream>

namespace stardust {

// ============================================================================
// String Conversions
// ============================================================================

const char* OutputTypeToString(OutputType type) {
    switch (type) {
        case OutputType::Basic: return "Basic";
        case OutputType::Alias: return "Alias";
        case OutputType::Foundry: return "Foundry";
        case OutputType::Nft: return "Nft";
        default: return "Unknown";
    }
}

const char* OutputRuleToString(OutputRule rule) {
    switch (rule) {
        case OutputRule::None: return "None";
        case OutputRule::AmountBelowStorageDeposit: return "Amount below minimum storage deposit";
        case OutputRule::AmountExceedsSupply: return "Amount exceeds token supply";
        case OutputRule::MissingUnlockCondition: return "Missing required unlock condition";
        case OutputRule::UnlockConditionNotAllowed: return "Unlock condition not allowed";
        case OutputRule::DuplicateUnlockCondition: return "Duplicate unlock condition";
        case OutputRule::UnorderedUnlockConditions: return "Unlock conditions not in canonical order";
        case OutputRule::FeatureNotAllowed: return "Feature not allowed";
        case OutputRule::DuplicateFeature: return "Duplicate feature";
        case OutputRule::UnorderedFeatures: return "Features not in canonical order";
        case OutputRule::ImmutableFeatureNotAllowed: return "Immutable feature not allowed";
        case OutputRule::DuplicateImmutableFeature: return "Duplicate immutable feature";
        case OutputRule::UnorderedImmutableFeatures: return "Immutable features not in canonical order";
        case OutputRule::DuplicateNativeToken: return "Duplicate native token";
        case OutputRule::UnorderedNativeTokens: return "Native tokens not in canonical order";
        case OutputRule::TooManyNativeTokens: return "Too many native tokens";
        case OutputRule::ZeroNativeTokenAmount: return "Native token amount is zero";
        case OutputRule::MetadataLength: return "Metadata length out of bounds";
        case OutputRule::TagLength: return "Tag length out of bounds";
        case OutputRule::StateMetadataLength: return "State metadata too long";
        case OutputRule::InvalidTimestamp: return "Invalid unlock condition timestamp";
        case OutputRule::InvalidStorageDepositReturn: return "Invalid storage deposit return amount";
        case OutputRule::InvalidAliasAddress: return "Address must be an alias address";
        case OutputRule::InvalidTokenScheme: return "Invalid token scheme";
        default: return "Unknown rule";
    }
}

namespace {

// ============================================================================
// Allow-Lists
// ============================================================================

constexpr uint32_t Bit(UnlockConditionType t) { return 1u << static_cast<uint8_t>(t); }
constexpr uint32_t Bit(FeatureType t) { return 1u << static_cast<uint8_t>(t); }

struct OutputRules {
    uint32_t allowedConditions;
    uint32_t requiredConditions;
    uint32_t allowedFeatures;
    uint32_t allowedImmutableFeatures;
};

OutputRules GetOutputRules(OutputType type) {
    const uint32_t ownedConditions =
        Bit(UnlockConditionType::Address) | Bit(UnlockConditionType::StorageDepositReturn) |
        Bit(UnlockConditionType::Timelock) | Bit(UnlockConditionType::Expiration);
    
    switch (type) {
        case OutputType::Basic:
            return {ownedConditions,
                    Bit(UnlockConditionType::Address),
                    Bit(FeatureType::Sender) | Bit(FeatureType::Metadata) | Bit(FeatureType::Tag),
                    0};
        case OutputType::Alias:
            return {Bit(UnlockConditionType::StateControllerAddress) |
                        Bit(UnlockConditionType::GovernorAddress),
                    Bit(UnlockConditionType::StateControllerAddress) |
                        Bit(UnlockConditionType::GovernorAddress),
                    Bit(FeatureType::Sender) | Bit(FeatureType::Metadata),
                    Bit(FeatureType::Issuer) | Bit(FeatureType::Metadata)};
        case OutputType::Foundry:
            return {Bit(UnlockConditionType::ImmutableAliasAddress),
                    Bit(UnlockConditionType::ImmutableAliasAddress),
                    Bit(FeatureType::Metadata),
                    Bit(FeatureType::Metadata)};
        case OutputType::Nft:
            return {ownedConditions,
                    Bit(UnlockConditionType::Address),
                    Bit(FeatureType::Sender) | Bit(FeatureType::Metadata) | Bit(FeatureType::Tag),
                    Bit(FeatureType::Issuer) | Bit(FeatureType::Metadata)};
    }
    return {0, 0, 0, 0};
}

OutputCheck Fail(OutputRule rule, const std::string& detail) {
    OutputCheck check;
    check.rule = rule;
    check.message = std::string(OutputRuleToString(rule)) + ": " + detail;
    return check;
}

/// Walk a sorted list and report the first duplicate or out-of-order pair
template<typename T, typename KeyFn>
OutputRule CheckOrdering(const std::vector<T>& items, KeyFn key,
                         OutputRule duplicate, OutputRule unordered) {
    for (size_t i = 1; i < items.size(); ++i) {
        auto prev = key(items[i - 1]);
        auto cur = key(items[i]);
        if (prev == cur) return duplicate;
        if (cur < prev) return unordered;
    }
    return OutputRule::None;
}

OutputCheck CheckFeatureList(const std::vector<Feature>& features, uint32_t allowed,
                             OutputRule notAllowed, OutputRule duplicate,
                             OutputRule unordered) {
    for (const auto& feature : features) {
        if ((allowed & Bit(feature.GetType())) == 0) {
            return Fail(notAllowed, FeatureTypeToString(feature.GetType()));
        }
        if (const auto* metadata = feature.TryAs<MetadataFeature>()) {
            if (metadata->data.empty() || metadata->data.size() > MAX_METADATA_LENGTH) {
                return Fail(OutputRule::MetadataLength,
                            std::to_string(metadata->data.size()) + " bytes");
            }
        }
        if (const auto* tag = feature.TryAs<TagFeature>()) {
            if (tag->tag.empty() || tag->tag.size() > MAX_TAG_LENGTH) {
                return Fail(OutputRule::TagLength, std::to_string(tag->tag.size()) + " bytes");
            }
        }
    }
    OutputRule order = CheckOrdering(features, [](const Feature& f) { return f.GetType(); },
                                     duplicate, unordered);
    if (order != OutputRule::None) {
        return Fail(order, "features");
    }
    return OutputCheck();
}

} // namespace

// ============================================================================
// Structural Validation
// ============================================================================

OutputCheck CheckOutputStructure(const Output& output) {
    const OutputRules rules = GetOutputRules(output.GetType());
    
    // Native tokens
    const auto& tokens = output.GetNativeTokens();
    if (tokens.size() > MAX_NATIVE_TOKENS_COUNT) {
        return Fail(OutputRule::TooManyNativeTokens, std::to_string(tokens.size()));
    }
    for (const auto& token : tokens) {
        if (token.amount.IsZero()) {
            return Fail(OutputRule::ZeroNativeTokenAmount, token.id.ToHex());
        }
    }
    OutputRule tokenOrder = CheckOrdering(
        tokens, [](const NativeToken& t) { return t.id; },
        OutputRule::DuplicateNativeToken, OutputRule::UnorderedNativeTokens);
    if (tokenOrder != OutputRule::None) {
        return Fail(tokenOrder, "native tokens");
    }
    
    // Unlock conditions
    uint32_t present = 0;
    for (const auto& condition : output.GetUnlockConditions()) {
        UnlockConditionType type = condition.GetType();
        if ((rules.allowedConditions & Bit(type)) == 0) {
            return Fail(OutputRule::UnlockConditionNotAllowed, UnlockConditionTypeToString(type));
        }
        present |= Bit(type);
        
        if (const auto* timelock = condition.TryAs<TimelockUnlockCondition>()) {
            if (timelock->unixTime == 0) {
                return Fail(OutputRule::InvalidTimestamp, "timelock");
            }
        }
        if (const auto* expiration = condition.TryAs<ExpirationUnlockCondition>()) {
            if (expiration->unixTime == 0) {
                return Fail(OutputRule::InvalidTimestamp, "expiration");
            }
        }
        if (const auto* alias = condition.TryAs<ImmutableAliasAddressUnlockCondition>()) {
            if (!alias->address.IsAlias()) {
                return Fail(OutputRule::InvalidAliasAddress, alias->address.ToString());
            }
        }
    }
    OutputRule conditionOrder = CheckOrdering(
        output.GetUnlockConditions(), [](const UnlockCondition& c) { return c.GetType(); },
        OutputRule::DuplicateUnlockCondition, OutputRule::UnorderedUnlockConditions);
    if (conditionOrder != OutputRule::None) {
        return Fail(conditionOrder, "unlock conditions");
    }
    if ((present & rules.requiredConditions) != rules.requiredConditions) {
        return Fail(OutputRule::MissingUnlockCondition, OutputTypeToString(output.GetType()));
    }
    
    // Features
    OutputCheck check = CheckFeatureList(output.GetFeatures(), rules.allowedFeatures,
                                         OutputRule::FeatureNotAllowed,
                                         OutputRule::DuplicateFeature,
                                         OutputRule::UnorderedFeatures);
    if (!check.IsValid()) return check;
    
    check = CheckFeatureList(output.GetImmutableFeatures(), rules.allowedImmutableFeatures,
                             OutputRule::ImmutableFeatureNotAllowed,
                             OutputRule::DuplicateImmutableFeature,
                             OutputRule::UnorderedImmutableFeatures);
    if (!check.IsValid()) return check;
    
    // Type specific
    if (output.GetType() == OutputType::Alias &&
        output.GetStateMetadata().size() > MAX_STATE_METADATA_LENGTH) {
        return Fail(OutputRule::StateMetadataLength,
                    std::to_string(output.GetStateMetadata().size()) + " bytes");
    }
    if (output.GetType() == OutputType::Foundry) {
        const auto& scheme = output.GetTokenScheme();
        U256 circulating;
        if (scheme.maximumSupply.IsZero() ||
            !scheme.mintedTokens.CheckedSub(scheme.meltedTokens, circulating) ||
            circulating > scheme.maximumSupply) {
            return Fail(OutputRule::InvalidTokenScheme, "minted " +
                        scheme.mintedTokens.ToString() + ", melted " +
                        scheme.meltedTokens.ToString() + ", max " +
                        scheme.maximumSupply.ToString());
        }
    }
    
    return OutputCheck();
}

// ============================================================================
// Output
// ============================================================================

Address Output::GetUnlockAddress(uint32_t now) const {
    switch (type_) {
        case OutputType::Alias:
            if (const auto* c = FindUnlockCondition<StateControllerAddressUnlockCondition>()) {
                return c->address;
            }
            break;
        case OutputType::Foundry:
            if (const auto* c = FindUnlockCondition<ImmutableAliasAddressUnlockCondition>()) {
                return c->address;
            }
            break;
        case OutputType::Basic:
        case OutputType::Nft:
            if (const auto* exp = FindUnlockCondition<ExpirationUnlockCondition>()) {
                if (now >= exp->unixTime) {
                    return exp->returnAddress;
                }
            }
            if (const auto* c = FindUnlockCondition<AddressUnlockCondition>()) {
                return c->address;
            }
            break;
    }
    return Address();
}

bool Output::IsTimelocked(uint32_t now) const {
    const auto* timelock = FindUnlockCondition<TimelockUnlockCondition>();
    return timelock != nullptr && now < timelock->unixTime;
}

std::vector<Byte> Output::ToBytes() const {
    DataStream ss;
    Serialize(ss, *this);
    return ss.Data();
}

std::optional<Output> Output::FromBytes(const std::vector<Byte>& bytes) {
    DataStream ss(bytes);
    Output output;
    try {
        Unserialize(ss, output);
    } catch (const std::ios_base::failure&) {
        return std::nullopt;
    }
    if (!ss.empty()) {
        return std::nullopt;
    }
    if (!CheckOutputStructure(output).IsValid()) {
        return std::nullopt;
    }
    return output;
}

size_t Output::GetSerializedSize() const {
    return GetSerializeSize(*this);
}

Hash256 Output::GetHash() const {
    return SHA256Hash(ToBytes());
}

bool Output::operator==(const Output& other) const {
    return type_ == other.type_ &&
           amount_ == other.amount_ &&
           nativeTokens_ == other.nativeTokens_ &&
           unlockConditions_ == other.unlockConditions_ &&
           features_ == other.features_ &&
           immutableFeatures_ == other.immutableFeatures_ &&
           chainId_ == other.chainId_ &&
           stateIndex_ == other.stateIndex_ &&
           stateMetadata_ == other.stateMetadata_ &&
           foundryCounter_ == other.foundryCounter_ &&
           serialNumber_ == other.serialNumber_ &&
           tokenScheme_ == other.tokenScheme_;
}

std::string Output::ToString() const {
    std::ostringstream ss;
    ss << OutputTypeToString(type_) << "Output(amount=" << amount_;
    for (const auto& token : nativeTokens_) {
        ss << ", token " << token.id.ToHex() << "=" << token.amount.ToString();
    }
    for (const auto& condition : unlockConditions_) {
        ss << ", " << condition.ToString();
    }
    for (const auto& feature : features_) {
        ss << ", " << feature.ToString();
    }
    ss << ")";
    return ss.str();
}

// ============================================================================
// OutputBuilder
// ============================================================================

OutputBuilder::OutputBuilder(OutputType type) {
    output_.type_ = type;
}

OutputBuilder OutputBuilder::Alias(const Hash256& aliasId) {
    OutputBuilder builder(OutputType::Alias);
    builder.output_.chainId_ = aliasId;
    return builder;
}

OutputBuilder OutputBuilder::Foundry(uint32_t serialNumber, const SimpleTokenScheme& scheme) {
    OutputBuilder builder(OutputType::Foundry);
    builder.output_.serialNumber_ = serialNumber;
    builder.output_.tokenScheme_ = scheme;
    return builder;
}

OutputBuilder OutputBuilder::Nft(const Hash256& nftId) {
    OutputBuilder builder(OutputType::Nft);
    builder.output_.chainId_ = nftId;
    return builder;
}

OutputBuilder OutputBuilder::From(const Output& output) {
    OutputBuilder builder(output.GetType());
    builder.output_ = output;
    return builder;
}

OutputBuilder& OutputBuilder::SetAmount(Amount amount) {
    output_.amount_ = amount;
    useMinimumAmount_ = false;
    return *this;
}

OutputBuilder& OutputBuilder::SetMinimumAmount() {
    useMinimumAmount_ = true;
    return *this;
}

OutputBuilder& OutputBuilder::AddNativeToken(const NativeToken& token) {
    output_.nativeTokens_.push_back(token);
    return *this;
}

OutputBuilder& OutputBuilder::SetNativeTokens(std::vector<NativeToken> tokens) {
    output_.nativeTokens_ = std::move(tokens);
    return *this;
}

OutputBuilder& OutputBuilder::AddUnlockCondition(const UnlockCondition& condition) {
    output_.unlockConditions_.push_back(condition);
    return *this;
}

OutputBuilder& OutputBuilder::AddFeature(const Feature& feature) {
    output_.features_.push_back(feature);
    return *this;
}

OutputBuilder& OutputBuilder::AddImmutableFeature(const Feature& feature) {
    output_.immutableFeatures_.push_back(feature);
    return *this;
}

OutputBuilder& OutputBuilder::SetStateIndex(uint32_t index) {
    output_.stateIndex_ = index;
    return *this;
}

OutputBuilder& OutputBuilder::SetStateMetadata(std::vector<Byte> metadata) {
    output_.stateMetadata_ = std::move(metadata);
    return *this;
}

OutputBuilder& OutputBuilder::SetFoundryCounter(uint32_t counter) {
    output_.foundryCounter_ = counter;
    return *this;
}

OutputBuildResult OutputBuilder::Build(const ProtocolParameters& params) const {
    Output output = output_;
    
    // Canonical ordering. Stable sorts keep duplicates adjacent so the
    // structural check reports them.
    std::stable_sort(output.nativeTokens_.begin(), output.nativeTokens_.end(),
                     [](const NativeToken& a, const NativeToken& b) { return a.id < b.id; });
    std::stable_sort(output.unlockConditions_.begin(), output.unlockConditions_.end());
    std::stable_sort(output.features_.begin(), output.features_.end());
    std::stable_sort(output.immutableFeatures_.begin(), output.immutableFeatures_.end());
    
    // Drop fields that the output type does not encode
    if (output.type_ != OutputType::Alias) {
        output.stateIndex_ = 0;
        output.stateMetadata_.clear();
        output.foundryCounter_ = 0;
    }
    if (output.type_ != OutputType::Alias && output.type_ != OutputType::Nft) {
        output.chainId_.SetNull();
    }
    if (output.type_ != OutputType::Foundry) {
        output.serialNumber_ = 0;
        output.tokenScheme_ = SimpleTokenScheme();
    }
    if (output.type_ == OutputType::Basic && !output.immutableFeatures_.empty()) {
        return OutputBuildResult::Failure(OutputRule::ImmutableFeatureNotAllowed,
                                          "Basic outputs have no immutable features");
    }
    
    OutputCheck check = CheckOutputStructure(output);
    if (!check.IsValid()) {
        return OutputBuildResult::Failure(check.rule, check.message);
    }
    
    // The amount field has a fixed width, so the size is known before the
    // amount is final.
    const Amount deposit = params.MinimumStorageDeposit(output.GetSerializedSize());
    if (useMinimumAmount_) {
        output.amount_ = deposit;
    }
    
    if (output.amount_ > params.tokenSupply) {
        return OutputBuildResult::Failure(OutputRule::AmountExceedsSupply,
                                          std::to_string(output.amount_));
    }
    
    if (const auto* sdr = output.FindUnlockCondition<StorageDepositReturnUnlockCondition>()) {
        Amount minReturn = MinimumBasicDeposit(sdr->returnAddress, params);
        if (sdr->amount < minReturn || sdr->amount > output.amount_) {
            return OutputBuildResult::Failure(
                OutputRule::InvalidStorageDepositReturn,
                "return " + std::to_string(sdr->amount) + ", minimum " +
                std::to_string(minReturn) + ", output amount " +
                std::to_string(output.amount_));
        }
    }
    
    if (output.amount_ < deposit) {
        return OutputBuildResult::Failure(
            OutputRule::AmountBelowStorageDeposit,
            "amount " + std::to_string(output.amount_) + " < required " +
            std::to_string(deposit));
    }
    
    return OutputBuildResult::Success(std::move(output));
}

OutputBuildResult BuildOutput(OutputType type,
                              Amount amount,
                              const std::vector<NativeToken>& nativeTokens,
                              const std::vector<UnlockCondition>& unlockConditions,
                              const std::vector<Feature>& features,
                              const ProtocolParameters& params) {
    OutputBuilder builder(type);
    builder.SetAmount(amount).SetNativeTokens(nativeTokens);
    for (const auto& condition : unlockConditions) {
        builder.AddUnlockCondition(condition);
    }
    for (const auto& feature : features) {
        builder.AddFeature(feature);
    }
    return builder.Build(params);
}

Amount MinimumBasicDeposit(const Address& address, const ProtocolParameters& params) {
    Output output;
    output.unlockConditions_.push_back(AddressUnlockCondition{address});
    return params.MinimumStorageDeposit(output);
}

} // namespace stardust
