// STARDUST - Output Model Tests
// Copyright (c) 2024 STARDUST Developers
// MIT License

#include <gtest/gtest.h>
#include "stardust/core/output.h"
#include "stardust/core/hex.h"
#include "stardust/core/protocol.h"

#include <string>
#include <vector>

namespace stardust {
namespace test {

// ============================================================================
// Test Fixture
// ============================================================================

class OutputTest : public ::testing::Test {
protected:
    void SetUp() override {
        owner = Address::Ed25519(Hash256::FromHex(
            "0x21fe31dfa154a261626bf854046fd2271b7bed4b6abe45aa58877ef47f9721b9"));
        sender = Address::Ed25519(Hash256::FromHex(
            "0x1111111111111111111111111111111111111111111111111111111111111111"));
        alias = Address::Alias(Hash256::FromHex(
            "0xfd477686e642855f2ead5931a8ee152fa9e8c52882bb291a3c02a7738ab74647"));
        tokenId = *NativeTokenId::FromHex(
            "0x082a1d58d3d725f9d3af50699c2cfa022274b199a9f4060b2331bf059e285bd2730100000000");
    }

    ProtocolParameters params;
    Address owner;
    Address sender;
    Address alias;
    NativeTokenId tokenId;
};

// ============================================================================
// Storage Deposit
// ============================================================================

TEST_F(OutputTest, MinimumBasicDeposit) {
    EXPECT_EQ(MinimumBasicDeposit(owner, params), 42600u);

    auto result = OutputBuilder::Basic()
        .SetMinimumAmount()
        .AddUnlockCondition(AddressUnlockCondition{owner})
        .Build(params);
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.output.GetSerializedSize(), 46u);
    EXPECT_EQ(result.output.GetAmount(), 42600u);
}

TEST_F(OutputTest, NativeTokenRaisesDeposit) {
    auto result = OutputBuilder::Basic()
        .SetMinimumAmount()
        .AddNativeToken(tokenId, U256(100))
        .AddUnlockCondition(AddressUnlockCondition{owner})
        .Build(params);
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.output.GetSerializedSize(), 116u);
    EXPECT_EQ(result.output.GetAmount(), 49600u);
}

TEST_F(OutputTest, AmountBelowDepositRejected) {
    auto result = OutputBuilder::Basic()
        .SetAmount(42599)
        .AddUnlockCondition(AddressUnlockCondition{owner})
        .Build(params);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.rule, OutputRule::AmountBelowStorageDeposit);
    EXPECT_EQ(result.GetErrorCode(), ErrorCode::InvalidOutput);
}

TEST_F(OutputTest, PluggableDepositFunction) {
    ProtocolParameters custom = params;
    custom.storageDeposit = [](size_t size) { return static_cast<Amount>(size); };
    auto result = OutputBuilder::Basic()
        .SetAmount(46)
        .AddUnlockCondition(AddressUnlockCondition{owner})
        .Build(custom);
    EXPECT_TRUE(result.success) << result.error;
}

// ============================================================================
// Builder Rules
// ============================================================================

TEST_F(OutputTest, TokenSenderMetadataExample) {
    std::vector<Byte> data(100, 0x42);
    auto result = OutputBuilder::Basic()
        .SetAmount(100000)
        .AddNativeToken(tokenId, U256(100))
        .AddUnlockCondition(AddressUnlockCondition{owner})
        .AddFeature(SenderFeature{sender})
        .AddFeature(MetadataFeature{data})
        .Build(params);
    ASSERT_TRUE(result.success) << result.error;

    const Output& out = result.output;
    EXPECT_EQ(out.GetUnlockConditions().size(), 1u);
    ASSERT_EQ(out.GetNativeTokens().size(), 1u);
    EXPECT_EQ(out.GetNativeTokens()[0].amount, U256(100));
    EXPECT_EQ(out.GetSerializedSize(), 153u + data.size());
    EXPECT_EQ(params.MinimumStorageDeposit(out), 100u * (533u + data.size()));
    EXPECT_GE(out.GetAmount(), params.MinimumStorageDeposit(out));
}

TEST_F(OutputTest, MissingAddressConditionRejected) {
    auto result = OutputBuilder::Basic()
        .SetAmount(100000)
        .AddNativeToken(tokenId, U256(100))
        .AddFeature(SenderFeature{sender})
        .AddFeature(MetadataFeature{{0x01}})
        .Build(params);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.rule, OutputRule::MissingUnlockCondition);
    EXPECT_EQ(result.GetErrorCode(), ErrorCode::InvalidOutput);
}

TEST_F(OutputTest, OrderIndependentEncoding) {
    auto a = OutputBuilder::Basic()
        .SetAmount(100000)
        .AddUnlockCondition(AddressUnlockCondition{owner})
        .AddUnlockCondition(TimelockUnlockCondition{1700000000})
        .AddFeature(SenderFeature{sender})
        .AddFeature(TagFeature{{0x74, 0x61, 0x67}})
        .Build(params);
    auto b = OutputBuilder::Basic()
        .AddFeature(TagFeature{{0x74, 0x61, 0x67}})
        .AddUnlockCondition(TimelockUnlockCondition{1700000000})
        .AddFeature(SenderFeature{sender})
        .AddUnlockCondition(AddressUnlockCondition{owner})
        .SetAmount(100000)
        .Build(params);
    ASSERT_TRUE(a.success && b.success);
    EXPECT_EQ(a.output.ToBytes(), b.output.ToBytes());
    EXPECT_EQ(a.output.GetHash(), b.output.GetHash());
    EXPECT_EQ(a.output.GetUnlockConditions()[0].GetType(), UnlockConditionType::Address);
}

TEST_F(OutputTest, DuplicatesRejected) {
    auto tokens = OutputBuilder::Basic()
        .SetAmount(100000)
        .AddNativeToken(tokenId, U256(1))
        .AddNativeToken(tokenId, U256(2))
        .AddUnlockCondition(AddressUnlockCondition{owner})
        .Build(params);
    EXPECT_EQ(tokens.rule, OutputRule::DuplicateNativeToken);

    auto features = OutputBuilder::Basic()
        .SetAmount(100000)
        .AddUnlockCondition(AddressUnlockCondition{owner})
        .AddFeature(SenderFeature{sender})
        .AddFeature(SenderFeature{owner})
        .Build(params);
    EXPECT_EQ(features.rule, OutputRule::DuplicateFeature);

    auto conditions = OutputBuilder::Basic()
        .SetAmount(100000)
        .AddUnlockCondition(AddressUnlockCondition{owner})
        .AddUnlockCondition(AddressUnlockCondition{sender})
        .Build(params);
    EXPECT_EQ(conditions.rule, OutputRule::DuplicateUnlockCondition);
}

TEST_F(OutputTest, AllowListsEnforced) {
    auto issuer = OutputBuilder::Basic()
        .SetAmount(100000)
        .AddUnlockCondition(AddressUnlockCondition{owner})
        .AddFeature(IssuerFeature{sender})
        .Build(params);
    EXPECT_EQ(issuer.rule, OutputRule::FeatureNotAllowed);

    auto controller = OutputBuilder::Basic()
        .SetAmount(100000)
        .AddUnlockCondition(AddressUnlockCondition{owner})
        .AddUnlockCondition(StateControllerAddressUnlockCondition{owner})
        .Build(params);
    EXPECT_EQ(controller.rule, OutputRule::UnlockConditionNotAllowed);
}

TEST_F(OutputTest, PayloadBounds) {
    auto empty = OutputBuilder::Basic()
        .SetAmount(100000)
        .AddUnlockCondition(AddressUnlockCondition{owner})
        .AddFeature(MetadataFeature{})
        .Build(params);
    EXPECT_EQ(empty.rule, OutputRule::MetadataLength);

    auto longTag = OutputBuilder::Basic()
        .SetAmount(100000)
        .AddUnlockCondition(AddressUnlockCondition{owner})
        .AddFeature(TagFeature{std::vector<Byte>(MAX_TAG_LENGTH + 1, 0x01)})
        .Build(params);
    EXPECT_EQ(longTag.rule, OutputRule::TagLength);

    auto zero = OutputBuilder::Basic()
        .SetAmount(100000)
        .AddNativeToken(tokenId, U256())
        .AddUnlockCondition(AddressUnlockCondition{owner})
        .Build(params);
    EXPECT_EQ(zero.rule, OutputRule::ZeroNativeTokenAmount);

    auto timelock = OutputBuilder::Basic()
        .SetAmount(100000)
        .AddUnlockCondition(AddressUnlockCondition{owner})
        .AddUnlockCondition(TimelockUnlockCondition{0})
        .Build(params);
    EXPECT_EQ(timelock.rule, OutputRule::InvalidTimestamp);
}

TEST_F(OutputTest, StorageDepositReturnBounds) {
    auto tooSmall = OutputBuilder::Basic()
        .SetAmount(100000)
        .AddUnlockCondition(AddressUnlockCondition{owner})
        .AddUnlockCondition(StorageDepositReturnUnlockCondition{sender, 1000})
        .Build(params);
    EXPECT_EQ(tooSmall.rule, OutputRule::InvalidStorageDepositReturn);

    auto ok = OutputBuilder::Basic()
        .SetAmount(100000)
        .AddUnlockCondition(AddressUnlockCondition{owner})
        .AddUnlockCondition(StorageDepositReturnUnlockCondition{sender, 42600})
        .Build(params);
    EXPECT_TRUE(ok.success) << ok.error;
}

TEST_F(OutputTest, AmountAboveSupplyRejected) {
    auto result = OutputBuilder::Basic()
        .SetAmount(params.tokenSupply + 1)
        .AddUnlockCondition(AddressUnlockCondition{owner})
        .Build(params);
    EXPECT_EQ(result.rule, OutputRule::AmountExceedsSupply);
}

// ============================================================================
// Chain Outputs
// ============================================================================

TEST_F(OutputTest, AliasOutputRequiresControllers) {
    auto missing = OutputBuilder::Alias(Hash256())
        .SetAmount(1000000)
        .AddUnlockCondition(StateControllerAddressUnlockCondition{owner})
        .Build(params);
    EXPECT_EQ(missing.rule, OutputRule::MissingUnlockCondition);

    auto result = OutputBuilder::Alias(Hash256())
        .SetAmount(1000000)
        .SetStateIndex(3)
        .AddUnlockCondition(GovernorAddressUnlockCondition{sender})
        .AddUnlockCondition(StateControllerAddressUnlockCondition{owner})
        .AddImmutableFeature(IssuerFeature{sender})
        .Build(params);
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.output.GetStateIndex(), 3u);
    EXPECT_EQ(result.output.GetUnlockAddress(0), owner);
}

TEST_F(OutputTest, FoundryTokenScheme) {
    SimpleTokenScheme scheme;
    scheme.mintedTokens = U256(50);
    scheme.maximumSupply = U256(1000);

    auto result = OutputBuilder::Foundry(1, scheme)
        .SetAmount(1000000)
        .AddUnlockCondition(ImmutableAliasAddressUnlockCondition{alias})
        .Build(params);
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.output.GetUnlockAddress(0), alias);

    auto notAlias = OutputBuilder::Foundry(1, scheme)
        .SetAmount(1000000)
        .AddUnlockCondition(ImmutableAliasAddressUnlockCondition{owner})
        .Build(params);
    EXPECT_EQ(notAlias.rule, OutputRule::InvalidAliasAddress);

    scheme.meltedTokens = U256(60);
    auto overMelted = OutputBuilder::Foundry(1, scheme)
        .SetAmount(1000000)
        .AddUnlockCondition(ImmutableAliasAddressUnlockCondition{alias})
        .Build(params);
    EXPECT_EQ(overMelted.rule, OutputRule::InvalidTokenScheme);
}

// ============================================================================
// Unlock Semantics
// ============================================================================

TEST_F(OutputTest, ExpirationHandsOverToReturnAddress) {
    auto result = OutputBuilder::Basic()
        .SetAmount(100000)
        .AddUnlockCondition(AddressUnlockCondition{owner})
        .AddUnlockCondition(ExpirationUnlockCondition{sender, 2000})
        .Build(params);
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.output.GetUnlockAddress(1999), owner);
    EXPECT_EQ(result.output.GetUnlockAddress(2000), sender);
}

TEST_F(OutputTest, Timelock) {
    auto result = OutputBuilder::Basic()
        .SetAmount(100000)
        .AddUnlockCondition(AddressUnlockCondition{owner})
        .AddUnlockCondition(TimelockUnlockCondition{2000})
        .Build(params);
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(result.output.IsTimelocked(1999));
    EXPECT_FALSE(result.output.IsTimelocked(2000));
}

// ============================================================================
// Encoding
// ============================================================================

TEST_F(OutputTest, DecodeRoundTrip) {
    auto result = OutputBuilder::Basic()
        .SetAmount(100000)
        .AddNativeToken(tokenId, U256(7))
        .AddUnlockCondition(AddressUnlockCondition{owner})
        .AddFeature(MetadataFeature{{0xde, 0xad}})
        .Build(params);
    ASSERT_TRUE(result.success);

    auto bytes = result.output.ToBytes();
    EXPECT_EQ(bytes[0], static_cast<Byte>(OutputType::Basic));
    auto decoded = Output::FromBytes(bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, result.output);
}

TEST_F(OutputTest, DecodeRejectsMalformed) {
    auto result = OutputBuilder::Basic()
        .SetAmount(100000)
        .AddUnlockCondition(AddressUnlockCondition{owner})
        .Build(params);
    ASSERT_TRUE(result.success);
    auto bytes = result.output.ToBytes();

    auto trailing = bytes;
    trailing.push_back(0x00);
    EXPECT_FALSE(Output::FromBytes(trailing).has_value());

    auto truncated = bytes;
    truncated.pop_back();
    EXPECT_FALSE(Output::FromBytes(truncated).has_value());

    auto badType = bytes;
    badType[0] = 0x02;
    EXPECT_FALSE(Output::FromBytes(badType).has_value());

    EXPECT_FALSE(Output::FromBytes({}).has_value());
}

TEST_F(OutputTest, FromExistingOutput) {
    auto original = OutputBuilder::Basic()
        .SetAmount(100000)
        .AddUnlockCondition(AddressUnlockCondition{owner})
        .AddFeature(TagFeature{{0x01}})
        .Build(params);
    ASSERT_TRUE(original.success);

    auto raised = OutputBuilder::From(original.output).SetAmount(250000).Build(params);
    ASSERT_TRUE(raised.success);
    EXPECT_EQ(raised.output.GetAmount(), 250000u);
    EXPECT_EQ(raised.output.GetFeatures(), original.output.GetFeatures());
}

} // namespace test
} // namespace stardust
