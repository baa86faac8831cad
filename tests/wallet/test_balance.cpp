// STARDUST - Balance Aggregation Tests
// Copyright (c) 2024 STARDUST Developers
// MIT License

#include <gtest/gtest.h>
#include "stardust/wallet/balance.h"

#include <cstdint>
#include <vector>

namespace stardust {
namespace wallet {
namespace test {

class BalanceTest : public ::testing::Test {
protected:
    void SetUp() override {
        owner = Address::Ed25519(Hash256::FromHex(std::string(64, '1')));
        tokenA = *NativeTokenId::FromHex(
            "0x082a1d58d3d725f9d3af50699c2cfa022274b199a9f4060b2331bf059e285bd2730100000000");
        tokenB = *NativeTokenId::FromHex(
            "0x082a1d58d3d725f9d3af50699c2cfa022274b199a9f4060b2331bf059e285bd2730200000000");
        // Large amounts without the default supply cap
        params.tokenSupply = UINT64_MAX;
    }

    Output Make(Amount amount, std::vector<NativeToken> tokens = {}) {
        auto result = OutputBuilder::Basic()
            .SetAmount(amount)
            .SetNativeTokens(std::move(tokens))
            .AddUnlockCondition(AddressUnlockCondition{owner})
            .Build(params);
        EXPECT_TRUE(result.success) << result.error;
        return result.output;
    }

    ProtocolParameters params;
    Address owner;
    NativeTokenId tokenA;
    NativeTokenId tokenB;
};

TEST_F(BalanceTest, EmptyIsZero) {
    Balance balance = ComputeBalance({});
    EXPECT_TRUE(balance.IsEmpty());
    EXPECT_EQ(balance.GetNativeToken(tokenA), U256());
}

TEST_F(BalanceTest, SumsBaseAndTokens) {
    Balance balance = ComputeBalance({
        Make(100000, {NativeToken(tokenA, U256(10))}),
        Make(200000, {NativeToken(tokenA, U256(5)), NativeToken(tokenB, U256(1))}),
        Make(50000),
    });
    EXPECT_EQ(balance.baseAmount, 350000u);
    EXPECT_EQ(balance.GetNativeToken(tokenA), U256(15));
    EXPECT_EQ(balance.GetNativeToken(tokenB), U256(1));
    EXPECT_EQ(balance.nativeTokens.size(), 2u);
}

TEST_F(BalanceTest, BaseOverflowIsFatal) {
    std::vector<Output> outputs = {Make(UINT64_MAX / 2 + 1), Make(UINT64_MAX / 2 + 1)};
    try {
        ComputeBalance(outputs);
        FAIL() << "expected overflow";
    } catch (const WalletError& e) {
        EXPECT_EQ(e.GetCode(), ErrorCode::Overflow);
    }
}

TEST_F(BalanceTest, TokenOverflowIsFatal) {
    std::vector<Output> outputs = {
        Make(100000, {NativeToken(tokenA, U256::Max())}),
        Make(100000, {NativeToken(tokenA, U256(1))}),
    };
    try {
        ComputeBalance(outputs);
        FAIL() << "expected overflow";
    } catch (const WalletError& e) {
        EXPECT_EQ(e.GetCode(), ErrorCode::Overflow);
    }
}

TEST_F(BalanceTest, MergeMatchesSequentialAdd) {
    std::vector<Output> first = {Make(100000, {NativeToken(tokenA, U256(3))})};
    std::vector<Output> second = {Make(70000), Make(80000, {NativeToken(tokenB, U256(9))})};

    Balance merged = ComputeBalance(first);
    merged.Merge(ComputeBalance(second));

    std::vector<Output> all = first;
    all.insert(all.end(), second.begin(), second.end());
    EXPECT_EQ(merged, ComputeBalance(all));
}

TEST_F(BalanceTest, TransactionBalanceRequiresExactTotals) {
    std::vector<Output> consumed = {Make(100000, {NativeToken(tokenA, U256(10))}),
                                    Make(100000)};
    std::vector<Output> created = {Make(150000, {NativeToken(tokenA, U256(10))}),
                                   Make(50000)};
    EXPECT_TRUE(CheckTransactionBalance(consumed, created));

    std::vector<Output> burned = {Make(200000, {NativeToken(tokenA, U256(9))})};
    EXPECT_FALSE(CheckTransactionBalance(consumed, burned));
}

} // namespace test
} // namespace wallet
} // namespace stardust
