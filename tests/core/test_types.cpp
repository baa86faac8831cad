// STARDUST - Core Types Tests
// Copyright (c) 2024 STARDUST Developers
// MIT License

#include <gtest/gtest.h>
#include "stardust/core/types.h"
#include "stardust/core/hex.h"
#include "stardust/core/uint256.h"

#include <array>
#include <stdexcept>

namespace stardust {
namespace test {

// ============================================================================
// Hash256 Tests
// ============================================================================

TEST(Hash256Test, DefaultConstructorCreatesZeroHash) {
    Hash256 h;
    EXPECT_TRUE(h.IsNull());
    EXPECT_EQ(h.size(), 32u);
}

TEST(Hash256Test, ConstructFromBytes) {
    std::array<Byte, 32> data;
    for (size_t i = 0; i < 32; ++i) {
        data[i] = static_cast<Byte>(i);
    }
    Hash256 h(data);
    for (size_t i = 0; i < 32; ++i) {
        EXPECT_EQ(h[i], i);
    }
    EXPECT_FALSE(h.IsNull());
}

TEST(Hash256Test, OrderingFollowsBytes) {
    std::array<Byte, 32> low{}, high{};
    high[0] = 0x01;
    EXPECT_LT(Hash256(low), Hash256(high));
    EXPECT_FALSE(Hash256(high) < Hash256(low));
}

TEST(Hash256Test, HexRoundTrip) {
    const std::string hex = "0xfd477686e642855f2ead5931a8ee152fa9e8c52882bb291a3c02a7738ab74647";
    Hash256 h = Hash256::FromHex(hex);
    EXPECT_EQ(h[0], 0xfd);
    EXPECT_EQ(h[31], 0x47);
    EXPECT_EQ(h.ToHex(), hex);
    EXPECT_EQ(Hash256::FromHex(hex.substr(2)), h);
}

TEST(Hash256Test, FromHexRejectsMalformed) {
    EXPECT_THROW(Hash256::FromHex("0x1234"), std::invalid_argument);
    EXPECT_THROW(Hash256::FromHex(std::string(64, 'z')), std::invalid_argument);
}

TEST(ErrorCodeTest, WalletErrorCarriesCode) {
    WalletError e(ErrorCode::Overflow, "boom");
    EXPECT_EQ(e.GetCode(), ErrorCode::Overflow);
    EXPECT_STREQ(e.what(), "boom");
    EXPECT_STRNE(ErrorCodeToString(ErrorCode::Overflow), "");
}

// ============================================================================
// Hex Tests
// ============================================================================

TEST(HexTest, EncodeDecode) {
    std::vector<Byte> bytes = {0x00, 0x01, 0xab, 0xff};
    EXPECT_EQ(BytesToHex(bytes), "0001abff");
    EXPECT_EQ(HexToBytes("0001abff"), bytes);
    EXPECT_EQ(HexToBytes("0x0001ABFF"), bytes);
}

TEST(HexTest, TryParseRejectsOddLengthAndJunk) {
    EXPECT_FALSE(TryParseHex("abc").has_value());
    EXPECT_FALSE(TryParseHex("0xgg").has_value());
    EXPECT_TRUE(TryParseHex("").has_value());
}

// ============================================================================
// U256 Tests
// ============================================================================

TEST(U256Test, CheckedAddDetectsOverflow) {
    U256 result;
    EXPECT_FALSE(U256::Max().CheckedAdd(U256(1), result));

    ASSERT_TRUE(U256(UINT64_MAX).CheckedAdd(U256(1), result));
    EXPECT_FALSE(result.FitsUint64());
    EXPECT_EQ(result.ToHex(), "0x10000000000000000");
}

TEST(U256Test, CheckedSubDetectsUnderflow) {
    U256 result;
    EXPECT_FALSE(U256(1).CheckedSub(U256(2), result));
    ASSERT_TRUE(U256(100).CheckedSub(U256(58), result));
    EXPECT_EQ(result, U256(42));
}

TEST(U256Test, DecimalAndHexText) {
    auto big = U256::FromString("340282366920938463463374607431768211456");
    ASSERT_TRUE(big.has_value());
    EXPECT_EQ(big->ToHex(), "0x100000000000000000000000000000000");
    EXPECT_EQ(big->ToString(), "340282366920938463463374607431768211456");

    EXPECT_EQ(U256().ToHex(), "0x0");
    EXPECT_EQ(U256().ToString(), "0");
    EXPECT_EQ(U256::FromHex("0x64"), U256(100));
    EXPECT_FALSE(U256::FromHex("0x" + std::string(65, 'f')).has_value());
    EXPECT_FALSE(U256::FromString("12a").has_value());
}

TEST(U256Test, LittleEndianWireForm) {
    auto bytes = U256(0x0102).ToLittleEndian();
    EXPECT_EQ(bytes[0], 0x02);
    EXPECT_EQ(bytes[1], 0x01);
    for (size_t i = 2; i < bytes.size(); ++i) {
        EXPECT_EQ(bytes[i], 0);
    }
    EXPECT_EQ(U256::FromLittleEndian(bytes), U256(0x0102));
}

TEST(U256Test, Comparison) {
    EXPECT_LT(U256(1), U256(2));
    EXPECT_GT(U256::Max(), U256(UINT64_MAX));
    EXPECT_TRUE(U256().IsZero());
}

} // namespace test
} // namespace stardust
