// STARDUST - Random Number Generation Tests
// Copyright (c) 2024 STARDUST Developers
// MIT License

#include <gtest/gtest.h>
#include "stardust/core/random.h"
#include "stardust/core/types.h"
#include <vector>
#include <set>
#include <algorithm>

using namespace stardust;

TEST(RandomTest, GetRandBytesNonZero) {
    std::vector<uint8_t> bytes(32);
    GetRandBytes(bytes.data(), bytes.size());

    bool allZero = std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; });
    EXPECT_FALSE(allZero);
}

TEST(RandomTest, GetRandBytesDifferent) {
    std::vector<uint8_t> bytes1(32);
    std::vector<uint8_t> bytes2(32);

    GetRandBytes(bytes1.data(), bytes1.size());
    GetRandBytes(bytes2.data(), bytes2.size());

    EXPECT_NE(bytes1, bytes2);
}

TEST(RandomTest, GetRandBytesZeroLength) {
    uint8_t dummy = 0;
    EXPECT_NO_THROW(GetRandBytes(&dummy, 0));
}

TEST(RandomTest, GetRandHash256) {
    std::set<Hash256> seen;
    for (int i = 0; i < 16; ++i) {
        Hash256 hash = GetRandHash256();
        EXPECT_FALSE(hash.IsNull());
        seen.insert(hash);
    }
    EXPECT_EQ(seen.size(), 16u);
}

TEST(RandomTest, GetRandUint64Varies) {
    std::set<uint64_t> seen;
    for (int i = 0; i < 16; ++i) {
        seen.insert(GetRandUint64());
    }
    EXPECT_GT(seen.size(), 1u);
}
