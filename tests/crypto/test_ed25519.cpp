// STARDUST - Ed25519 Tests
// Copyright (c) 2024 STARDUST Developers
// MIT License

#include <gtest/gtest.h>
#include "stardust/crypto/ed25519.h"
#include "stardust/core/hex.h"

#include <array>
#include <string>
#include <vector>

namespace stardust {
namespace test {

// ============================================================================
// RFC 8032 Test 1
// ============================================================================

class Ed25519Test : public ::testing::Test {
protected:
    void SetUp() override {
        auto bytes = HexToBytes(
            "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60");
        std::copy(bytes.begin(), bytes.end(), seed.begin());
    }

    std::array<Byte, ed25519::SEED_SIZE> seed{};
};

TEST_F(Ed25519Test, PublicKeyFromSeed) {
    auto pk = Ed25519GetPublicKey(seed.data());
    ASSERT_TRUE(pk.has_value());
    EXPECT_EQ(BytesToHex(std::vector<Byte>(pk->begin(), pk->end())),
              "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a");
}

TEST_F(Ed25519Test, SignEmptyMessage) {
    Byte empty = 0;
    auto sig = Ed25519Sign(seed.data(), &empty, 0);
    ASSERT_TRUE(sig.has_value());
    EXPECT_EQ(BytesToHex(std::vector<Byte>(sig->begin(), sig->end())),
              "e5564300c360ac729086e2cc806e828a84877f1eb8e5d974d873e06522490155"
              "5fb8821590a33bacc61e39701cf9b46bd25bf5f0595bbe24655141438e7a100b");
}

TEST_F(Ed25519Test, VerifyAcceptsGenuineSignature) {
    auto pk = Ed25519GetPublicKey(seed.data());
    std::vector<Byte> msg = {0x01, 0x02, 0x03};
    auto sig = Ed25519Sign(seed.data(), msg.data(), msg.size());
    ASSERT_TRUE(pk && sig);
    EXPECT_TRUE(Ed25519Verify(*pk, msg.data(), msg.size(), *sig));
}

TEST_F(Ed25519Test, VerifyRejectsTampering) {
    auto pk = Ed25519GetPublicKey(seed.data());
    std::vector<Byte> msg = {0x01, 0x02, 0x03};
    auto sig = Ed25519Sign(seed.data(), msg.data(), msg.size());
    ASSERT_TRUE(pk && sig);

    std::vector<Byte> altered = msg;
    altered[0] ^= 0x01;
    EXPECT_FALSE(Ed25519Verify(*pk, altered.data(), altered.size(), *sig));

    Ed25519SignatureBytes badSig = *sig;
    badSig[10] ^= 0x80;
    EXPECT_FALSE(Ed25519Verify(*pk, msg.data(), msg.size(), badSig));

    Ed25519PublicKey otherKey = *pk;
    otherKey[0] ^= 0x01;
    EXPECT_FALSE(Ed25519Verify(otherKey, msg.data(), msg.size(), *sig));
}

} // namespace test
} // namespace stardust
