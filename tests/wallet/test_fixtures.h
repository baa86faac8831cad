// STARDUST - Wallet Test Helpers
// Copyright (c) 2024 STARDUST Developers
// MIT License

#ifndef STARDUST_TESTS_WALLET_TEST_FIXTURES_H
#define STARDUST_TESTS_WALLET_TEST_FIXTURES_H

#include <gtest/gtest.h>
#include "stardust/core/output.h"
#include "stardust/core/transaction.h"
#include "stardust/wallet/account.h"

#include <string>
#include <vector>

namespace stardust {
namespace test {

/// Ed25519 address whose hash is `fill` repeated
inline Address TestAddress(char fill) {
    return Address::Ed25519(Hash256::FromHex(std::string(64, fill)));
}

inline OutputId TestOutputId(char fill, uint16_t index = 0) {
    return OutputId(TransactionId::FromHex(std::string(64, fill)), index);
}

inline NativeTokenId TestToken(uint32_t serial) {
    return NativeTokenId::FromFoundry(
        Address::Alias(Hash256::FromHex(std::string(64, 'f'))), serial, 0);
}

inline Output MakeBasicOutput(const ProtocolParameters& params, const Address& owner,
                              Amount amount, std::vector<NativeToken> tokens = {}) {
    auto result = OutputBuilder::Basic()
        .SetAmount(amount)
        .SetNativeTokens(std::move(tokens))
        .AddUnlockCondition(AddressUnlockCondition{owner})
        .Build(params);
    EXPECT_TRUE(result.success) << result.error;
    return result.output;
}

inline wallet::WalletOutput MakeWalletOutput(const OutputId& id, const Output& output) {
    wallet::WalletOutput out(id, output);
    out.blockId = BlockId::FromHex(std::string(64, 'd'));
    out.milestoneIndex = 100;
    out.milestoneTimestamp = 1700000000;
    return out;
}

} // namespace test
} // namespace stardust

#endif // STARDUST_TESTS_WALLET_TEST_FIXTURES_H
