// STARDUST - Account State Tests
// Copyright (c) 2024 STARDUST Developers
// MIT License

#include <gtest/gtest.h>
#include "stardust/wallet/account.h"
#include "stardust/wallet/signer.h"
#include "test_fixtures.h"

#include <memory>

namespace stardust {
namespace wallet {
namespace test {

using stardust::test::MakeBasicOutput;
using stardust::test::MakeWalletOutput;
using stardust::test::TestAddress;
using stardust::test::TestOutputId;
using stardust::test::TestToken;

class AccountTest : public ::testing::Test {
protected:
    void SetUp() override {
        owner = TestAddress('1');
        stranger = TestAddress('2');
        account.reset(new Account(0, params));
        account->AddAddress(owner);
    }

    WalletOutput Add(char fill, Amount amount, std::vector<NativeToken> tokens = {}) {
        WalletOutput out = MakeWalletOutput(TestOutputId(fill),
                                            MakeBasicOutput(params, owner, amount, tokens));
        EXPECT_TRUE(account->AddOutput(out));
        return out;
    }

    ProtocolParameters params;
    Address owner;
    Address stranger;
    std::unique_ptr<Account> account;
};

// ============================================================================
// Addresses
// ============================================================================

TEST_F(AccountTest, DefaultAlias) {
    EXPECT_EQ(account->GetAlias(), "account-0");
    Account named(3, params, "savings");
    EXPECT_EQ(named.GetAlias(), "savings");
    EXPECT_EQ(named.GetIndex(), 3u);
}

TEST_F(AccountTest, ChangeAddressFallsBackToFirst) {
    EXPECT_EQ(account->GetChangeAddress(), owner);

    account->SetChangeAddress(stranger);
    EXPECT_EQ(account->GetChangeAddress(), stranger);
    EXPECT_TRUE(account->IsOwnAddress(stranger));
    EXPECT_EQ(account->GetAddresses().size(), 2u);

    Account empty(1, params);
    EXPECT_FALSE(empty.GetChangeAddress().has_value());
}

TEST_F(AccountTest, DeriveAddressesThroughSigner) {
    SecureSigner signer(std::make_shared<MemorySecretBackend>(), 1000);
    std::array<Byte, MASTER_SEED_SIZE> seed{};
    seed.fill(0x42);
    ASSERT_TRUE(signer.Initialize("pw", seed));
    auto unlocked = signer.Unlock("pw");
    ASSERT_TRUE(unlocked.success);

    Account derived(2, params);
    ASSERT_TRUE(derived.DeriveAddresses(*unlocked.session, 3));
    EXPECT_EQ(derived.GetAddresses().size(), 4u);
    EXPECT_TRUE(signer.HasAddress(*derived.GetChangeAddress()));

    unlocked.session->Release();
    Account locked(3, params);
    EXPECT_FALSE(locked.DeriveAddresses(*unlocked.session, 1));
}

// ============================================================================
// Outputs and Status
// ============================================================================

TEST_F(AccountTest, AddOutputRejectsDuplicates) {
    WalletOutput out = Add('a', 100000);
    EXPECT_FALSE(account->AddOutput(out));
    EXPECT_EQ(account->OutputCount(), 1u);
    EXPECT_TRUE(account->RemoveOutput(out.outputId));
    EXPECT_FALSE(account->RemoveOutput(out.outputId));
}

TEST_F(AccountTest, SpendableExcludesForeignAndLocked) {
    Add('a', 100000);

    // Owned by someone else
    account->AddOutput(MakeWalletOutput(TestOutputId('b'),
                                        MakeBasicOutput(params, stranger, 100000)));

    // Timelocked until 2000
    auto timelocked = OutputBuilder::Basic()
        .SetAmount(100000)
        .AddUnlockCondition(AddressUnlockCondition{owner})
        .AddUnlockCondition(TimelockUnlockCondition{2000})
        .Build(params);
    ASSERT_TRUE(timelocked.success);
    account->AddOutput(MakeWalletOutput(TestOutputId('c'), timelocked.output));

    // Owes a storage deposit return
    auto sdr = OutputBuilder::Basic()
        .SetAmount(100000)
        .AddUnlockCondition(AddressUnlockCondition{owner})
        .AddUnlockCondition(StorageDepositReturnUnlockCondition{stranger, 42600})
        .Build(params);
    ASSERT_TRUE(sdr.success);
    account->AddOutput(MakeWalletOutput(TestOutputId('e'), sdr.output));

    auto spendable = account->GetSpendableOutputs(1000);
    ASSERT_EQ(spendable.size(), 1u);
    EXPECT_EQ(spendable[0].outputId, TestOutputId('a'));

    EXPECT_EQ(account->GetSpendableOutputs(2000).size(), 2u);
}

TEST_F(AccountTest, ExpiredOutputMovesToReturnAddress) {
    auto expiring = OutputBuilder::Basic()
        .SetAmount(100000)
        .AddUnlockCondition(AddressUnlockCondition{owner})
        .AddUnlockCondition(ExpirationUnlockCondition{stranger, 5000})
        .Build(params);
    ASSERT_TRUE(expiring.success);
    account->AddOutput(MakeWalletOutput(TestOutputId('a'), expiring.output));

    EXPECT_EQ(account->GetSpendableOutputs(4999).size(), 1u);
    EXPECT_TRUE(account->GetSpendableOutputs(5000).empty());
}

TEST_F(AccountTest, ReserveIsAllOrNothing) {
    Add('a', 100000);
    Add('b', 100000);

    EXPECT_FALSE(account->Reserve({TestOutputId('a'), TestOutputId('5')}));
    EXPECT_EQ(account->GetOutput(TestOutputId('a'))->status, OutputStatus::Available);

    ASSERT_TRUE(account->Reserve({TestOutputId('a')}));
    EXPECT_FALSE(account->Reserve({TestOutputId('a'), TestOutputId('b')}));
    EXPECT_EQ(account->GetOutput(TestOutputId('b'))->status, OutputStatus::Available);

    account->ReleaseReservation({TestOutputId('a')});
    EXPECT_EQ(account->GetOutput(TestOutputId('a'))->status, OutputStatus::Available);
}

TEST_F(AccountTest, PendingLifecycleConfirmed) {
    Add('a', 100000);
    Add('b', 100000);
    TransactionId txid = TransactionId::FromHex(std::string(64, '7'));
    BlockId block = BlockId::FromHex(std::string(64, '8'));

    account->MarkPendingSpent({TestOutputId('a'), TestOutputId('5')}, txid);
    EXPECT_EQ(account->GetPendingInputs(txid).size(), 1u);
    EXPECT_TRUE(account->GetSpendableOutputs(0).size() == 1u);

    EXPECT_EQ(account->SettleConfirmed(txid, block), 1u);
    EXPECT_FALSE(account->GetOutput(TestOutputId('a')).has_value());
    EXPECT_EQ(account->OutputCount(), 1u);
    EXPECT_EQ(account->GetConfirmation(txid), block);
}

TEST_F(AccountTest, PendingLifecycleReverted) {
    Add('a', 100000);
    TransactionId txid = TransactionId::FromHex(std::string(64, '7'));

    account->MarkPendingSpent({TestOutputId('a')}, txid);
    EXPECT_EQ(account->RevertPending(txid), 1u);

    auto out = account->GetOutput(TestOutputId('a'));
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->status, OutputStatus::Available);
    EXPECT_TRUE(out->spentBy.IsNull());
    EXPECT_FALSE(account->GetConfirmation(txid).has_value());
}

TEST_F(AccountTest, ReplaceOutputsKeepsLocalMarks) {
    Add('a', 100000);
    Add('b', 100000);
    TransactionId txid = TransactionId::FromHex(std::string(64, '7'));
    account->MarkPendingSpent({TestOutputId('a')}, txid);

    std::vector<WalletOutput> ledger = {
        MakeWalletOutput(TestOutputId('a'), MakeBasicOutput(params, owner, 100000)),
        MakeWalletOutput(TestOutputId('c'), MakeBasicOutput(params, owner, 300000)),
    };
    ledger[1].status = OutputStatus::PendingSpent;
    account->ReplaceOutputs(ledger);

    EXPECT_EQ(account->OutputCount(), 2u);
    EXPECT_EQ(account->GetOutput(TestOutputId('a'))->status, OutputStatus::PendingSpent);
    EXPECT_EQ(account->GetOutput(TestOutputId('a'))->spentBy, txid);
    EXPECT_EQ(account->GetOutput(TestOutputId('c'))->status, OutputStatus::Available);
    EXPECT_FALSE(account->GetOutput(TestOutputId('b')).has_value());
}

TEST_F(AccountTest, SyncDoesNotRestoreOutputsSettledMeanwhile) {
    Add('a', 100000);
    Add('b', 100000);
    TransactionId txid = TransactionId::FromHex(std::string(64, '7'));
    account->MarkPendingSpent({TestOutputId('a')}, txid);

    // Ledger view taken before the settle
    std::vector<WalletOutput> ledger = account->GetOutputs();
    uint64_t marker = account->BeginSync();
    ASSERT_EQ(account->SettleConfirmed(txid, BlockId::FromHex(std::string(64, '8'))), 1u);

    account->ReplaceOutputs(ledger, marker);
    EXPECT_FALSE(account->GetOutput(TestOutputId('a')).has_value());
    EXPECT_TRUE(account->GetOutput(TestOutputId('b')).has_value());

    // A sync started after the settle trusts the ledger again
    uint64_t later = account->BeginSync();
    account->ReplaceOutputs(ledger, later);
    EXPECT_TRUE(account->GetOutput(TestOutputId('a')).has_value());
}

TEST_F(AccountTest, AbandonedSyncLeavesOtherSyncGuarded) {
    Add('a', 100000);
    TransactionId txid = TransactionId::FromHex(std::string(64, '7'));
    account->MarkPendingSpent({TestOutputId('a')}, txid);
    std::vector<WalletOutput> ledger = account->GetOutputs();

    uint64_t first = account->BeginSync();
    uint64_t second = account->BeginSync();
    account->SettleConfirmed(txid, BlockId::FromHex(std::string(64, '8')));
    account->AbandonSync(first);

    // The other sync still began before the settle
    account->ReplaceOutputs(ledger, second);
    EXPECT_EQ(account->OutputCount(), 0u);
}

TEST_F(AccountTest, ConfirmationHistoryIsBounded) {
    BlockId block = BlockId::FromHex(std::string(64, '8'));
    auto txidOf = [](size_t i) {
        std::string hex = std::to_string(i);
        return TransactionId::FromHex(std::string(64 - hex.size(), '0') + hex);
    };

    const size_t total = Account::MAX_RECORDED_CONFIRMATIONS + 5;
    for (size_t i = 0; i < total; ++i) {
        account->SettleConfirmed(txidOf(i), block);
    }
    // Settling again does not count twice
    account->SettleConfirmed(txidOf(total - 1), block);

    EXPECT_EQ(account->ConfirmationCount(), Account::MAX_RECORDED_CONFIRMATIONS);
    EXPECT_FALSE(account->GetConfirmation(txidOf(0)).has_value());
    EXPECT_FALSE(account->GetConfirmation(txidOf(4)).has_value());
    EXPECT_EQ(account->GetConfirmation(txidOf(5)), block);
    EXPECT_EQ(account->GetConfirmation(txidOf(total - 1)), block);
}

// ============================================================================
// Balance
// ============================================================================

TEST_F(AccountTest, BalanceSplitsAvailablePendingLocked) {
    NativeTokenId token = TestToken(1);
    Add('a', 100000, {NativeToken(token, U256(25))});
    Add('b', 200000);

    auto timelocked = OutputBuilder::Basic()
        .SetAmount(70000)
        .AddUnlockCondition(AddressUnlockCondition{owner})
        .AddUnlockCondition(TimelockUnlockCondition{2000})
        .Build(params);
    ASSERT_TRUE(timelocked.success);
    account->AddOutput(MakeWalletOutput(TestOutputId('c'), timelocked.output));

    auto sdr = OutputBuilder::Basic()
        .SetAmount(90000)
        .AddUnlockCondition(AddressUnlockCondition{owner})
        .AddUnlockCondition(StorageDepositReturnUnlockCondition{stranger, 50000})
        .Build(params);
    ASSERT_TRUE(sdr.success);
    account->AddOutput(MakeWalletOutput(TestOutputId('e'), sdr.output));

    account->MarkPendingSpent({TestOutputId('b')},
                              TransactionId::FromHex(std::string(64, '7')));

    AccountBalance balance = account->GetBalance(1000);
    EXPECT_EQ(balance.total.baseAmount, 460000u);
    EXPECT_EQ(balance.total.GetNativeToken(token), U256(25));
    EXPECT_EQ(balance.available.baseAmount, 100000u);
    EXPECT_EQ(balance.available.GetNativeToken(token), U256(25));
    EXPECT_EQ(balance.pendingAmount, 200000u);
    EXPECT_EQ(balance.lockedAmount, 70000u + 50000u);

    Amount deposits = 0;
    for (const auto& out : account->GetOutputs()) {
        deposits += params.MinimumStorageDeposit(out.output);
    }
    EXPECT_EQ(balance.requiredStorageDeposit, deposits);
}

TEST_F(AccountTest, BalanceOverflowIsFatal) {
    ProtocolParameters unlimited = params;
    unlimited.tokenSupply = UINT64_MAX;
    Account big(5, unlimited);
    big.AddAddress(owner);
    big.AddOutput(MakeWalletOutput(TestOutputId('a'),
                                   MakeBasicOutput(unlimited, owner, UINT64_MAX - 10)));
    big.AddOutput(MakeWalletOutput(TestOutputId('b'),
                                   MakeBasicOutput(unlimited, owner, 100000)));
    try {
        big.GetBalance(0);
        FAIL() << "expected overflow";
    } catch (const WalletError& e) {
        EXPECT_EQ(e.GetCode(), ErrorCode::Overflow);
    }
}

} // namespace test
} // namespace wallet
} // namespace stardust
