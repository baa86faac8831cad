// STARDUST - Account Synchronization Tests
// Copyright (c) 2024 STARDUST Developers
// MIT License

#include <gtest/gtest.h>
#include "stardust/wallet/sync.h"
#include "fake_node.h"
#include "test_fixtures.h"

namespace stardust {
namespace wallet {
namespace test {

using stardust::test::FakeNode;
using stardust::test::MakeBasicOutput;
using stardust::test::MakeWalletOutput;
using stardust::test::TestAddress;
using stardust::test::TestOutputId;

class SyncTest : public ::testing::Test {
protected:
    void SetUp() override {
        first = TestAddress('1');
        second = TestAddress('2');
        account.AddAddress(first);
        account.AddAddress(second);
    }

    client::OutputWithMetadata Unspent(char fill, const Address& owner, Amount amount) {
        client::OutputWithMetadata item;
        item.outputId = TestOutputId(fill);
        item.output = MakeBasicOutput(params, owner, amount);
        item.blockId = BlockId::FromHex(std::string(64, 'd'));
        item.milestoneIndex = 42;
        item.milestoneTimestamp = 1700000042;
        return item;
    }

    ProtocolParameters params;
    Account account{0, ProtocolParameters()};
    FakeNode node;
    Address first;
    Address second;
};

TEST_F(SyncTest, CollectsOutputsOfAllAddresses) {
    node.SetUnspent(first, {Unspent('a', first, 100000)});
    node.SetUnspent(second, {Unspent('b', second, 200000), Unspent('c', second, 300000)});

    SyncResult result = SyncAccount(account, node);
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.outputsBefore, 0u);
    EXPECT_EQ(result.outputsAfter, 3u);

    auto out = account.GetOutput(TestOutputId('b'));
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->milestoneIndex, 42u);
    EXPECT_EQ(out->milestoneTimestamp, 1700000042u);
    EXPECT_EQ(out->status, OutputStatus::Available);
    EXPECT_EQ(account.GetBalance(0).available.baseAmount, 600000u);
}

TEST_F(SyncTest, SpentOutputsDisappear) {
    node.SetUnspent(first, {Unspent('a', first, 100000), Unspent('b', first, 100000)});
    ASSERT_TRUE(SyncAccount(account, node).success);

    node.SetUnspent(first, {Unspent('b', first, 100000)});
    SyncResult result = SyncAccount(account, node);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.outputsBefore, 2u);
    EXPECT_EQ(result.outputsAfter, 1u);
    EXPECT_FALSE(account.GetOutput(TestOutputId('a')).has_value());
}

TEST_F(SyncTest, PendingMarkSurvivesWhileUnspent) {
    node.SetUnspent(first, {Unspent('a', first, 100000)});
    ASSERT_TRUE(SyncAccount(account, node).success);

    TransactionId txid = TransactionId::FromHex(std::string(64, '7'));
    account.MarkPendingSpent({TestOutputId('a')}, txid);

    ASSERT_TRUE(SyncAccount(account, node).success);
    auto out = account.GetOutput(TestOutputId('a'));
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->status, OutputStatus::PendingSpent);
    EXPECT_EQ(out->spentBy, txid);
}

TEST_F(SyncTest, NetworkFailureLeavesAccountUntouched) {
    account.AddOutput(MakeWalletOutput(TestOutputId('5'), MakeBasicOutput(params, first, 100000)));
    node.SetFetchFails(true);

    SyncResult result = SyncAccount(account, node);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, ErrorCode::NetworkError);
    EXPECT_EQ(account.OutputCount(), 1u);
    EXPECT_TRUE(account.GetOutput(TestOutputId('5')).has_value());
}

TEST_F(SyncTest, StaleFetchDoesNotRestoreSettledOutput) {
    node.SetUnspent(first, {Unspent('a', first, 100000), Unspent('b', first, 100000)});
    ASSERT_TRUE(SyncAccount(account, node).success);

    TransactionId txid = TransactionId::FromHex(std::string(64, '7'));
    BlockId block = BlockId::FromHex(std::string(64, '8'));
    account.MarkPendingSpent({TestOutputId('a')}, txid);

    // The node still answers with 'a'; the confirmation lands mid-sync
    bool settled = false;
    node.SetFetchHook([&]() {
        if (!settled) {
            settled = true;
            EXPECT_EQ(account.SettleConfirmed(txid, block), 1u);
        }
    });

    SyncResult result = SyncAccount(account, node);
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_TRUE(settled);
    EXPECT_FALSE(account.GetOutput(TestOutputId('a')).has_value());
    EXPECT_TRUE(account.GetOutput(TestOutputId('b')).has_value());
    EXPECT_EQ(result.outputsAfter, 1u);

    // Once the node catches up a later sync agrees
    node.SetFetchHook(nullptr);
    node.SetUnspent(first, {Unspent('b', first, 100000)});
    ASSERT_TRUE(SyncAccount(account, node).success);
    EXPECT_EQ(account.OutputCount(), 1u);
}

TEST_F(SyncTest, FailedSyncEndsCleanly) {
    node.SetUnspent(first, {Unspent('a', first, 100000)});
    ASSERT_TRUE(SyncAccount(account, node).success);

    node.SetFetchFails(true);
    EXPECT_FALSE(SyncAccount(account, node).success);

    // No sync is left open, so a settle is not remembered for later
    TransactionId txid = TransactionId::FromHex(std::string(64, '7'));
    account.MarkPendingSpent({TestOutputId('a')}, txid);
    account.SettleConfirmed(txid, BlockId::FromHex(std::string(64, '8')));

    node.SetFetchFails(false);
    ASSERT_TRUE(SyncAccount(account, node).success);
    EXPECT_TRUE(account.GetOutput(TestOutputId('a')).has_value());
}

} // namespace test
} // namespace wallet
} // namespace stardust
