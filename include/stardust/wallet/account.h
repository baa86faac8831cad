// STARDUST - Account State
// Copyright (c) 2024 STARDUST Developers
// MIT License
//
// An account owns the unspent outputs known for its addresses and tracks
// which of them are being spent. It is an explicit object owned by the
// caller; every mutation takes the account's own mutex so different
// accounts never block each other.

#ifndef STARDUST_WALLET_ACCOUNT_H
#define STARDUST_WALLET_ACCOUNT_H

#include "stardust/core/address.h"
#include "stardust/core/output.h"
#include "stardust/core/protocol.h"
#include "stardust/core/transaction.h"
#include "stardust/core/types.h"
#include "stardust/wallet/balance.h"

#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace stardust {
namespace wallet {

class SignerSession;

// ============================================================================
// Wallet Output
// ============================================================================

/// Local status of an owned output
enum class OutputStatus {
    Available,      // Unspent, free for selection
    Reserved,       // Selected by a build whose submission is in flight
    PendingSpent,   // Spent by an accepted transaction awaiting inclusion
};

const char* OutputStatusToString(OutputStatus status);

/**
 * An output owned by the account together with its ledger metadata.
 */
class WalletOutput {
public:
    OutputId outputId;
    Output output;

    /// Block that created the output
    BlockId blockId;
    uint32_t milestoneIndex{0};
    uint32_t milestoneTimestamp{0};

    OutputStatus status{OutputStatus::Available};

    /// Spending transaction while PendingSpent
    TransactionId spentBy;

    WalletOutput() = default;
    WalletOutput(const OutputId& id, const Output& out) : outputId(id), output(out) {}

    Amount GetValue() const { return output.GetAmount(); }

    /// Basic output, Available, no storage deposit return, not timelocked
    /// and unlockable now by one of `owned`
    bool IsSpendable(const std::set<Address>& owned, uint32_t now) const;
};

/// Balance view of an account
struct AccountBalance {
    /// Everything held, including outputs being spent
    Balance total;

    /// What input selection can use right now
    Balance available;

    /// Base amount of Reserved and PendingSpent outputs
    Amount pendingAmount{0};

    /// Base amount held but not spendable: timelocked outputs, outputs
    /// expired to another address and storage deposit returns owed
    Amount lockedAmount{0};

    /// Sum of the minimum storage deposits of all held outputs
    Amount requiredStorageDeposit{0};
};

// ============================================================================
// Account
// ============================================================================

class Account {
public:
    /// Confirmations GetConfirmation() remembers; the oldest are dropped first
    static constexpr size_t MAX_RECORDED_CONFIRMATIONS = 1024;

    Account(uint32_t index, ProtocolParameters params, std::string alias = "");

    Account(const Account&) = delete;
    Account& operator=(const Account&) = delete;

    uint32_t GetIndex() const { return index_; }
    const std::string& GetAlias() const { return alias_; }
    const ProtocolParameters& GetParams() const { return params_; }

    /// Hold the account lock across several calls. Recursive, so member
    /// calls made while holding it do not deadlock.
    std::unique_lock<std::recursive_mutex> Lock() const {
        return std::unique_lock<std::recursive_mutex>(mutex_);
    }

    // ========================================================================
    // Addresses
    // ========================================================================

    void AddAddress(const Address& address);

    /// Also registers the address as owned
    void SetChangeAddress(const Address& address);

    /// Change address, or the first address when none was set
    std::optional<Address> GetChangeAddress() const;

    std::vector<Address> GetAddresses() const;
    bool IsOwnAddress(const Address& address) const;

    /// Derive `count` receive addresses and one change address through the
    /// signer and register them. Returns false if the session refuses.
    bool DeriveAddresses(SignerSession& session, uint32_t count);

    // ========================================================================
    // Outputs
    // ========================================================================

    /// False if the output is already known
    bool AddOutput(const WalletOutput& output);

    bool RemoveOutput(const OutputId& id);

    std::optional<WalletOutput> GetOutput(const OutputId& id) const;

    /// Snapshot copy of all outputs
    std::vector<WalletOutput> GetOutputs() const;

    /// Outputs input selection may use at `now`
    std::vector<WalletOutput> GetSpendableOutputs(uint32_t now) const;

    size_t OutputCount() const;

    /**
     * Replace the known outputs with `unspent` (the ledger's view). Outputs
     * that are still unspent keep their local Reserved/PendingSpent mark.
     */
    void ReplaceOutputs(const std::vector<WalletOutput>& unspent);

    /**
     * Begin a sync. The ledger view fetched afterwards may predate a
     * SettleConfirmed() that runs before ReplaceOutputs(unspent, marker);
     * outputs settled in between are not added back.
     */
    uint64_t BeginSync();

    /// ReplaceOutputs() for a sync started with BeginSync(); ends that sync
    void ReplaceOutputs(const std::vector<WalletOutput>& unspent, uint64_t syncMarker);

    /// End a sync that will not replace the outputs
    void AbandonSync(uint64_t syncMarker);

    // ========================================================================
    // Spending
    // ========================================================================

    /// Available -> Reserved for all ids, or for none
    bool Reserve(const std::vector<OutputId>& ids);

    /// Reserved -> Available
    void ReleaseReservation(const std::vector<OutputId>& ids);

    /// Reserved/Available -> PendingSpent by `txid`
    void MarkPendingSpent(const std::vector<OutputId>& ids, const TransactionId& txid);

    /// Inputs currently PendingSpent by `txid`
    std::vector<OutputId> GetPendingInputs(const TransactionId& txid) const;

    /// Remove the inputs of an included transaction; returns how many
    size_t SettleConfirmed(const TransactionId& txid, const BlockId& blockId);

    /// Make the inputs of a conflicting transaction Available again
    size_t RevertPending(const TransactionId& txid);

    /// Block recorded by SettleConfirmed(), among the last
    /// MAX_RECORDED_CONFIRMATIONS settled transactions
    std::optional<BlockId> GetConfirmation(const TransactionId& txid) const;

    size_t ConfirmationCount() const;

    // ========================================================================
    // Balance
    // ========================================================================

    /// Computed over a snapshot; the lock is not held while aggregating.
    /// Throws WalletError(Overflow).
    AccountBalance GetBalance(uint32_t now) const;

private:
    uint32_t index_;
    ProtocolParameters params_;
    std::string alias_;

    mutable std::recursive_mutex mutex_;

    std::vector<Address> addresses_;
    std::set<Address> addressSet_;
    std::optional<Address> changeAddress_;

    std::map<OutputId, WalletOutput> outputs_;
    std::map<TransactionId, BlockId> confirmations_;
    std::deque<TransactionId> confirmationOrder_;

    // Settle sequence number per output removed while a sync is running
    uint64_t settleSequence_{0};
    std::map<OutputId, uint64_t> settledDuringSync_;
    std::multiset<uint64_t> activeSyncs_;

    /// Caller must hold the lock
    void EndSyncLocked(uint64_t syncMarker);
    void ReplaceOutputsLocked(const std::vector<WalletOutput>& unspent,
                              std::optional<uint64_t> syncMarker);
};

} // namespace wallet
} // namespace stardust

#endif // STARDUST_WALLET_ACCOUNT_H
