// STARDUST - Account State Implementation
// Copyright (c) 2024 STARDUST Developers
// MIT License

#include "stardust/wallet/account.h"
#include "stardust/util/logging.h"
#include "stardust/wallet/signer.h"

namespace stardust {
namespace wallet {

namespace {

void AddChecked(Amount& total, Amount value) {
    if (value > UINT64_MAX - total) {
        throw WalletError(ErrorCode::Overflow, "Account balance overflow");
    }
    total += value;
}

} // namespace

const char* OutputStatusToString(OutputStatus status) {
    switch (status) {
        case OutputStatus::Available:    return "available";
        case OutputStatus::Reserved:     return "reserved";
        case OutputStatus::PendingSpent: return "pending-spent";
        default:                         return "unknown";
    }
}

// ============================================================================
// WalletOutput
// ============================================================================

bool WalletOutput::IsSpendable(const std::set<Address>& owned, uint32_t now) const {
    if (status != OutputStatus::Available || !output.IsBasic()) {
        return false;
    }
    // Consuming it would require a return output; not handled by selection
    if (output.FindUnlockCondition<StorageDepositReturnUnlockCondition>() != nullptr) {
        return false;
    }
    if (output.IsTimelocked(now)) {
        return false;
    }
    return owned.count(output.GetUnlockAddress(now)) > 0;
}

// ============================================================================
// Account
// ============================================================================

Account::Account(uint32_t index, ProtocolParameters params, std::string alias)
    : index_(index), params_(std::move(params)), alias_(std::move(alias)) {
    if (alias_.empty()) {
        alias_ = "account-" + std::to_string(index_);
    }
}

void Account::AddAddress(const Address& address) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (addressSet_.insert(address).second) {
        addresses_.push_back(address);
    }
}

void Account::SetChangeAddress(const Address& address) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    AddAddress(address);
    changeAddress_ = address;
}

std::optional<Address> Account::GetChangeAddress() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (changeAddress_) {
        return changeAddress_;
    }
    if (addresses_.empty()) {
        return std::nullopt;
    }
    return addresses_.front();
}

std::vector<Address> Account::GetAddresses() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return addresses_;
}

bool Account::IsOwnAddress(const Address& address) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return addressSet_.count(address) > 0;
}

bool Account::DeriveAddresses(SignerSession& session, uint32_t count) {
    for (uint32_t i = 0; i < count; ++i) {
        AddressResult result = session.GenerateAddress(index_, 0, i);
        if (!result.success) {
            LOG_WARN(util::LogCategory::WALLET) << alias_ << ": address derivation failed: "
                                                << result.message;
            return false;
        }
        AddAddress(result.address);
    }

    AddressResult change = session.GenerateAddress(index_, 1, 0);
    if (!change.success) {
        LOG_WARN(util::LogCategory::WALLET) << alias_ << ": change derivation failed: "
                                            << change.message;
        return false;
    }
    SetChangeAddress(change.address);
    return true;
}

bool Account::AddOutput(const WalletOutput& output) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return outputs_.emplace(output.outputId, output).second;
}

bool Account::RemoveOutput(const OutputId& id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return outputs_.erase(id) > 0;
}

std::optional<WalletOutput> Account::GetOutput(const OutputId& id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = outputs_.find(id);
    if (it == outputs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<WalletOutput> Account::GetOutputs() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::vector<WalletOutput> result;
    result.reserve(outputs_.size());
    for (const auto& [id, out] : outputs_) {
        result.push_back(out);
    }
    return result;
}

std::vector<WalletOutput> Account::GetSpendableOutputs(uint32_t now) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::vector<WalletOutput> result;
    for (const auto& [id, out] : outputs_) {
        if (out.IsSpendable(addressSet_, now)) {
            result.push_back(out);
        }
    }
    return result;
}

size_t Account::OutputCount() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return outputs_.size();
}

void Account::ReplaceOutputs(const std::vector<WalletOutput>& unspent) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReplaceOutputsLocked(unspent, std::nullopt);
}

uint64_t Account::BeginSync() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    activeSyncs_.insert(settleSequence_);
    return settleSequence_;
}

void Account::ReplaceOutputs(const std::vector<WalletOutput>& unspent, uint64_t syncMarker) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReplaceOutputsLocked(unspent, syncMarker);
    EndSyncLocked(syncMarker);
}

void Account::AbandonSync(uint64_t syncMarker) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    EndSyncLocked(syncMarker);
}

void Account::EndSyncLocked(uint64_t syncMarker) {
    auto it = activeSyncs_.find(syncMarker);
    if (it != activeSyncs_.end()) {
        activeSyncs_.erase(it);
    }
    if (activeSyncs_.empty()) {
        settledDuringSync_.clear();
        return;
    }
    // Entries no running sync can still see in its ledger view
    const uint64_t oldest = *activeSyncs_.begin();
    for (auto entry = settledDuringSync_.begin(); entry != settledDuringSync_.end();) {
        if (entry->second <= oldest) {
            entry = settledDuringSync_.erase(entry);
        } else {
            ++entry;
        }
    }
}

void Account::ReplaceOutputsLocked(const std::vector<WalletOutput>& unspent,
                                   std::optional<uint64_t> syncMarker) {
    std::map<OutputId, WalletOutput> next;
    size_t skipped = 0;
    for (const auto& incoming : unspent) {
        if (syncMarker) {
            auto settled = settledDuringSync_.find(incoming.outputId);
            if (settled != settledDuringSync_.end() && settled->second > *syncMarker) {
                ++skipped;
                continue;
            }
        }
        WalletOutput out = incoming;
        auto it = outputs_.find(out.outputId);
        if (it != outputs_.end()) {
            out.status = it->second.status;
            out.spentBy = it->second.spentBy;
        } else {
            out.status = OutputStatus::Available;
            out.spentBy.SetNull();
        }
        next[out.outputId] = std::move(out);
    }

    LOG_DEBUG(util::LogCategory::SYNC) << alias_ << ": outputs " << outputs_.size()
                                       << " -> " << next.size() << " (" << skipped
                                       << " settled meanwhile)";
    outputs_ = std::move(next);
}

bool Account::Reserve(const std::vector<OutputId>& ids) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    for (const auto& id : ids) {
        auto it = outputs_.find(id);
        if (it == outputs_.end() || it->second.status != OutputStatus::Available) {
            return false;
        }
    }
    for (const auto& id : ids) {
        outputs_[id].status = OutputStatus::Reserved;
    }
    return true;
}

void Account::ReleaseReservation(const std::vector<OutputId>& ids) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    for (const auto& id : ids) {
        auto it = outputs_.find(id);
        if (it != outputs_.end() && it->second.status == OutputStatus::Reserved) {
            it->second.status = OutputStatus::Available;
        }
    }
}

void Account::MarkPendingSpent(const std::vector<OutputId>& ids, const TransactionId& txid) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    for (const auto& id : ids) {
        auto it = outputs_.find(id);
        if (it == outputs_.end()) {
            // Dropped by a concurrent sync
            continue;
        }
        it->second.status = OutputStatus::PendingSpent;
        it->second.spentBy = txid;
    }
}

std::vector<OutputId> Account::GetPendingInputs(const TransactionId& txid) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::vector<OutputId> result;
    for (const auto& [id, out] : outputs_) {
        if (out.status == OutputStatus::PendingSpent && out.spentBy == txid) {
            result.push_back(id);
        }
    }
    return result;
}

size_t Account::SettleConfirmed(const TransactionId& txid, const BlockId& blockId) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ++settleSequence_;
    size_t removed = 0;
    for (auto it = outputs_.begin(); it != outputs_.end();) {
        if (it->second.status == OutputStatus::PendingSpent && it->second.spentBy == txid) {
            if (!activeSyncs_.empty()) {
                settledDuringSync_[it->first] = settleSequence_;
            }
            it = outputs_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (confirmations_.find(txid) == confirmations_.end()) {
        confirmationOrder_.push_back(txid);
    }
    confirmations_[txid] = blockId;
    while (confirmationOrder_.size() > MAX_RECORDED_CONFIRMATIONS) {
        confirmations_.erase(confirmationOrder_.front());
        confirmationOrder_.pop_front();
    }
    return removed;
}

size_t Account::RevertPending(const TransactionId& txid) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    size_t reverted = 0;
    for (auto& [id, out] : outputs_) {
        if (out.status == OutputStatus::PendingSpent && out.spentBy == txid) {
            out.status = OutputStatus::Available;
            out.spentBy.SetNull();
            ++reverted;
        }
    }
    return reverted;
}

std::optional<BlockId> Account::GetConfirmation(const TransactionId& txid) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = confirmations_.find(txid);
    if (it == confirmations_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t Account::ConfirmationCount() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return confirmations_.size();
}

AccountBalance Account::GetBalance(uint32_t now) const {
    std::vector<WalletOutput> snapshot;
    std::set<Address> owned;
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        snapshot.reserve(outputs_.size());
        for (const auto& [id, out] : outputs_) {
            snapshot.push_back(out);
        }
        owned = addressSet_;
    }

    AccountBalance balance;
    for (const auto& out : snapshot) {
        balance.total.Add(out.output);
        AddChecked(balance.requiredStorageDeposit, params_.MinimumStorageDeposit(out.output));

        if (out.status != OutputStatus::Available) {
            AddChecked(balance.pendingAmount, out.GetValue());
            continue;
        }
        if (out.IsSpendable(owned, now)) {
            balance.available.Add(out.output);
            continue;
        }

        const auto* sdr = out.output.FindUnlockCondition<StorageDepositReturnUnlockCondition>();
        if (sdr != nullptr && !out.output.IsTimelocked(now) &&
            owned.count(out.output.GetUnlockAddress(now)) > 0) {
            AddChecked(balance.lockedAmount, sdr->amount);
        } else {
            AddChecked(balance.lockedAmount, out.GetValue());
        }
    }
    return balance;
}

} // namespace wallet
} // namespace stardust
