// STARDUST - Transaction Builder Implementation
// Copyright (c) 2024 STARDUST Developers
// MIT License

#include "stardust/wallet/txbuilder.h"
#include "stardust/util/logging.h"
#include "stardust/util/time.h"
#include "stardust/wallet/balance.h"
#include "stardust/wallet/inputselection.h"
#include "stardust/wallet/signer.h"

#include <algorithm>
#include <map>
#include <set>
#include <sstream>

namespace stardust {
namespace wallet {

namespace LogCategory = util::LogCategory;

namespace {

uint32_t CurrentUnixTime() {
    int64_t now = util::GetTime();
    if (now < 0) return 0;
    if (now > static_cast<int64_t>(UINT32_MAX)) return UINT32_MAX;
    return static_cast<uint32_t>(now);
}

/// Returns reserved inputs to Available unless Commit() was called
class ReservationGuard {
public:
    ReservationGuard(Account& account, std::vector<OutputId> ids)
        : account_(account), ids_(std::move(ids)) {}

    ~ReservationGuard() {
        if (active_) {
            account_.ReleaseReservation(ids_);
        }
    }

    ReservationGuard(const ReservationGuard&) = delete;
    ReservationGuard& operator=(const ReservationGuard&) = delete;

    void Commit() { active_ = false; }

private:
    Account& account_;
    std::vector<OutputId> ids_;
    bool active_{true};
};

} // namespace

// ============================================================================
// SubmissionHandle / PreparedTransaction
// ============================================================================

std::string SubmissionHandle::ToString() const {
    std::ostringstream ss;
    ss << "SubmissionHandle(tx=" << transactionId.ToHex()
       << ", block=" << blockId.ToHex()
       << ", account=" << accountIndex << ")";
    return ss.str();
}

std::vector<Output> PreparedTransaction::GetConsumedOutputs() const {
    std::vector<Output> result;
    result.reserve(inputs.size());
    for (const auto& in : inputs) {
        result.push_back(in.output);
    }
    return result;
}

std::vector<OutputId> PreparedTransaction::GetInputIds() const {
    std::vector<OutputId> result;
    result.reserve(inputs.size());
    for (const auto& in : inputs) {
        result.push_back(in.outputId);
    }
    return result;
}

std::vector<Address> PreparedTransaction::GetRequiredAddresses() const {
    std::vector<Address> result;
    std::set<Address> seen;
    for (const auto& in : inputs) {
        Address addr = in.output.GetUnlockAddress(evaluatedAt);
        if (seen.insert(addr).second) {
            result.push_back(addr);
        }
    }
    return result;
}

// ============================================================================
// TransactionBuilder
// ============================================================================

TransactionBuilder::TransactionBuilder(Account& account, client::INodeClient& client,
                                       ProtocolParameters params)
    : account_(account), client_(client), params_(std::move(params)) {}

PrepareResult TransactionBuilder::PrepareLocked(const std::vector<Output>& targets,
                                                uint32_t now) const {
    if (targets.empty()) {
        return PrepareResult::Failure(ErrorCode::InvalidOutput, "No target outputs");
    }
    if (targets.size() > MAX_OUTPUTS_COUNT) {
        return PrepareResult::Failure(ErrorCode::InvalidOutput,
                                      "Too many target outputs: " + std::to_string(targets.size()));
    }
    for (size_t i = 0; i < targets.size(); ++i) {
        Amount deposit = params_.MinimumStorageDeposit(targets[i]);
        if (targets[i].GetAmount() < deposit) {
            return PrepareResult::Failure(
                ErrorCode::InvalidOutput,
                "Target " + std::to_string(i) + " below storage deposit " + std::to_string(deposit));
        }
    }

    // 1. Required totals
    const Balance required = ComputeBalance(targets);

    std::optional<Address> changeAddress = account_.GetChangeAddress();
    if (!changeAddress) {
        return PrepareResult::Failure(ErrorCode::InsufficientFunds, "Account has no addresses");
    }

    // 2. Selection
    InputSelector selector(params_, *changeAddress);
    SelectionResult selection = selector.Select(account_.GetSpendableOutputs(now), required);
    if (!selection.success) {
        return PrepareResult::Failure(selection.error, selection.message,
                                      selection.deficientAsset);
    }

    // 3. Outputs: targets, then change
    PreparedTransaction tx;
    tx.evaluatedAt = now;
    tx.essence.outputs = targets;

    if (selection.createChange) {
        const std::vector<std::vector<NativeToken>> groups =
            InputSelector::SplitChangeTokens(selection.remainderTokens);
        if (targets.size() + groups.size() > MAX_OUTPUTS_COUNT) {
            return PrepareResult::Failure(
                ErrorCode::InvalidOutput,
                "Too many outputs: " + std::to_string(targets.size()) + " targets and " +
                    std::to_string(groups.size()) + " change outputs");
        }

        // Later groups carry their minimum deposit, the first one the rest
        std::vector<Output> extra;
        Amount extraAmount = 0;
        for (size_t g = 1; g < groups.size(); ++g) {
            OutputBuildResult change = OutputBuilder::Basic()
                .AddUnlockCondition(AddressUnlockCondition{*changeAddress})
                .SetNativeTokens(groups[g])
                .SetMinimumAmount()
                .Build(params_);
            if (!change.success) {
                return PrepareResult::Failure(ErrorCode::InvalidOutput,
                                              "Change output: " + change.error);
            }
            extraAmount += change.output.GetAmount();
            extra.push_back(change.output);
        }
        if (extraAmount > selection.remainderAmount) {
            return PrepareResult::Failure(ErrorCode::InsufficientFunds,
                                          "Remainder does not cover the change deposits");
        }

        OutputBuildResult change = OutputBuilder::Basic()
            .SetAmount(selection.remainderAmount - extraAmount)
            .SetNativeTokens(groups.front())
            .AddUnlockCondition(AddressUnlockCondition{*changeAddress})
            .Build(params_);
        if (!change.success) {
            return PrepareResult::Failure(ErrorCode::InvalidOutput,
                                          "Change output: " + change.error);
        }
        tx.changeIndex = tx.essence.outputs.size();
        tx.changeCount = groups.size();
        tx.essence.outputs.push_back(change.output);
        tx.essence.outputs.insert(tx.essence.outputs.end(), extra.begin(), extra.end());
    } else if (selection.remainderAmount > 0) {
        const Output& first = tx.essence.outputs.front();
        if (selection.remainderAmount > UINT64_MAX - first.GetAmount()) {
            throw WalletError(ErrorCode::Overflow, "Target amount overflow");
        }
        OutputBuildResult folded = OutputBuilder::From(first)
            .SetAmount(first.GetAmount() + selection.remainderAmount)
            .Build(params_);
        if (!folded.success) {
            return PrepareResult::Failure(ErrorCode::InvalidOutput,
                                          "First target with remainder: " + folded.error);
        }
        tx.essence.outputs.front() = folded.output;
        tx.foldedRemainder = selection.remainderAmount;
    }

    // 4. Deterministic essence
    tx.inputs = std::move(selection.selected);
    std::sort(tx.inputs.begin(), tx.inputs.end(),
              [](const WalletOutput& a, const WalletOutput& b) {
                  return a.outputId < b.outputId;
              });
    tx.essence.networkId = params_.GetNetworkId();
    tx.essence.inputs = tx.GetInputIds();
    tx.essence.inputsCommitment = ComputeInputsCommitment(tx.GetConsumedOutputs());

    return PrepareResult::Success(std::move(tx));
}

PrepareResult TransactionBuilder::Prepare(const std::vector<Output>& targets) const {
    auto lock = account_.Lock();
    return PrepareLocked(targets, CurrentUnixTime());
}

TransactionPayload TransactionBuilder::Sign(const PreparedTransaction& tx,
                                            SignerSession& session) {
    const Hash256 hash = tx.essence.GetHash();
    const std::vector<Address> required = tx.GetRequiredAddresses();

    SignResult result = session.Sign(hash, required);
    if (!result.success) {
        throw WalletError(result.error, result.message);
    }

    std::vector<Unlock> unlocks;
    unlocks.reserve(tx.inputs.size());
    std::map<Address, uint16_t> firstUnlock;
    for (size_t i = 0; i < tx.inputs.size(); ++i) {
        Address addr = tx.inputs[i].output.GetUnlockAddress(tx.evaluatedAt);
        auto ref = firstUnlock.find(addr);
        if (ref != firstUnlock.end()) {
            unlocks.push_back(ReferenceUnlock{ref->second});
            continue;
        }
        auto sig = result.signatures.find(addr);
        if (sig == result.signatures.end()) {
            throw WalletError(ErrorCode::IncompleteSignatures,
                              "No signature for " + addr.ToHex());
        }
        firstUnlock[addr] = static_cast<uint16_t>(i);
        unlocks.push_back(SignatureUnlock{sig->second});
    }

    TransactionPayload payload(tx.essence, std::move(unlocks));
    if (!VerifyUnlocks(payload, tx.GetConsumedOutputs(), tx.evaluatedAt)) {
        throw WalletError(ErrorCode::IncompleteSignatures,
                          "Signatures do not unlock every input");
    }
    return payload;
}

SubmitResult TransactionBuilder::BuildAndSubmit(const std::vector<Output>& targets,
                                                SignerSession& session) {
    PreparedTransaction tx;
    {
        auto lock = account_.Lock();
        PrepareResult prepared = PrepareLocked(targets, CurrentUnixTime());
        if (!prepared.success) {
            LOG_INFO(LogCategory::TXBUILDER) << account_.GetAlias() << ": build failed: "
                                             << prepared.message;
            return SubmitResult::Failure(prepared.error, prepared.message,
                                         prepared.deficientAsset);
        }
        tx = std::move(prepared.transaction);
        if (!account_.Reserve(tx.GetInputIds())) {
            return SubmitResult::Failure(ErrorCode::InsufficientFunds,
                                         "Selected inputs are no longer available");
        }
    }

    const std::vector<OutputId> inputIds = tx.GetInputIds();
    ReservationGuard reservation(account_, inputIds);

    TransactionPayload payload;
    try {
        payload = Sign(tx, session);
    } catch (const WalletError& e) {
        if (e.GetCode() == ErrorCode::SignerLocked) {
            return SubmitResult::Failure(ErrorCode::SignerLocked, e.what());
        }
        LOG_ERROR(LogCategory::TXBUILDER) << account_.GetAlias() << ": " << e.what();
        throw;
    }

    const TransactionId txid = payload.GetId();
    client::SubmitResponse response;
    try {
        response = client_.SubmitTransaction(payload.ToBytes());
    } catch (const client::NodeError& e) {
        LOG_WARN(LogCategory::TXBUILDER) << "Submission of " << txid.ToHex()
                                         << " failed: " << e.what();
        return SubmitResult::Failure(ErrorCode::NetworkError, e.what());
    } catch (const std::exception& e) {
        LOG_ERROR(LogCategory::TXBUILDER) << "Submission of " << txid.ToHex()
                                          << " aborted: " << e.what();
        throw;
    }

    if (!response.accepted) {
        LOG_WARN(LogCategory::TXBUILDER) << "Node rejected " << txid.ToHex() << ": "
                                         << response.reason;
        return SubmitResult::Failure(ErrorCode::Rejected, response.reason);
    }

    account_.MarkPendingSpent(inputIds, txid);
    reservation.Commit();

    SubmissionHandle handle;
    handle.transactionId = txid;
    handle.blockId = response.blockId;
    handle.accountIndex = account_.GetIndex();

    LOG_INFO(LogCategory::TXBUILDER) << account_.GetAlias() << ": submitted " << txid.ToHex()
                                     << " with " << inputIds.size() << " inputs in block "
                                     << response.blockId.ToHex();
    return SubmitResult::Success(handle);
}

} // namespace wallet
} // namespace stardust
