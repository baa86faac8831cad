// STARDUST - Transaction Builder and Submitter
// Copyright (c) 2024 STARDUST Developers
// MIT License
//
// Turns a list of target outputs into a signed transaction paid from an
// account, submits it and marks the consumed outputs pending-spent.
//
// Steps:
// 1. Required totals from the targets
// 2. Largest-first input selection (InputSelector)
// 3. Change outputs (at most MAX_NATIVE_TOKENS_COUNT tokens each), or small
//    remainders added to the first target
// 4. Deterministic essence: inputs ordered by output id, targets in caller
//    order followed by the change outputs
// 5. One signature per distinct unlocking address, reference unlocks for
//    further inputs of that address
// 6. Submission through the node client
// 7. Inputs marked pending-spent; a SubmissionHandle is returned

#ifndef STARDUST_WALLET_TXBUILDER_H
#define STARDUST_WALLET_TXBUILDER_H

#include "stardust/client/node_client.h"
#include "stardust/core/native_token.h"
#include "stardust/core/output.h"
#include "stardust/core/protocol.h"
#include "stardust/core/transaction.h"
#include "stardust/core/types.h"
#include "stardust/wallet/account.h"

#include <optional>
#include <string>
#include <vector>

namespace stardust {
namespace wallet {

class SignerSession;

/// Identifies a submitted transaction for confirmation polling
struct SubmissionHandle {
    TransactionId transactionId;

    /// Block the node attached the transaction to
    BlockId blockId;

    uint32_t accountIndex{0};

    bool operator==(const SubmissionHandle& o) const {
        return transactionId == o.transactionId && blockId == o.blockId &&
               accountIndex == o.accountIndex;
    }
    bool operator!=(const SubmissionHandle& o) const { return !(*this == o); }

    std::string ToString() const;
};

/// Unsigned transaction with the data needed to sign it
struct PreparedTransaction {
    TransactionEssence essence;

    /// Consumed outputs, in essence input order
    std::vector<WalletOutput> inputs;

    /// Index of the first change output in essence.outputs
    std::optional<size_t> changeIndex;

    /// Number of consecutive change outputs starting at changeIndex
    size_t changeCount{0};

    /// Base amount added to the first target instead of a change output
    Amount foldedRemainder{0};

    /// Time the unlock addresses were evaluated at
    uint32_t evaluatedAt{0};

    std::vector<Output> GetConsumedOutputs() const;
    std::vector<OutputId> GetInputIds() const;

    /// Distinct unlock addresses of the inputs, in input order
    std::vector<Address> GetRequiredAddresses() const;
};

struct PrepareResult {
    bool success{false};
    ErrorCode error{ErrorCode::None};
    std::string message;
    std::optional<NativeTokenId> deficientAsset;
    PreparedTransaction transaction;

    static PrepareResult Success(PreparedTransaction tx) {
        PrepareResult r;
        r.success = true;
        r.transaction = std::move(tx);
        return r;
    }

    static PrepareResult Failure(ErrorCode code, const std::string& msg,
                                 std::optional<NativeTokenId> asset = std::nullopt) {
        PrepareResult r;
        r.error = code;
        r.message = msg;
        r.deficientAsset = std::move(asset);
        return r;
    }
};

struct SubmitResult {
    bool success{false};
    ErrorCode error{ErrorCode::None};
    std::string message;
    std::optional<NativeTokenId> deficientAsset;
    SubmissionHandle handle;

    static SubmitResult Success(const SubmissionHandle& h) {
        SubmitResult r;
        r.success = true;
        r.handle = h;
        return r;
    }

    static SubmitResult Failure(ErrorCode code, const std::string& msg,
                                std::optional<NativeTokenId> asset = std::nullopt) {
        SubmitResult r;
        r.error = code;
        r.message = msg;
        r.deficientAsset = std::move(asset);
        return r;
    }
};

class TransactionBuilder {
public:
    TransactionBuilder(Account& account, client::INodeClient& client,
                       ProtocolParameters params);

    /**
     * Build, sign and submit a transaction creating `targets`.
     *
     * Recoverable failures (InvalidOutput, InsufficientFunds, SignerLocked,
     * NetworkError, Rejected) are returned. Throws WalletError with
     * IncompleteSignatures if the session cannot sign for every input and
     * with Overflow if the totals overflow; nothing is submitted then.
     * Reserved inputs are released on every exit except acceptance by the
     * node, exceptions from the node client included.
     */
    SubmitResult BuildAndSubmit(const std::vector<Output>& targets, SignerSession& session);

    /// Dry run: selection and essence without reserving, signing or submitting
    PrepareResult Prepare(const std::vector<Output>& targets) const;

    /// Attach unlocks signed by `session`. Throws WalletError
    /// (IncompleteSignatures, SignerLocked).
    static TransactionPayload Sign(const PreparedTransaction& tx, SignerSession& session);

private:
    /// Caller must hold the account lock
    PrepareResult PrepareLocked(const std::vector<Output>& targets, uint32_t now) const;

    Account& account_;
    client::INodeClient& client_;
    ProtocolParameters params_;
};

} // namespace wallet
} // namespace stardust

#endif // STARDUST_WALLET_TXBUILDER_H
