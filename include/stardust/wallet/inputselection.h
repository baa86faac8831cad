// STARDUST - Input Selection
// Copyright (c) 2024 STARDUST Developers
// MIT License
//
// Greedy largest-first selection of account outputs covering the totals of
// a set of target outputs. Native tokens are covered first (largest holding
// of each token first), then the base amount, including the deposit of the
// change outputs when they are needed. Leftover tokens are spread over as
// many change outputs as the per-output token limit requires.

#ifndef STARDUST_WALLET_INPUTSELECTION_H
#define STARDUST_WALLET_INPUTSELECTION_H

#include "stardust/core/address.h"
#include "stardust/core/native_token.h"
#include "stardust/core/protocol.h"
#include "stardust/core/types.h"
#include "stardust/wallet/account.h"
#include "stardust/wallet/balance.h"

#include <optional>
#include <string>
#include <vector>

namespace stardust {
namespace wallet {

/// Result of input selection
struct SelectionResult {
    bool success{false};
    ErrorCode error{ErrorCode::None};
    std::string message;

    /// Asset that could not be covered; nullopt means the base token
    std::optional<NativeTokenId> deficientAsset;

    /// Selected inputs, in selection order
    std::vector<WalletOutput> selected;

    /// Totals of the selected inputs
    Balance selectedTotal;

    /// Selected minus required
    Amount remainderAmount{0};
    std::vector<NativeToken> remainderTokens;

    /// True if the remainder goes to a change output. Otherwise any
    /// remaining base amount is too small for its own output and is added
    /// to the first target.
    bool createChange{false};

    /// Change outputs the remainder is split into (0 without change)
    size_t changeOutputCount{0};

    size_t Size() const { return selected.size(); }

    static SelectionResult Failure(ErrorCode code, const std::string& msg,
                                   std::optional<NativeTokenId> asset = std::nullopt) {
        SelectionResult r;
        r.error = code;
        r.message = msg;
        r.deficientAsset = std::move(asset);
        return r;
    }
};

class InputSelector {
public:
    InputSelector(const ProtocolParameters& params, const Address& changeAddress)
        : params_(params), changeAddress_(changeAddress) {}

    /**
     * Select from `available` enough to cover `required`.
     * Fails with InsufficientFunds naming the first asset that cannot be
     * covered. Ties between equal holdings are broken by output id so the
     * result does not depend on the order of `available`.
     */
    SelectionResult Select(std::vector<WalletOutput> available, const Balance& required) const;

    /// Minimum deposit of the change outputs carrying `tokens`. Throws
    /// WalletError if such an output cannot be built.
    Amount ChangeDeposit(const std::vector<NativeToken>& tokens) const;

    /// `tokens` in groups of at most MAX_NATIVE_TOKENS_COUNT; one empty
    /// group for no tokens
    static std::vector<std::vector<NativeToken>> SplitChangeTokens(
        const std::vector<NativeToken>& tokens);

private:
    bool TryChangeDeposit(const std::vector<NativeToken>& tokens, Amount& deposit,
                          std::string& error) const;

    const ProtocolParameters& params_;
    Address changeAddress_;
};

} // namespace wallet
} // namespace stardust

#endif // STARDUST_WALLET_INPUTSELECTION_H
