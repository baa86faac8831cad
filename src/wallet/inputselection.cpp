// STARDUST - Input Selection Implementation
// Copyright (c) 2024 STARDUST Developers
// MIT License

#include "stardust/wallet/inputselection.h"
#include "stardust/core/output.h"
#include "stardust/core/transaction.h"
#include "stardust/util/logging.h"

#include <algorithm>

namespace stardust {
namespace wallet {

namespace {

U256 TokenAmount(const Output& output, const NativeTokenId& id) {
    for (const auto& token : output.GetNativeTokens()) {
        if (token.id == id) {
            return token.amount;
        }
    }
    return U256();
}

/// Largest holding of `id` first
void SortByToken(std::vector<WalletOutput>& outputs, const NativeTokenId& id) {
    std::sort(outputs.begin(), outputs.end(),
              [&id](const WalletOutput& a, const WalletOutput& b) {
                  U256 va = TokenAmount(a.output, id);
                  U256 vb = TokenAmount(b.output, id);
                  if (va != vb) return va > vb;
                  return a.outputId < b.outputId;
              });
}

/// Largest base amount first
void SortByValue(std::vector<WalletOutput>& outputs) {
    std::sort(outputs.begin(), outputs.end(),
              [](const WalletOutput& a, const WalletOutput& b) {
                  if (a.GetValue() != b.GetValue()) return a.GetValue() > b.GetValue();
                  return a.outputId < b.outputId;
              });
}

} // namespace

std::vector<std::vector<NativeToken>> InputSelector::SplitChangeTokens(
    const std::vector<NativeToken>& tokens) {
    std::vector<std::vector<NativeToken>> groups;
    for (size_t i = 0; i < tokens.size(); i += MAX_NATIVE_TOKENS_COUNT) {
        size_t end = std::min(tokens.size(), i + MAX_NATIVE_TOKENS_COUNT);
        groups.emplace_back(tokens.begin() + i, tokens.begin() + end);
    }
    if (groups.empty()) {
        groups.emplace_back();
    }
    return groups;
}

bool InputSelector::TryChangeDeposit(const std::vector<NativeToken>& tokens, Amount& deposit,
                                     std::string& error) const {
    deposit = 0;
    for (const auto& group : SplitChangeTokens(tokens)) {
        OutputBuildResult result = OutputBuilder::Basic()
            .AddUnlockCondition(AddressUnlockCondition{changeAddress_})
            .SetNativeTokens(group)
            .SetMinimumAmount()
            .Build(params_);
        if (!result.success) {
            error = "Cannot build change output: " + result.error;
            return false;
        }
        if (result.output.GetAmount() > UINT64_MAX - deposit) {
            error = "Change deposit overflow";
            return false;
        }
        deposit += result.output.GetAmount();
    }
    return true;
}

Amount InputSelector::ChangeDeposit(const std::vector<NativeToken>& tokens) const {
    Amount deposit = 0;
    std::string error;
    if (!TryChangeDeposit(tokens, deposit, error)) {
        throw WalletError(ErrorCode::InvalidOutput, error);
    }
    return deposit;
}

SelectionResult InputSelector::Select(std::vector<WalletOutput> available,
                                      const Balance& required) const {
    std::vector<Output> all;
    all.reserve(available.size());
    for (const auto& out : available) {
        all.push_back(out.output);
    }
    const Balance held = ComputeBalance(all);

    SelectionResult result;
    std::vector<WalletOutput> pool = std::move(available);

    auto takeFront = [&result, &pool]() {
        result.selectedTotal.Add(pool.front().output);
        result.selected.push_back(std::move(pool.front()));
        pool.erase(pool.begin());
    };

    // Native tokens first
    for (const auto& [id, need] : required.nativeTokens) {
        SortByToken(pool, id);
        while (result.selectedTotal.GetNativeToken(id) < need) {
            if (pool.empty() || TokenAmount(pool.front().output, id).IsZero()) {
                return SelectionResult::Failure(
                    ErrorCode::InsufficientFunds,
                    "Insufficient native token " + id.ToHex() + ": required " +
                        need.ToString() + ", available " + held.GetNativeToken(id).ToString(),
                    id);
            }
            takeFront();
        }
    }

    // Base amount, plus the deposit of the change output if one is needed
    SortByValue(pool);
    for (;;) {
        std::vector<NativeToken> leftover;
        for (const auto& [id, amount] : result.selectedTotal.nativeTokens) {
            U256 rest;
            if (!amount.CheckedSub(required.GetNativeToken(id), rest)) {
                throw WalletError(ErrorCode::Overflow, "Native token underflow for " + id.ToHex());
            }
            if (!rest.IsZero()) {
                leftover.emplace_back(id, rest);
            }
        }

        Amount needBase = required.baseAmount;
        Amount deposit = 0;
        std::string error;
        if (!TryChangeDeposit(leftover, deposit, error)) {
            return SelectionResult::Failure(ErrorCode::InvalidOutput, error);
        }
        if (!leftover.empty()) {
            if (deposit > UINT64_MAX - needBase) {
                throw WalletError(ErrorCode::Overflow, "Required base amount overflow");
            }
            needBase += deposit;
        }

        if (result.selectedTotal.baseAmount >= needBase) {
            result.remainderAmount = result.selectedTotal.baseAmount - required.baseAmount;
            result.remainderTokens = std::move(leftover);
            result.createChange = !result.remainderTokens.empty() ||
                (result.remainderAmount > 0 && result.remainderAmount >= deposit);
            break;
        }

        if (pool.empty()) {
            return SelectionResult::Failure(
                ErrorCode::InsufficientFunds,
                "Insufficient base amount: required " + std::to_string(needBase) +
                    ", available " + std::to_string(held.baseAmount));
        }
        takeFront();
    }

    if (result.selected.empty()) {
        // A transaction consumes at least one input
        if (pool.empty()) {
            return SelectionResult::Failure(ErrorCode::InsufficientFunds,
                                            "No spendable outputs");
        }
        takeFront();
        result.remainderAmount = result.selectedTotal.baseAmount - required.baseAmount;
        for (const auto& token : result.selected.front().output.GetNativeTokens()) {
            result.remainderTokens.push_back(token);
        }
        result.createChange = true;
    }

    if (result.createChange) {
        result.changeOutputCount = SplitChangeTokens(result.remainderTokens).size();
    }

    if (result.selected.size() > MAX_INPUTS_COUNT) {
        return SelectionResult::Failure(
            ErrorCode::InsufficientFunds,
            "Selection needs " + std::to_string(result.selected.size()) +
                " inputs, maximum is " + std::to_string(MAX_INPUTS_COUNT));
    }

    LOG_DEBUG(util::LogCategory::TXBUILDER)
        << "Selected " << result.selected.size() << " inputs, remainder "
        << result.remainderAmount << " (" << result.remainderTokens.size() << " tokens)"
        << (result.createChange ? ", change" : "");

    result.success = true;
    return result;
}

} // namespace wallet
} // namespace stardust
