// STARDUST - Balance Aggregation Implementation
// Copyright (c) 2024 STARDUST Developers
// MIT License

#include "stardust/wallet/balance.h"

#include <sstream>

namespace stardust {
namespace wallet {

void Balance::AddBase(Amount amount) {
    if (amount > UINT64_MAX - baseAmount) {
        throw WalletError(ErrorCode::Overflow, "Base amount overflow");
    }
    baseAmount += amount;
}

void Balance::AddNativeToken(const NativeTokenId& id, const U256& amount) {
    U256& total = nativeTokens[id];
    U256 sum;
    if (!total.CheckedAdd(amount, sum)) {
        throw WalletError(ErrorCode::Overflow,
                          "Native token overflow for " + id.ToHex());
    }
    total = sum;
}

void Balance::Add(const Output& output) {
    AddBase(output.GetAmount());
    for (const auto& token : output.GetNativeTokens()) {
        AddNativeToken(token.id, token.amount);
    }
}

void Balance::Merge(const Balance& other) {
    AddBase(other.baseAmount);
    for (const auto& [id, amount] : other.nativeTokens) {
        AddNativeToken(id, amount);
    }
}

U256 Balance::GetNativeToken(const NativeTokenId& id) const {
    auto it = nativeTokens.find(id);
    return it == nativeTokens.end() ? U256() : it->second;
}

std::string Balance::ToString() const {
    std::ostringstream ss;
    ss << "Balance(base=" << baseAmount;
    for (const auto& [id, amount] : nativeTokens) {
        ss << ", " << id.ToHex() << "=" << amount.ToString();
    }
    ss << ")";
    return ss.str();
}

Balance ComputeBalance(const std::vector<Output>& outputs) {
    Balance balance;
    for (const auto& output : outputs) {
        balance.Add(output);
    }
    return balance;
}

bool CheckTransactionBalance(const std::vector<Output>& consumed,
                             const std::vector<Output>& created) {
    return ComputeBalance(consumed) == ComputeBalance(created);
}

} // namespace wallet
} // namespace stardust
