// STARDUST - Balance Aggregation
// Copyright (c) 2024 STARDUST Developers
// MIT License
//
// Sums base amounts and native tokens over a set of outputs. Every addition
// is checked; an overflow throws WalletError(Overflow) instead of wrapping.

#ifndef STARDUST_WALLET_BALANCE_H
#define STARDUST_WALLET_BALANCE_H

#include "stardust/core/native_token.h"
#include "stardust/core/output.h"
#include "stardust/core/types.h"
#include "stardust/core/uint256.h"

#include <map>
#include <string>
#include <vector>

namespace stardust {
namespace wallet {

/// Base amount plus per-token totals
struct Balance {
    Amount baseAmount{0};
    std::map<NativeTokenId, U256> nativeTokens;
    
    /// Add the contents of one output
    void Add(const Output& output);
    
    void AddBase(Amount amount);
    void AddNativeToken(const NativeTokenId& id, const U256& amount);
    
    /// Combine with a partial result; same overflow rules as Add()
    void Merge(const Balance& other);
    
    /// Zero when the token is not held
    U256 GetNativeToken(const NativeTokenId& id) const;
    
    bool IsEmpty() const { return baseAmount == 0 && nativeTokens.empty(); }
    
    bool operator==(const Balance& other) const {
        return baseAmount == other.baseAmount && nativeTokens == other.nativeTokens;
    }
    bool operator!=(const Balance& other) const { return !(*this == other); }
    
    std::string ToString() const;
};

/// Total over all outputs. Throws WalletError(Overflow).
Balance ComputeBalance(const std::vector<Output>& outputs);

/// True if consumed and created outputs carry exactly the same totals per
/// asset (no implicit minting or burning)
bool CheckTransactionBalance(const std::vector<Output>& consumed,
                             const std::vector<Output>& created);

} // namespace wallet
} // namespace stardust

#endif // STARDUST_WALLET_BALANCE_H
