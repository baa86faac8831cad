// STARDUST - Unlock Condition Implementation
// Copyright (c) 2024 STARDUST Developers
// MIT License

#include "stardust/core/unlock_condition.h"

#include <sstream>

namespace stardust {

const char* UnlockConditionTypeToString(UnlockConditionType type) {
    switch (type) {
        case UnlockConditionType::Address: return "Address";
        case UnlockConditionType::StorageDepositReturn: return "StorageDepositReturn";
        case UnlockConditionType::Timelock: return "Timelock";
        case UnlockConditionType::Expiration: return "Expiration";
        case UnlockConditionType::StateControllerAddress: return "StateControllerAddress";
        case UnlockConditionType::GovernorAddress: return "GovernorAddress";
        case UnlockConditionType::ImmutableAliasAddress: return "ImmutableAliasAddress";
        default: return "Unknown";
    }
}

std::string UnlockCondition::ToString() const {
    std::ostringstream ss;
    ss << UnlockConditionTypeToString(GetType()) << "(";
    std::visit([&ss](const auto& c) {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, StorageDepositReturnUnlockCondition>) {
            ss << c.returnAddress.ToString() << ", " << c.amount;
        } else if constexpr (std::is_same_v<T, TimelockUnlockCondition>) {
            ss << c.unixTime;
        } else if constexpr (std::is_same_v<T, ExpirationUnlockCondition>) {
            ss << c.returnAddress.ToString() << ", " << c.unixTime;
        } else {
            ss << c.address.ToString();
        }
    }, value_);
    ss << ")";
    return ss.str();
}

} // namespace stardust
