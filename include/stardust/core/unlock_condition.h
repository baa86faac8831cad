// STARDUST - Unlock Conditions
// Copyright (c) 2024 STARDUST Developers
// MIT License
//
// Unlock conditions form a closed set of variants. The variant index of
// UnlockCondition equals the wire discriminant, which is also the key of
// the canonical (ascending) ordering inside an output.

#ifndef STARDUST_CORE_UNLOCK_CONDITION_H
#define STARDUST_CORE_UNLOCK_CONDITION_H

#include "stardust/core/address.h"
#include "stardust/core/serialize.h"
#include "stardust/core/types.h"

#include <string>
#include <variant>

namespace stardust {

enum class UnlockConditionType : uint8_t {
    Address = 0,
    StorageDepositReturn = 1,
    Timelock = 2,
    Expiration = 3,
    StateControllerAddress = 4,
    GovernorAddress = 5,
    ImmutableAliasAddress = 6,
};

const char* UnlockConditionTypeToString(UnlockConditionType type);

/// Output can be unlocked by the owner of an address
struct AddressUnlockCondition {
    static constexpr UnlockConditionType TYPE = UnlockConditionType::Address;
    Address address;
    
    bool operator==(const AddressUnlockCondition& o) const { return address == o.address; }
};

/// The consuming transaction must return `amount` to `returnAddress`
struct StorageDepositReturnUnlockCondition {
    static constexpr UnlockConditionType TYPE = UnlockConditionType::StorageDepositReturn;
    Address returnAddress;
    Amount amount = 0;
    
    bool operator==(const StorageDepositReturnUnlockCondition& o) const {
        return returnAddress == o.returnAddress && amount == o.amount;
    }
};

/// Output cannot be consumed before `unixTime`
struct TimelockUnlockCondition {
    static constexpr UnlockConditionType TYPE = UnlockConditionType::Timelock;
    uint32_t unixTime = 0;
    
    bool operator==(const TimelockUnlockCondition& o) const { return unixTime == o.unixTime; }
};

/// From `unixTime` on, only `returnAddress` may consume the output
struct ExpirationUnlockCondition {
    static constexpr UnlockConditionType TYPE = UnlockConditionType::Expiration;
    Address returnAddress;
    uint32_t unixTime = 0;
    
    bool operator==(const ExpirationUnlockCondition& o) const {
        return returnAddress == o.returnAddress && unixTime == o.unixTime;
    }
};

struct StateControllerAddressUnlockCondition {
    static constexpr UnlockConditionType TYPE = UnlockConditionType::StateControllerAddress;
    Address address;
    
    bool operator==(const StateControllerAddressUnlockCondition& o) const {
        return address == o.address;
    }
};

struct GovernorAddressUnlockCondition {
    static constexpr UnlockConditionType TYPE = UnlockConditionType::GovernorAddress;
    Address address;
    
    bool operator==(const GovernorAddressUnlockCondition& o) const { return address == o.address; }
};

/// Foundry outputs are controlled by an alias; the address must be an Alias address
struct ImmutableAliasAddressUnlockCondition {
    static constexpr UnlockConditionType TYPE = UnlockConditionType::ImmutableAliasAddress;
    Address address;
    
    bool operator==(const ImmutableAliasAddressUnlockCondition& o) const {
        return address == o.address;
    }
};

/**
 * Tagged union over all unlock condition kinds.
 * Alternatives are declared in discriminant order.
 */
class UnlockCondition {
public:
    using Variant = std::variant<AddressUnlockCondition,
                                 StorageDepositReturnUnlockCondition,
                                 TimelockUnlockCondition,
                                 ExpirationUnlockCondition,
                                 StateControllerAddressUnlockCondition,
                                 GovernorAddressUnlockCondition,
                                 ImmutableAliasAddressUnlockCondition>;
    
    UnlockCondition() = default;
    UnlockCondition(const AddressUnlockCondition& c) : value_(c) {}
    UnlockCondition(const StorageDepositReturnUnlockCondition& c) : value_(c) {}
    UnlockCondition(const TimelockUnlockCondition& c) : value_(c) {}
    UnlockCondition(const ExpirationUnlockCondition& c) : value_(c) {}
    UnlockCondition(const StateControllerAddressUnlockCondition& c) : value_(c) {}
    UnlockCondition(const GovernorAddressUnlockCondition& c) : value_(c) {}
    UnlockCondition(const ImmutableAliasAddressUnlockCondition& c) : value_(c) {}
    
    UnlockConditionType GetType() const {
        return static_cast<UnlockConditionType>(value_.index());
    }
    
    template<typename T>
    bool Is() const { return std::holds_alternative<T>(value_); }
    
    template<typename T>
    const T& As() const { return std::get<T>(value_); }
    
    template<typename T>
    const T* TryAs() const { return std::get_if<T>(&value_); }
    
    const Variant& Get() const { return value_; }
    
    bool operator==(const UnlockCondition& other) const { return value_ == other.value_; }
    bool operator!=(const UnlockCondition& other) const { return !(*this == other); }
    
    /// Canonical ordering: ascending discriminant
    bool operator<(const UnlockCondition& other) const { return GetType() < other.GetType(); }
    
    std::string ToString() const;

private:
    Variant value_;
};

template<typename Stream>
void Serialize(Stream& s, const UnlockCondition& condition) {
    ser_writedata8(s, static_cast<uint8_t>(condition.GetType()));
    std::visit([&s](const auto& c) {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, StorageDepositReturnUnlockCondition>) {
            Serialize(s, c.returnAddress);
            ser_writedata64(s, c.amount);
        } else if constexpr (std::is_same_v<T, TimelockUnlockCondition>) {
            ser_writedata32(s, c.unixTime);
        } else if constexpr (std::is_same_v<T, ExpirationUnlockCondition>) {
            Serialize(s, c.returnAddress);
            ser_writedata32(s, c.unixTime);
        } else {
            Serialize(s, c.address);
        }
    }, condition.Get());
}

template<typename Stream>
void Unserialize(Stream& s, UnlockCondition& condition) {
    uint8_t type = ser_readdata8(s);
    switch (static_cast<UnlockConditionType>(type)) {
        case UnlockConditionType::Address: {
            AddressUnlockCondition c;
            Unserialize(s, c.address);
            condition = c;
            break;
        }
        case UnlockConditionType::StorageDepositReturn: {
            StorageDepositReturnUnlockCondition c;
            Unserialize(s, c.returnAddress);
            c.amount = ser_readdata64(s);
            condition = c;
            break;
        }
        case UnlockConditionType::Timelock: {
            TimelockUnlockCondition c;
            c.unixTime = ser_readdata32(s);
            condition = c;
            break;
        }
        case UnlockConditionType::Expiration: {
            ExpirationUnlockCondition c;
            Unserialize(s, c.returnAddress);
            c.unixTime = ser_readdata32(s);
            condition = c;
            break;
        }
        case UnlockConditionType::StateControllerAddress: {
            StateControllerAddressUnlockCondition c;
            Unserialize(s, c.address);
            condition = c;
            break;
        }
        case UnlockConditionType::GovernorAddress: {
            GovernorAddressUnlockCondition c;
            Unserialize(s, c.address);
            condition = c;
            break;
        }
        case UnlockConditionType::ImmutableAliasAddress: {
            ImmutableAliasAddressUnlockCondition c;
            Unserialize(s, c.address);
            condition = c;
            break;
        }
        default:
            throw std::ios_base::failure("Unknown unlock condition type");
    }
}

} // namespace stardust

#endif // STARDUST_CORE_UNLOCK_CONDITION_H
