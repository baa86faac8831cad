// STARDUST - Protocol Parameters Implementation
// Copyright (c) 2024 STARDUST Developers
// MIT License

#include "stardust/core/protocol.h"
#include "stardust/core/output.h"
#include "stardust/crypto/sha256.h"

namespace stardust {

uint64_t ProtocolParameters::GetNetworkId() const {
    Hash256 digest = SHA256Hash(reinterpret_cast<const Byte*>(networkName.data()),
                                networkName.size());
    uint64_t id = 0;
    for (size_t i = 0; i < 8; ++i) {
        id |= static_cast<uint64_t>(digest[i]) << (8 * i);
    }
    return id;
}

Amount ProtocolParameters::MinimumStorageDeposit(const Output& output) const {
    return MinimumStorageDeposit(output.GetSerializedSize());
}

} // namespace stardust
