// STARDUST - Protocol Parameters
// Copyright (c) 2024 STARDUST Developers
// MIT License
//
// Network parameters the client must agree on with the node: the address
// prefix, the network id signed into every essence and the rent structure
// that prices storage deposits.

#ifndef STARDUST_CORE_PROTOCOL_H
#define STARDUST_CORE_PROTOCOL_H

#include "stardust/core/bech32.h"
#include "stardust/core/types.h"

#include <cstdint>
#include <functional>
#include <string>

namespace stardust {

class Output;

/// Length of an output id (transaction id + u16 index)
constexpr size_t OUTPUT_ID_SIZE = 34;

/// Ledger metadata stored per output: block id, milestone index, milestone timestamp
constexpr size_t OUTPUT_METADATA_SIZE = 32 + 4 + 4;

/**
 * Storage deposit pricing.
 *
 *   deposit = vByteCost * (vByteFactorData * size + offset)
 *   offset  = vByteFactorKey * OUTPUT_ID_SIZE + vByteFactorData * OUTPUT_METADATA_SIZE
 */
struct RentStructure {
    uint32_t vByteCost{100};
    uint8_t vByteFactorKey{10};
    uint8_t vByteFactorData{1};
    
    /// Virtual bytes charged for every output regardless of its content
    uint64_t VByteOffset() const {
        return static_cast<uint64_t>(vByteFactorKey) * OUTPUT_ID_SIZE +
               static_cast<uint64_t>(vByteFactorData) * OUTPUT_METADATA_SIZE;
    }
    
    /// Minimum deposit for an output of the given serialized size
    Amount MinimumDeposit(size_t serializedSize) const {
        uint64_t vbytes = static_cast<uint64_t>(vByteFactorData) * serializedSize + VByteOffset();
        return static_cast<Amount>(vByteCost) * vbytes;
    }
};

/// Pluggable deposit rule: serialized output size -> minimum amount
using StorageDepositFunction = std::function<Amount(size_t serializedSize)>;

struct ProtocolParameters {
    /// Human-readable address prefix
    std::string bech32Hrp{Bech32HRP::SHIMMER_TESTNET};
    
    /// Network name; the network id is derived from it
    std::string networkName{"testnet"};
    
    RentStructure rentStructure;
    
    Amount tokenSupply{TOKEN_SUPPLY};
    
    /// Overrides the rent structure when set
    StorageDepositFunction storageDeposit;
    
    /// First 8 bytes (little endian) of the SHA-256 digest of the network name
    uint64_t GetNetworkId() const;
    
    Amount MinimumStorageDeposit(size_t serializedSize) const {
        if (storageDeposit) {
            return storageDeposit(serializedSize);
        }
        return rentStructure.MinimumDeposit(serializedSize);
    }
    
    Amount MinimumStorageDeposit(const Output& output) const;
};

} // namespace stardust

#endif // STARDUST_CORE_PROTOCOL_H
