// STARDUST - Transaction Header
// Copyright (c) 2024 STARDUST Developers
// MIT License
//
// Transaction payload primitives: output ids, the signed essence and the
// unlocks that authorize consuming the inputs.

#ifndef STARDUST_CORE_TRANSACTION_H
#define STARDUST_CORE_TRANSACTION_H

#include "stardust/core/address.h"
#include "stardust/core/output.h"
#include "stardust/core/serialize.h"
#include "stardust/core/types.h"
#include "stardust/crypto/ed25519.h"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace stardust {

/// Maximum inputs consumed by one transaction
constexpr size_t MAX_INPUTS_COUNT = 128;

/// Maximum outputs created by one transaction
constexpr size_t MAX_OUTPUTS_COUNT = 128;

// ============================================================================
// OutputId - Reference to a transaction output
// ============================================================================

class OutputId {
public:
    static constexpr size_t SIZE = 34;
    
    OutputId() : index_(0) {}
    OutputId(const TransactionId& txid, uint16_t index) : txid_(txid), index_(index) {}
    
    const TransactionId& GetTransactionId() const { return txid_; }
    uint16_t GetIndex() const { return index_; }
    
    /// "0x" + transaction id + u16 index (little endian), 68 hex digits
    std::string ToHex() const;
    static std::optional<OutputId> FromHex(const std::string& hex);
    
    friend bool operator<(const OutputId& a, const OutputId& b) {
        if (a.txid_ != b.txid_) return a.txid_ < b.txid_;
        return a.index_ < b.index_;
    }
    
    friend bool operator==(const OutputId& a, const OutputId& b) {
        return a.txid_ == b.txid_ && a.index_ == b.index_;
    }
    
    friend bool operator!=(const OutputId& a, const OutputId& b) {
        return !(a == b);
    }

private:
    TransactionId txid_;
    uint16_t index_;
};

template<typename Stream>
void Serialize(Stream& s, const OutputId& id) {
    Serialize(s, id.GetTransactionId());
    ser_writedata16(s, id.GetIndex());
}

template<typename Stream>
void Unserialize(Stream& s, OutputId& id) {
    TransactionId txid;
    Unserialize(s, txid);
    uint16_t index = ser_readdata16(s);
    id = OutputId(txid, index);
}

// ============================================================================
// Transaction Essence
// ============================================================================

/// The signed part of a transaction
struct TransactionEssence {
    static constexpr uint8_t TYPE = 1;
    static constexpr uint8_t UTXO_INPUT_TYPE = 0;
    
    uint64_t networkId{0};
    std::vector<OutputId> inputs;
    Hash256 inputsCommitment;
    std::vector<Output> outputs;
    
    /// Message signed by every signature unlock
    Hash256 GetHash() const;
};

template<typename Stream>
void Serialize(Stream& s, const TransactionEssence& essence) {
    ser_writedata8(s, TransactionEssence::TYPE);
    ser_writedata64(s, essence.networkId);
    ser_writedata16(s, static_cast<uint16_t>(essence.inputs.size()));
    for (const auto& input : essence.inputs) {
        ser_writedata8(s, TransactionEssence::UTXO_INPUT_TYPE);
        Serialize(s, input);
    }
    Serialize(s, essence.inputsCommitment);
    ser_writedata16(s, static_cast<uint16_t>(essence.outputs.size()));
    for (const auto& output : essence.outputs) {
        Serialize(s, output);
    }
    // No tagged data payload
    ser_writedata32(s, 0);
}

template<typename Stream>
void Unserialize(Stream& s, TransactionEssence& essence) {
    if (ser_readdata8(s) != TransactionEssence::TYPE) {
        throw std::ios_base::failure("Unknown essence type");
    }
    essence.networkId = ser_readdata64(s);
    uint16_t inputCount = ser_readdata16(s);
    if (inputCount == 0 || inputCount > MAX_INPUTS_COUNT) {
        throw std::ios_base::failure("Invalid input count");
    }
    essence.inputs.clear();
    for (uint16_t i = 0; i < inputCount; ++i) {
        if (ser_readdata8(s) != TransactionEssence::UTXO_INPUT_TYPE) {
            throw std::ios_base::failure("Unknown input type");
        }
        OutputId id;
        Unserialize(s, id);
        essence.inputs.push_back(id);
    }
    Unserialize(s, essence.inputsCommitment);
    uint16_t outputCount = ser_readdata16(s);
    if (outputCount == 0 || outputCount > MAX_OUTPUTS_COUNT) {
        throw std::ios_base::failure("Invalid output count");
    }
    essence.outputs.clear();
    for (uint16_t i = 0; i < outputCount; ++i) {
        Output output;
        Unserialize(s, output);
        essence.outputs.push_back(std::move(output));
    }
    if (ser_readdata32(s) != 0) {
        throw std::ios_base::failure("Essence payloads are not supported");
    }
}

// ============================================================================
// Unlocks
// ============================================================================

struct Ed25519Signature {
    static constexpr uint8_t TYPE = 0;
    
    Ed25519PublicKey publicKey{};
    Ed25519SignatureBytes signature{};
    
    /// Address of the signing key
    Address GetAddress() const { return Address::FromPublicKey(publicKey); }
    
    bool Verify(const Hash256& message) const;
    
    bool operator==(const Ed25519Signature& o) const {
        return publicKey == o.publicKey && signature == o.signature;
    }
};

/// Unlocks an input with a signature
struct SignatureUnlock {
    static constexpr uint8_t TYPE = 0;
    Ed25519Signature signature;
    
    bool operator==(const SignatureUnlock& o) const { return signature == o.signature; }
};

/// Reuses the signature unlock at an earlier index
struct ReferenceUnlock {
    static constexpr uint8_t TYPE = 1;
    uint16_t index{0};
    
    bool operator==(const ReferenceUnlock& o) const { return index == o.index; }
};

using Unlock = std::variant<SignatureUnlock, ReferenceUnlock>;

template<typename Stream>
void Serialize(Stream& s, const Unlock& unlock) {
    if (const auto* sig = std::get_if<SignatureUnlock>(&unlock)) {
        ser_writedata8(s, SignatureUnlock::TYPE);
        ser_writedata8(s, Ed25519Signature::TYPE);
        Serialize(s, sig->signature.publicKey);
        Serialize(s, sig->signature.signature);
    } else {
        ser_writedata8(s, ReferenceUnlock::TYPE);
        ser_writedata16(s, std::get<ReferenceUnlock>(unlock).index);
    }
}

template<typename Stream>
void Unserialize(Stream& s, Unlock& unlock) {
    uint8_t type = ser_readdata8(s);
    if (type == SignatureUnlock::TYPE) {
        if (ser_readdata8(s) != Ed25519Signature::TYPE) {
            throw std::ios_base::failure("Unknown signature type");
        }
        SignatureUnlock sig;
        Unserialize(s, sig.signature.publicKey);
        Unserialize(s, sig.signature.signature);
        unlock = sig;
    } else if (type == ReferenceUnlock::TYPE) {
        ReferenceUnlock ref;
        ref.index = ser_readdata16(s);
        unlock = ref;
    } else {
        throw std::ios_base::failure("Unknown unlock type");
    }
}

// ============================================================================
// Transaction Payload
// ============================================================================

class TransactionPayload {
public:
    static constexpr uint32_t TYPE = 6;
    
    TransactionPayload() = default;
    TransactionPayload(TransactionEssence essence, std::vector<Unlock> unlocks)
        : essence_(std::move(essence)), unlocks_(std::move(unlocks)) {}
    
    const TransactionEssence& GetEssence() const { return essence_; }
    const std::vector<Unlock>& GetUnlocks() const { return unlocks_; }
    
    std::vector<Byte> ToBytes() const;
    static std::optional<TransactionPayload> FromBytes(const std::vector<Byte>& bytes);
    
    /// SHA-256 of the serialized payload
    TransactionId GetId() const;

private:
    TransactionEssence essence_;
    std::vector<Unlock> unlocks_;
};

template<typename Stream>
void Serialize(Stream& s, const TransactionPayload& tx) {
    ser_writedata32(s, TransactionPayload::TYPE);
    Serialize(s, tx.GetEssence());
    ser_writedata16(s, static_cast<uint16_t>(tx.GetUnlocks().size()));
    for (const auto& unlock : tx.GetUnlocks()) {
        Serialize(s, unlock);
    }
}

// ============================================================================
// Transaction Rules
// ============================================================================

/// SHA-256 over the concatenated hashes of the consumed outputs
Hash256 ComputeInputsCommitment(const std::vector<Output>& consumed);

/**
 * Verify that every input is unlocked: one signature unlock per distinct
 * unlock address (matching that address and valid over the essence hash)
 * and reference unlocks pointing back to it.
 */
bool VerifyUnlocks(const TransactionPayload& tx,
                   const std::vector<Output>& consumed,
                   uint32_t now);

} // namespace stardust

#endif // STARDUST_CORE_TRANSACTION_H
