// STARDUST - Transaction Implementation
// Copyright (c) 2024 STARDUST Developers
// MIT License

#include "stardust/core/transaction.h"
#include "stardust/core/hex.h"
#include "stardust/crypto/sha256.h"

#include <map>

namespace stardust {

// ============================================================================
// OutputId
// ============================================================================

std::string OutputId::ToHex() const {
    DataStream ss;
    Serialize(ss, *this);
    return "0x" + ss.ToHex();
}

std::optional<OutputId> OutputId::FromHex(const std::string& hex) {
    auto bytes = TryParseHex(hex);
    if (!bytes || bytes->size() != SIZE) {
        return std::nullopt;
    }
    DataStream ss(std::move(*bytes));
    OutputId id;
    Unserialize(ss, id);
    return id;
}

// ============================================================================
// Essence and Signatures
// ============================================================================

Hash256 TransactionEssence::GetHash() const {
    DataStream ss;
    Serialize(ss, *this);
    return SHA256Hash(ss.Data());
}

bool Ed25519Signature::Verify(const Hash256& message) const {
    return Ed25519Verify(publicKey, message.data(), message.size(), signature);
}

// ============================================================================
// TransactionPayload
// ============================================================================

std::vector<Byte> TransactionPayload::ToBytes() const {
    DataStream ss;
    Serialize(ss, *this);
    return ss.Data();
}

std::optional<TransactionPayload> TransactionPayload::FromBytes(const std::vector<Byte>& bytes) {
    DataStream ss(bytes);
    TransactionEssence essence;
    std::vector<Unlock> unlocks;
    try {
        if (ser_readdata32(ss) != TYPE) {
            return std::nullopt;
        }
        Unserialize(ss, essence);
        uint16_t count = ser_readdata16(ss);
        for (uint16_t i = 0; i < count; ++i) {
            Unlock unlock;
            Unserialize(ss, unlock);
            unlocks.push_back(unlock);
        }
    } catch (const std::ios_base::failure&) {
        return std::nullopt;
    }
    if (!ss.empty() || unlocks.size() != essence.inputs.size()) {
        return std::nullopt;
    }
    for (const auto& output : essence.outputs) {
        if (!CheckOutputStructure(output).IsValid()) {
            return std::nullopt;
        }
    }
    return TransactionPayload(std::move(essence), std::move(unlocks));
}

TransactionId TransactionPayload::GetId() const {
    return TransactionId(SHA256Hash(ToBytes()));
}

// ============================================================================
// Transaction Rules
// ============================================================================

Hash256 ComputeInputsCommitment(const std::vector<Output>& consumed) {
    SHA256 hasher;
    for (const auto& output : consumed) {
        Hash256 outputHash = output.GetHash();
        hasher.Write(outputHash.data(), outputHash.size());
    }
    Hash256 result;
    hasher.Finalize(result.data());
    return result;
}

bool VerifyUnlocks(const TransactionPayload& tx,
                   const std::vector<Output>& consumed,
                   uint32_t now) {
    const auto& essence = tx.GetEssence();
    const auto& unlocks = tx.GetUnlocks();
    if (consumed.size() != essence.inputs.size() || unlocks.size() != consumed.size()) {
        return false;
    }
    if (ComputeInputsCommitment(consumed) != essence.inputsCommitment) {
        return false;
    }
    
    const Hash256 message = essence.GetHash();
    std::map<Address, size_t> signedAt;
    
    for (size_t i = 0; i < consumed.size(); ++i) {
        if (consumed[i].IsTimelocked(now)) {
            return false;
        }
        Address required = consumed[i].GetUnlockAddress(now);
        
        if (const auto* sig = std::get_if<SignatureUnlock>(&unlocks[i])) {
            if (signedAt.count(required) != 0) {
                return false;  // must reference the earlier unlock
            }
            if (sig->signature.GetAddress() != required || !sig->signature.Verify(message)) {
                return false;
            }
            signedAt[required] = i;
        } else {
            const auto& ref = std::get<ReferenceUnlock>(unlocks[i]);
            auto it = signedAt.find(required);
            if (it == signedAt.end() || it->second != ref.index) {
                return false;
            }
        }
    }
    return true;
}

} // namespace stardust
