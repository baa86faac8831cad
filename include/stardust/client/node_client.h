// STARDUST - Node Client Interface
// Copyright (c) 2024 STARDUST Developers
// MIT License
//
// Contract of the network node the engine talks to. Transport is out of
// scope; implementations wrap whatever API the node exposes.

#ifndef STARDUST_CLIENT_NODE_CLIENT_H
#define STARDUST_CLIENT_NODE_CLIENT_H

#include "stardust/core/address.h"
#include "stardust/core/output.h"
#include "stardust/core/transaction.h"
#include "stardust/core/types.h"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace stardust {
namespace client {

/// Transport-level failure (connection refused, timeout, malformed reply).
/// Thrown by INodeClient implementations.
class NodeError : public std::runtime_error {
public:
    explicit NodeError(const std::string& msg) : std::runtime_error(msg) {}
};

/// Node's answer to a submission
struct SubmitResponse {
    bool accepted{false};
    /// Block that carries the transaction (when accepted)
    BlockId blockId;
    /// Refusal reason (when not accepted)
    std::string reason;

    static SubmitResponse Accepted(const BlockId& block) {
        SubmitResponse r;
        r.accepted = true;
        r.blockId = block;
        return r;
    }

    static SubmitResponse Rejected(const std::string& why) {
        SubmitResponse r;
        r.reason = why;
        return r;
    }
};

enum class InclusionState {
    Pending,
    Confirmed,
    Conflicting,
    NotFound,
};

const char* InclusionStateToString(InclusionState state);

struct InclusionStatus {
    InclusionState state{InclusionState::Pending};
    /// Referencing block for Confirmed
    BlockId blockId;
    /// Conflict reason reported by the node
    std::string reason;

    static InclusionStatus Pending() { return InclusionStatus(); }

    static InclusionStatus Confirmed(const BlockId& block) {
        InclusionStatus s;
        s.state = InclusionState::Confirmed;
        s.blockId = block;
        return s;
    }

    static InclusionStatus Conflicting(const std::string& why) {
        InclusionStatus s;
        s.state = InclusionState::Conflicting;
        s.reason = why;
        return s;
    }

    static InclusionStatus NotFound() {
        InclusionStatus s;
        s.state = InclusionState::NotFound;
        return s;
    }
};

/// An unspent output with its ledger metadata
struct OutputWithMetadata {
    OutputId outputId;
    Output output;
    BlockId blockId;
    uint32_t milestoneIndex{0};
    uint32_t milestoneTimestamp{0};
};

/**
 * Node API used by the engine. All methods may be called from worker
 * threads concurrently and throw NodeError on transport failure.
 */
class INodeClient {
public:
    virtual ~INodeClient() = default;

    /// Submit a serialized transaction payload
    virtual SubmitResponse SubmitTransaction(const std::vector<Byte>& payload) = 0;

    /// Inclusion state of a previously submitted transaction
    virtual InclusionStatus GetStatus(const TransactionId& txid) = 0;

    /// Unspent outputs currently owned by `address`
    virtual std::vector<OutputWithMetadata> FetchUnspentOutputs(const Address& address) = 0;
};

} // namespace client
} // namespace stardust

#endif // STARDUST_CLIENT_NODE_CLIENT_H
