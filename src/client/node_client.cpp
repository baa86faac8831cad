// STARDUST - Node Client Interface
// Copyright (c) 2024 STARDUST Developers
// MIT License

#include "stardust/client/node_client.h"

namespace stardust {
namespace client {

const char* InclusionStateToString(InclusionState state) {
    switch (state) {
        case InclusionState::Pending:     return "pending";
        case InclusionState::Confirmed:   return "confirmed";
        case InclusionState::Conflicting: return "conflicting";
        case InclusionState::NotFound:    return "not-found";
        default:                          return "unknown";
    }
}

} // namespace client
} // namespace stardust
