// STARDUST - Account Synchronization
// Copyright (c) 2024 STARDUST Developers
// MIT License

#ifndef STARDUST_WALLET_SYNC_H
#define STARDUST_WALLET_SYNC_H

#include "stardust/client/node_client.h"
#include "stardust/core/types.h"
#include "stardust/wallet/account.h"

#include <cstddef>
#include <string>

namespace stardust {
namespace wallet {

struct SyncResult {
    bool success{false};
    ErrorCode error{ErrorCode::None};
    std::string message;

    size_t outputsBefore{0};
    size_t outputsAfter{0};

    static SyncResult Failure(ErrorCode code, const std::string& msg) {
        SyncResult r;
        r.error = code;
        r.message = msg;
        return r;
    }
};

/**
 * Replace the account's outputs with the unspent outputs the node reports
 * for its addresses. Local Reserved/PendingSpent marks survive for outputs
 * that are still unspent. Nothing changes if any address query fails.
 * Outputs settled by a confirmation while the queries run stay removed.
 */
SyncResult SyncAccount(Account& account, client::INodeClient& client);

} // namespace wallet
} // namespace stardust

#endif // STARDUST_WALLET_SYNC_H
