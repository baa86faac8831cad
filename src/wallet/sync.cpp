// STARDUST - Account Synchronization Implementation
// Copyright (c) 2024 STARDUST Developers
// MIT License

#include "stardust/wallet/sync.h"
#include "stardust/util/logging.h"

#include <map>
#include <vector>

namespace stardust {
namespace wallet {

namespace LogCategory = util::LogCategory;

namespace {

/// Ends the account's sync unless ReplaceOutputs() did
class SyncMarkerGuard {
public:
    explicit SyncMarkerGuard(Account& account) : account_(account), marker_(account.BeginSync()) {}

    ~SyncMarkerGuard() {
        if (active_) {
            account_.AbandonSync(marker_);
        }
    }

    SyncMarkerGuard(const SyncMarkerGuard&) = delete;
    SyncMarkerGuard& operator=(const SyncMarkerGuard&) = delete;

    uint64_t Marker() const { return marker_; }
    void Commit() { active_ = false; }

private:
    Account& account_;
    uint64_t marker_;
    bool active_{true};
};

} // namespace

SyncResult SyncAccount(Account& account, client::INodeClient& client) {
    // Query without the account lock; the node round trips may be slow.
    // Outputs settled while querying are not brought back by a stale view.
    SyncMarkerGuard sync(account);
    std::map<OutputId, WalletOutput> fetched;
    for (const auto& address : account.GetAddresses()) {
        std::vector<client::OutputWithMetadata> unspent;
        try {
            unspent = client.FetchUnspentOutputs(address);
        } catch (const client::NodeError& e) {
            LOG_WARN(LogCategory::SYNC) << account.GetAlias() << ": fetching "
                                        << address.ToHex() << " failed: " << e.what();
            return SyncResult::Failure(ErrorCode::NetworkError, e.what());
        }

        for (const auto& item : unspent) {
            WalletOutput out(item.outputId, item.output);
            out.blockId = item.blockId;
            out.milestoneIndex = item.milestoneIndex;
            out.milestoneTimestamp = item.milestoneTimestamp;
            fetched[item.outputId] = std::move(out);
        }
    }

    std::vector<WalletOutput> outputs;
    outputs.reserve(fetched.size());
    for (auto& [id, out] : fetched) {
        outputs.push_back(std::move(out));
    }

    SyncResult result;
    {
        auto lock = account.Lock();
        result.outputsBefore = account.OutputCount();
        account.ReplaceOutputs(outputs, sync.Marker());
        sync.Commit();
        result.outputsAfter = account.OutputCount();
    }
    result.success = true;

    LOG_INFO(LogCategory::SYNC) << account.GetAlias() << ": synced, "
                                << result.outputsAfter << " unspent outputs";
    return result;
}

} // namespace wallet
} // namespace stardust
