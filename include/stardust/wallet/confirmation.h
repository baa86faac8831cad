// STARDUST - Inclusion Confirmation
// Copyright (c) 2024 STARDUST Developers
// MIT License
//
// Polls the node for the inclusion state of a submitted transaction and
// settles the account when the answer is definitive.
//
//   Submitted -> Confirmed     inputs removed, block recorded
//   Submitted -> Conflicting   inputs Available again, ConflictingTransaction
//   Submitted -> TimedOut      pending marks kept, Timeout
//   Submitted -> Cancelled     local wait abandoned, nothing touched
//
// Every poll is a task on a util::Scheduler; nothing blocks between polls.

#ifndef STARDUST_WALLET_CONFIRMATION_H
#define STARDUST_WALLET_CONFIRMATION_H

#include "stardust/client/node_client.h"
#include "stardust/core/types.h"
#include "stardust/util/threadpool.h"
#include "stardust/wallet/account.h"
#include "stardust/wallet/txbuilder.h"

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace stardust {
namespace wallet {

/// Polling schedule
struct ConfirmationPolicy {
    std::chrono::milliseconds initialInterval{1000};
    double backoffMultiplier{1.5};
    std::chrono::milliseconds maxInterval{10000};
    uint32_t maxAttempts{40};
    std::chrono::milliseconds maxWait{120000};

    /// Interval following `current`, capped at maxInterval
    std::chrono::milliseconds NextInterval(std::chrono::milliseconds current) const;
};

enum class ConfirmationState {
    Submitted,
    Confirmed,
    Conflicting,
    TimedOut,
    Cancelled,
};

const char* ConfirmationStateToString(ConfirmationState state);

struct ConfirmationResult {
    ConfirmationState state{ConfirmationState::Submitted};
    ErrorCode error{ErrorCode::None};
    std::string message;

    /// Including block (Confirmed)
    BlockId blockId;

    /// Status queries made
    uint32_t attempts{0};

    bool IsConfirmed() const { return state == ConfirmationState::Confirmed; }

    static ConfirmationResult Confirmed(const BlockId& block, uint32_t attempts) {
        ConfirmationResult r;
        r.state = ConfirmationState::Confirmed;
        r.blockId = block;
        r.attempts = attempts;
        return r;
    }

    static ConfirmationResult Failure(ConfirmationState state, ErrorCode code,
                                      const std::string& msg, uint32_t attempts) {
        ConfirmationResult r;
        r.state = state;
        r.error = code;
        r.message = msg;
        r.attempts = attempts;
        return r;
    }
};

namespace detail {
struct ConfirmationJob;
}

/**
 * Handle to one tracked transaction. Copies share the same job.
 */
class ConfirmationTask {
public:
    ConfirmationTask() = default;

    bool IsValid() const { return job_ != nullptr; }

    const SubmissionHandle& GetHandle() const;

    /// Current state; Submitted until a terminal state is reached
    ConfirmationState GetState() const;

    /// Resolves once with the terminal result
    std::shared_future<ConfirmationResult> GetFuture() const;

    /// Block until the terminal result is available
    ConfirmationResult Wait() const;

    /// False if no result within `timeout`
    bool WaitFor(std::chrono::milliseconds timeout) const;

    /// Stop polling. The transaction itself is unaffected. Returns false if
    /// a terminal state was already reached.
    bool Cancel();

private:
    friend class ConfirmationTracker;

    explicit ConfirmationTask(std::shared_ptr<detail::ConfirmationJob> job)
        : job_(std::move(job)) {}

    std::shared_ptr<detail::ConfirmationJob> job_;
};

/**
 * Drives confirmation jobs for one account.
 *
 * The account, client and scheduler must outlive the tracker. Destroying
 * the tracker cancels the jobs that are still polling and waits for status
 * queries already in flight, so none touches the account afterwards.
 */
class ConfirmationTracker {
public:
    ConfirmationTracker(Account& account, client::INodeClient& client,
                        util::Scheduler& scheduler);
    ~ConfirmationTracker();

    ConfirmationTracker(const ConfirmationTracker&) = delete;
    ConfirmationTracker& operator=(const ConfirmationTracker&) = delete;

    /// Start polling for `handle`; the first query runs after the initial interval
    ConfirmationTask Track(const SubmissionHandle& handle,
                           const ConfirmationPolicy& policy = ConfirmationPolicy());

    /// Blocking form of Track()
    ConfirmationResult WaitForInclusion(const SubmissionHandle& handle,
                                        const ConfirmationPolicy& policy = ConfirmationPolicy());

    /// Jobs that have not reached a terminal state
    size_t ActiveCount() const;

    /// Cancel every job and wait for in-flight status queries to return
    void CancelAll();

private:
    Account& account_;
    client::INodeClient& client_;
    util::Scheduler& scheduler_;

    mutable std::mutex mutex_;
    std::vector<std::weak_ptr<detail::ConfirmationJob>> jobs_;
};

} // namespace wallet
} // namespace stardust

#endif // STARDUST_WALLET_CONFIRMATION_H
