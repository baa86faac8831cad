// STARDUST - Inclusion Confirmation Implementation
// Copyright (c) 2024 STARDUST Developers
// MIT License

#include "stardust/wallet/confirmation.h"
#include "stardust/util/logging.h"

#include <algorithm>
#include <condition_variable>
#include <exception>

namespace stardust {
namespace wallet {

namespace LogCategory = util::LogCategory;
using std::chrono::milliseconds;

std::chrono::milliseconds ConfirmationPolicy::NextInterval(milliseconds current) const {
    double next = static_cast<double>(current.count()) * std::max(backoffMultiplier, 1.0);
    if (next > static_cast<double>(maxInterval.count())) {
        return maxInterval;
    }
    return milliseconds(static_cast<milliseconds::rep>(next));
}

const char* ConfirmationStateToString(ConfirmationState state) {
    switch (state) {
        case ConfirmationState::Submitted:   return "submitted";
        case ConfirmationState::Confirmed:   return "confirmed";
        case ConfirmationState::Conflicting: return "conflicting";
        case ConfirmationState::TimedOut:    return "timed-out";
        case ConfirmationState::Cancelled:   return "cancelled";
        default:                             return "unknown";
    }
}

// ============================================================================
// Job
// ============================================================================

namespace detail {

struct ConfirmationJob : public std::enable_shared_from_this<ConfirmationJob> {
    ConfirmationJob(Account& acc, client::INodeClient& cl, util::Scheduler& sched,
                    const SubmissionHandle& h, const ConfirmationPolicy& p)
        : account(acc), client(cl), scheduler(sched), handle(h), policy(p),
          started(std::chrono::steady_clock::now()), interval(p.initialInterval),
          future(promise.get_future().share()) {}

    void Start();
    void Poll();
    bool Cancel();

    ConfirmationState GetState() const {
        std::lock_guard<std::mutex> lock(mutex);
        return state;
    }

    /// Terminal and no status query outstanding
    bool IsSettled() const {
        std::lock_guard<std::mutex> lock(mutex);
        return state != ConfirmationState::Submitted && !querying;
    }

    /// Block until no Poll() is talking to the node
    void WaitIdle() {
        std::unique_lock<std::mutex> lock(mutex);
        idle.wait(lock, [this]() { return !querying; });
    }

    // Both require `mutex`
    void Finish(const ConfirmationResult& result);
    void ScheduleNext(milliseconds delay);

    Account& account;
    client::INodeClient& client;
    util::Scheduler& scheduler;
    const SubmissionHandle handle;
    const ConfirmationPolicy policy;
    const std::chrono::steady_clock::time_point started;

    mutable std::mutex mutex;
    std::condition_variable idle;
    bool querying{false};
    ConfirmationState state{ConfirmationState::Submitted};
    uint32_t attempts{0};
    milliseconds interval;
    util::Scheduler::TaskId taskId{0};

    std::promise<ConfirmationResult> promise;
    std::shared_future<ConfirmationResult> future;
};

void ConfirmationJob::Finish(const ConfirmationResult& result) {
    state = result.state;
    promise.set_value(result);

    LOG_INFO(LogCategory::CONFIRM) << handle.transactionId.ToHex() << ": "
                                   << ConfirmationStateToString(result.state)
                                   << " after " << result.attempts << " queries";
}

void ConfirmationJob::ScheduleNext(milliseconds delay) {
    std::shared_ptr<ConfirmationJob> self = shared_from_this();
    taskId = scheduler.ScheduleAfter(delay, [self]() { self->Poll(); });
}

void ConfirmationJob::Start() {
    std::lock_guard<std::mutex> lock(mutex);
    if (policy.maxAttempts == 0 || policy.maxWait.count() <= 0) {
        Finish(ConfirmationResult::Failure(ConfirmationState::TimedOut, ErrorCode::Timeout,
                                           "Empty polling budget", 0));
        return;
    }
    ScheduleNext(std::min(interval, policy.maxWait));
}

void ConfirmationJob::Poll() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (state != ConfirmationState::Submitted) {
            return;
        }
        ++attempts;
        querying = true;
    }

    // No lock held while talking to the node. Any failure counts as an
    // unanswered attempt.
    client::InclusionStatus status;
    bool queried = true;
    try {
        status = client.GetStatus(handle.transactionId);
    } catch (const client::NodeError& e) {
        queried = false;
        LOG_WARN(LogCategory::CONFIRM) << handle.transactionId.ToHex()
                                       << ": status query failed: " << e.what();
    } catch (const std::exception& e) {
        queried = false;
        LOG_ERROR(LogCategory::CONFIRM) << handle.transactionId.ToHex()
                                        << ": unexpected status query error: " << e.what();
    }

    std::lock_guard<std::mutex> lock(mutex);
    querying = false;
    idle.notify_all();
    if (state != ConfirmationState::Submitted) {
        // Cancelled while the query was in flight
        return;
    }

    if (queried) {
        LOG_DEBUG(LogCategory::CONFIRM) << handle.transactionId.ToHex() << ": attempt "
                                        << attempts << " "
                                        << client::InclusionStateToString(status.state);
        switch (status.state) {
            case client::InclusionState::Confirmed: {
                size_t removed = account.SettleConfirmed(handle.transactionId, status.blockId);
                LOG_DEBUG(LogCategory::CONFIRM) << "Removed " << removed << " spent inputs";
                Finish(ConfirmationResult::Confirmed(status.blockId, attempts));
                return;
            }
            case client::InclusionState::Conflicting: {
                size_t reverted = account.RevertPending(handle.transactionId);
                LOG_DEBUG(LogCategory::CONFIRM) << "Reverted " << reverted << " inputs";
                Finish(ConfirmationResult::Failure(
                    ConfirmationState::Conflicting, ErrorCode::ConflictingTransaction,
                    status.reason.empty() ? "Conflicting transaction" : status.reason,
                    attempts));
                return;
            }
            case client::InclusionState::Pending:
            case client::InclusionState::NotFound:
                break;
        }
    }

    auto elapsed = std::chrono::duration_cast<milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (attempts >= policy.maxAttempts || elapsed >= policy.maxWait) {
        Finish(ConfirmationResult::Failure(
            ConfirmationState::TimedOut, ErrorCode::Timeout,
            "No definitive status after " + std::to_string(attempts) + " queries",
            attempts));
        return;
    }

    interval = policy.NextInterval(interval);
    ScheduleNext(std::min(interval, policy.maxWait - elapsed));
}

bool ConfirmationJob::Cancel() {
    std::lock_guard<std::mutex> lock(mutex);
    if (state != ConfirmationState::Submitted) {
        return false;
    }
    if (!scheduler.Cancel(taskId)) {
        LOG_TRACE(LogCategory::CONFIRM) << "Poll " << taskId << " already dispatched";
    }
    Finish(ConfirmationResult::Failure(ConfirmationState::Cancelled, ErrorCode::Cancelled,
                                       "Wait cancelled", attempts));
    return true;
}

} // namespace detail

// ============================================================================
// ConfirmationTask
// ============================================================================

const SubmissionHandle& ConfirmationTask::GetHandle() const {
    return job_->handle;
}

ConfirmationState ConfirmationTask::GetState() const {
    return job_->GetState();
}

std::shared_future<ConfirmationResult> ConfirmationTask::GetFuture() const {
    return job_->future;
}

ConfirmationResult ConfirmationTask::Wait() const {
    return job_->future.get();
}

bool ConfirmationTask::WaitFor(milliseconds timeout) const {
    return job_->future.wait_for(timeout) == std::future_status::ready;
}

bool ConfirmationTask::Cancel() {
    return job_ != nullptr && job_->Cancel();
}

// ============================================================================
// ConfirmationTracker
// ============================================================================

ConfirmationTracker::ConfirmationTracker(Account& account, client::INodeClient& client,
                                         util::Scheduler& scheduler)
    : account_(account), client_(client), scheduler_(scheduler) {
    scheduler_.Start();
}

ConfirmationTracker::~ConfirmationTracker() {
    CancelAll();
}

ConfirmationTask ConfirmationTracker::Track(const SubmissionHandle& handle,
                                            const ConfirmationPolicy& policy) {
    auto job = std::make_shared<detail::ConfirmationJob>(account_, client_, scheduler_,
                                                         handle, policy);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs_.erase(std::remove_if(jobs_.begin(), jobs_.end(),
                                   [](const std::weak_ptr<detail::ConfirmationJob>& w) {
                                       auto j = w.lock();
                                       return !j || j->IsSettled();
                                   }),
                    jobs_.end());
        jobs_.push_back(job);
    }

    LOG_DEBUG(LogCategory::CONFIRM) << "Tracking " << handle.ToString();
    job->Start();
    return ConfirmationTask(job);
}

ConfirmationResult ConfirmationTracker::WaitForInclusion(const SubmissionHandle& handle,
                                                         const ConfirmationPolicy& policy) {
    return Track(handle, policy).Wait();
}

size_t ConfirmationTracker::ActiveCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& weak : jobs_) {
        auto job = weak.lock();
        if (job && job->GetState() == ConfirmationState::Submitted) {
            ++count;
        }
    }
    return count;
}

void ConfirmationTracker::CancelAll() {
    std::vector<std::shared_ptr<detail::ConfirmationJob>> active;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& weak : jobs_) {
            if (auto job = weak.lock()) {
                active.push_back(std::move(job));
            }
        }
        jobs_.clear();
    }
    for (auto& job : active) {
        job->Cancel();
    }
    // A poll dispatched before the cancel may still be querying the node
    for (auto& job : active) {
        job->WaitIdle();
    }
}

} // namespace wallet
} // namespace stardust
