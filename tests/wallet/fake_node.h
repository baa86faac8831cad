// STARDUST - Scripted Node Client for Tests
// Copyright (c) 2024 STARDUST Developers
// MIT License

#ifndef STARDUST_TESTS_WALLET_FAKE_NODE_H
#define STARDUST_TESTS_WALLET_FAKE_NODE_H

#include "stardust/client/node_client.h"

#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace stardust {
namespace test {

/**
 * In-memory INodeClient. Submissions follow `submitMode`; status queries
 * pop scripted answers and repeat Pending once the script is exhausted.
 */
class FakeNode : public client::INodeClient {
public:
    /// Fail throws NodeError; Crash throws a plain std::runtime_error
    enum class SubmitMode { Accept, Reject, Fail, Crash };

    /// One scripted status answer, or the exception thrown in its place
    struct StatusStep {
        enum class Kind { Answer, NodeFailure, Crash };
        Kind kind{Kind::Answer};
        client::InclusionStatus status;
    };

    client::SubmitResponse SubmitTransaction(const std::vector<Byte>& payload) override {
        std::chrono::milliseconds delay;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            submitted_.push_back(payload);
            delay = submitDelay_;
        }
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        switch (submitMode_) {
            case SubmitMode::Reject:
                return client::SubmitResponse::Rejected("invalid transaction");
            case SubmitMode::Fail:
                throw client::NodeError("connection refused");
            case SubmitMode::Crash:
                throw std::runtime_error("malformed node response");
            case SubmitMode::Accept:
                break;
        }
        return client::SubmitResponse::Accepted(BlockId::FromHex(std::string(64, 'b')));
    }

    client::InclusionStatus GetStatus(const TransactionId& txid) override {
        std::chrono::milliseconds delay;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queried_.push_back(txid);
            delay = statusDelay_;
            ++activeQueries_;
        }
        struct QueryDone {
            FakeNode& node;
            ~QueryDone() {
                std::lock_guard<std::mutex> lock(node.mutex_);
                --node.activeQueries_;
            }
        } done{*this};
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (script_.empty()) {
            return client::InclusionStatus::Pending();
        }
        StatusStep step = script_.front();
        script_.pop_front();
        switch (step.kind) {
            case StatusStep::Kind::NodeFailure:
                throw client::NodeError("status query timed out");
            case StatusStep::Kind::Crash:
                throw std::runtime_error("unexpected status payload");
            case StatusStep::Kind::Answer:
                break;
        }
        return step.status;
    }

    std::vector<client::OutputWithMetadata> FetchUnspentOutputs(const Address& address) override {
        std::vector<client::OutputWithMetadata> result;
        std::function<void()> hook;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (fetchFails_) {
                throw client::NodeError("node unreachable");
            }
            auto it = unspent_.find(address);
            if (it != unspent_.end()) {
                result = it->second;
            }
            hook = fetchHook_;
        }
        // Runs after the snapshot is taken, before it reaches the caller
        if (hook) {
            hook();
        }
        return result;
    }

    // ========================================================================
    // Scripting
    // ========================================================================

    void SetSubmitMode(SubmitMode mode) {
        std::lock_guard<std::mutex> lock(mutex_);
        submitMode_ = mode;
    }

    void SetSubmitDelay(std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex_);
        submitDelay_ = delay;
    }

    void SetStatusDelay(std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex_);
        statusDelay_ = delay;
    }

    void PushStatus(const client::InclusionStatus& status) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.push_back(StatusStep{StatusStep::Kind::Answer, status});
    }

    void PushStatusFailure() {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.push_back(StatusStep{StatusStep::Kind::NodeFailure, client::InclusionStatus()});
    }

    void PushStatusCrash() {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.push_back(StatusStep{StatusStep::Kind::Crash, client::InclusionStatus()});
    }

    /// Called once per FetchUnspentOutputs() after the answer is fixed
    void SetFetchHook(std::function<void()> hook) {
        std::lock_guard<std::mutex> lock(mutex_);
        fetchHook_ = std::move(hook);
    }

    void SetUnspent(const Address& address, std::vector<client::OutputWithMetadata> outputs) {
        std::lock_guard<std::mutex> lock(mutex_);
        unspent_[address] = std::move(outputs);
    }

    void SetFetchFails(bool fails) {
        std::lock_guard<std::mutex> lock(mutex_);
        fetchFails_ = fails;
    }

    size_t SubmitCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return submitted_.size();
    }

    std::vector<std::vector<Byte>> Submitted() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return submitted_;
    }

    size_t StatusQueryCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queried_.size();
    }

    /// Status queries that have started and not yet returned
    size_t ActiveStatusQueries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return activeQueries_;
    }

private:
    mutable std::mutex mutex_;
    SubmitMode submitMode_{SubmitMode::Accept};
    std::chrono::milliseconds submitDelay_{0};
    std::chrono::milliseconds statusDelay_{0};
    size_t activeQueries_{0};
    std::deque<StatusStep> script_;
    std::map<Address, std::vector<client::OutputWithMetadata>> unspent_;
    bool fetchFails_{false};
    std::function<void()> fetchHook_;
    std::vector<std::vector<Byte>> submitted_;
    std::vector<TransactionId> queried_;
};

} // namespace test
} // namespace stardust

#endif // STARDUST_TESTS_WALLET_FAKE_NODE_H
