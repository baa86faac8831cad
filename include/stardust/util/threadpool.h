// STARDUST - Thread Pool and Scheduler
// Copyright (c) 2024 STARDUST Developers
// MIT License
//
// Worker pool for I/O-bound background work and a scheduler for delayed,
// cancellable tasks. Confirmation polling runs on these.

#ifndef STARDUST_UTIL_THREADPOOL_H
#define STARDUST_UTIL_THREADPOOL_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <queue>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace stardust {
namespace util {

// ============================================================================
// Thread Pool
// ============================================================================

/**
 * Fixed set of worker threads consuming a FIFO task queue.
 *
 * Submit() returns a future that carries the task's result or exception.
 * Execute() is fire-and-forget; an exception escaping such a task is
 * logged and the worker keeps running.
 */
class ThreadPool {
public:
    struct Config {
        size_t numThreads{0};       // 0 = hardware concurrency
        size_t maxQueueSize{10000};
        std::string name{"pool"};
    };

    ThreadPool();
    explicit ThreadPool(size_t numThreads);
    explicit ThreadPool(const Config& config);

    /// Joins the workers; queued tasks that have not started are dropped
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Block until the queue is empty and no task is executing
    void Wait();

    void Shutdown();

    bool IsRunning() const { return running_.load(); }
    size_t ThreadCount() const { return workers_.size(); }
    size_t PendingTasks() const;
    size_t ActiveTasks() const { return activeTasks_.load(); }
    const std::string& GetName() const { return config_.name; }

    template<typename F, typename... Args>
    auto Submit(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type> {
        using ReturnType = typename std::invoke_result<F, Args...>::type;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...));
        std::future<ReturnType> result = task->get_future();
        Enqueue([task]() { (*task)(); });
        return result;
    }

    template<typename F, typename... Args>
    void Execute(F&& f, Args&&... args) {
        Enqueue(std::bind(std::forward<F>(f), std::forward<Args>(args)...));
    }

private:
    void Start();
    void Enqueue(std::function<void()> func);
    void WorkerLoop();

    Config config_;
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    mutable std::mutex queueMutex_;
    std::condition_variable condition_;
    std::condition_variable waitCondition_;

    std::atomic<bool> running_{false};
    std::atomic<size_t> activeTasks_{0};
};

// ============================================================================
// Scheduler
// ============================================================================

/**
 * Runs tasks on a thread pool once their delay has elapsed.
 *
 * Each scheduled task gets an id; Cancel(id) removes it if it has not been
 * dispatched yet. A task that is already running is not interrupted.
 */
class Scheduler {
public:
    using TaskId = uint64_t;

    /// Workers of the pool owned by a default-constructed scheduler. A task
    /// blocked on I/O holds one worker; due tasks beyond this count wait.
    static constexpr size_t DEFAULT_SCHEDULER_WORKERS = 4;

    /// Scheduler with its own pool of DEFAULT_SCHEDULER_WORKERS workers
    Scheduler();

    /// Scheduler dispatching onto an external pool that outlives it
    explicit Scheduler(ThreadPool& pool);

    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    void Start();
    void Stop();
    bool IsRunning() const { return running_.load(); }

    template<typename F, typename... Args>
    TaskId ScheduleAfter(std::chrono::milliseconds delay, F&& f, Args&&... args) {
        return ScheduleTask(std::chrono::steady_clock::now() + delay,
                            std::bind(std::forward<F>(f), std::forward<Args>(args)...));
    }

    /// False if the task already ran, is running or never existed
    bool Cancel(TaskId taskId);

    void CancelAll();

    /// Number of tasks waiting for their deadline
    size_t TaskCount() const;

private:
    using Deadline = std::pair<std::chrono::steady_clock::time_point, TaskId>;

    TaskId ScheduleTask(std::chrono::steady_clock::time_point time,
                        std::function<void()> func);
    void SchedulerLoop();

    std::unique_ptr<ThreadPool> ownedPool_;
    ThreadPool* pool_;
    std::thread schedulerThread_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::set<Deadline> deadlines_;
    std::map<TaskId, std::function<void()>> tasks_;

    std::atomic<bool> running_{false};
    std::atomic<TaskId> nextId_{1};
};

} // namespace util
} // namespace stardust

#endif // STARDUST_UTIL_THREADPOOL_H
