// STARDUST - Thread Pool Implementation
// Copyright (c) 2024 STARDUST Developers
// MIT License

#include "stardust/util/threadpool.h"
#include "stardust/util/logging.h"

namespace stardust {
namespace util {

// ============================================================================
// ThreadPool
// ============================================================================

ThreadPool::ThreadPool() : ThreadPool(Config{}) {}

ThreadPool::ThreadPool(size_t numThreads) {
    config_.numThreads = numThreads;
    Start();
}

ThreadPool::ThreadPool(const Config& config) : config_(config) {
    Start();
}

ThreadPool::~ThreadPool() {
    Shutdown();
}

void ThreadPool::Start() {
    running_.store(true);

    size_t numThreads = config_.numThreads;
    if (numThreads == 0) {
        numThreads = std::thread::hardware_concurrency();
        if (numThreads == 0) {
            numThreads = 2;
        }
    }

    workers_.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
        workers_.emplace_back(&ThreadPool::WorkerLoop, this);
    }
}

void ThreadPool::Wait() {
    std::unique_lock<std::mutex> lock(queueMutex_);
    waitCondition_.wait(lock, [this] {
        return tasks_.empty() && activeTasks_.load() == 0;
    });
}

void ThreadPool::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    std::lock_guard<std::mutex> lock(queueMutex_);
    std::queue<std::function<void()>> empty;
    std::swap(tasks_, empty);
    waitCondition_.notify_all();
}

size_t ThreadPool::PendingTasks() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return tasks_.size();
}

void ThreadPool::Enqueue(std::function<void()> func) {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (!running_.load()) {
            throw std::runtime_error("ThreadPool " + config_.name + " not running");
        }
        if (tasks_.size() >= config_.maxQueueSize) {
            throw std::runtime_error("ThreadPool " + config_.name + " queue full");
        }
        tasks_.push(std::move(func));
    }
    condition_.notify_one();
}

void ThreadPool::WorkerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            condition_.wait(lock, [this] {
                return !running_.load() || !tasks_.empty();
            });
            if (!running_.load()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
            activeTasks_.fetch_add(1);
        }

        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR(LogCategory::DEFAULT) << "Task on pool " << config_.name
                                            << " failed: " << e.what();
        }

        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            activeTasks_.fetch_sub(1);
        }
        waitCondition_.notify_all();
    }
}

// ============================================================================
// Scheduler
// ============================================================================

Scheduler::Scheduler()
    : ownedPool_(new ThreadPool(
          ThreadPool::Config{DEFAULT_SCHEDULER_WORKERS, 10000, "scheduler"}))
    , pool_(ownedPool_.get()) {}

Scheduler::Scheduler(ThreadPool& pool) : pool_(&pool) {}

Scheduler::~Scheduler() {
    Stop();
}

void Scheduler::Start() {
    if (running_.exchange(true)) {
        return;
    }
    schedulerThread_ = std::thread(&Scheduler::SchedulerLoop, this);
}

void Scheduler::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    condition_.notify_all();
    if (schedulerThread_.joinable()) {
        schedulerThread_.join();
    }
    CancelAll();
}

bool Scheduler::Cancel(TaskId taskId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(taskId);
    if (it == tasks_.end()) {
        return false;
    }
    tasks_.erase(it);
    for (auto d = deadlines_.begin(); d != deadlines_.end(); ++d) {
        if (d->second == taskId) {
            deadlines_.erase(d);
            break;
        }
    }
    condition_.notify_all();
    return true;
}

void Scheduler::CancelAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    tasks_.clear();
    deadlines_.clear();
}

size_t Scheduler::TaskCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

Scheduler::TaskId Scheduler::ScheduleTask(std::chrono::steady_clock::time_point time,
                                          std::function<void()> func) {
    TaskId id = nextId_.fetch_add(1);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.emplace(id, std::move(func));
        deadlines_.emplace(time, id);
    }
    condition_.notify_all();
    return id;
}

void Scheduler::SchedulerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_.load()) {
        if (deadlines_.empty()) {
            condition_.wait(lock, [this] {
                return !running_.load() || !deadlines_.empty();
            });
            continue;
        }

        auto next = *deadlines_.begin();
        if (next.first > std::chrono::steady_clock::now()) {
            condition_.wait_until(lock, next.first);
            continue;
        }

        deadlines_.erase(deadlines_.begin());
        auto it = tasks_.find(next.second);
        if (it == tasks_.end()) {
            continue;
        }
        std::function<void()> func = std::move(it->second);
        tasks_.erase(it);

        lock.unlock();
        try {
            pool_->Execute(std::move(func));
        } catch (const std::runtime_error& e) {
            LOG_ERROR(LogCategory::DEFAULT) << "Dropping scheduled task "
                                            << next.second << ": " << e.what();
        }
        lock.lock();
    }
}

} // namespace util
} // namespace stardust
