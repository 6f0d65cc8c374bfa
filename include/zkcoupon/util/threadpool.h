// ZKCOUPON - Thread Pool
// Copyright (c) 2024 ZKCOUPON Developers
// MIT License
//
// Worker pool used for batch proof verification, plus a scheduler that
// drives periodic maintenance (expiry sweeps, reservation reconciliation).

#ifndef ZKCOUPON_UTIL_THREADPOOL_H
#define ZKCOUPON_UTIL_THREADPOOL_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace zkcoupon {
namespace util {

// ============================================================================
// Thread Pool
// ============================================================================

/**
 * Fixed-size FIFO thread pool.
 *
 * Submit() returns a future that carries the task's result or exception.
 * Shutdown() drops tasks that have not started yet and joins the workers.
 */
class ThreadPool {
public:
    struct Config {
        size_t numThreads{0};        // 0 = hardware concurrency
        size_t maxQueueSize{10000};  // Maximum pending tasks
        std::string name{"pool"};    // Pool name for logging
    };

    ThreadPool();
    explicit ThreadPool(size_t numThreads);
    explicit ThreadPool(const Config& config);

    /// Joins the workers
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Block until the queue is drained and no task is executing
    void Wait();

    void Shutdown();

    bool IsRunning() const { return running_.load(); }
    size_t ThreadCount() const { return workers_.size(); }
    size_t PendingTasks() const;
    size_t ActiveTasks() const { return activeTasks_.load(); }
    const std::string& Name() const { return config_.name; }

    /**
     * Submit a task for execution.
     * @throws std::runtime_error if the pool is stopped or the queue is full
     */
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

    /// Fire-and-forget variant; exceptions are logged by the worker
    template<typename F, typename... Args>
    void Execute(F&& f, Args&&... args) {
        Enqueue(std::bind(std::forward<F>(f), std::forward<Args>(args)...));
    }

private:
    void Start();
    void Enqueue(std::function<void()> task);
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
// Scheduled Tasks
// ============================================================================

/**
 * Scheduler for delayed and periodic tasks. Due tasks are handed to the
 * pool, so a slow task never delays the timer thread.
 */
class Scheduler {
public:
    explicit Scheduler(ThreadPool& pool);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    void Start();
    void Stop();
    bool IsRunning() const { return running_.load(); }

    /// Run once after `delay`; returns an id for Cancel()
    uint64_t ScheduleAfter(std::chrono::milliseconds delay, std::function<void()> func);

    /// Run every `period`, first after `initialDelay`
    uint64_t SchedulePeriodic(std::chrono::milliseconds initialDelay,
                              std::chrono::milliseconds period,
                              std::function<void()> func);

    bool Cancel(uint64_t taskId);
    void CancelAll();
    size_t TaskCount() const;

private:
    struct ScheduledTask {
        uint64_t id;
        std::chrono::steady_clock::time_point nextRun;
        std::chrono::milliseconds period;
        std::function<void()> task;

        bool operator>(const ScheduledTask& other) const {
            return nextRun > other.nextRun;
        }
    };

    uint64_t ScheduleTask(std::chrono::steady_clock::time_point time,
                          std::chrono::milliseconds period,
                          std::function<void()> func);
    void SchedulerLoop();

    ThreadPool& pool_;
    std::thread schedulerThread_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::priority_queue<ScheduledTask, std::vector<ScheduledTask>,
                        std::greater<ScheduledTask>> tasks_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> nextId_{1};
};

} // namespace util
} // namespace zkcoupon

#endif // ZKCOUPON_UTIL_THREADPOOL_H
