#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace MapForge {

/**
 * TaskGroup counts outstanding tasks so a caller can join on all of them.
 */
class TaskGroup {
public:
    TaskGroup() : pendingCount_(0) {}

    void increment() {
        ++pendingCount_;
    }

    void decrement() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (--pendingCount_ == 0) {
            cv_.notify_all();
        }
    }

    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return pendingCount_.load() == 0; });
    }

    bool isComplete() const {
        return pendingCount_.load() == 0;
    }

private:
    std::atomic<uint32_t> pendingCount_;
    std::mutex mutex_;
    std::condition_variable cv_;
};

/**
 * Fixed-size worker pool running submitted tasks in FIFO order.
 *
 * Usage:
 *   TaskScheduler scheduler;
 *   scheduler.initialize(4);
 *
 *   TaskGroup group;
 *   scheduler.submit([&]{ buildNormalMap(); }, &group);
 *   scheduler.submit([&]{ buildHeightMap(); }, &group);
 *   group.wait();
 *
 * A scheduler that is not running executes submitted tasks inline.
 */
class TaskScheduler {
public:
    TaskScheduler() = default;
    ~TaskScheduler();

    TaskScheduler(const TaskScheduler&) = delete;
    TaskScheduler& operator=(const TaskScheduler&) = delete;

    // Process-wide pool, lazily initialized by the caller
    static TaskScheduler& instance();

    // 0 = hardware concurrency - 1, at least 2. Counts above maxThreadCount()
    // are capped. Returns false, leaving the scheduler stopped, when the
    // workers cannot be created.
    bool initialize(uint32_t numThreads = 0);

    // Four workers per hardware thread
    static uint32_t maxThreadCount();

    // Drains queued tasks, then joins the workers
    void shutdown();

    void submit(std::function<void()> task, TaskGroup* group = nullptr);

    // Worker index of the calling thread, -1 outside the pool
    int32_t getCurrentThreadId() const;

    uint32_t getThreadCount() const { return static_cast<uint32_t>(workers_.size()); }

    bool isRunning() const { return running_.load(); }

private:
    struct Task {
        std::function<void()> func;
        TaskGroup* group = nullptr;
    };

    void workerThread(uint32_t threadId);
    static void run(Task& task);

    std::vector<std::thread> workers_;

    std::queue<Task> taskQueue_;
    std::mutex queueMutex_;
    std::condition_variable queueCondition_;

    std::atomic<bool> running_{false};

    static thread_local int32_t currentThreadId_;
};

/**
 * RAII helper that joins its group on scope exit.
 */
class ScopedTaskGroup {
public:
    explicit ScopedTaskGroup(TaskScheduler& scheduler) : scheduler_(scheduler) {}
    ~ScopedTaskGroup() { group_.wait(); }

    ScopedTaskGroup(const ScopedTaskGroup&) = delete;
    ScopedTaskGroup& operator=(const ScopedTaskGroup&) = delete;

    void submit(std::function<void()> task) {
        scheduler_.submit(std::move(task), &group_);
    }

    void wait() { group_.wait(); }
    bool isComplete() const { return group_.isComplete(); }

private:
    TaskScheduler& scheduler_;
    TaskGroup group_;
};

} // namespace MapForge
