#include "TaskScheduler.h"
#include <SDL3/SDL_log.h>
#include <exception>

namespace MapForge {

thread_local int32_t TaskScheduler::currentThreadId_ = -1;

TaskScheduler& TaskScheduler::instance() {
    static TaskScheduler instance;
    return instance;
}

TaskScheduler::~TaskScheduler() {
    shutdown();
}

uint32_t TaskScheduler::maxThreadCount() {
    uint32_t hwThreads = std::thread::hardware_concurrency();
    return (hwThreads > 0 ? hwThreads : 1) * 4;
}

bool TaskScheduler::initialize(uint32_t numThreads) {
    if (running_.load()) {
        return true; // Already initialized
    }

    // Reserve one hardware thread for the caller, but keep at least 2 workers
    if (numThreads == 0) {
        uint32_t hwThreads = std::thread::hardware_concurrency();
        numThreads = hwThreads > 2 ? hwThreads - 1 : 2;
    }

    uint32_t maxThreads = maxThreadCount();
    if (numThreads > maxThreads) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "TaskScheduler: %u threads requested, capping at %u", numThreads, maxThreads);
        numThreads = maxThreads;
    }

    running_.store(true);

    try {
        workers_.reserve(numThreads);
        for (uint32_t i = 0; i < numThreads; ++i) {
            workers_.emplace_back(&TaskScheduler::workerThread, this, i);
        }
    } catch (const std::exception& e) {
        // std::system_error from thread creation or std::bad_alloc
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                     "TaskScheduler: Failed to start workers: %s", e.what());
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            running_.store(false);
        }
        queueCondition_.notify_all();
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers_.clear();

        // Anything queued while no worker survived runs here instead
        while (!taskQueue_.empty()) {
            Task task = std::move(taskQueue_.front());
            taskQueue_.pop();
            run(task);
        }
        return false;
    }

    SDL_Log("TaskScheduler: Initialized with %u worker threads", numThreads);
    return true;
}

void TaskScheduler::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (!running_.load()) {
            return;
        }
        running_.store(false);
    }

    queueCondition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    SDL_Log("TaskScheduler: Shutdown complete");
}

void TaskScheduler::submit(std::function<void()> task, TaskGroup* group) {
    if (group) {
        group->increment();
    }

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (running_.load()) {
            taskQueue_.push(Task{std::move(task), group});
            queueCondition_.notify_one();
            return;
        }
    }

    // Not running: execute synchronously
    Task inlineTask{std::move(task), group};
    run(inlineTask);
}

int32_t TaskScheduler::getCurrentThreadId() const {
    return currentThreadId_;
}

void TaskScheduler::run(Task& task) {
    if (task.func) {
        task.func();
    }
    if (task.group) {
        task.group->decrement();
    }
}

void TaskScheduler::workerThread(uint32_t threadId) {
    currentThreadId_ = static_cast<int32_t>(threadId);

    while (true) {
        Task task;

        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            queueCondition_.wait(lock, [this] {
                return !taskQueue_.empty() || !running_.load();
            });

            // Queued work is drained before exiting so no group waits forever
            if (taskQueue_.empty()) {
                break;
            }

            task = std::move(taskQueue_.front());
            taskQueue_.pop();
        }

        run(task);
    }

    currentThreadId_ = -1;
}

} // namespace MapForge
