#pragma once
#include <functional>
#include <vector>
#include <deque>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>

// Fixed-size pool for blocking work (process execution, file I/O).
class WorkerPool {
public:
    using Task = std::function<void()>;

    explicit WorkerPool(size_t threadCount);
    ~WorkerPool();

    // Returns false once the pool is shutting down.
    bool submit(Task task);

    // Finishes running tasks, drops queued ones, joins all workers.
    void shutdown();

    size_t getThreadCount() const { return workers_.size(); }
    bool isRunning() const { return running_.load(); }

private:
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void workerLoop(size_t index);

    std::vector<std::thread> workers_;
    std::deque<Task> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> running_;
};
