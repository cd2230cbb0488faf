#include "WorkerPool.hpp"
#include "Logger.hpp"

WorkerPool::WorkerPool(size_t threadCount) : running_(true) {
    if (threadCount == 0) {
        threadCount = 1;
    }
    workers_.reserve(threadCount);
    for (size_t i = 0; i < threadCount; ++i) {
        workers_.emplace_back(&WorkerPool::workerLoop, this, i);
    }
    LOG_DEBUG("Worker pool started with " + std::to_string(threadCount) + " threads");
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.load()) {
            LOG_DEBUG("Worker pool stopped, task dropped");
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_.store(false);
        if (!tasks_.empty()) {
            LOG_DEBUG("Dropping " + std::to_string(tasks_.size()) + " queued tasks");
            tasks_.clear();
        }
    }
    cv_.notify_all();

    for (auto& worker : workers_) {
        if (!worker.joinable()) continue;
        if (worker.get_id() == std::this_thread::get_id()) {
            worker.detach();
        } else {
            worker.join();
        }
    }
}

void WorkerPool::workerLoop(size_t index) {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !running_.load() || !tasks_.empty(); });
            if (!running_.load()) {
                break;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("Worker " + std::to_string(index) + " task failed: " + std::string(e.what()));
        }
    }
}
