#include "ControlQueue.hpp"
#include "Logger.hpp"

ControlQueue::ControlQueue() : running_(false), nextSequence_(0) {}

ControlQueue::~ControlQueue() {
    stop();
}

bool ControlQueue::start() {
    if (running_.load()) {
        LOG_WARNING("Control queue already running");
        return true;
    }

    try {
        running_.store(true);
        thread_ = std::thread(&ControlQueue::threadFunc, this);
        LOG_DEBUG("Control queue started");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start control queue: " + std::string(e.what()));
        running_.store(false);
        return false;
    }
}

void ControlQueue::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.load() && !thread_.joinable()) {
            return;
        }
        running_.store(false);
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        if (thread_.get_id() == std::this_thread::get_id()) {
            thread_.detach();
        } else {
            thread_.join();
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!queue_.empty()) {
        LOG_DEBUG("Control queue stopped with " + std::to_string(queue_.size()) + " pending tasks");
        queue_ = decltype(queue_)();
    }
}

bool ControlQueue::post(Task task) {
    return postDelayed(std::chrono::milliseconds(0), std::move(task));
}

bool ControlQueue::postDelayed(std::chrono::milliseconds delay, Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.load()) {
            LOG_DEBUG("Control queue stopped, task dropped");
            return false;
        }
        queue_.push(Entry{Clock::now() + delay, nextSequence_++, std::move(task)});
    }
    cv_.notify_one();
    return true;
}

bool ControlQueue::isControlThread() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::this_thread::get_id() == threadId_;
}

void ControlQueue::threadFunc() {
    std::unique_lock<std::mutex> lock(mutex_);
    threadId_ = std::this_thread::get_id();
    while (running_.load()) {
        if (queue_.empty()) {
            cv_.wait(lock);
            continue;
        }

        auto due = queue_.top().due;
        if (Clock::now() < due) {
            cv_.wait_until(lock, due);
            continue;
        }

        Task task = queue_.top().task;
        queue_.pop();
        lock.unlock();

        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("Control task failed: " + std::string(e.what()));
        }

        lock.lock();
    }
}
