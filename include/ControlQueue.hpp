#pragma once
#include <functional>
#include <queue>
#include <vector>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <chrono>
#include <cstdint>

// The single controlling context. Every inventory write and every step decision of a
// lifecycle sequence runs on this thread, one task at a time, in due-time order.
class ControlQueue {
public:
    using Task = std::function<void()>;
    using Clock = std::chrono::steady_clock;

    ControlQueue();
    ~ControlQueue();

    bool start();
    void stop();
    bool isRunning() const { return running_.load(); }

    bool post(Task task);

    // Schedules without blocking the queue; other tasks keep running during the delay.
    bool postDelayed(std::chrono::milliseconds delay, Task task);

    bool isControlThread() const;

private:
    ControlQueue(const ControlQueue&) = delete;
    ControlQueue& operator=(const ControlQueue&) = delete;

    struct Entry {
        Clock::time_point due;
        uint64_t sequence;
        Task task;
    };

    struct EntryOrder {
        bool operator()(const Entry& a, const Entry& b) const {
            if (a.due != b.due) return a.due > b.due;
            return a.sequence > b.sequence;
        }
    };

    void threadFunc();

    std::priority_queue<Entry, std::vector<Entry>, EntryOrder> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> running_;
    uint64_t nextSequence_;
    std::thread thread_;
    std::thread::id threadId_;
};
