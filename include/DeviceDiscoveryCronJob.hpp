#pragma once

#include "InventoryRefresher.hpp"
#include "InventoryStore.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

// Pull-based periodic refresh: nothing notifies us of device changes, so the
// inventory is re-fetched on a fixed interval.
class DeviceDiscoveryCronJob {
public:
    DeviceDiscoveryCronJob(InventoryRefresher& refresher,
                           const InventoryStore& store,
                           std::chrono::milliseconds interval);
    ~DeviceDiscoveryCronJob();

    bool start();
    void stop();
    bool isRunning() const;

    unsigned long getTickCount() const { return ticks_.load(); }

private:
    void cronJobThreadFunc();

    InventoryRefresher& refresher_;
    const InventoryStore& store_;
    std::chrono::milliseconds interval_;
    std::atomic<bool> running_;
    std::atomic<unsigned long> ticks_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
};
