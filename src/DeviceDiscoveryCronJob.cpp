#include "DeviceDiscoveryCronJob.hpp"
#include "Logger.hpp"

DeviceDiscoveryCronJob::DeviceDiscoveryCronJob(InventoryRefresher& refresher,
                                               const InventoryStore& store,
                                               std::chrono::milliseconds interval)
    : refresher_(refresher), store_(store), interval_(interval), running_(false), ticks_(0) {
}

DeviceDiscoveryCronJob::~DeviceDiscoveryCronJob() {
    stop();
}

bool DeviceDiscoveryCronJob::start() {
    if (running_.load()) {
        LOG_WARNING("Device discovery cron job already running");
        return true;
    }

    try {
        running_.store(true);
        thread_ = std::thread(&DeviceDiscoveryCronJob::cronJobThreadFunc, this);
        LOG_INFO("Device discovery cron job started, interval " +
                 std::to_string(interval_.count()) + " ms");
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start device discovery cron job: " + std::string(e.what()));
        running_.store(false);
        return false;
    }
}

void DeviceDiscoveryCronJob::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.load() && !thread_.joinable()) {
            return;
        }
        running_.store(false);
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }

    LOG_INFO("Device discovery cron job stopped");
}

bool DeviceDiscoveryCronJob::isRunning() const {
    return running_.load();
}

void DeviceDiscoveryCronJob::cronJobThreadFunc() {
    LOG_DEBUG("Device discovery cron job thread started");

    while (running_.load()) {
        try {
            unsigned long tick = ++ticks_;
            if (store_.isLoading()) {
                LOG_DEBUG("Cron tick #" + std::to_string(tick) + " skipped, previous refresh still loading");
            } else {
                LOG_DEBUG("Cron tick #" + std::to_string(tick) + ", refreshing inventory");
                refresher_.refreshAll(InventoryRefresher::Completion());
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Exception in cron job thread: " + std::string(e.what()));
        }

        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, interval_, [this] { return !running_.load(); });
    }

    LOG_DEBUG("Device discovery cron job thread stopped");
}
