#pragma once
#include "AndroidDiscovery.hpp"
#include "AvdConfigReader.hpp"
#include "CommandOrchestrator.hpp"
#include "ConfigLoader.hpp"
#include "ControlQueue.hpp"
#include "DeviceDiscoveryCronJob.hpp"
#include "InventoryRefresher.hpp"
#include "InventoryStore.hpp"
#include "IOSDiscovery.hpp"
#include "ProcessRunner.hpp"
#include "ToolLocator.hpp"
#include "USBSerialScanner.hpp"
#include "WorkerPool.hpp"
#include <atomic>
#include <memory>
#include <string>

class DeviceManager : public InventoryRefresher {
public:
    DeviceManager();
    ~DeviceManager() override;

    bool initialize(const std::string& configPath = "");

    // Tests inject a scripted runner; nullptr uses the real one
    bool initialize(const DiscoveryConfig& config, std::shared_ptr<ProcessRunner> runner = nullptr);
    void shutdown();
    bool isRunning() const { return running_.load(); }

    // Inventory fetches; completions run on the control queue after the list is stored
    void refreshAll(Completion done) override;
    void fetchIOSSimulators(Completion done) override;
    void fetchIOSDevices(Completion done) override;
    void fetchAndroidEmulators(Completion done) override;
    void fetchAndroidDevices(Completion done) override;

    void refreshAll() { refreshAll(Completion()); }

    // Blocks the caller (never call from the control queue)
    bool refreshAllAndWait(std::chrono::milliseconds timeout);

    Inventory getInventory() const;
    void subscribe(InventoryStore::Observer observer);

    CommandOrchestrator& commands();

    bool startCronJob();
    void stopCronJob();

    const DiscoveryConfig& getConfig() const { return config_; }

private:
    template <typename T>
    void dispatchFetch(const std::string& category,
                       std::function<FetchResult<T>()> fetch,
                       std::function<void(std::vector<T>)> store,
                       Completion done);

    DiscoveryConfig config_;
    std::atomic<bool> running_;

    std::shared_ptr<ProcessRunner> runner_;
    std::unique_ptr<ToolLocator> locator_;
    std::unique_ptr<AvdConfigReader> avdReader_;
    std::unique_ptr<USBSerialScanner> usbScanner_;
    std::unique_ptr<IOSDiscovery> iosDiscovery_;
    std::unique_ptr<AndroidDiscovery> androidDiscovery_;
    std::unique_ptr<WorkerPool> pool_;
    std::unique_ptr<ControlQueue> control_;
    InventoryStore store_;
    std::unique_ptr<CommandOrchestrator> orchestrator_;
    std::unique_ptr<DeviceDiscoveryCronJob> cronJob_;
};
