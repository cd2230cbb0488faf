#include "DeviceManager.hpp"
#include "Logger.hpp"
#include <future>
#include <stdexcept>

DeviceManager::DeviceManager() : running_(false) {}

DeviceManager::~DeviceManager() {
    shutdown();
}

bool DeviceManager::initialize(const std::string& configPath) {
    ConfigLoader loader;
    if (!configPath.empty() && !loader.loadFromFile(configPath)) {
        LOG_ERROR("Failed to load discovery configuration from " + configPath);
        return false;
    }
    return initialize(loader.getConfig());
}

bool DeviceManager::initialize(const DiscoveryConfig& config, std::shared_ptr<ProcessRunner> runner) {
    if (running_.load()) {
        LOG_WARNING("Device manager already initialized");
        return true;
    }

    try {
        config_ = config;

        Logger::getInstance().setLogLevel(Logger::levelFromString(config_.logLevel));
        if (!config_.logFile.empty()) {
            Logger::getInstance().setLogFile(config_.logFile);
        }

        runner_ = runner ? runner : std::make_shared<ProcessRunner>();
        locator_ = std::make_unique<ToolLocator>(*runner_, config_.toolPaths);
        avdReader_ = std::make_unique<AvdConfigReader>(config_.avdHome, config_.avdSearchDirectories);
        usbScanner_ = std::make_unique<USBSerialScanner>(*runner_, *locator_);
        iosDiscovery_ = std::make_unique<IOSDiscovery>(*runner_, *locator_);
        androidDiscovery_ = std::make_unique<AndroidDiscovery>(*runner_, *locator_, *avdReader_,
                                                               config_.resolveEmulatorIdsByAvdName);

        pool_ = std::make_unique<WorkerPool>(static_cast<size_t>(config_.workerThreads));
        control_ = std::make_unique<ControlQueue>();
        if (!control_->start()) {
            LOG_ERROR("Failed to start control queue");
            pool_->shutdown();
            return false;
        }

        orchestrator_ = std::make_unique<CommandOrchestrator>(*runner_, *locator_, *iosDiscovery_,
                                                              *androidDiscovery_, *avdReader_, *pool_,
                                                              *control_, *this, config_.timing,
                                                              config_.systemAppsToClear);

        running_ = true;
        LOG_INFO("Device manager initialized (AVD home " + config_.avdHome + ", " +
                 std::to_string(config_.workerThreads) + " workers)");
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("Failed to initialize device manager: " + std::string(e.what()));
        return false;
    }
}

void DeviceManager::shutdown() {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("Shutting down device manager...");
    stopCronJob();

    // Workers may still post into the control queue, so they stop first
    if (pool_) {
        pool_->shutdown();
    }
    if (control_) {
        control_->stop();
    }

    LOG_INFO("Device manager shutdown complete");
}

template <typename T>
void DeviceManager::dispatchFetch(const std::string& category,
                                  std::function<FetchResult<T>()> fetch,
                                  std::function<void(std::vector<T>)> store,
                                  Completion done) {
    if (!running_.load()) {
        LOG_WARNING("Device manager not running, " + category + " fetch skipped");
        return;
    }

    control_->post([this, category, fetch, store, done]() {
        store_.beginFetch();

        bool queued = pool_->submit([this, category, fetch, store, done]() {
            FetchResult<T> result = fetch();
            if (!result.ok()) {
                // Tool absence is the normal state on hosts without that platform's SDK
                if (result.error == DiscoveryError::TOOL_NOT_FOUND) {
                    LOG_DEBUG(category + " unavailable: " + result.detail + " not found");
                } else {
                    LOG_WARNING(category + " fetch failed: " + discoveryErrorToString(result.error) +
                                " (" + result.detail + ")");
                }
            }

            auto items = std::make_shared<std::vector<T>>(std::move(result.items));
            control_->post([this, store, done, items]() {
                store(std::move(*items));
                store_.completeFetch();
                if (done) {
                    done();
                }
            });
        });

        if (!queued) {
            store_.completeFetch();
        }
    });
}

void DeviceManager::refreshAll(Completion done) {
    LOG_DEBUG("Refreshing full inventory");
    auto remaining = std::make_shared<int>(4);
    Completion oneDone = [remaining, done]() {
        // Runs on the control queue only, so the counter needs no lock
        if (--(*remaining) == 0 && done) {
            done();
        }
    };

    fetchIOSSimulators(oneDone);
    fetchIOSDevices(oneDone);
    fetchAndroidEmulators(oneDone);
    fetchAndroidDevices(oneDone);
}

void DeviceManager::fetchIOSSimulators(Completion done) {
    dispatchFetch<SimulatorRecord>("iOS simulators",
        [this]() { return iosDiscovery_->fetchSimulators(); },
        [this](std::vector<SimulatorRecord> items) { store_.replaceIOSSimulators(std::move(items)); },
        done);
}

void DeviceManager::fetchIOSDevices(Completion done) {
    dispatchFetch<PhysicalDevice>("iOS devices",
        [this]() {
            auto xcrun = locator_->locate(Tool::XCRUN);
            if (!xcrun) {
                return FetchResult<PhysicalDevice>::failure(DiscoveryError::TOOL_NOT_FOUND, "xcrun");
            }
            return iosDiscovery_->fetchDevices(usbScanner_->scan());
        },
        [this](std::vector<PhysicalDevice> items) { store_.replaceIOSDevices(std::move(items)); },
        done);
}

void DeviceManager::fetchAndroidEmulators(Completion done) {
    dispatchFetch<EmulatorRecord>("Android emulators",
        [this]() { return androidDiscovery_->fetchEmulators(); },
        [this](std::vector<EmulatorRecord> items) { store_.replaceAndroidEmulators(std::move(items)); },
        done);
}

void DeviceManager::fetchAndroidDevices(Completion done) {
    dispatchFetch<PhysicalDevice>("Android devices",
        [this]() {
            auto adb = locator_->locate(Tool::ADB);
            if (!adb) {
                return FetchResult<PhysicalDevice>::failure(DiscoveryError::TOOL_NOT_FOUND, "adb");
            }
            return androidDiscovery_->fetchDevices(usbScanner_->scan());
        },
        [this](std::vector<PhysicalDevice> items) { store_.replaceAndroidDevices(std::move(items)); },
        done);
}

bool DeviceManager::refreshAllAndWait(std::chrono::milliseconds timeout) {
    if (!running_.load()) {
        return false;
    }
    if (control_->isControlThread()) {
        LOG_ERROR("refreshAllAndWait called from the control queue");
        return false;
    }

    auto finished = std::make_shared<std::promise<void>>();
    std::future<void> future = finished->get_future();
    refreshAll([finished]() { finished->set_value(); });
    return future.wait_for(timeout) == std::future_status::ready;
}

Inventory DeviceManager::getInventory() const {
    return store_.snapshot();
}

void DeviceManager::subscribe(InventoryStore::Observer observer) {
    store_.subscribe(std::move(observer));
}

CommandOrchestrator& DeviceManager::commands() {
    if (!orchestrator_) {
        throw std::logic_error("DeviceManager::commands() before initialize()");
    }
    return *orchestrator_;
}

bool DeviceManager::startCronJob() {
    if (!running_.load()) {
        LOG_ERROR("Device manager not initialized, cannot start cron job");
        return false;
    }
    if (config_.refreshIntervalSeconds <= 0) {
        LOG_INFO("Periodic refresh disabled (refreshIntervalSeconds = 0)");
        return false;
    }
    if (!cronJob_) {
        cronJob_ = std::make_unique<DeviceDiscoveryCronJob>(*this, store_,
            std::chrono::seconds(config_.refreshIntervalSeconds));
    }
    return cronJob_->start();
}

void DeviceManager::stopCronJob() {
    if (cronJob_) {
        cronJob_->stop();
    }
}
