#pragma once
#include "AndroidDiscovery.hpp"
#include "AvdConfigReader.hpp"
#include "ConfigLoader.hpp"
#include "ControlQueue.hpp"
#include "DiscoveryResult.hpp"
#include "InventoryRefresher.hpp"
#include "IOSDiscovery.hpp"
#include "ProcessRunner.hpp"
#include "ToolLocator.hpp"
#include "WorkerPool.hpp"
#include <functional>
#include <string>
#include <vector>

using OperationCallback = std::function<void(const OperationResult&)>;

// Multi-step lifecycle commands for simulators and emulators.
//
// Every step runs its tool on the worker pool and makes its next decision on the
// control queue. Waits between steps poll the tool's own status query until the
// expected state shows up or the attempt budget runs out; an exhausted budget is
// logged and the sequence carries on. Callbacks run on the control queue after the
// final re-fetch has been stored.
class CommandOrchestrator {
public:
    CommandOrchestrator(ProcessRunner& runner,
                        const ToolLocator& locator,
                        IOSDiscovery& iosDiscovery,
                        AndroidDiscovery& androidDiscovery,
                        const AvdConfigReader& avdReader,
                        WorkerPool& pool,
                        ControlQueue& control,
                        InventoryRefresher& refresher,
                        const TimingConfig& timing,
                        const std::vector<std::string>& systemAppsToClear);

    void startSimulator(const std::string& udid, OperationCallback done = OperationCallback());
    void stopSimulator(const std::string& udid, OperationCallback done = OperationCallback());
    void restartSimulator(const std::string& udid, OperationCallback done = OperationCallback());
    void eraseSimulator(const std::string& udid, OperationCallback done = OperationCallback());
    void deleteSimulator(const std::string& udid, OperationCallback done = OperationCallback());

    void startEmulator(const std::string& avdName, OperationCallback done = OperationCallback());
    void stopEmulator(const std::string& avdName, OperationCallback done = OperationCallback());
    void restartEmulator(const std::string& avdName, OperationCallback done = OperationCallback());
    void eraseEmulator(const std::string& avdName, OperationCallback done = OperationCallback());
    void deleteEmulator(const std::string& avdName, OperationCallback done = OperationCallback());
    void setEmulatorNetwork(const std::string& avdName, bool enabled, OperationCallback done = OperationCallback());

private:
    using StepCallback = std::function<void(const OperationResult&)>;

    struct WipeOutcome {
        OperationResult result;
        std::vector<std::string> uninstalled;
    };

    template <typename T>
    void async(std::function<T()> work, std::function<void(T)> next);

    void withTool(Tool tool, StepCallback onMissing, std::function<void(const std::string&)> next);
    void withDeviceId(const std::string& avdName, StepCallback onMissing,
                      std::function<void(const std::string&)> next);
    void runStep(const std::string& path, const std::vector<std::string>& args,
                 std::function<void(const ProcessResult&)> next);
    void pollUntil(const std::string& description, std::function<bool()> probe, int maxAttempts,
                   std::function<void(bool)> next, int attempt = 0);

    void bootSimulator(const std::string& xcrun, const std::string& udid, OperationCallback done);
    void launchSimulatorApp(const std::string& udid, std::function<void()> next);
    void stopEmulatorSequence(const std::string& avdName, StepCallback next);
    WipeOutcome wipeEmulator(const std::string& adb, const std::string& deviceId);

    void finish(const std::string& operation, const OperationCallback& done, const OperationResult& result);
    static OperationResult fromProcess(const std::string& what, const ProcessResult& result);

    ProcessRunner& runner_;
    const ToolLocator& locator_;
    IOSDiscovery& iosDiscovery_;
    AndroidDiscovery& androidDiscovery_;
    const AvdConfigReader& avdReader_;
    WorkerPool& pool_;
    ControlQueue& control_;
    InventoryRefresher& refresher_;
    TimingConfig timing_;
    std::vector<std::string> systemAppsToClear_;
};
