#pragma once
#include "DeviceInfo.hpp"
#include "DiscoveryResult.hpp"
#include "ProcessRunner.hpp"
#include "ToolLocator.hpp"
#include <optional>
#include <set>
#include <string>

class IOSDiscovery {
public:
    IOSDiscovery(ProcessRunner& runner, const ToolLocator& locator);

    FetchResult<SimulatorRecord> fetchSimulators();
    FetchResult<PhysicalDevice> fetchDevices(const std::set<std::string>& usbSerials);

    // Re-queries the simulator listing; nullopt if the UDID is not (or no longer) listed
    // or the listing could not be obtained.
    std::optional<SimulatorRecord> findSimulator(const std::string& udid);

    // simctl JSON -> available simulators
    static FetchResult<SimulatorRecord> parseSimulatorList(const std::string& jsonText);

    // xctrace text -> physical devices (simulators and Macs excluded)
    static std::vector<PhysicalDevice> parseDeviceList(const std::string& output,
                                                       const std::set<std::string>& usbSerials);

    // "com.apple.CoreSimulator.SimRuntime.iOS-17-5" -> "iOS 17.5"
    static std::string versionLabel(const std::string& runtime);

private:
    ProcessRunner& runner_;
    const ToolLocator& locator_;
};
