#pragma once
#include "AvdConfigReader.hpp"
#include "DeviceInfo.hpp"
#include "DiscoveryResult.hpp"
#include "ProcessRunner.hpp"
#include "ToolLocator.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

struct AdbDeviceEntry {
    std::string serial;
    std::string state;                  // "device", "offline", "unauthorized", ...
    std::vector<std::string> details;   // "usb:1-1", "product:x", "model:y", ...
};

class AndroidDiscovery {
public:
    AndroidDiscovery(ProcessRunner& runner, const ToolLocator& locator,
                     const AvdConfigReader& avdReader, bool resolveIdsByAvdName);

    FetchResult<EmulatorRecord> fetchEmulators();
    FetchResult<PhysicalDevice> fetchDevices(const std::set<std::string>& usbSerials);

    // AVD names of qemu-system processes in the process table
    std::vector<std::string> getRunningAvdNames();
    bool isAvdRunning(const std::string& avdName);

    // emulator-<port> serials that adb reports in the "device" state
    std::vector<std::string> getEmulatorSerials();

    // Running AVD name -> emulator serial
    std::map<std::string, std::string> mapEmulatorSerials(const std::vector<std::string>& runningAvds);

    // Device id to address adb commands for one AVD; nullopt when the AVD is not running
    // or no emulator is online
    std::optional<std::string> resolveDeviceId(const std::string& avdName);

    std::optional<std::string> getProperty(const std::string& serial, const std::string& key);
    std::string queryApiLevel(const std::string& serial);
    std::optional<std::string> queryAvdName(const std::string& serial);

    // Third-party packages; nullopt when the listing failed
    std::optional<std::vector<std::string>> listThirdPartyPackages(const std::string& serial);

    static std::vector<std::string> parseAvdList(const std::string& output);
    static std::optional<std::string> parseAvdNameFromCommandLine(const std::string& commandLine);
    static std::vector<AdbDeviceEntry> parseAdbDevices(const std::string& output);
    static std::vector<std::string> parseEmulatorSerials(const std::string& output);
    static std::vector<std::string> parsePackageList(const std::string& output);
    static std::string composeDisplayName(const std::string& manufacturer, const std::string& model,
                                          const std::string& productName);

private:
    std::string resolveDisplayName(const AdbDeviceEntry& entry);
    std::optional<std::string> adbPath();

    ProcessRunner& runner_;
    const ToolLocator& locator_;
    const AvdConfigReader& avdReader_;
    bool resolveIdsByAvdName_;
};
