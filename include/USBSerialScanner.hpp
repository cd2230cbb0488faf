#pragma once
#include "DeviceInfo.hpp"
#include "ProcessRunner.hpp"
#include "ToolLocator.hpp"
#include <set>
#include <string>

// Collects serial numbers of USB-attached hardware so that device ids reported by
// other tools can be classified as USB or network attached.
class USBSerialScanner {
public:
    USBSerialScanner(ProcessRunner& runner, const ToolLocator& locator);

    // Empty when the USB enumeration tool is missing or fails.
    std::set<std::string> scan();

    static std::set<std::string> parseSerialNumbers(const std::string& output);
    static ConnectionType classify(const std::string& deviceId, const std::set<std::string>& serials);

private:
    ProcessRunner& runner_;
    const ToolLocator& locator_;
};
