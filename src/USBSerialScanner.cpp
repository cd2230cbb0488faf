#include "USBSerialScanner.hpp"
#include "Logger.hpp"
#include "TextUtils.hpp"

namespace {
const std::string kSerialMarker = "Serial Number:";
const size_t kIOSSerialLength = 20;
const size_t kAndroidSerialLength = 10;
}

USBSerialScanner::USBSerialScanner(ProcessRunner& runner, const ToolLocator& locator)
    : runner_(runner), locator_(locator) {}

std::set<std::string> USBSerialScanner::scan() {
    auto profiler = locator_.locate(Tool::SYSTEM_PROFILER);
    if (!profiler) {
        LOG_DEBUG("USB enumeration tool unavailable, all devices classify as WiFi");
        return {};
    }

    ProcessResult result = runner_.run(*profiler, {"SPUSBDataType"});
    if (!result.success) {
        LOG_WARNING("USB enumeration failed: " + TextUtils::trim(result.error));
        return {};
    }

    auto serials = parseSerialNumbers(result.output);
    LOG_DEBUG("Found " + std::to_string(serials.size()) + " USB serial numbers");
    return serials;
}

std::set<std::string> USBSerialScanner::parseSerialNumbers(const std::string& output) {
    std::set<std::string> serials;

    for (const auto& line : TextUtils::splitLines(output)) {
        size_t pos = line.find(kSerialMarker);
        if (pos == std::string::npos) continue;

        std::string serial = TextUtils::trim(line.substr(pos + kSerialMarker.size()));
        if (serial.size() >= kIOSSerialLength) {
            serials.insert(TextUtils::removeAll(serial, '-'));
        } else if (serial.size() >= kAndroidSerialLength) {
            serials.insert(serial);
        }
    }

    return serials;
}

ConnectionType USBSerialScanner::classify(const std::string& deviceId, const std::set<std::string>& serials) {
    if (serials.count(deviceId) > 0 || serials.count(TextUtils::removeAll(deviceId, '-')) > 0) {
        return ConnectionType::USB;
    }
    return ConnectionType::WIFI;
}
