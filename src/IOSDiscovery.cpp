#include "IOSDiscovery.hpp"
#include "Logger.hpp"
#include "TextUtils.hpp"
#include "USBSerialScanner.hpp"
#include <regex>

IOSDiscovery::IOSDiscovery(ProcessRunner& runner, const ToolLocator& locator)
    : runner_(runner), locator_(locator) {}

FetchResult<SimulatorRecord> IOSDiscovery::fetchSimulators() {
    auto xcrun = locator_.locate(Tool::XCRUN);
    if (!xcrun) {
        return FetchResult<SimulatorRecord>::failure(DiscoveryError::TOOL_NOT_FOUND, "xcrun");
    }

    ProcessResult result = runner_.run(*xcrun, {"simctl", "list", "devices", "--json"});
    if (result.failure == ProcessFailure::LAUNCH_FAILED) {
        return FetchResult<SimulatorRecord>::failure(DiscoveryError::PROCESS_LAUNCH_FAILURE, result.error);
    }
    if (!result.success) {
        return FetchResult<SimulatorRecord>::failure(DiscoveryError::PROCESS_EXIT_FAILURE,
            "simctl exited with " + std::to_string(result.exitCode) + ": " + TextUtils::trim(result.error));
    }

    return parseSimulatorList(result.output);
}

std::optional<SimulatorRecord> IOSDiscovery::findSimulator(const std::string& udid) {
    auto simulators = fetchSimulators();
    for (const auto& simulator : simulators.items) {
        if (simulator.udid == udid) {
            return simulator;
        }
    }
    return std::nullopt;
}

FetchResult<SimulatorRecord> IOSDiscovery::parseSimulatorList(const std::string& jsonText) {
    FetchResult<SimulatorRecord> result;

    json root;
    try {
        root = json::parse(jsonText);
    } catch (const json::parse_error& e) {
        return FetchResult<SimulatorRecord>::failure(DiscoveryError::PARSE_FAILURE, e.what());
    }

    if (!root.is_object() || !root.contains("devices") || !root["devices"].is_object()) {
        return FetchResult<SimulatorRecord>::failure(DiscoveryError::PARSE_FAILURE,
                                                     "missing devices object");
    }

    for (auto& [runtime, devices] : root["devices"].items()) {
        if (!devices.is_array()) continue;

        std::string version = versionLabel(runtime);
        for (const auto& device : devices) {
            if (!device.is_object()) continue;

            auto available = device.find("isAvailable");
            auto udid = device.find("udid");
            auto name = device.find("name");
            auto state = device.find("state");
            if (available == device.end() || !available->is_boolean() || !available->get<bool>()) continue;
            if (udid == device.end() || !udid->is_string()) continue;
            if (name == device.end() || !name->is_string()) continue;
            if (state == device.end() || !state->is_string()) continue;

            SimulatorRecord record;
            record.udid = udid->get<std::string>();
            record.name = name->get<std::string>();
            record.state = state->get<std::string>();
            record.runtime = runtime;
            record.version = version;
            result.items.push_back(record);
        }
    }

    return result;
}

std::string IOSDiscovery::versionLabel(const std::string& runtime) {
    static const std::regex dashed(R"(iOS-(\d+)(?:-(\d+))?)");
    static const std::regex spaced(R"(iOS (\d+(?:\.\d+)*))");

    std::smatch match;
    if (std::regex_search(runtime, match, dashed)) {
        std::string label = "iOS " + match[1].str();
        if (match[2].matched) {
            label += "." + match[2].str();
        }
        return label;
    }
    if (std::regex_search(runtime, match, spaced)) {
        return "iOS " + match[1].str();
    }
    return runtime;
}

FetchResult<PhysicalDevice> IOSDiscovery::fetchDevices(const std::set<std::string>& usbSerials) {
    auto xcrun = locator_.locate(Tool::XCRUN);
    if (!xcrun) {
        return FetchResult<PhysicalDevice>::failure(DiscoveryError::TOOL_NOT_FOUND, "xcrun");
    }

    ProcessResult result = runner_.run(*xcrun, {"xctrace", "list", "devices"});
    if (result.failure == ProcessFailure::LAUNCH_FAILED) {
        return FetchResult<PhysicalDevice>::failure(DiscoveryError::PROCESS_LAUNCH_FAILURE, result.error);
    }
    if (!result.success) {
        return FetchResult<PhysicalDevice>::failure(DiscoveryError::PROCESS_EXIT_FAILURE,
            "xctrace exited with " + std::to_string(result.exitCode) + ": " + TextUtils::trim(result.error));
    }

    FetchResult<PhysicalDevice> devices;
    devices.items = parseDeviceList(result.output, usbSerials);
    return devices;
}

std::vector<PhysicalDevice> IOSDiscovery::parseDeviceList(const std::string& output,
                                                          const std::set<std::string>& usbSerials) {
    static const std::regex deviceLine(R"(^(.+?) \(([^)]+)\) \(([^)]+)\)$)");

    std::vector<PhysicalDevice> devices;
    bool offlineSection = false;

    for (const auto& line : TextUtils::splitLines(output)) {
        if (TextUtils::contains(line, "== Devices Offline ==")) {
            offlineSection = true;
            continue;
        }
        if (TextUtils::contains(line, "== Devices ==")) {
            offlineSection = false;
            continue;
        }

        if (TextUtils::trim(line).empty()) continue;
        if (TextUtils::containsIgnoreCase(line, "macos") ||
            TextUtils::containsIgnoreCase(line, "simulator") ||
            TextUtils::contains(line, "Mac")) {
            continue;
        }

        std::smatch match;
        if (!std::regex_match(line, match, deviceLine)) continue;

        PhysicalDevice device;
        device.name = TextUtils::trim(match[1].str());
        device.version = TextUtils::trim(match[2].str());
        device.id = TextUtils::trim(match[3].str());
        device.connected = !offlineSection;
        device.transport = USBSerialScanner::classify(device.id, usbSerials);
        device.platform = Platform::IOS;
        devices.push_back(device);
    }

    return devices;
}
