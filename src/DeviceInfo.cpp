#include "DeviceInfo.hpp"

std::string platformToString(Platform platform) {
    switch (platform) {
        case Platform::IOS: return "ios";
        case Platform::ANDROID: return "android";
        default: return "unknown";
    }
}

std::string connectionTypeToString(ConnectionType type) {
    switch (type) {
        case ConnectionType::USB: return "usb";
        case ConnectionType::WIFI: return "wifi";
        default: return "unknown";
    }
}

BootState SimulatorRecord::bootState() const {
    if (state == "Booted") return BootState::BOOTED;
    if (state == "Shutdown") return BootState::SHUTDOWN;
    return BootState::OTHER;
}

json SimulatorRecord::toJson() const {
    json j;
    j["udid"] = udid;
    j["name"] = name;
    j["state"] = state;
    j["running"] = isRunning();
    j["runtime"] = runtime;
    j["version"] = version;
    return j;
}

json PhysicalDevice::toJson() const {
    json j;
    j["id"] = id;
    j["name"] = name;
    j["connected"] = connected;
    j["transport"] = connectionTypeToString(transport);
    j["version"] = version;
    j["platform"] = platformToString(platform);
    return j;
}

json EmulatorRecord::toJson() const {
    json j;
    j["name"] = name;
    j["running"] = running;
    j["deviceId"] = deviceId ? json(*deviceId) : json(nullptr);
    j["apiLevel"] = apiLevel;
    return j;
}

json Inventory::toJson() const {
    json j;
    j["iosSimulators"] = json::array();
    for (const auto& simulator : iosSimulators) {
        j["iosSimulators"].push_back(simulator.toJson());
    }
    j["iosDevices"] = json::array();
    for (const auto& device : iosDevices) {
        j["iosDevices"].push_back(device.toJson());
    }
    j["androidEmulators"] = json::array();
    for (const auto& emulator : androidEmulators) {
        j["androidEmulators"].push_back(emulator.toJson());
    }
    j["androidDevices"] = json::array();
    for (const auto& device : androidDevices) {
        j["androidDevices"].push_back(device.toJson());
    }
    j["loading"] = loading;
    j["revision"] = revision;
    return j;
}
