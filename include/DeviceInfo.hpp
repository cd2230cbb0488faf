#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

enum class Platform {
    IOS,
    ANDROID
};

enum class ConnectionType {
    USB,
    WIFI
};

enum class BootState {
    BOOTED,
    SHUTDOWN,
    OTHER
};

std::string platformToString(Platform platform);
std::string connectionTypeToString(ConnectionType type);

struct SimulatorRecord {
    std::string udid;
    std::string name;
    std::string state;      // raw simctl state ("Booted", "Shutdown", "Creating", ...)
    std::string runtime;    // raw runtime key
    std::string version;    // "iOS 17.5" or the raw runtime

    bool isRunning() const { return state == "Booted"; }
    BootState bootState() const;

    json toJson() const;
};

struct PhysicalDevice {
    std::string id;         // UDID or ADB serial
    std::string name;
    bool connected{false};
    ConnectionType transport{ConnectionType::WIFI};
    std::string version;    // platform version or "API <n>"
    Platform platform{Platform::IOS};

    json toJson() const;
};

struct EmulatorRecord {
    std::string name;                       // AVD name
    bool running{false};
    std::optional<std::string> deviceId;    // "emulator-<port>" while running
    std::string apiLevel;                   // "API <n>" or "Unknown"

    json toJson() const;
};

struct Inventory {
    std::vector<SimulatorRecord> iosSimulators;
    std::vector<PhysicalDevice> iosDevices;
    std::vector<EmulatorRecord> androidEmulators;
    std::vector<PhysicalDevice> androidDevices;
    bool loading{false};
    uint64_t revision{0};

    json toJson() const;
};
