#include "AndroidDiscovery.hpp"
#include "Logger.hpp"
#include "TextUtils.hpp"
#include "USBSerialScanner.hpp"
#include <algorithm>

namespace {

const std::string kUnknownApiLevel = "Unknown";

bool containsName(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

template <typename T>
FetchResult<T> processFailure(const std::string& what, const ProcessResult& result) {
    if (result.failure == ProcessFailure::LAUNCH_FAILED) {
        return FetchResult<T>::failure(DiscoveryError::PROCESS_LAUNCH_FAILURE, what + ": " + result.error);
    }
    return FetchResult<T>::failure(DiscoveryError::PROCESS_EXIT_FAILURE,
        what + " exited with " + std::to_string(result.exitCode) + ": " + TextUtils::trim(result.error));
}

} // namespace

AndroidDiscovery::AndroidDiscovery(ProcessRunner& runner, const ToolLocator& locator,
                                   const AvdConfigReader& avdReader, bool resolveIdsByAvdName)
    : runner_(runner), locator_(locator), avdReader_(avdReader), resolveIdsByAvdName_(resolveIdsByAvdName) {}

std::optional<std::string> AndroidDiscovery::adbPath() {
    return locator_.locate(Tool::ADB);
}

FetchResult<EmulatorRecord> AndroidDiscovery::fetchEmulators() {
    auto emulator = locator_.locate(Tool::EMULATOR);
    if (!emulator) {
        return FetchResult<EmulatorRecord>::failure(DiscoveryError::TOOL_NOT_FOUND, "emulator");
    }

    ProcessResult listing = runner_.run(*emulator, {"-list-avds"});
    if (!listing.success) {
        return processFailure<EmulatorRecord>("emulator -list-avds", listing);
    }

    std::vector<std::string> avds = parseAvdList(listing.output);
    std::vector<std::string> running = getRunningAvdNames();
    std::map<std::string, std::string> deviceIds = mapEmulatorSerials(running);

    FetchResult<EmulatorRecord> result;
    for (const auto& name : avds) {
        EmulatorRecord record;
        record.name = name;
        record.running = containsName(running, name);

        if (record.running) {
            auto it = deviceIds.find(name);
            if (it != deviceIds.end()) {
                record.deviceId = it->second;
            }
        }

        if (record.running && record.deviceId) {
            record.apiLevel = queryApiLevel(*record.deviceId);
        } else {
            record.apiLevel = avdReader_.readApiLevel(name);
        }
        result.items.push_back(record);
    }

    LOG_DEBUG("Found " + std::to_string(result.items.size()) + " AVDs, " +
              std::to_string(running.size()) + " running");
    return result;
}

std::vector<std::string> AndroidDiscovery::getRunningAvdNames() {
    std::vector<std::string> names;

    auto pgrep = locator_.locate(Tool::PGREP);
    auto ps = locator_.locate(Tool::PS);
    if (!pgrep || !ps) {
        LOG_DEBUG("pgrep/ps unavailable, treating all AVDs as stopped");
        return names;
    }

    // pgrep exits 1 when nothing matches
    ProcessResult pids = runner_.run(*pgrep, {"-f", "qemu-system.*-avd"});
    if (!pids.success) {
        return names;
    }

    for (const auto& pidLine : TextUtils::splitLines(pids.output)) {
        std::string pid = TextUtils::trim(pidLine);
        if (pid.empty()) continue;

        ProcessResult command = runner_.run(*ps, {"-o", "command", "-p", pid});
        if (!command.success) continue;

        for (const auto& line : TextUtils::splitLines(command.output)) {
            if (!TextUtils::contains(line, "-avd")) continue;
            auto name = parseAvdNameFromCommandLine(line);
            if (name && !containsName(names, *name)) {
                names.push_back(*name);
            }
        }
    }

    return names;
}

bool AndroidDiscovery::isAvdRunning(const std::string& avdName) {
    return containsName(getRunningAvdNames(), avdName);
}

std::vector<std::string> AndroidDiscovery::getEmulatorSerials() {
    auto adb = adbPath();
    if (!adb) {
        return {};
    }

    ProcessResult result = runner_.run(*adb, {"devices"});
    if (!result.success) {
        LOG_WARNING("adb devices failed: " + TextUtils::trim(result.error));
        return {};
    }
    return parseEmulatorSerials(result.output);
}

std::map<std::string, std::string> AndroidDiscovery::mapEmulatorSerials(const std::vector<std::string>& runningAvds) {
    std::map<std::string, std::string> mapping;
    if (runningAvds.empty()) {
        return mapping;
    }

    std::vector<std::string> serials = getEmulatorSerials();
    if (serials.empty()) {
        return mapping;
    }

    if (!resolveIdsByAvdName_) {
        // Every running AVD shares the first online emulator
        for (const auto& avd : runningAvds) {
            mapping[avd] = serials.front();
        }
        return mapping;
    }

    std::map<std::string, std::string> serialByAvd;
    std::set<std::string> claimed;
    for (const auto& serial : serials) {
        auto avdName = queryAvdName(serial);
        if (!avdName) continue;
        claimed.insert(serial);
        if (serialByAvd.count(*avdName) == 0) {
            serialByAvd[*avdName] = serial;
        }
    }

    std::vector<std::string> unresolved;
    for (const auto& avd : runningAvds) {
        auto it = serialByAvd.find(avd);
        if (it != serialByAvd.end()) {
            mapping[avd] = it->second;
        } else {
            unresolved.push_back(avd);
        }
    }

    // Emulators that would not tell their AVD name go to the remaining AVDs in order
    auto next = serials.begin();
    for (const auto& avd : unresolved) {
        while (next != serials.end() && claimed.count(*next) > 0) {
            ++next;
        }
        if (next == serials.end()) {
            LOG_DEBUG("No emulator serial left for running AVD " + avd);
            break;
        }
        mapping[avd] = *next;
        claimed.insert(*next);
    }

    return mapping;
}

std::optional<std::string> AndroidDiscovery::resolveDeviceId(const std::string& avdName) {
    // A stopped AVD has no serial; never hand it another emulator's
    std::vector<std::string> running = getRunningAvdNames();
    if (!containsName(running, avdName)) {
        LOG_DEBUG("AVD " + avdName + " is not running");
        return std::nullopt;
    }

    auto mapping = mapEmulatorSerials(running);
    auto it = mapping.find(avdName);
    if (it == mapping.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> AndroidDiscovery::getProperty(const std::string& serial, const std::string& key) {
    auto adb = adbPath();
    if (!adb) {
        return std::nullopt;
    }

    ProcessResult result = runner_.run(*adb, {"-s", serial, "shell", "getprop", key});
    if (!result.success) {
        return std::nullopt;
    }

    std::string value = TextUtils::trim(result.output);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

std::string AndroidDiscovery::queryApiLevel(const std::string& serial) {
    auto sdk = getProperty(serial, "ro.build.version.sdk");
    if (!sdk) {
        return kUnknownApiLevel;
    }
    return "API " + *sdk;
}

std::optional<std::string> AndroidDiscovery::queryAvdName(const std::string& serial) {
    auto name = getProperty(serial, "ro.boot.qemu.avd_name");
    if (name) {
        return name;
    }

    // Older system images only answer through the emulator console
    auto adb = adbPath();
    if (!adb) {
        return std::nullopt;
    }
    ProcessResult result = runner_.run(*adb, {"-s", serial, "emu", "avd", "name"});
    if (!result.success) {
        return std::nullopt;
    }
    for (const auto& line : TextUtils::splitLines(result.output)) {
        std::string trimmed = TextUtils::trim(line);
        if (trimmed.empty() || trimmed == "OK" || TextUtils::startsWith(trimmed, "KO")) continue;
        return trimmed;
    }
    return std::nullopt;
}

std::optional<std::vector<std::string>> AndroidDiscovery::listThirdPartyPackages(const std::string& serial) {
    auto adb = adbPath();
    if (!adb) {
        return std::nullopt;
    }

    ProcessResult result = runner_.run(*adb, {"-s", serial, "shell", "pm", "list", "packages", "-3"});
    if (!result.success) {
        return std::nullopt;
    }
    return parsePackageList(result.output);
}

FetchResult<PhysicalDevice> AndroidDiscovery::fetchDevices(const std::set<std::string>& usbSerials) {
    auto adb = adbPath();
    if (!adb) {
        return FetchResult<PhysicalDevice>::failure(DiscoveryError::TOOL_NOT_FOUND, "adb");
    }

    ProcessResult listing = runner_.run(*adb, {"devices", "-l"});
    if (!listing.success) {
        return processFailure<PhysicalDevice>("adb devices -l", listing);
    }

    FetchResult<PhysicalDevice> result;
    for (const auto& entry : parseAdbDevices(listing.output)) {
        if (entry.state != "device") {
            LOG_DEBUG("Skipping " + entry.serial + " in state " + entry.state);
            continue;
        }

        PhysicalDevice device;
        device.id = entry.serial;
        device.name = resolveDisplayName(entry);
        device.connected = true;
        device.version = queryApiLevel(entry.serial);
        device.platform = Platform::ANDROID;

        bool usbToken = std::any_of(entry.details.begin(), entry.details.end(),
            [](const std::string& detail) { return TextUtils::startsWith(detail, "usb:"); });
        device.transport = usbToken ? ConnectionType::USB
                                    : USBSerialScanner::classify(entry.serial, usbSerials);
        result.items.push_back(device);
    }

    return result;
}

std::string AndroidDiscovery::resolveDisplayName(const AdbDeviceEntry& entry) {
    for (const auto& detail : entry.details) {
        if (TextUtils::startsWith(detail, "product:")) {
            std::string productName = detail.substr(8);
            std::string manufacturer = getProperty(entry.serial, "ro.product.manufacturer").value_or("");
            std::string model = getProperty(entry.serial, "ro.product.model").value_or("");
            return composeDisplayName(manufacturer, model, productName);
        }
        if (TextUtils::startsWith(detail, "model:")) {
            return detail.substr(6);
        }
    }
    return entry.serial;
}

std::string AndroidDiscovery::composeDisplayName(const std::string& manufacturer, const std::string& model,
                                                 const std::string& productName) {
    if (!manufacturer.empty() && !model.empty()) {
        return TextUtils::capitalizeWords(manufacturer) + " " + model;
    }
    if (!manufacturer.empty()) {
        return TextUtils::capitalizeWords(manufacturer);
    }
    if (!model.empty()) {
        return model;
    }
    return productName;
}

std::vector<std::string> AndroidDiscovery::parseAvdList(const std::string& output) {
    std::vector<std::string> names;
    for (const auto& line : TextUtils::splitLines(output)) {
        std::string name = TextUtils::trim(line);
        // Newer emulator builds interleave "INFO    | ..." log lines
        if (name.empty() || TextUtils::contains(name, "|")) continue;
        names.push_back(name);
    }
    return names;
}

std::optional<std::string> AndroidDiscovery::parseAvdNameFromCommandLine(const std::string& commandLine) {
    auto tokens = TextUtils::splitWhitespace(commandLine);
    for (size_t i = 0; i + 1 < tokens.size(); ++i) {
        if (tokens[i] == "-avd") {
            return tokens[i + 1];
        }
    }
    return std::nullopt;
}

std::vector<AdbDeviceEntry> AndroidDiscovery::parseAdbDevices(const std::string& output) {
    std::vector<AdbDeviceEntry> entries;

    for (const auto& line : TextUtils::splitLines(output)) {
        std::string trimmed = TextUtils::trim(line);
        if (trimmed.empty()) continue;
        if (TextUtils::contains(trimmed, "List of devices")) continue;
        if (TextUtils::contains(trimmed, "emulator-")) continue;
        if (TextUtils::startsWith(trimmed, "*")) continue;     // adb daemon startup chatter

        auto tokens = TextUtils::splitWhitespace(trimmed);
        if (tokens.size() < 2) continue;

        AdbDeviceEntry entry;
        entry.serial = tokens[0];
        entry.state = tokens[1];
        entry.details.assign(tokens.begin() + 2, tokens.end());
        entries.push_back(entry);
    }

    return entries;
}

std::vector<std::string> AndroidDiscovery::parseEmulatorSerials(const std::string& output) {
    std::vector<std::string> serials;

    for (const auto& line : TextUtils::splitLines(output)) {
        if (!TextUtils::contains(line, "emulator-")) continue;

        auto fields = TextUtils::split(line, '\t');
        if (fields.size() < 2) continue;

        std::string serial = TextUtils::trim(fields[0]);
        std::string state = TextUtils::trim(fields[1]);
        if (state == "device" && TextUtils::startsWith(serial, "emulator-")) {
            serials.push_back(serial);
        }
    }

    return serials;
}

std::vector<std::string> AndroidDiscovery::parsePackageList(const std::string& output) {
    std::vector<std::string> packages;
    for (const auto& line : TextUtils::splitLines(output)) {
        std::string trimmed = TextUtils::trim(line);
        if (!TextUtils::startsWith(trimmed, "package:")) continue;
        std::string name = TextUtils::trim(trimmed.substr(8));
        if (!name.empty()) {
            packages.push_back(name);
        }
    }
    return packages;
}
