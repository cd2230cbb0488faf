#include "ToolLocator.hpp"
#include "Logger.hpp"
#include "TextUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

bool isExistingFile(const std::string& path) {
    std::error_code ec;
    return !path.empty() && fs::exists(path, ec) && !fs::is_directory(path, ec);
}

std::vector<std::string> androidSdkRoots() {
    std::vector<std::string> roots;
    const char* androidHome = std::getenv("ANDROID_HOME");
    if (androidHome && *androidHome) {
        roots.push_back(androidHome);
    }
    const char* sdkRoot = std::getenv("ANDROID_SDK_ROOT");
    if (sdkRoot && *sdkRoot && (roots.empty() || roots.front() != sdkRoot)) {
        roots.push_back(sdkRoot);
    }
    return roots;
}

} // namespace

ToolLocator::ToolLocator(ProcessRunner& runner, const CandidateOverrides& overrides)
    : runner_(runner), overrides_(overrides) {}

std::string ToolLocator::toolName(Tool tool) {
    switch (tool) {
        case Tool::XCRUN: return "xcrun";
        case Tool::OPEN: return "open";
        case Tool::SYSTEM_PROFILER: return "system_profiler";
        case Tool::ADB: return "adb";
        case Tool::EMULATOR: return "emulator";
        case Tool::PGREP: return "pgrep";
        case Tool::PS: return "ps";
        case Tool::WHICH: return "which";
        default: return "unknown";
    }
}

std::vector<std::string> ToolLocator::defaultCandidates(Tool tool) {
    const std::string home = TextUtils::homeDirectory();
    std::vector<std::string> paths;

    switch (tool) {
        case Tool::XCRUN:
            paths = {"/usr/bin/xcrun"};
            break;
        case Tool::OPEN:
            paths = {"/usr/bin/open"};
            break;
        case Tool::SYSTEM_PROFILER:
            paths = {"/usr/sbin/system_profiler"};
            break;
        case Tool::ADB:
            paths = {
                "/opt/homebrew/bin/adb",
                "/usr/local/bin/adb",
                "/usr/bin/adb",
                home + "/Library/Android/sdk/platform-tools/adb",
                home + "/Android/Sdk/platform-tools/adb"
            };
            for (const auto& root : androidSdkRoots()) {
                paths.push_back(root + "/platform-tools/adb");
            }
            break;
        case Tool::EMULATOR:
            paths = {
                home + "/Library/Android/sdk/emulator/emulator",
                "/opt/homebrew/bin/emulator",
                "/usr/local/bin/emulator",
                home + "/Android/Sdk/emulator/emulator"
            };
            for (const auto& root : androidSdkRoots()) {
                paths.push_back(root + "/emulator/emulator");
            }
            break;
        case Tool::PGREP:
            paths = {"/usr/bin/pgrep", "/bin/pgrep"};
            break;
        case Tool::PS:
            paths = {"/bin/ps", "/usr/bin/ps"};
            break;
        case Tool::WHICH:
            paths = {"/usr/bin/which", "/bin/which"};
            break;
    }
    return paths;
}

std::vector<std::string> ToolLocator::candidates(Tool tool) const {
    auto it = overrides_.find(toolName(tool));
    if (it != overrides_.end()) {
        return it->second;
    }
    return defaultCandidates(tool);
}

std::optional<std::string> ToolLocator::locate(Tool tool) const {
    for (const auto& path : candidates(tool)) {
        if (isExistingFile(path)) {
            return path;
        }
    }

    if (tool == Tool::WHICH) {
        LOG_DEBUG("which not found in any candidate location");
        return std::nullopt;
    }

    auto found = locateWithWhich(tool);
    if (!found) {
        LOG_DEBUG("Tool not found: " + toolName(tool));
    }
    return found;
}

std::optional<std::string> ToolLocator::locateWithWhich(Tool tool) const {
    auto which = locate(Tool::WHICH);
    if (!which) {
        return std::nullopt;
    }

    ProcessResult result = runner_.run(*which, {toolName(tool)});
    if (!result.success) {
        return std::nullopt;
    }

    std::string path = TextUtils::trim(result.output);
    // which may print several matches; the first one is what the shell would run
    auto newline = path.find('\n');
    if (newline != std::string::npos) {
        path = TextUtils::trim(path.substr(0, newline));
    }

    if (!isExistingFile(path)) {
        LOG_DEBUG("which reported " + path + " for " + toolName(tool) + " but it does not exist");
        return std::nullopt;
    }
    return path;
}
