#include "AvdConfigReader.hpp"
#include "Logger.hpp"
#include "TextUtils.hpp"
#include <cstdlib>
#include <filesystem>
#include <regex>

namespace fs = std::filesystem;

namespace {
const std::string kUnknownApiLevel = "Unknown";

// AVD names are plain file name stems; anything that could leave the search directory is refused
bool isPlainAvdName(const std::string& name) {
    return !name.empty() && name.find('/') == std::string::npos &&
           name.find('\\') == std::string::npos && name.find("..") == std::string::npos;
}
}

AvdConfigReader::AvdConfigReader(const std::string& avdHome, const std::vector<std::string>& searchDirectories)
    : avdHome_(avdHome), searchDirectories_(searchDirectories) {}

std::string AvdConfigReader::defaultAvdHome() {
    const char* avdHome = std::getenv("ANDROID_AVD_HOME");
    if (avdHome && *avdHome) {
        return avdHome;
    }
    const char* userHome = std::getenv("ANDROID_USER_HOME");
    if (userHome && *userHome) {
        return std::string(userHome) + "/avd";
    }
    return TextUtils::homeDirectory() + "/.android/avd";
}

std::vector<std::string> AvdConfigReader::defaultSearchDirectories(const std::string& avdHome) {
    std::vector<std::string> dirs = {avdHome};
    std::string legacy = TextUtils::homeDirectory() + "/Library/Android/sdk/avd";
    if (legacy != avdHome) {
        dirs.push_back(legacy);
    }
    return dirs;
}

std::string AvdConfigReader::resolveConfigPath(const std::string& avdName) const {
    std::string iniContents;
    if (TextUtils::readFile(avdHome_ + "/" + avdName + ".ini", iniContents)) {
        for (const auto& line : TextUtils::splitLines(iniContents)) {
            std::string trimmed = TextUtils::trim(line);
            if (TextUtils::startsWith(trimmed, "path=")) {
                std::string path = TextUtils::trim(trimmed.substr(5));
                if (!path.empty()) {
                    return path + "/config.ini";
                }
            }
        }
    }
    return avdHome_ + "/" + avdName + ".avd/config.ini";
}

std::string AvdConfigReader::readApiLevel(const std::string& avdName) const {
    std::string configPath = resolveConfigPath(avdName);
    std::string contents;
    if (!TextUtils::readFile(configPath, contents)) {
        LOG_DEBUG("No readable config for AVD " + avdName + " at " + configPath);
        return kUnknownApiLevel;
    }
    return parseApiLevel(contents);
}

std::string AvdConfigReader::parseApiLevel(const std::string& configContents) {
    static const std::regex targetPattern(R"(^target=android-(\d+)$)");
    static const std::regex platformPattern(R"(android-(\d+))");

    std::vector<std::string> lines;
    for (const auto& line : TextUtils::splitLines(configContents)) {
        lines.push_back(TextUtils::trim(line));
    }

    // Explicit API field wins over the target, which wins over any android-N mention
    for (const auto& line : lines) {
        if (TextUtils::startsWith(line, "androidApiLevel=")) {
            std::string value = TextUtils::trim(line.substr(16));
            if (!value.empty()) {
                return "API " + value;
            }
        }
    }

    std::smatch match;
    for (const auto& line : lines) {
        if (std::regex_match(line, match, targetPattern)) {
            return "API " + match[1].str();
        }
    }

    for (const auto& line : lines) {
        if (std::regex_search(line, match, platformPattern)) {
            return "API " + match[1].str();
        }
    }

    return kUnknownApiLevel;
}

OperationResult AvdConfigReader::deleteAvd(const std::string& avdName, bool& removed) const {
    removed = false;
    if (!isPlainAvdName(avdName)) {
        LOG_ERROR("Refusing to delete AVD with invalid name '" + avdName + "'");
        return OperationResult::failure(DiscoveryError::FILESYSTEM_FAILURE, "invalid AVD name: " + avdName);
    }

    OperationResult lastError;

    for (const auto& dir : searchDirectories_) {
        fs::path avdDir = fs::path(dir) / (avdName + ".avd");
        fs::path iniFile = fs::path(dir) / (avdName + ".ini");

        std::error_code ec;
        if (!fs::exists(avdDir, ec)) {
            continue;
        }

        LOG_INFO("Deleting AVD directory " + avdDir.string());
        fs::remove_all(avdDir, ec);
        if (ec) {
            LOG_ERROR("Failed to delete " + avdDir.string() + ": " + ec.message());
            lastError = OperationResult::failure(DiscoveryError::FILESYSTEM_FAILURE,
                                                 avdDir.string() + ": " + ec.message());
            continue;
        }

        if (fs::exists(iniFile, ec)) {
            fs::remove(iniFile, ec);
            if (ec) {
                LOG_WARNING("Deleted " + avdDir.string() + " but not " + iniFile.string() + ": " + ec.message());
            }
        }

        removed = true;
        return OperationResult::success();
    }

    if (lastError.ok()) {
        LOG_INFO("No AVD storage found for " + avdName + ", nothing to delete");
    }
    return lastError;
}
