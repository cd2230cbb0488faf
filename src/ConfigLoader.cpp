#include "ConfigLoader.hpp"
#include "AvdConfigReader.hpp"
#include "Logger.hpp"
#include "TextUtils.hpp"
#include <fstream>

ConfigLoader::ConfigLoader() : searchDirectoriesSet_(false) {
    setDefaults();
}

bool ConfigLoader::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        LOG_ERROR("Cannot open config file: " + filename);
        return false;
    }

    try {
        json j;
        file >> j;
        return loadDiscoveryConfig(j);
    } catch (const std::exception& e) {
        LOG_ERROR("Error parsing config file " + filename + ": " + std::string(e.what()));
        return false;
    }
}

bool ConfigLoader::loadFromString(const std::string& content) {
    try {
        return loadDiscoveryConfig(json::parse(content));
    } catch (const std::exception& e) {
        LOG_ERROR("Error parsing configuration: " + std::string(e.what()));
        return false;
    }
}

bool ConfigLoader::loadDiscoveryConfig(const json& j) {
    if (!j.is_object()) {
        LOG_ERROR("Configuration root must be a JSON object");
        return false;
    }

    try {
        if (j.contains("logFile")) {
            config_.logFile = j["logFile"].get<std::string>();
        }
        if (j.contains("logLevel")) {
            config_.logLevel = j["logLevel"].get<std::string>();
        }
        if (j.contains("workerThreads")) {
            config_.workerThreads = j["workerThreads"].get<int>();
        }
        if (j.contains("refreshIntervalSeconds")) {
            config_.refreshIntervalSeconds = j["refreshIntervalSeconds"].get<int>();
        }
        if (j.contains("avdHome")) {
            config_.avdHome = TextUtils::expandHome(j["avdHome"].get<std::string>());
        }
        if (j.contains("avdSearchDirectories")) {
            config_.avdSearchDirectories.clear();
            for (const auto& dir : j["avdSearchDirectories"].get<std::vector<std::string>>()) {
                config_.avdSearchDirectories.push_back(TextUtils::expandHome(dir));
            }
            searchDirectoriesSet_ = !config_.avdSearchDirectories.empty();
        }
        if (j.contains("resolveEmulatorIdsByAvdName")) {
            config_.resolveEmulatorIdsByAvdName = j["resolveEmulatorIdsByAvdName"].get<bool>();
        }
        if (j.contains("systemAppsToClear")) {
            config_.systemAppsToClear = j["systemAppsToClear"].get<std::vector<std::string>>();
        }
        if (j.contains("timing")) {
            auto timing = j["timing"];
            if (timing.contains("pollIntervalMs")) {
                config_.timing.pollIntervalMs = timing["pollIntervalMs"].get<int>();
            }
            if (timing.contains("maxPollAttempts")) {
                config_.timing.maxPollAttempts = timing["maxPollAttempts"].get<int>();
            }
            if (timing.contains("bootPollAttempts")) {
                config_.timing.bootPollAttempts = timing["bootPollAttempts"].get<int>();
            }
        }
        if (j.contains("toolPaths")) {
            for (auto& [tool, paths] : j["toolPaths"].items()) {
                std::vector<std::string> expanded;
                for (const auto& path : paths.get<std::vector<std::string>>()) {
                    expanded.push_back(TextUtils::expandHome(path));
                }
                config_.toolPaths[tool] = expanded;
            }
        }
    } catch (const json::exception& e) {
        LOG_ERROR("Invalid configuration value: " + std::string(e.what()));
        return false;
    }

    finalize();
    LOG_INFO("Discovery configuration loaded successfully");
    return true;
}

DiscoveryConfig ConfigLoader::getConfig() const {
    return config_;
}

void ConfigLoader::setDefaults() {
    config_.logFile = "";
    config_.logLevel = "INFO";
    config_.workerThreads = 4;
    config_.refreshIntervalSeconds = 0;
    config_.avdHome = "";
    config_.avdSearchDirectories.clear();
    config_.resolveEmulatorIdsByAvdName = true;
    config_.systemAppsToClear = {
        "com.android.settings",
        "com.android.launcher",
        "com.google.android.gm",
        "com.android.vending",
        "com.google.android.apps.maps"
    };
    config_.timing.pollIntervalMs = 500;
    config_.timing.maxPollAttempts = 20;
    config_.timing.bootPollAttempts = 120;
    config_.toolPaths.clear();
    finalize();
}

// Derived values: AVD home from the environment and the search list from the AVD home
void ConfigLoader::finalize() {
    if (config_.workerThreads < 1) {
        LOG_WARNING("workerThreads must be at least 1, using 1");
        config_.workerThreads = 1;
    }
    if (config_.timing.pollIntervalMs < 0) {
        config_.timing.pollIntervalMs = 0;
    }
    if (config_.timing.maxPollAttempts < 1) {
        config_.timing.maxPollAttempts = 1;
    }
    if (config_.timing.bootPollAttempts < 1) {
        config_.timing.bootPollAttempts = 1;
    }
    if (config_.avdHome.empty()) {
        config_.avdHome = AvdConfigReader::defaultAvdHome();
    }
    if (!searchDirectoriesSet_) {
        config_.avdSearchDirectories = AvdConfigReader::defaultSearchDirectories(config_.avdHome);
    }
}
