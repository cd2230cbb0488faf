#pragma once
#include <string>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

struct TimingConfig {
    int pollIntervalMs;     // spacing between status re-checks
    int maxPollAttempts;    // budget for shutdown/delete/uninstall consistency
    int bootPollAttempts;   // budget for an emulator to show up after launch
};

struct DiscoveryConfig {
    std::string logFile;
    std::string logLevel;
    int workerThreads;
    int refreshIntervalSeconds;     // 0 disables the cron job
    std::string avdHome;
    std::vector<std::string> avdSearchDirectories;
    bool resolveEmulatorIdsByAvdName;
    std::vector<std::string> systemAppsToClear;
    TimingConfig timing;
    std::map<std::string, std::vector<std::string>> toolPaths;
};

class ConfigLoader {
public:
    ConfigLoader();
    bool loadFromFile(const std::string& filename);
    bool loadFromString(const std::string& content);
    DiscoveryConfig getConfig() const;

private:
    DiscoveryConfig config_;
    bool searchDirectoriesSet_;
    void setDefaults();
    bool loadDiscoveryConfig(const json& jsonConfig);
    void finalize();
};
