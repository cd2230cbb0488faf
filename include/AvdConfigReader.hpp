#pragma once
#include "DiscoveryResult.hpp"
#include <string>
#include <vector>

// On-disk AVD storage: <home>/<name>.ini pointer files and <name>.avd directories.
class AvdConfigReader {
public:
    AvdConfigReader(const std::string& avdHome, const std::vector<std::string>& searchDirectories);

    // <avdHome>/<name>.ini "path=" target + "/config.ini", else <avdHome>/<name>.avd/config.ini
    std::string resolveConfigPath(const std::string& avdName) const;

    // "API <n>" or "Unknown"
    std::string readApiLevel(const std::string& avdName) const;

    // Removes the first <dir>/<name>.avd found and its companion <dir>/<name>.ini.
    // Nothing found is not an error; removed reports whether anything was deleted.
    OperationResult deleteAvd(const std::string& avdName, bool& removed) const;

    const std::string& getAvdHome() const { return avdHome_; }

    static std::string parseApiLevel(const std::string& configContents);

    static std::string defaultAvdHome();
    static std::vector<std::string> defaultSearchDirectories(const std::string& avdHome);

private:
    std::string avdHome_;
    std::vector<std::string> searchDirectories_;
};
