#include "ConfigLoader.hpp"
#include "fakes/TestSandbox.hpp"
#include <gtest/gtest.h>

TEST(config_loader, defaults_are_usable) {
    ConfigLoader loader;
    DiscoveryConfig config = loader.getConfig();

    EXPECT_EQ(config.logLevel, "INFO");
    EXPECT_EQ(config.workerThreads, 4);
    EXPECT_EQ(config.refreshIntervalSeconds, 0);
    EXPECT_TRUE(config.resolveEmulatorIdsByAvdName);
    EXPECT_FALSE(config.avdHome.empty());
    ASSERT_FALSE(config.avdSearchDirectories.empty());
    EXPECT_EQ(config.avdSearchDirectories.front(), config.avdHome);
    EXPECT_EQ(config.systemAppsToClear.size(), 5u);
    EXPECT_EQ(config.timing.pollIntervalMs, 500);
    EXPECT_TRUE(config.toolPaths.empty());
}

TEST(config_loader, values_override_defaults) {
    ConfigLoader loader;
    ASSERT_TRUE(loader.loadFromString(R"({
        "logLevel": "DEBUG",
        "workerThreads": 2,
        "avdHome": "/data/avd",
        "resolveEmulatorIdsByAvdName": false,
        "timing": {"pollIntervalMs": 50, "maxPollAttempts": 7},
        "toolPaths": {"adb": ["/opt/sdk/platform-tools/adb"]}
    })"));

    DiscoveryConfig config = loader.getConfig();
    EXPECT_EQ(config.logLevel, "DEBUG");
    EXPECT_EQ(config.workerThreads, 2);
    EXPECT_EQ(config.avdHome, "/data/avd");
    EXPECT_EQ(config.avdSearchDirectories.front(), "/data/avd");
    EXPECT_FALSE(config.resolveEmulatorIdsByAvdName);
    EXPECT_EQ(config.timing.pollIntervalMs, 50);
    EXPECT_EQ(config.timing.maxPollAttempts, 7);
    EXPECT_EQ(config.timing.bootPollAttempts, 120);
    ASSERT_EQ(config.toolPaths.count("adb"), 1u);
    EXPECT_EQ(config.toolPaths["adb"].front(), "/opt/sdk/platform-tools/adb");
}

TEST(config_loader, explicit_search_directories_are_kept) {
    ConfigLoader loader;
    ASSERT_TRUE(loader.loadFromString(R"({"avdHome": "/a", "avdSearchDirectories": ["/b", "/c"]})"));
    DiscoveryConfig config = loader.getConfig();
    EXPECT_EQ(config.avdSearchDirectories, (std::vector<std::string>{"/b", "/c"}));
}

TEST(config_loader, malformed_or_mistyped_input_fails) {
    ConfigLoader loader;
    EXPECT_FALSE(loader.loadFromString("{ not json"));
    EXPECT_FALSE(loader.loadFromString(R"({"workerThreads": "many"})"));
    EXPECT_FALSE(loader.loadFromString("[1, 2]"));
}

TEST(config_loader, reads_file_and_reports_missing_one) {
    TestSandbox sandbox;
    std::string path = sandbox.writeFile("config.json", R"({"refreshIntervalSeconds": 9})");

    ConfigLoader loader;
    EXPECT_TRUE(loader.loadFromFile(path));
    EXPECT_EQ(loader.getConfig().refreshIntervalSeconds, 9);

    ConfigLoader missing;
    EXPECT_FALSE(missing.loadFromFile(sandbox.root() + "/nope.json"));
    EXPECT_EQ(missing.getConfig().refreshIntervalSeconds, 0);
}
