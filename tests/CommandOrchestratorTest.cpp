#include "CommandOrchestrator.hpp"
#include "fakes/FakeInventoryRefresher.hpp"
#include "fakes/FakeProcessRunner.hpp"
#include "fakes/TestSandbox.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <future>
#include <memory>

namespace {

const std::string kUdid = "A1B2C3D4-0000-1111-2222-333344445555";

std::string simctlListing(const std::string& state) {
    return R"({"devices": {"com.apple.CoreSimulator.SimRuntime.iOS-17-5": [
        {"udid": ")" + kUdid + R"(", "name": "iPhone 15", "state": ")" + state + R"(", "isAvailable": true}
    ]}})";
}

const std::string kEmptyListing = R"({"devices": {}})";

}

class CommandOrchestratorFixture : public ::testing::Test {
protected:
    void SetUp() override {
        build({Tool::XCRUN, Tool::OPEN, Tool::ADB, Tool::EMULATOR, Tool::PGREP, Tool::PS});
    }

    void TearDown() override {
        pool->shutdown();
        control.stop();
    }

    void build(const std::set<Tool>& present) {
        if (pool) {
            pool->shutdown();
        }
        control.stop();

        locator = std::make_unique<ToolLocator>(runner, sandbox.tools(present));
        reader = std::make_unique<AvdConfigReader>(sandbox.avdHome(),
                                                   std::vector<std::string>{sandbox.avdHome()});
        ios = std::make_unique<IOSDiscovery>(runner, *locator);
        android = std::make_unique<AndroidDiscovery>(runner, *locator, *reader, true);
        pool = std::make_unique<WorkerPool>(2);
        ASSERT_TRUE(control.start());

        TimingConfig timing{1, 3, 3};
        orchestrator = std::make_unique<CommandOrchestrator>(runner, *locator, *ios, *android, *reader,
            *pool, control, refresher, timing, std::vector<std::string>{"com.android.settings"});

        xcrun = sandbox.toolPath(Tool::XCRUN);
        adb = sandbox.toolPath(Tool::ADB);
        simctlList = xcrun + " simctl list devices --json";
        pgrep = sandbox.toolPath(Tool::PGREP) + " -f qemu-system.*-avd";
        ps = sandbox.toolPath(Tool::PS) + " -o command -p 4242";
    }

    OperationResult await(std::function<void(OperationCallback)> operation) {
        auto promise = std::make_shared<std::promise<OperationResult>>();
        auto future = promise->get_future();
        operation([promise](const OperationResult& result) { promise->set_value(result); });
        if (future.wait_for(std::chrono::seconds(10)) != std::future_status::ready) {
            ADD_FAILURE() << "operation did not complete";
            return OperationResult::failure(DiscoveryError::NONE, "timeout");
        }
        return future.get();
    }

    // Pixel_7 online as emulator-5554
    void scriptOnlineEmulator() {
        runner.respond(adb + " devices", "List of devices attached\nemulator-5554\tdevice\n");
        runner.respond(adb + " -s emulator-5554 shell getprop ro.boot.qemu.avd_name", "Pixel_7\n");
    }

    static ProcessResult running() {
        return ProcessResult::completed(0, "4242\n", "");
    }

    static ProcessResult notRunning() {
        return ProcessResult::completed(1, "", "");
    }

    void scriptProcessTable(const std::vector<ProcessResult>& pgrepAnswers) {
        runner.respondSequence(pgrep, pgrepAnswers);
        runner.respond(ps, "COMMAND\n/sdk/emulator/qemu/linux-x86_64/qemu-system-x86_64 -avd Pixel_7\n");
    }

    TestSandbox sandbox;
    FakeProcessRunner runner;
    FakeInventoryRefresher refresher;
    ControlQueue control;
    std::unique_ptr<ToolLocator> locator;
    std::unique_ptr<AvdConfigReader> reader;
    std::unique_ptr<IOSDiscovery> ios;
    std::unique_ptr<AndroidDiscovery> android;
    std::unique_ptr<WorkerPool> pool;
    std::unique_ptr<CommandOrchestrator> orchestrator;

    std::string xcrun;
    std::string adb;
    std::string simctlList;
    std::string pgrep;
    std::string ps;
};

TEST_F(CommandOrchestratorFixture, stop_simulator_shuts_down_and_refetches) {
    runner.respond(xcrun + " simctl shutdown " + kUdid, "");

    OperationResult result = await([this](OperationCallback done) { orchestrator->stopSimulator(kUdid, done); });

    EXPECT_TRUE(result.ok());
    EXPECT_EQ(runner.callCount(xcrun + " simctl shutdown " + kUdid), 1u);
    EXPECT_EQ(refresher.simulatorFetches.load(), 1);
}

TEST_F(CommandOrchestratorFixture, stop_simulator_reports_tool_exit_status) {
    runner.respond(xcrun + " simctl shutdown " + kUdid, "", 149, "Unable to shutdown device in current state");

    OperationResult result = await([this](OperationCallback done) { orchestrator->stopSimulator(kUdid, done); });

    EXPECT_EQ(result.error, DiscoveryError::PROCESS_EXIT_FAILURE);
    EXPECT_NE(result.detail.find("149"), std::string::npos);
    EXPECT_EQ(refresher.simulatorFetches.load(), 0);
}

TEST_F(CommandOrchestratorFixture, start_simulator_without_xcrun_runs_nothing) {
    build({Tool::OPEN});

    OperationResult result = await([this](OperationCallback done) { orchestrator->startSimulator(kUdid, done); });

    EXPECT_EQ(result.error, DiscoveryError::TOOL_NOT_FOUND);
    EXPECT_EQ(runner.callCount(xcrun + " simctl boot " + kUdid), 0u);
    EXPECT_EQ(refresher.simulatorFetches.load(), 0);
}

TEST_F(CommandOrchestratorFixture, start_simulator_boots_then_opens_app) {
    std::string boot = xcrun + " simctl boot " + kUdid;
    std::string open = sandbox.toolPath(Tool::OPEN) + " -a Simulator --args -CurrentDeviceUDID " + kUdid;
    runner.respond(boot, "");
    runner.respond(open, "");

    OperationResult result = await([this](OperationCallback done) { orchestrator->startSimulator(kUdid, done); });

    EXPECT_TRUE(result.ok());
    ASSERT_GE(runner.indexOf(open), 0);
    EXPECT_LT(runner.indexOf(boot), runner.indexOf(open));
    EXPECT_EQ(refresher.simulatorFetches.load(), 1);
}

TEST_F(CommandOrchestratorFixture, restart_simulator_shuts_down_boots_and_opens_app) {
    std::string shutdown = xcrun + " simctl shutdown " + kUdid;
    std::string boot = xcrun + " simctl boot " + kUdid;
    std::string open = sandbox.toolPath(Tool::OPEN) + " -a Simulator --args -CurrentDeviceUDID " + kUdid;
    runner.respond(shutdown, "");
    runner.respond(boot, "");
    runner.respond(open, "");
    runner.respondSequence(simctlList, {
        ProcessResult::completed(0, simctlListing("Booted"), ""),
        ProcessResult::completed(0, simctlListing("Shutdown"), "")
    });

    OperationResult result = await([this](OperationCallback done) { orchestrator->restartSimulator(kUdid, done); });

    EXPECT_TRUE(result.ok());
    ASSERT_GE(runner.indexOf(open), 0);
    EXPECT_LT(runner.indexOf(shutdown), runner.indexOf(boot));
    EXPECT_LT(runner.indexOf(boot), runner.indexOf(open));
    EXPECT_EQ(runner.callCount(simctlList), 2u);
    EXPECT_EQ(refresher.simulatorFetches.load(), 1);
}

TEST_F(CommandOrchestratorFixture, restart_simulator_boots_after_shutdown_checks_run_out) {
    runner.respond(xcrun + " simctl shutdown " + kUdid, "");
    runner.respond(xcrun + " simctl boot " + kUdid, "");
    runner.respond(simctlList, simctlListing("Booted"));

    OperationResult result = await([this](OperationCallback done) { orchestrator->restartSimulator(kUdid, done); });

    EXPECT_TRUE(result.ok());
    EXPECT_EQ(runner.callCount(simctlList), 3u);
    EXPECT_EQ(runner.callCount(xcrun + " simctl boot " + kUdid), 1u);
    EXPECT_EQ(refresher.simulatorFetches.load(), 1);
}

TEST_F(CommandOrchestratorFixture, restart_simulator_ignores_failed_shutdown) {
    runner.respond(xcrun + " simctl shutdown " + kUdid, "", 149, "Unable to shutdown device in current state: Shutdown");
    runner.respond(xcrun + " simctl boot " + kUdid, "");
    runner.respond(simctlList, simctlListing("Shutdown"));

    OperationResult result = await([this](OperationCallback done) { orchestrator->restartSimulator(kUdid, done); });

    EXPECT_TRUE(result.ok());
    EXPECT_EQ(runner.callCount(simctlList), 1u);
    EXPECT_EQ(runner.callCount(xcrun + " simctl boot " + kUdid), 1u);
}

TEST_F(CommandOrchestratorFixture, restart_simulator_reports_boot_failure) {
    runner.respond(xcrun + " simctl shutdown " + kUdid, "");
    runner.respond(xcrun + " simctl boot " + kUdid, "", 2, "Invalid device");
    runner.respond(simctlList, kEmptyListing);

    OperationResult result = await([this](OperationCallback done) { orchestrator->restartSimulator(kUdid, done); });

    EXPECT_EQ(result.error, DiscoveryError::PROCESS_EXIT_FAILURE);
    EXPECT_EQ(refresher.simulatorFetches.load(), 0);
}

TEST_F(CommandOrchestratorFixture, erase_simulator_runs_shutdown_erase_boot_in_order) {
    std::string shutdown = xcrun + " simctl shutdown " + kUdid;
    std::string erase = xcrun + " simctl erase " + kUdid;
    std::string boot = xcrun + " simctl boot " + kUdid;
    runner.respond(shutdown, "");
    runner.respond(erase, "");
    runner.respond(boot, "");
    runner.respondSequence(simctlList, {
        ProcessResult::completed(0, simctlListing("Shutdown"), ""),
        ProcessResult::completed(0, simctlListing("Booted"), "")
    });

    OperationResult result = await([this](OperationCallback done) { orchestrator->eraseSimulator(kUdid, done); });

    EXPECT_TRUE(result.ok());
    EXPECT_LT(runner.indexOf(shutdown), runner.indexOf(erase));
    EXPECT_LT(runner.indexOf(erase), runner.indexOf(boot));
    EXPECT_EQ(runner.callCount(simctlList), 2u);
    EXPECT_EQ(refresher.refreshAllCalls.load(), 1);
}

TEST_F(CommandOrchestratorFixture, erase_simulator_continues_when_shutdown_never_shows) {
    runner.respond(xcrun + " simctl shutdown " + kUdid, "");
    runner.respond(xcrun + " simctl erase " + kUdid, "");
    runner.respond(xcrun + " simctl boot " + kUdid, "");
    runner.respond(simctlList, simctlListing("Booted"));

    OperationResult result = await([this](OperationCallback done) { orchestrator->eraseSimulator(kUdid, done); });

    EXPECT_TRUE(result.ok());
    // three shutdown checks, then one boot check
    EXPECT_EQ(runner.callCount(simctlList), 4u);
    EXPECT_EQ(runner.callCount(xcrun + " simctl erase " + kUdid), 1u);
}

TEST_F(CommandOrchestratorFixture, erase_simulator_failure_still_boots_and_refreshes) {
    runner.respond(xcrun + " simctl shutdown " + kUdid, "");
    runner.respond(xcrun + " simctl erase " + kUdid, "", 1, "erase failed");
    runner.respond(xcrun + " simctl boot " + kUdid, "");
    runner.respondSequence(simctlList, {
        ProcessResult::completed(0, simctlListing("Shutdown"), ""),
        ProcessResult::completed(0, simctlListing("Booted"), "")
    });

    OperationResult result = await([this](OperationCallback done) { orchestrator->eraseSimulator(kUdid, done); });

    EXPECT_EQ(result.error, DiscoveryError::PROCESS_EXIT_FAILURE);
    EXPECT_EQ(runner.callCount(xcrun + " simctl boot " + kUdid), 1u);
    EXPECT_EQ(refresher.refreshAllCalls.load(), 1);
}

TEST_F(CommandOrchestratorFixture, delete_simulator_waits_until_unlisted) {
    runner.respond(xcrun + " simctl delete " + kUdid, "");
    runner.respondSequence(simctlList, {
        ProcessResult::completed(0, simctlListing("Shutdown"), ""),
        ProcessResult::completed(0, kEmptyListing, "")
    });

    OperationResult result = await([this](OperationCallback done) { orchestrator->deleteSimulator(kUdid, done); });

    EXPECT_TRUE(result.ok());
    EXPECT_EQ(runner.callCount(simctlList), 2u);
    EXPECT_EQ(refresher.simulatorFetches.load(), 1);
}

TEST_F(CommandOrchestratorFixture, delete_emulator_without_files_still_refetches) {
    OperationResult result = await([this](OperationCallback done) { orchestrator->deleteEmulator("Ghost", done); });

    EXPECT_TRUE(result.ok());
    EXPECT_EQ(refresher.emulatorFetches.load(), 1);
}

TEST_F(CommandOrchestratorFixture, delete_emulator_removes_avd_storage) {
    sandbox.createAvd("Pixel_7", "image.sysdir.1=system-images/android-34/google_apis/x86_64/\n");

    OperationResult result = await([this](OperationCallback done) { orchestrator->deleteEmulator("Pixel_7", done); });

    EXPECT_TRUE(result.ok());
    EXPECT_FALSE(std::filesystem::exists(sandbox.avdHome() + "/Pixel_7.avd"));
    EXPECT_FALSE(std::filesystem::exists(sandbox.avdHome() + "/Pixel_7.ini"));
    EXPECT_EQ(refresher.emulatorFetches.load(), 1);
}

TEST_F(CommandOrchestratorFixture, stop_emulator_without_online_device_is_unresolved) {
    scriptProcessTable({running()});
    runner.respond(adb + " devices", "List of devices attached\n");

    OperationResult result = await([this](OperationCallback done) { orchestrator->stopEmulator("Pixel_7", done); });

    EXPECT_EQ(result.error, DiscoveryError::DEVICE_NOT_RESOLVED);
    EXPECT_EQ(runner.callCount(adb + " -s emulator-5554 emu kill"), 0u);
    EXPECT_EQ(refresher.refreshAllCalls.load(), 0);
}

TEST_F(CommandOrchestratorFixture, stop_emulator_kills_and_waits_for_exit) {
    scriptOnlineEmulator();
    runner.respond(adb + " -s emulator-5554 emu kill", "OK: killing emulator, bye bye\n");
    // resolved while running, still running at the first check, gone at the second
    scriptProcessTable({running(), running(), notRunning()});

    OperationResult result = await([this](OperationCallback done) { orchestrator->stopEmulator("Pixel_7", done); });

    EXPECT_TRUE(result.ok());
    EXPECT_EQ(runner.callCount(adb + " -s emulator-5554 emu kill"), 1u);
    EXPECT_EQ(runner.callCount(pgrep), 3u);
    EXPECT_EQ(refresher.refreshAllCalls.load(), 1);
}

TEST_F(CommandOrchestratorFixture, stop_emulator_leaves_other_running_emulator_alone) {
    // Only Pixel_8 runs, as emulator-5554, and it does not report its AVD name
    runner.respond(pgrep, "4343\n");
    runner.respond(sandbox.toolPath(Tool::PS) + " -o command -p 4343",
                   "COMMAND\n/sdk/emulator/qemu/linux-x86_64/qemu-system-x86_64 -avd Pixel_8\n");
    runner.respond(adb + " devices", "List of devices attached\nemulator-5554\tdevice\n");
    runner.respond(adb + " -s emulator-5554 emu kill", "OK: killing emulator, bye bye\n");
    runner.respond(adb + " -s emulator-5554 shell svc wifi disable", "");
    runner.respond(adb + " -s emulator-5554 shell svc data disable", "");

    OperationResult stop = await([this](OperationCallback done) { orchestrator->stopEmulator("Pixel_7", done); });
    OperationResult network = await([this](OperationCallback done) {
        orchestrator->setEmulatorNetwork("Pixel_7", false, done);
    });

    EXPECT_EQ(stop.error, DiscoveryError::DEVICE_NOT_RESOLVED);
    EXPECT_EQ(network.error, DiscoveryError::DEVICE_NOT_RESOLVED);
    EXPECT_EQ(runner.callCount(adb + " -s emulator-5554 emu kill"), 0u);
    EXPECT_EQ(runner.callCount(adb + " -s emulator-5554 shell svc wifi disable"), 0u);
    EXPECT_EQ(refresher.refreshAllCalls.load(), 0);
}

TEST_F(CommandOrchestratorFixture, set_network_toggles_wifi_and_data) {
    scriptOnlineEmulator();
    scriptProcessTable({running()});
    runner.respond(adb + " -s emulator-5554 shell svc wifi disable", "");
    runner.respond(adb + " -s emulator-5554 shell svc data disable", "");

    OperationResult result = await([this](OperationCallback done) {
        orchestrator->setEmulatorNetwork("Pixel_7", false, done);
    });

    EXPECT_TRUE(result.ok());
    EXPECT_EQ(runner.callCount(adb + " -s emulator-5554 shell svc wifi disable"), 1u);
    EXPECT_EQ(runner.callCount(adb + " -s emulator-5554 shell svc data disable"), 1u);
}

TEST_F(CommandOrchestratorFixture, set_network_reports_failed_toggle) {
    scriptOnlineEmulator();
    scriptProcessTable({running()});
    runner.respond(adb + " -s emulator-5554 shell svc data enable", "");

    OperationResult result = await([this](OperationCallback done) {
        orchestrator->setEmulatorNetwork("Pixel_7", true, done);
    });

    EXPECT_EQ(result.error, DiscoveryError::PROCESS_EXIT_FAILURE);
    EXPECT_EQ(runner.callCount(adb + " -s emulator-5554 shell svc data enable"), 1u);
}

TEST_F(CommandOrchestratorFixture, erase_emulator_uninstalls_and_clears_apps) {
    scriptOnlineEmulator();
    scriptProcessTable({running()});
    std::string list = adb + " -s emulator-5554 shell pm list packages -3";
    runner.respondSequence(list, {
        ProcessResult::completed(0, "package:com.example.a\npackage:com.example.b\n", ""),
        ProcessResult::completed(0, "package:com.example.b\n", ""),
        ProcessResult::completed(0, "", "")
    });
    runner.respond(adb + " -s emulator-5554 shell pm uninstall com.example.a", "Success\n");
    runner.respond(adb + " -s emulator-5554 shell pm uninstall com.example.b", "Success\n");
    runner.respond(adb + " -s emulator-5554 shell pm clear com.android.settings", "Success\n");

    OperationResult result = await([this](OperationCallback done) { orchestrator->eraseEmulator("Pixel_7", done); });

    EXPECT_TRUE(result.ok());
    EXPECT_EQ(runner.callCount(adb + " -s emulator-5554 shell pm clear com.android.settings"), 1u);
    EXPECT_LT(runner.indexOf(adb + " -s emulator-5554 shell pm uninstall com.example.b"),
              runner.indexOf(adb + " -s emulator-5554 shell pm clear com.android.settings"));
    EXPECT_EQ(runner.callCount(list), 3u);
    EXPECT_EQ(refresher.refreshAllCalls.load(), 1);
}

TEST_F(CommandOrchestratorFixture, erase_emulator_fails_when_packages_cannot_be_listed) {
    scriptOnlineEmulator();
    scriptProcessTable({running()});

    OperationResult result = await([this](OperationCallback done) { orchestrator->eraseEmulator("Pixel_7", done); });

    EXPECT_EQ(result.error, DiscoveryError::PROCESS_EXIT_FAILURE);
    EXPECT_EQ(refresher.refreshAllCalls.load(), 0);
}

TEST_F(CommandOrchestratorFixture, start_emulator_spawns_and_waits_for_process) {
    scriptProcessTable({notRunning(), running()});

    OperationResult result = await([this](OperationCallback done) { orchestrator->startEmulator("Pixel_7", done); });

    EXPECT_TRUE(result.ok());
    ASSERT_EQ(runner.spawned().size(), 1u);
    EXPECT_EQ(runner.spawned().front(), sandbox.toolPath(Tool::EMULATOR) + " -avd Pixel_7");
    EXPECT_EQ(runner.callCount(pgrep), 2u);
    EXPECT_EQ(refresher.emulatorFetches.load(), 1);
}

TEST_F(CommandOrchestratorFixture, start_emulator_reports_spawn_failure) {
    runner.setSpawnSucceeds(false);

    OperationResult result = await([this](OperationCallback done) { orchestrator->startEmulator("Pixel_7", done); });

    EXPECT_EQ(result.error, DiscoveryError::PROCESS_LAUNCH_FAILURE);
    EXPECT_EQ(refresher.emulatorFetches.load(), 0);
}

TEST_F(CommandOrchestratorFixture, restart_emulator_starts_even_when_not_running) {
    scriptOnlineEmulator();
    scriptProcessTable({notRunning(), running()});

    OperationResult result = await([this](OperationCallback done) { orchestrator->restartEmulator("Pixel_7", done); });

    EXPECT_TRUE(result.ok());
    EXPECT_EQ(runner.callCount(adb + " -s emulator-5554 emu kill"), 0u);
    EXPECT_EQ(runner.spawned().size(), 1u);
    EXPECT_EQ(refresher.emulatorFetches.load(), 1);
}
