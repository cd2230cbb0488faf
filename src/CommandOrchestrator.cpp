#include "CommandOrchestrator.hpp"
#include "Logger.hpp"
#include "TextUtils.hpp"
#include <chrono>
#include <memory>
#include <optional>

CommandOrchestrator::CommandOrchestrator(ProcessRunner& runner,
                                         const ToolLocator& locator,
                                         IOSDiscovery& iosDiscovery,
                                         AndroidDiscovery& androidDiscovery,
                                         const AvdConfigReader& avdReader,
                                         WorkerPool& pool,
                                         ControlQueue& control,
                                         InventoryRefresher& refresher,
                                         const TimingConfig& timing,
                                         const std::vector<std::string>& systemAppsToClear)
    : runner_(runner),
      locator_(locator),
      iosDiscovery_(iosDiscovery),
      androidDiscovery_(androidDiscovery),
      avdReader_(avdReader),
      pool_(pool),
      control_(control),
      refresher_(refresher),
      timing_(timing),
      systemAppsToClear_(systemAppsToClear) {}

// ---- step plumbing ----

template <typename T>
void CommandOrchestrator::async(std::function<T()> work, std::function<void(T)> next) {
    bool queued = pool_.submit([this, work, next]() {
        T value = work();
        control_.post([next, value]() { next(value); });
    });
    if (!queued) {
        LOG_WARNING("Worker pool stopped, lifecycle step dropped");
    }
}

void CommandOrchestrator::withTool(Tool tool, StepCallback onMissing,
                                   std::function<void(const std::string&)> next) {
    async<std::optional<std::string>>(
        [this, tool]() { return locator_.locate(tool); },
        [tool, onMissing, next](std::optional<std::string> path) {
            if (!path) {
                onMissing(OperationResult::failure(DiscoveryError::TOOL_NOT_FOUND, ToolLocator::toolName(tool)));
                return;
            }
            next(*path);
        });
}

void CommandOrchestrator::withDeviceId(const std::string& avdName, StepCallback onMissing,
                                       std::function<void(const std::string&)> next) {
    async<std::optional<std::string>>(
        [this, avdName]() { return androidDiscovery_.resolveDeviceId(avdName); },
        [avdName, onMissing, next](std::optional<std::string> deviceId) {
            if (!deviceId) {
                onMissing(OperationResult::failure(DiscoveryError::DEVICE_NOT_RESOLVED,
                                                   "no online emulator for " + avdName));
                return;
            }
            next(*deviceId);
        });
}

void CommandOrchestrator::runStep(const std::string& path, const std::vector<std::string>& args,
                                  std::function<void(const ProcessResult&)> next) {
    LOG_DEBUG("Running " + ProcessRunner::describe(path, args));
    async<ProcessResult>(
        [this, path, args]() { return runner_.run(path, args); },
        [next](ProcessResult result) { next(result); });
}

void CommandOrchestrator::pollUntil(const std::string& description, std::function<bool()> probe,
                                    int maxAttempts, std::function<void(bool)> next, int attempt) {
    async<bool>(probe, [this, description, probe, maxAttempts, next, attempt](bool reached) {
        if (reached) {
            LOG_DEBUG(description + " after " + std::to_string(attempt + 1) + " checks");
            next(true);
            return;
        }
        if (attempt + 1 >= maxAttempts) {
            LOG_WARNING("Gave up waiting: " + description + " (" + std::to_string(maxAttempts) +
                        " checks), continuing");
            next(false);
            return;
        }
        control_.postDelayed(std::chrono::milliseconds(timing_.pollIntervalMs),
            [this, description, probe, maxAttempts, next, attempt]() {
                pollUntil(description, probe, maxAttempts, next, attempt + 1);
            });
    });
}

void CommandOrchestrator::finish(const std::string& operation, const OperationCallback& done,
                                 const OperationResult& result) {
    if (result.ok()) {
        LOG_INFO(operation + " completed");
    } else {
        LOG_WARNING(operation + " failed: " + discoveryErrorToString(result.error) +
                    (result.detail.empty() ? "" : " (" + result.detail + ")"));
    }
    if (done) {
        done(result);
    }
}

OperationResult CommandOrchestrator::fromProcess(const std::string& what, const ProcessResult& result) {
    if (result.success) {
        return OperationResult::success();
    }
    if (result.failure == ProcessFailure::LAUNCH_FAILED) {
        return OperationResult::failure(DiscoveryError::PROCESS_LAUNCH_FAILURE, what + ": " + result.error);
    }
    return OperationResult::failure(DiscoveryError::PROCESS_EXIT_FAILURE,
        what + " exited with " + std::to_string(result.exitCode) + ": " + TextUtils::trim(result.error));
}

// ---- iOS simulators ----

void CommandOrchestrator::startSimulator(const std::string& udid, OperationCallback done) {
    LOG_INFO("Starting simulator " + udid);
    withTool(Tool::XCRUN,
        [this, done](const OperationResult& missing) { finish("Start simulator", done, missing); },
        [this, udid, done](const std::string& xcrun) { bootSimulator(xcrun, udid, done); });
}

void CommandOrchestrator::bootSimulator(const std::string& xcrun, const std::string& udid, OperationCallback done) {
    runStep(xcrun, {"simctl", "boot", udid}, [this, udid, done](const ProcessResult& result) {
        if (!result.success) {
            finish("Start simulator " + udid, done, fromProcess("simctl boot", result));
            return;
        }
        launchSimulatorApp(udid, [this, udid, done]() {
            refresher_.fetchIOSSimulators([this, udid, done]() {
                finish("Start simulator " + udid, done, OperationResult::success());
            });
        });
    });
}

void CommandOrchestrator::launchSimulatorApp(const std::string& udid, std::function<void()> next) {
    async<bool>(
        [this, udid]() {
            auto open = locator_.locate(Tool::OPEN);
            if (!open) {
                LOG_DEBUG("No UI launcher available, simulator " + udid + " runs headless");
                return false;
            }
            ProcessResult result = runner_.run(*open, {"-a", "Simulator", "--args", "-CurrentDeviceUDID", udid});
            if (!result.success) {
                LOG_WARNING("Failed to open Simulator app: " + TextUtils::trim(result.error));
            }
            return result.success;
        },
        [next](bool) { next(); });
}

void CommandOrchestrator::stopSimulator(const std::string& udid, OperationCallback done) {
    LOG_INFO("Stopping simulator " + udid);
    const std::string operation = "Stop simulator " + udid;
    withTool(Tool::XCRUN,
        [this, operation, done](const OperationResult& missing) { finish(operation, done, missing); },
        [this, udid, operation, done](const std::string& xcrun) {
            runStep(xcrun, {"simctl", "shutdown", udid}, [this, operation, done](const ProcessResult& result) {
                if (!result.success) {
                    finish(operation, done, fromProcess("simctl shutdown", result));
                    return;
                }
                refresher_.fetchIOSSimulators([this, operation, done]() {
                    finish(operation, done, OperationResult::success());
                });
            });
        });
}

void CommandOrchestrator::restartSimulator(const std::string& udid, OperationCallback done) {
    LOG_INFO("Restarting simulator " + udid);
    const std::string operation = "Restart simulator " + udid;
    withTool(Tool::XCRUN,
        [this, operation, done](const OperationResult& missing) { finish(operation, done, missing); },
        [this, udid, done](const std::string& xcrun) {
            runStep(xcrun, {"simctl", "shutdown", udid}, [this, xcrun, udid, done](const ProcessResult& result) {
                if (!result.success) {
                    LOG_DEBUG("simctl shutdown " + udid + ": " + TextUtils::trim(result.error));
                }
                pollUntil("simulator " + udid + " shut down",
                    [this, udid]() {
                        auto simulator = iosDiscovery_.findSimulator(udid);
                        return !simulator || !simulator->isRunning();
                    },
                    timing_.maxPollAttempts,
                    [this, xcrun, udid, done](bool) { bootSimulator(xcrun, udid, done); });
            });
        });
}

void CommandOrchestrator::eraseSimulator(const std::string& udid, OperationCallback done) {
    LOG_INFO("Erasing simulator " + udid);
    const std::string operation = "Erase simulator " + udid;
    withTool(Tool::XCRUN,
        [this, operation, done](const OperationResult& missing) { finish(operation, done, missing); },
        [this, udid, operation, done](const std::string& xcrun) {
            auto outcome = std::make_shared<OperationResult>();

            auto refresh = [this, operation, done, outcome]() {
                refresher_.refreshAll([this, operation, done, outcome]() {
                    finish(operation, done, *outcome);
                });
            };

            auto boot = [this, xcrun, udid, outcome, refresh]() {
                runStep(xcrun, {"simctl", "boot", udid}, [this, udid, outcome, refresh](const ProcessResult& result) {
                    if (!result.success) {
                        if (outcome->ok()) {
                            *outcome = fromProcess("simctl boot", result);
                        }
                        refresh();
                        return;
                    }
                    pollUntil("simulator " + udid + " booted",
                        [this, udid]() {
                            auto simulator = iosDiscovery_.findSimulator(udid);
                            return simulator && simulator->isRunning();
                        },
                        timing_.maxPollAttempts,
                        [refresh](bool) { refresh(); });
                });
            };

            auto erase = [this, xcrun, udid, outcome, boot](bool) {
                runStep(xcrun, {"simctl", "erase", udid}, [outcome, boot](const ProcessResult& result) {
                    if (!result.success) {
                        *outcome = fromProcess("simctl erase", result);
                    }
                    boot();
                });
            };

            runStep(xcrun, {"simctl", "shutdown", udid}, [this, udid, erase](const ProcessResult& result) {
                if (!result.success) {
                    LOG_DEBUG("simctl shutdown " + udid + ": " + TextUtils::trim(result.error));
                }
                pollUntil("simulator " + udid + " shut down",
                    [this, udid]() {
                        auto simulator = iosDiscovery_.findSimulator(udid);
                        return !simulator || simulator->bootState() == BootState::SHUTDOWN;
                    },
                    timing_.maxPollAttempts,
                    erase);
            });
        });
}

void CommandOrchestrator::deleteSimulator(const std::string& udid, OperationCallback done) {
    LOG_INFO("Deleting simulator " + udid);
    const std::string operation = "Delete simulator " + udid;
    withTool(Tool::XCRUN,
        [this, operation, done](const OperationResult& missing) { finish(operation, done, missing); },
        [this, udid, operation, done](const std::string& xcrun) {
            runStep(xcrun, {"simctl", "delete", udid}, [this, udid, operation, done](const ProcessResult& result) {
                if (!result.success) {
                    finish(operation, done, fromProcess("simctl delete", result));
                    return;
                }
                pollUntil("simulator " + udid + " removed",
                    [this, udid]() { return !iosDiscovery_.findSimulator(udid).has_value(); },
                    timing_.maxPollAttempts,
                    [this, operation, done](bool) {
                        refresher_.fetchIOSSimulators([this, operation, done]() {
                            finish(operation, done, OperationResult::success());
                        });
                    });
            });
        });
}

// ---- Android emulators ----

void CommandOrchestrator::startEmulator(const std::string& avdName, OperationCallback done) {
    LOG_INFO("Starting emulator " + avdName);
    const std::string operation = "Start emulator " + avdName;
    withTool(Tool::EMULATOR,
        [this, operation, done](const OperationResult& missing) { finish(operation, done, missing); },
        [this, avdName, operation, done](const std::string& emulator) {
            async<bool>(
                [this, emulator, avdName]() { return runner_.spawnDetached(emulator, {"-avd", avdName}); },
                [this, avdName, operation, done](bool spawned) {
                    if (!spawned) {
                        finish(operation, done, OperationResult::failure(
                            DiscoveryError::PROCESS_LAUNCH_FAILURE, "emulator -avd " + avdName));
                        return;
                    }
                    pollUntil("emulator " + avdName + " running",
                        [this, avdName]() { return androidDiscovery_.isAvdRunning(avdName); },
                        timing_.bootPollAttempts,
                        [this, operation, done](bool) {
                            refresher_.fetchAndroidEmulators([this, operation, done]() {
                                finish(operation, done, OperationResult::success());
                            });
                        });
                });
        });
}

void CommandOrchestrator::stopEmulatorSequence(const std::string& avdName, StepCallback next) {
    withTool(Tool::ADB, next, [this, avdName, next](const std::string& adb) {
        withDeviceId(avdName, next, [this, adb, avdName, next](const std::string& deviceId) {
            runStep(adb, {"-s", deviceId, "emu", "kill"}, [this, avdName, next](const ProcessResult& result) {
                if (!result.success) {
                    next(fromProcess("adb emu kill", result));
                    return;
                }
                pollUntil("emulator " + avdName + " stopped",
                    [this, avdName]() { return !androidDiscovery_.isAvdRunning(avdName); },
                    timing_.maxPollAttempts,
                    [next](bool) { next(OperationResult::success()); });
            });
        });
    });
}

void CommandOrchestrator::stopEmulator(const std::string& avdName, OperationCallback done) {
    LOG_INFO("Stopping emulator " + avdName);
    const std::string operation = "Stop emulator " + avdName;
    stopEmulatorSequence(avdName, [this, operation, done](const OperationResult& result) {
        if (!result.ok()) {
            finish(operation, done, result);
            return;
        }
        refresher_.refreshAll([this, operation, done, result]() { finish(operation, done, result); });
    });
}

void CommandOrchestrator::restartEmulator(const std::string& avdName, OperationCallback done) {
    LOG_INFO("Restarting emulator " + avdName);
    stopEmulatorSequence(avdName, [this, avdName, done](const OperationResult& result) {
        if (!result.ok()) {
            LOG_INFO("Emulator " + avdName + " was not stopped (" + discoveryErrorToString(result.error) +
                     "), starting it anyway");
        }
        startEmulator(avdName, done);
    });
}

CommandOrchestrator::WipeOutcome CommandOrchestrator::wipeEmulator(const std::string& adb, const std::string& deviceId) {
    WipeOutcome outcome;

    auto packages = androidDiscovery_.listThirdPartyPackages(deviceId);
    if (!packages) {
        outcome.result = OperationResult::failure(DiscoveryError::PROCESS_EXIT_FAILURE,
                                                  "pm list packages on " + deviceId);
        return outcome;
    }

    LOG_INFO("Uninstalling " + std::to_string(packages->size()) + " packages from " + deviceId);
    for (const auto& package : *packages) {
        ProcessResult result = runner_.run(adb, {"-s", deviceId, "shell", "pm", "uninstall", package});
        if (result.success) {
            outcome.uninstalled.push_back(package);
        } else {
            LOG_WARNING("Failed to uninstall " + package + ": " + TextUtils::trim(result.error + result.output));
        }
    }

    for (const auto& app : systemAppsToClear_) {
        ProcessResult result = runner_.run(adb, {"-s", deviceId, "shell", "pm", "clear", app});
        if (!result.success) {
            LOG_DEBUG("pm clear " + app + " failed on " + deviceId);
        }
    }

    return outcome;
}

void CommandOrchestrator::eraseEmulator(const std::string& avdName, OperationCallback done) {
    LOG_INFO("Erasing emulator " + avdName);
    const std::string operation = "Erase emulator " + avdName;
    auto fail = [this, operation, done](const OperationResult& result) { finish(operation, done, result); };

    withTool(Tool::ADB, fail, [this, avdName, operation, done, fail](const std::string& adb) {
        withDeviceId(avdName, fail, [this, adb, operation, done](const std::string& deviceId) {
            async<WipeOutcome>(
                [this, adb, deviceId]() { return wipeEmulator(adb, deviceId); },
                [this, deviceId, operation, done](WipeOutcome outcome) {
                    if (!outcome.result.ok()) {
                        finish(operation, done, outcome.result);
                        return;
                    }
                    auto removed = outcome.uninstalled;
                    pollUntil("packages removed from " + deviceId,
                        [this, deviceId, removed]() {
                            auto remaining = androidDiscovery_.listThirdPartyPackages(deviceId);
                            if (!remaining) {
                                return false;
                            }
                            for (const auto& package : removed) {
                                for (const auto& left : *remaining) {
                                    if (left == package) return false;
                                }
                            }
                            return true;
                        },
                        timing_.maxPollAttempts,
                        [this, operation, done](bool) {
                            refresher_.refreshAll([this, operation, done]() {
                                finish(operation, done, OperationResult::success());
                            });
                        });
                });
        });
    });
}

void CommandOrchestrator::deleteEmulator(const std::string& avdName, OperationCallback done) {
    LOG_INFO("Deleting emulator " + avdName);
    const std::string operation = "Delete emulator " + avdName;
    async<OperationResult>(
        [this, avdName]() {
            bool removed = false;
            return avdReader_.deleteAvd(avdName, removed);
        },
        [this, operation, done](OperationResult result) {
            refresher_.fetchAndroidEmulators([this, operation, done, result]() {
                finish(operation, done, result);
            });
        });
}

void CommandOrchestrator::setEmulatorNetwork(const std::string& avdName, bool enabled, OperationCallback done) {
    const std::string action = enabled ? "enable" : "disable";
    LOG_INFO("Network " + action + " on emulator " + avdName);
    const std::string operation = "Network " + action + " on " + avdName;
    auto fail = [this, operation, done](const OperationResult& result) { finish(operation, done, result); };

    withTool(Tool::ADB, fail, [this, avdName, action, operation, done, fail](const std::string& adb) {
        withDeviceId(avdName, fail, [this, adb, action, operation, done](const std::string& deviceId) {
            async<OperationResult>(
                [this, adb, deviceId, action]() {
                    ProcessResult wifi = runner_.run(adb, {"-s", deviceId, "shell", "svc", "wifi", action});
                    ProcessResult data = runner_.run(adb, {"-s", deviceId, "shell", "svc", "data", action});
                    if (!wifi.success) {
                        return fromProcess("svc wifi " + action, wifi);
                    }
                    return fromProcess("svc data " + action, data);
                },
                [this, operation, done](OperationResult result) { finish(operation, done, result); });
        });
    });
}
