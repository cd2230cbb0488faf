#include "DeviceManager.hpp"
#include "Logger.hpp"
#include "ConfigLoader.hpp"
#include <atomic>
#include <csignal>
#include <future>
#include <iostream>
#include <memory>
#include <set>
#include <thread>
#include <vector>
#include <unistd.h>

namespace {

std::atomic<bool> g_stopRequested(false);

void signalHandler(int) {
    g_stopRequested.store(true);
}

const std::chrono::minutes kRefreshTimeout(5);

const std::set<std::string> kCommands = {
    "list", "watch",
    "start-simulator", "stop-simulator", "restart-simulator", "erase-simulator", "delete-simulator",
    "start-emulator", "stop-emulator", "restart-emulator", "erase-emulator", "delete-emulator",
    "set-network"
};

} // namespace

void printHelp(const char* programName) {
    std::cout << "Usage: " << programName << " [OPTIONS] COMMAND [ARGS]\n\n";
    std::cout << "Mobile Device Discovery\n";
    std::cout << "Discovers iOS simulators, iOS devices, Android emulators and Android devices\n";
    std::cout << "through the platform command-line tools and drives their lifecycle.\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config FILE                   Path to configuration JSON file\n";
    std::cout << "  -v, --verbose                       Log at DEBUG level\n";
    std::cout << "  -h, --help                          Display this help message and exit\n\n";
    std::cout << "Commands:\n";
    std::cout << "  list                                Refresh once and print the inventory as JSON\n";
    std::cout << "  watch                               Refresh periodically, print after every refresh\n";
    std::cout << "  start-simulator UDID                Boot a simulator and open it\n";
    std::cout << "  stop-simulator UDID                 Shut a simulator down\n";
    std::cout << "  restart-simulator UDID              Shut down, then boot again\n";
    std::cout << "  erase-simulator UDID                Reset a simulator to factory state\n";
    std::cout << "  delete-simulator UDID               Delete a simulator\n";
    std::cout << "  start-emulator AVD                  Launch an Android emulator\n";
    std::cout << "  stop-emulator AVD                   Kill a running emulator\n";
    std::cout << "  restart-emulator AVD                Kill, then launch again\n";
    std::cout << "  erase-emulator AVD                  Remove user apps and clear system app data\n";
    std::cout << "  delete-emulator AVD                 Delete the AVD from disk\n";
    std::cout << "  set-network AVD on|off              Toggle WiFi and mobile data\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << programName << " list\n";
    std::cout << "  " << programName << " -c /etc/mobdiscovery/config.json watch\n";
    std::cout << "  " << programName << " stop-emulator Pixel_7_API_34\n";
}

bool validateConfigFile(const std::string& filePath, ConfigLoader& loader) {
    if (access(filePath.c_str(), F_OK) != 0) {
        std::cerr << "Error: config file not found: " << filePath << std::endl;
        return false;
    }

    if (access(filePath.c_str(), R_OK) != 0) {
        std::cerr << "Error: config file is not readable: " << filePath << std::endl;
        return false;
    }

    if (!loader.loadFromFile(filePath)) {
        std::cerr << "Error: Failed to parse config file: " << filePath << std::endl;
        return false;
    }
    return true;
}

json operationToJson(const std::string& command, const std::string& target, const OperationResult& result) {
    json j;
    j["command"] = command;
    j["target"] = target;
    j["ok"] = result.ok();
    j["error"] = discoveryErrorToString(result.error);
    j["detail"] = result.detail;
    return j;
}

int runWatch(DeviceManager& manager) {
    manager.subscribe([](const Inventory& inventory) {
        if (!inventory.loading) {
            std::cout << inventory.toJson().dump() << std::endl;
        }
    });

    manager.refreshAll();
    if (!manager.startCronJob()) {
        LOG_ERROR("Periodic refresh could not be started");
        return 1;
    }

    while (!g_stopRequested.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    return 0;
}

int runLifecycle(DeviceManager& manager, const std::string& command, const std::vector<std::string>& args) {
    auto finished = std::make_shared<std::promise<OperationResult>>();
    std::future<OperationResult> future = finished->get_future();
    OperationCallback done = [finished](const OperationResult& result) { finished->set_value(result); };

    const std::string& target = args[0];
    CommandOrchestrator& commands = manager.commands();

    if (command == "start-simulator") {
        commands.startSimulator(target, done);
    } else if (command == "stop-simulator") {
        commands.stopSimulator(target, done);
    } else if (command == "restart-simulator") {
        commands.restartSimulator(target, done);
    } else if (command == "erase-simulator") {
        commands.eraseSimulator(target, done);
    } else if (command == "delete-simulator") {
        commands.deleteSimulator(target, done);
    } else if (command == "start-emulator") {
        commands.startEmulator(target, done);
    } else if (command == "stop-emulator") {
        commands.stopEmulator(target, done);
    } else if (command == "restart-emulator") {
        commands.restartEmulator(target, done);
    } else if (command == "erase-emulator") {
        commands.eraseEmulator(target, done);
    } else if (command == "delete-emulator") {
        commands.deleteEmulator(target, done);
    } else if (command == "set-network") {
        commands.setEmulatorNetwork(target, args[1] == "on", done);
    } else {
        std::cerr << "Error: Unknown command: " << command << std::endl;
        return 1;
    }

    while (future.wait_for(std::chrono::milliseconds(200)) != std::future_status::ready) {
        if (g_stopRequested.load()) {
            LOG_WARNING("Interrupted while waiting for " + command);
            return 130;
        }
    }

    json output;
    output["operation"] = operationToJson(command, target, future.get());
    output["inventory"] = manager.getInventory().toJson();
    std::cout << output.dump(2) << std::endl;
    return 0;
}

int main(int argc, char* argv[]) {
    std::string configFile;
    std::string command;
    std::vector<std::string> commandArgs;
    bool verbose = false;

    // Parse command line arguments manually for better control
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (!command.empty()) {
            commandArgs.push_back(arg);
        } else if (arg == "-h" || arg == "--help") {
            printHelp(argv[0]);
            return 0;
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                configFile = argv[++i];
            } else {
                std::cerr << "Error: " << arg << " requires a file path argument." << std::endl;
                return 1;
            }
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: Unknown argument: " << arg << std::endl;
            std::cerr << "Use -h or --help for usage information." << std::endl;
            return 1;
        } else {
            command = arg;
        }
    }

    if (command.empty()) {
        std::cerr << "Error: a command is required." << std::endl;
        std::cerr << "Use -h or --help for usage information." << std::endl;
        return 1;
    }

    if (kCommands.count(command) == 0) {
        std::cerr << "Error: Unknown command: " << command << std::endl;
        std::cerr << "Use -h or --help for usage information." << std::endl;
        return 1;
    }

    size_t requiredArgs = 0;
    if (command == "set-network") {
        requiredArgs = 2;
    } else if (command != "list" && command != "watch") {
        requiredArgs = 1;
    }
    if (commandArgs.size() != requiredArgs) {
        std::cerr << "Error: " << command << " expects " << requiredArgs << " argument(s)." << std::endl;
        return 1;
    }
    if (command == "set-network" && commandArgs[1] != "on" && commandArgs[1] != "off") {
        std::cerr << "Error: set-network expects on or off, got " << commandArgs[1] << std::endl;
        return 1;
    }

    ConfigLoader loader;
    if (!configFile.empty() && !validateConfigFile(configFile, loader)) {
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    DiscoveryConfig config = loader.getConfig();
    if (verbose) {
        config.logLevel = "DEBUG";
    }
    if (command == "watch" && config.refreshIntervalSeconds <= 0) {
        config.refreshIntervalSeconds = 5;
    }

    DeviceManager manager;
    if (!manager.initialize(config)) {
        std::cerr << "Error: Failed to initialize device manager" << std::endl;
        return 1;
    }

    int exitCode = 0;
    try {
        if (command == "list") {
            if (!manager.refreshAllAndWait(kRefreshTimeout)) {
                LOG_WARNING("Inventory refresh did not finish in time, printing partial results");
            }
            std::cout << manager.getInventory().toJson().dump(2) << std::endl;
        } else if (command == "watch") {
            exitCode = runWatch(manager);
        } else {
            exitCode = runLifecycle(manager, command, commandArgs);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Exception in device manager: " + std::string(e.what()));
        std::cerr << "Error: " << e.what() << std::endl;
        exitCode = 1;
    }

    manager.shutdown();
    return exitCode;
}
