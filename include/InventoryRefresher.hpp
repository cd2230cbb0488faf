#pragma once
#include <functional>

// Re-fetch entry points the orchestrator triggers after a lifecycle command.
// Completions run on the control queue once the fetched list has been stored.
class InventoryRefresher {
public:
    using Completion = std::function<void()>;

    virtual ~InventoryRefresher() = default;

    virtual void refreshAll(Completion done) = 0;
    virtual void fetchIOSSimulators(Completion done) = 0;
    virtual void fetchIOSDevices(Completion done) = 0;
    virtual void fetchAndroidEmulators(Completion done) = 0;
    virtual void fetchAndroidDevices(Completion done) = 0;
};
