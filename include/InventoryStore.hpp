#pragma once
#include "DeviceInfo.hpp"
#include <functional>
#include <mutex>
#include <vector>

// Latest known device lists. Written only from the control queue; readers on any
// thread receive copies.
class InventoryStore {
public:
    using Observer = std::function<void(const Inventory&)>;

    InventoryStore() = default;

    Inventory snapshot() const;
    bool isLoading() const;

    void subscribe(Observer observer);

    void replaceIOSSimulators(std::vector<SimulatorRecord> simulators);
    void replaceIOSDevices(std::vector<PhysicalDevice> devices);
    void replaceAndroidEmulators(std::vector<EmulatorRecord> emulators);
    void replaceAndroidDevices(std::vector<PhysicalDevice> devices);

    // loading stays true while at least one fetch is outstanding
    void beginFetch();
    void completeFetch();

private:
    InventoryStore(const InventoryStore&) = delete;
    InventoryStore& operator=(const InventoryStore&) = delete;

    template <typename Mutator>
    void update(Mutator mutator);

    mutable std::mutex mutex_;
    Inventory inventory_;
    int pendingFetches_{0};

    std::mutex observersMutex_;
    std::vector<Observer> observers_;
};
