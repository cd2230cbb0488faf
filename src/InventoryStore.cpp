#include "InventoryStore.hpp"
#include "Logger.hpp"

Inventory InventoryStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inventory_;
}

bool InventoryStore::isLoading() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inventory_.loading;
}

void InventoryStore::subscribe(Observer observer) {
    std::lock_guard<std::mutex> lock(observersMutex_);
    observers_.push_back(std::move(observer));
}

template <typename Mutator>
void InventoryStore::update(Mutator mutator) {
    Inventory copy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        mutator(inventory_);
        inventory_.revision++;
        copy = inventory_;
    }

    std::vector<Observer> observers;
    {
        std::lock_guard<std::mutex> lock(observersMutex_);
        observers = observers_;
    }

    for (const auto& observer : observers) {
        try {
            observer(copy);
        } catch (const std::exception& e) {
            LOG_ERROR("Inventory observer exception: " + std::string(e.what()));
        }
    }
}

void InventoryStore::replaceIOSSimulators(std::vector<SimulatorRecord> simulators) {
    LOG_DEBUG("Inventory: " + std::to_string(simulators.size()) + " iOS simulators");
    update([&simulators](Inventory& inventory) {
        inventory.iosSimulators = std::move(simulators);
    });
}

void InventoryStore::replaceIOSDevices(std::vector<PhysicalDevice> devices) {
    LOG_DEBUG("Inventory: " + std::to_string(devices.size()) + " iOS devices");
    update([&devices](Inventory& inventory) {
        inventory.iosDevices = std::move(devices);
    });
}

void InventoryStore::replaceAndroidEmulators(std::vector<EmulatorRecord> emulators) {
    LOG_DEBUG("Inventory: " + std::to_string(emulators.size()) + " Android emulators");
    update([&emulators](Inventory& inventory) {
        inventory.androidEmulators = std::move(emulators);
    });
}

void InventoryStore::replaceAndroidDevices(std::vector<PhysicalDevice> devices) {
    LOG_DEBUG("Inventory: " + std::to_string(devices.size()) + " Android devices");
    update([&devices](Inventory& inventory) {
        inventory.androidDevices = std::move(devices);
    });
}

void InventoryStore::beginFetch() {
    update([this](Inventory& inventory) {
        pendingFetches_++;
        inventory.loading = true;
    });
}

void InventoryStore::completeFetch() {
    update([this](Inventory& inventory) {
        if (pendingFetches_ > 0) {
            pendingFetches_--;
        }
        inventory.loading = pendingFetches_ > 0;
    });
}
