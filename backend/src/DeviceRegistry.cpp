#include "DeviceRegistry.hpp"
#include "Device.hpp"

#include <iostream>

namespace fastmda {

DeviceRegistry::DeviceRegistry() {}

DeviceRegistry::~DeviceRegistry() {
    disconnect_all();
}

void DeviceRegistry::register_device(std::shared_ptr<Device> dev) {
    if (!dev) throw ConfigError("DeviceRegistry: null device");
    std::lock_guard<std::mutex> lock(registry_mutex);
    const std::string id = dev->id();
    if (!devices.emplace(id, std::move(dev)).second) {
        throw ConfigError("DeviceRegistry: duplicate device id '" + id + "'");
    }
}

std::shared_ptr<Device> DeviceRegistry::get_device(const std::string& id) const {
    std::lock_guard<std::mutex> lock(registry_mutex);
    auto it = devices.find(id);
    return it == devices.end() ? nullptr : it->second;
}

std::shared_ptr<Device> DeviceRegistry::require_device(const std::string& id) const {
    auto d = get_device(id);
    if (!d) throw NotFoundError("unknown device '" + id + "'");
    return d;
}

void DeviceRegistry::remove_device(const std::string& id) {
    std::shared_ptr<Device> d;
    {
        std::lock_guard<std::mutex> lock(registry_mutex);
        auto it = devices.find(id);
        if (it == devices.end()) throw NotFoundError("unknown device '" + id + "'");
        d = it->second;
        devices.erase(it);
    }
    auto r = d->disconnect();
    if (!r.ok()) {
        std::cerr << "DeviceRegistry: removed " << id << " but disconnect failed: " << r.message << std::endl;
    }
}

std::vector<std::string> DeviceRegistry::list_ids() const {
    std::lock_guard<std::mutex> lock(registry_mutex);
    std::vector<std::string> ids;
    ids.reserve(devices.size());
    for (const auto& [id, _] : devices) ids.push_back(id);
    return ids;
}

std::size_t DeviceRegistry::size() const {
    std::lock_guard<std::mutex> lock(registry_mutex);
    return devices.size();
}

void DeviceRegistry::for_each_device(const std::function<void(const std::shared_ptr<Device>&)>& fn) const {
    std::vector<std::shared_ptr<Device>> snapshot;
    {
        std::lock_guard<std::mutex> lock(registry_mutex);
        for (const auto& [id, d] : devices) snapshot.push_back(d);
    }
    for (const auto& d : snapshot) fn(d);
}

nlohmann::json DeviceRegistry::get_descriptor_graph() const {
    nlohmann::json graph = nlohmann::json::array();
    for_each_device([&](const std::shared_ptr<Device>& d) {
        graph.push_back(d->descriptor());
    });
    return graph;
}

void DeviceRegistry::disconnect_all() {
    for_each_device([](const std::shared_ptr<Device>& d) {
        if (!d->is_connected()) return;
        auto r = d->disconnect();
        if (!r.ok()) {
            std::cerr << "DeviceRegistry: disconnect of " << d->id() << " failed: " << r.message << std::endl;
        }
    });
}

} // namespace fastmda
