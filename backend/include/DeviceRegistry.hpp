#pragma once
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace fastmda {

class Device;

/**
 * @brief Process-wide mapping from device id to live Device instances.
 *
 * Populated at startup (see DeviceConfigLoader), read-mostly while runs
 * execute, torn down by disconnect_all() at shutdown.
 */
class DeviceRegistry {
public:
    DeviceRegistry();
    ~DeviceRegistry();

    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    // Throws ConfigError on duplicate id.
    void register_device(std::shared_ptr<Device> dev);

    std::shared_ptr<Device> get_device(const std::string& id) const;
    // Throws NotFoundError.
    std::shared_ptr<Device> require_device(const std::string& id) const;

    // Disconnects and removes; throws NotFoundError.
    void remove_device(const std::string& id);

    std::vector<std::string> list_ids() const;
    std::size_t size() const;

    // Apply a function to each registered device (thread-safe)
    void for_each_device(const std::function<void(const std::shared_ptr<Device>&)>& fn) const;

    // Return all descriptors for discovery
    nlohmann::json get_descriptor_graph() const;

    void disconnect_all();

private:
    std::map<std::string, std::shared_ptr<Device>> devices;
    mutable std::mutex registry_mutex;
};

} // namespace fastmda
