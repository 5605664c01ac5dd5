#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace fastmda {

class DeviceRegistry;
class DeviceTypeCatalog;

struct LoadedDevice {
    std::string id;
    std::string type;
    bool connected = false;
    std::string message; // connection failure text, if any
};

/**
 * @brief Creates and registers devices from a configuration document:
 * {"devices": [{"id", "type", "args": {...}, "connect": true}]}
 *
 * Malformed entries and unknown types throw ConfigError before anything is
 * registered. A connection failure is logged and the device stays registered
 * but disconnected.
 */
class DeviceConfigLoader {
public:
    explicit DeviceConfigLoader(const DeviceTypeCatalog& catalog);

    std::vector<LoadedDevice> load(const std::string& path, DeviceRegistry& registry) const;
    std::vector<LoadedDevice> load_json(const nlohmann::json& doc, DeviceRegistry& registry) const;

private:
    const DeviceTypeCatalog& catalog_;
};

} // namespace fastmda
