#pragma once
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

namespace fastmda {

class Device;
class IDeviceToolkit;

/**
 * @brief Maps device type names to factories.
 *
 * This is the extension point for user-supplied device implementations:
 * register a factory under a type name and reference that name from the
 * device configuration file.
 */
class DeviceTypeCatalog {
public:
    using Factory = std::function<std::shared_ptr<Device>(const std::string& id, const nlohmann::json& args)>;

    // `args` documents constructor arguments as {name: description}. Replaces an existing entry.
    void register_type(const std::string& type, const std::string& description, nlohmann::json args, Factory factory);
    void install(IDeviceToolkit& toolkit);

    bool has_type(const std::string& type) const;

    // Throws ConfigError for unknown types or malformed args.
    std::shared_ptr<Device> create(const std::string& id, const std::string& type, const nlohmann::json& args) const;

    // [{type, description, args}] in name order.
    nlohmann::json describe() const;

private:
    struct Entry {
        std::string description;
        nlohmann::json args;
        Factory factory;
    };

    mutable std::mutex m_;
    std::map<std::string, Entry> types_;
};

} // namespace fastmda
