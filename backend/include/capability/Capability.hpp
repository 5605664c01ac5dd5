#pragma once

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "capability/Setting.hpp"

namespace fastmda {

class Device;

/**
 * @brief Common part of detectors and actuators.
 *
 * A capability is created by its owning Device during construction and
 * never outlives it; holders of a capability pointer keep the Device alive too.
 * The key is unique among capabilities of the same kind on one device.
 */
class Capability {
public:
    Capability(int key, Device& device) : key_(key), device_(device) {}
    virtual ~Capability() = default;

    Capability(const Capability&) = delete;
    Capability& operator=(const Capability&) = delete;

    int key() const { return key_; }
    Device& device() const { return device_; }

    virtual std::string name() const = 0;
    virtual std::string unit() const { return {}; }

    const SettingMap& settings() const { return settings_; }
    virtual nlohmann::json descriptor() const = 0;

protected:
    void add_setting(std::shared_ptr<Setting> setting);
    // Throws HardwareError when the owning device is disconnected.
    void require_connected() const;
    std::string label() const;
    nlohmann::json settings_descriptor() const;

private:
    int key_;
    Device& device_;
    SettingMap settings_;
};

} // namespace fastmda
