#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "capability/Domain.hpp"

namespace fastmda {

class Device;

/**
 * @brief A configuration value of a device, actuator or detector
 * (exposure time, gain, averaging mode, ...).
 *
 * Settings follow the same domain rules as actuators but never take part
 * in a measurement's step sequence.
 */
class Setting {
public:
    Setting(int key, Device& device) : key_(key), device_(device) {}
    virtual ~Setting() = default;

    int key() const { return key_; }
    Device& device() const { return device_; }

    virtual std::string name() const = 0;
    virtual std::string unit() const { return {}; }
    virtual bool is_able_to_set() const { return true; }
    virtual nlohmann::json descriptor() const = 0;

protected:
    // Throws HardwareError when the owning device is disconnected, BusyError when not settable.
    void require_settable() const;
    std::string label() const;

private:
    int key_;
    Device& device_;
};

class DiscreteSetting : public Setting {
public:
    using Setting::Setting;

    virtual std::vector<std::string> get_options() const = 0;
    std::size_t get_value();
    void set_value(std::size_t index);

    void set_invalid_option(std::size_t index) { domain_.set_invalid(index); }
    void set_valid_option(std::size_t index) { domain_.set_valid(index); }
    std::vector<std::size_t> get_invalid_options() const { return domain_.invalid(); }

    nlohmann::json descriptor() const override;

protected:
    virtual std::size_t do_get_value() = 0;
    virtual void do_set_value(std::size_t index) = 0;

private:
    DiscreteDomain domain_;
};

class ContinuousSetting : public Setting {
public:
    using Setting::Setting;

    virtual Limits get_hardware_limits() const = 0;
    double get_value();
    void set_value(double value);

    Limits get_soft_limits() const { return domain_.soft_limits(); }
    void set_soft_limits(const Limits& limits) { domain_.set_soft_limits(limits, get_hardware_limits()); }

    nlohmann::json descriptor() const override;

protected:
    virtual double do_get_value() = 0;
    virtual void do_set_value(double value) = 0;

private:
    ContinuousDomain domain_;
};

using SettingMap = std::map<int, std::shared_ptr<Setting>>;

} // namespace fastmda
