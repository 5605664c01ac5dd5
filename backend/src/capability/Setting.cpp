#include "capability/Setting.hpp"

#include "Device.hpp"
#include "core/Errors.hpp"

using json = nlohmann::json;

namespace fastmda {

void Setting::require_settable() const {
    if (!device_.is_connected()) {
        throw HardwareError(label() + ": " + errors::D1200_DEVICE_DISCONNECTED);
    }
    if (!is_able_to_set()) {
        throw BusyError(label() + " is busy");
    }
}

std::string Setting::label() const {
    return device_.id() + "/setting " + std::to_string(key_) + " (" + name() + ")";
}

std::size_t DiscreteSetting::get_value() {
    if (!device().is_connected()) {
        throw HardwareError(label() + ": " + errors::D1200_DEVICE_DISCONNECTED);
    }
    return do_get_value();
}

void DiscreteSetting::set_value(std::size_t index) {
    domain_.check(index, get_options().size(), label());
    require_settable();
    do_set_value(index);
}

json DiscreteSetting::descriptor() const {
    return {
        {"key", key()},
        {"name", name()},
        {"kind", "discrete"},
        {"unit", unit()},
        {"options", get_options()},
        {"invalid_options", get_invalid_options()}
    };
}

double ContinuousSetting::get_value() {
    if (!device().is_connected()) {
        throw HardwareError(label() + ": " + errors::D1200_DEVICE_DISCONNECTED);
    }
    return do_get_value();
}

void ContinuousSetting::set_value(double value) {
    domain_.check(value, get_hardware_limits(), label());
    require_settable();
    do_set_value(value);
}

json ContinuousSetting::descriptor() const {
    return {
        {"key", key()},
        {"name", name()},
        {"kind", "continuous"},
        {"unit", unit()},
        {"hardware_limits", get_hardware_limits()},
        {"software_limits", get_soft_limits()}
    };
}

} // namespace fastmda
