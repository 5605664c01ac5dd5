#include "capability/Actuator.hpp"

#include "Device.hpp"
#include "core/Errors.hpp"

#include <cmath>

using json = nlohmann::json;

namespace fastmda {

const char* to_string(ActuatorKind kind) {
    return kind == ActuatorKind::Discrete ? "discrete" : "continuous";
}

void to_json(json& j, const ActuatorPosition& p) {
    j = json{
        {"device_id", p.device_id},
        {"actuator", p.actuator},
        {"name", p.name},
        {"kind", to_string(p.kind)}
    };
    if (p.kind == ActuatorKind::Discrete) {
        j["index"] = static_cast<std::size_t>(p.value);
        j["label"] = p.label;
    } else {
        j["value"] = p.value;
        j["unit"] = p.unit;
    }
}

void Actuator::require_settable() const {
    require_connected();
    if (!is_able_to_set()) {
        throw BusyError(label() + " is busy");
    }
}

ActuatorPosition Actuator::position_base() const {
    ActuatorPosition p;
    p.device_id = device().id();
    p.actuator = key();
    p.name = name();
    p.kind = kind();
    p.unit = unit();
    return p;
}

// ---- DiscreteActuator ----

std::size_t DiscreteActuator::get_position() {
    require_connected();
    return do_get_position();
}

void DiscreteActuator::set_position(std::size_t index) {
    domain_.check(index, get_position_values().size(), label());
    require_settable();
    do_set_position(index);
}

void DiscreteActuator::validate_target(double target) const {
    const std::size_t count = get_position_values().size();
    if (!(target >= 0.0) || std::floor(target) != target) {
        throw InvalidPositionError(LimitKind::Hard, label() + ": " + errors::D1300_INDEX_OUT_OF_RANGE +
                                   " (not an option index)");
    }
    // compare as double so huge targets never reach the integer conversion
    if (target >= static_cast<double>(count)) {
        throw InvalidPositionError(LimitKind::Hard, label() + ": " + errors::D1300_INDEX_OUT_OF_RANGE);
    }
    domain_.check(static_cast<std::size_t>(target), count, label());
}

void DiscreteActuator::move_to(double target) {
    validate_target(target);
    set_position(static_cast<std::size_t>(target));
}

ActuatorPosition DiscreteActuator::read_position() {
    ActuatorPosition p = position_base();
    const std::size_t index = get_position();
    const auto options = get_position_values();
    p.value = static_cast<double>(index);
    if (index < options.size()) p.label = options[index];
    return p;
}

json DiscreteActuator::descriptor() const {
    return {
        {"key", key()},
        {"name", name()},
        {"kind", "discrete"},
        {"unit", unit()},
        {"options", get_position_values()},
        {"invalid_options", get_invalid_options()},
        {"settings", settings_descriptor()}
    };
}

// ---- ContinuousActuator ----

double ContinuousActuator::get_position() {
    require_connected();
    return do_get_position();
}

void ContinuousActuator::set_position(double value) {
    domain_.check(value, get_hardware_limits(), label());
    require_settable();
    do_set_position(value);
}

void ContinuousActuator::validate_target(double target) const {
    domain_.check(target, get_hardware_limits(), label());
}

void ContinuousActuator::move_to(double target) {
    set_position(target);
}

ActuatorPosition ContinuousActuator::read_position() {
    ActuatorPosition p = position_base();
    p.value = get_position();
    return p;
}

json ContinuousActuator::descriptor() const {
    return {
        {"key", key()},
        {"name", name()},
        {"kind", "continuous"},
        {"unit", unit()},
        {"hardware_limits", get_hardware_limits()},
        {"software_limits", get_soft_limits()},
        {"settings", settings_descriptor()}
    };
}

} // namespace fastmda
