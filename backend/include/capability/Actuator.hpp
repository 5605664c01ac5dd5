#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "capability/Capability.hpp"
#include "capability/Domain.hpp"

namespace fastmda {

enum class ActuatorKind { Discrete, Continuous };

const char* to_string(ActuatorKind kind);

// Observed position of one actuator, as recorded in a DataPoint.
struct ActuatorPosition {
    std::string device_id;
    int actuator = 0;
    std::string name;
    ActuatorKind kind = ActuatorKind::Continuous;
    double value = 0.0;  // continuous position, or option index for discrete actuators
    std::string label;   // option label (discrete only)
    std::string unit;
};

void to_json(nlohmann::json& j, const ActuatorPosition& p);

/**
 * @brief Capability holding a position that can be commanded.
 *
 * Commanded positions are validated against the actuator's domain before the
 * hardware hook runs; on validation failure the position is untouched.
 * set_position blocks until the move completes. It is idempotent with respect
 * to the final hardware state but not atomic: a concurrent read may observe an
 * intermediate position.
 */
class Actuator : public Capability {
public:
    using Capability::Capability;

    virtual ActuatorKind kind() const = 0;
    virtual bool is_able_to_set() const { return true; }

    // Kind-agnostic access used by scans. Discrete targets are option indices.
    virtual void validate_target(double target) const = 0;
    virtual void move_to(double target) = 0;
    virtual ActuatorPosition read_position() = 0;

protected:
    void require_settable() const;
    ActuatorPosition position_base() const;
};

class DiscreteActuator : public Actuator {
public:
    using Actuator::Actuator;

    ActuatorKind kind() const override { return ActuatorKind::Discrete; }

    // Ordered option labels; stable for the actuator's lifetime.
    virtual std::vector<std::string> get_position_values() const = 0;

    std::size_t get_position();
    void set_position(std::size_t index);

    void set_invalid_option(std::size_t index) { domain_.set_invalid(index); }
    void set_valid_option(std::size_t index) { domain_.set_valid(index); }
    std::vector<std::size_t> get_invalid_options() const { return domain_.invalid(); }

    void validate_target(double target) const override;
    void move_to(double target) override;
    ActuatorPosition read_position() override;
    nlohmann::json descriptor() const override;

protected:
    virtual std::size_t do_get_position() = 0;
    virtual void do_set_position(std::size_t index) = 0;

private:
    DiscreteDomain domain_;
};

class ContinuousActuator : public Actuator {
public:
    using Actuator::Actuator;

    ActuatorKind kind() const override { return ActuatorKind::Continuous; }

    virtual Limits get_hardware_limits() const = 0;

    double get_position();
    void set_position(double value);

    Limits get_soft_limits() const { return domain_.soft_limits(); }
    void set_soft_limits(const Limits& limits) { domain_.set_soft_limits(limits, get_hardware_limits()); }

    void validate_target(double target) const override;
    void move_to(double target) override;
    ActuatorPosition read_position() override;
    nlohmann::json descriptor() const override;

protected:
    virtual double do_get_position() = 0;
    virtual void do_set_position(double value) = 0;

private:
    ContinuousDomain domain_;
};

using ActuatorMap = std::map<int, std::shared_ptr<Actuator>>;

} // namespace fastmda
