#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/DataPoint.hpp"

namespace fastmda {

class Device;
class Detector;
class Actuator;

// Capabilities are referenced together with their owning device, which keeps it alive.
struct DetectorRef {
    std::shared_ptr<Device> device;
    std::shared_ptr<Detector> detector;
};

struct ActuatorRef {
    std::shared_ptr<Device> device;
    std::shared_ptr<Actuator> actuator;
};

/**
 * @brief The abstract sequencing unit executed by the MeasurementEngine.
 *
 * A measurement is bound to its capabilities at construction and describes a
 * sequence of steps. The engine calls acquire_step() strictly in order, one
 * step at a time, and never overlaps two steps of the same measurement; the
 * measurement only has to perform the hardware operations of one step.
 *
 * To add a new measurement type:
 *  1. Inherit from Measurement and implement type(), devices(), step_count()
 *     and acquire_step().
 *  2. Override validate() to check targets against capability domains.
 *  3. Optionally register a builder in MeasurementCatalog so it can be started
 *     from a JSON configuration.
 */
class Measurement {
public:
    virtual ~Measurement() = default;

    virtual std::string type() const = 0;

    // Devices driven by this measurement; the engine leases all of them for the run.
    virtual std::vector<std::shared_ptr<Device>> devices() const = 0;

    // Called before the first step. Throws InvalidPositionError / ConfigError.
    virtual void validate() const {}

    // Total number of steps, or nullopt when the sequence runs until cancelled.
    virtual std::optional<std::size_t> step_count() const = 0;

    // Earliest start of `step` relative to the run start.
    virtual std::chrono::nanoseconds step_offset(std::size_t step) const;

    // Performs the actuator moves and detector reads of one step.
    virtual DataPoint acquire_step(std::size_t step) = 0;

    virtual nlohmann::json describe() const;

protected:
    static std::vector<DetectorReading> read_all(const std::vector<DetectorRef>& detectors);
    static void add_unique(std::vector<std::shared_ptr<Device>>& out, const std::shared_ptr<Device>& d);
    static nlohmann::json describe_detectors(const std::vector<DetectorRef>& detectors);
};

} // namespace fastmda
