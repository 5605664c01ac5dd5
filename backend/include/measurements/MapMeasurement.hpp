#pragma once

#include <vector>

#include "core/Measurement.hpp"

namespace fastmda {

enum class MapMode {
    Grid, // outer product; first axis varies slowest (row-major)
    Zip   // all axes step together; equal target counts required
};

const char* to_string(MapMode mode);

struct MapAxis {
    ActuatorRef actuator;
    std::vector<double> targets; // option indices for discrete actuators
};

/**
 * @brief N-dimensional scan: moves every axis to its step target, in axis
 * order, then reads all detectors; one DataPoint per combination.
 */
class MapMeasurement : public Measurement {
public:
    MapMeasurement(std::vector<MapAxis> axes, std::vector<DetectorRef> detectors, MapMode mode = MapMode::Grid);

    std::string type() const override { return "map"; }
    std::vector<std::shared_ptr<Device>> devices() const override;
    void validate() const override;
    std::optional<std::size_t> step_count() const override { return steps_; }
    DataPoint acquire_step(std::size_t step) override;
    nlohmann::json describe() const override;

    MapMode mode() const { return mode_; }
    // Per-axis targets of `step`, in axis order.
    std::vector<double> targets_for(std::size_t step) const;

private:
    std::vector<MapAxis> axes_;
    std::vector<DetectorRef> detectors_;
    MapMode mode_;
    std::size_t steps_ = 0;
};

} // namespace fastmda
