#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "capability/Actuator.hpp"
#include "capability/Reading.hpp"

namespace fastmda {

struct DetectorReading {
    std::string device_id;
    int detector = 0;
    Reading reading;
};

// One measurement step: actuator positions (if any) bound to the detector readings taken there.
struct DataPoint {
    std::size_t step = 0;
    int64_t ts_ms = 0;
    double elapsed_s = 0.0;
    std::vector<ActuatorPosition> positions;
    std::vector<DetectorReading> readings;
};

void to_json(nlohmann::json& j, const DetectorReading& r);
void to_json(nlohmann::json& j, const DataPoint& dp);

} // namespace fastmda
