#include "core/DataPoint.hpp"

using json = nlohmann::json;

namespace fastmda {

void to_json(json& j, const DetectorReading& r) {
    j = json{{"device_id", r.device_id}, {"detector", r.detector}, {"reading", r.reading}};
}

void to_json(json& j, const DataPoint& dp) {
    j = json{
        {"step", dp.step},
        {"ts_ms", dp.ts_ms},
        {"elapsed_s", dp.elapsed_s},
        {"positions", dp.positions},
        {"readings", dp.readings}
    };
}

} // namespace fastmda
