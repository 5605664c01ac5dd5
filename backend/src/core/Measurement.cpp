#include "core/Measurement.hpp"

#include "Device.hpp"

#include <algorithm>

using json = nlohmann::json;

namespace fastmda {

std::chrono::nanoseconds Measurement::step_offset(std::size_t) const {
    return std::chrono::nanoseconds::zero();
}

json Measurement::describe() const {
    json j = {{"type", type()}};
    auto n = step_count();
    j["steps"] = n ? json(*n) : json(nullptr);
    j["devices"] = json::array();
    for (const auto& d : devices()) j["devices"].push_back(d->id());
    return j;
}

std::vector<DetectorReading> Measurement::read_all(const std::vector<DetectorRef>& detectors) {
    std::vector<DetectorReading> out;
    out.reserve(detectors.size());
    for (const auto& ref : detectors) {
        DetectorReading r;
        r.device_id = ref.device->id();
        r.detector = ref.detector->key();
        try {
            r.reading = ref.detector->read();
        } catch (Error& e) {
            if (e.device_id().empty()) e.set_device_id(r.device_id);
            throw;
        }
        out.push_back(std::move(r));
    }
    return out;
}

void Measurement::add_unique(std::vector<std::shared_ptr<Device>>& out, const std::shared_ptr<Device>& d) {
    if (std::find(out.begin(), out.end(), d) == out.end()) out.push_back(d);
}

json Measurement::describe_detectors(const std::vector<DetectorRef>& detectors) {
    json out = json::array();
    for (const auto& ref : detectors) {
        out.push_back({
            {"device", ref.device->id()},
            {"detector", ref.detector->key()},
            {"name", ref.detector->name()}
        });
    }
    return out;
}

} // namespace fastmda
