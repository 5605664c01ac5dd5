#include "measurements/MapMeasurement.hpp"

#include "Device.hpp"
#include "core/Errors.hpp"

using json = nlohmann::json;

namespace fastmda {

const char* to_string(MapMode mode) {
    return mode == MapMode::Grid ? "grid" : "zip";
}

MapMeasurement::MapMeasurement(std::vector<MapAxis> axes, std::vector<DetectorRef> detectors, MapMode mode)
: axes_(std::move(axes)), detectors_(std::move(detectors)), mode_(mode) {
    if (axes_.empty()) throw ConfigError("map: at least one axis is required");
    if (detectors_.empty()) throw ConfigError("map: at least one detector is required");
    for (const auto& ref : detectors_) {
        if (!ref.device || !ref.detector) throw ConfigError("map: null detector reference");
    }
    for (std::size_t i = 0; i < axes_.size(); ++i) {
        const auto& a = axes_[i];
        if (!a.actuator.device || !a.actuator.actuator) throw ConfigError("map: null actuator reference");
        if (a.targets.empty()) throw ConfigError("map: axis " + std::to_string(i) + " has no targets");
    }

    if (mode_ == MapMode::Grid) {
        steps_ = 1;
        for (const auto& a : axes_) steps_ *= a.targets.size();
    } else {
        steps_ = axes_.front().targets.size();
        for (const auto& a : axes_) {
            if (a.targets.size() != steps_) throw ConfigError("map: zip mode requires equal target counts on all axes");
        }
    }
}

std::vector<std::shared_ptr<Device>> MapMeasurement::devices() const {
    std::vector<std::shared_ptr<Device>> out;
    for (const auto& a : axes_) add_unique(out, a.actuator.device);
    for (const auto& ref : detectors_) add_unique(out, ref.device);
    return out;
}

void MapMeasurement::validate() const {
    for (const auto& a : axes_) {
        for (double t : a.targets) a.actuator.actuator->validate_target(t);
    }
}

std::vector<double> MapMeasurement::targets_for(std::size_t step) const {
    std::vector<double> out(axes_.size());
    if (mode_ == MapMode::Zip) {
        for (std::size_t i = 0; i < axes_.size(); ++i) out[i] = axes_[i].targets.at(step);
        return out;
    }
    // last axis varies fastest
    std::size_t rem = step;
    for (std::size_t i = axes_.size(); i-- > 0;) {
        const auto n = axes_[i].targets.size();
        out[i] = axes_[i].targets[rem % n];
        rem /= n;
    }
    return out;
}

DataPoint MapMeasurement::acquire_step(std::size_t step) {
    const auto targets = targets_for(step);
    DataPoint dp;
    dp.step = step;
    dp.positions.reserve(axes_.size());
    for (std::size_t i = 0; i < axes_.size(); ++i) {
        const auto& ref = axes_[i].actuator;
        try {
            ref.actuator->move_to(targets[i]);
        } catch (Error& e) {
            if (e.device_id().empty()) e.set_device_id(ref.device->id());
            throw;
        }
    }
    for (const auto& a : axes_) dp.positions.push_back(a.actuator.actuator->read_position());
    dp.readings = read_all(detectors_);
    return dp;
}

json MapMeasurement::describe() const {
    json j = Measurement::describe();
    j["mode"] = to_string(mode_);
    j["axes"] = json::array();
    for (const auto& a : axes_) {
        j["axes"].push_back({
            {"device", a.actuator.device->id()},
            {"actuator", a.actuator.actuator->key()},
            {"name", a.actuator.actuator->name()},
            {"kind", to_string(a.actuator.actuator->kind())},
            {"targets", a.targets}
        });
    }
    j["detectors"] = describe_detectors(detectors_);
    return j;
}

} // namespace fastmda
