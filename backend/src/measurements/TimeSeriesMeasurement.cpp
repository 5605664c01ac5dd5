#include "measurements/TimeSeriesMeasurement.hpp"

#include "Device.hpp"
#include "core/Errors.hpp"

#include <cmath>
#include <string>

using json = nlohmann::json;

namespace fastmda {

TimeSeriesMeasurement::TimeSeriesMeasurement(std::vector<DetectorRef> detectors,
                                             std::chrono::duration<double> interval,
                                             std::optional<std::size_t> count)
: detectors_(std::move(detectors)), interval_(interval), count_(count) {
    if (detectors_.empty()) throw ConfigError("time_series: at least one detector is required");
    for (const auto& ref : detectors_) {
        if (!ref.device || !ref.detector) throw ConfigError("time_series: null detector reference");
    }
    if (!(interval_.count() >= 0.0) || !std::isfinite(interval_.count())) {
        throw ConfigError("time_series: interval must be a finite number >= 0");
    }
    if (interval_.count() > kMaxIntervalSeconds) {
        throw ConfigError("time_series: interval must not exceed " + std::to_string(kMaxIntervalSeconds) + " s");
    }
    if (count_ && *count_ == 0) throw ConfigError("time_series: count must be positive");
}

std::vector<std::shared_ptr<Device>> TimeSeriesMeasurement::devices() const {
    std::vector<std::shared_ptr<Device>> out;
    for (const auto& ref : detectors_) add_unique(out, ref.device);
    return out;
}

std::chrono::nanoseconds TimeSeriesMeasurement::step_offset(std::size_t step) const {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(interval_ * static_cast<double>(step));
}

DataPoint TimeSeriesMeasurement::acquire_step(std::size_t step) {
    DataPoint dp;
    dp.step = step;
    dp.readings = read_all(detectors_);
    return dp;
}

json TimeSeriesMeasurement::describe() const {
    json j = Measurement::describe();
    j["interval_s"] = interval_.count();
    j["count"] = count_ ? json(*count_) : json(nullptr);
    j["detectors"] = describe_detectors(detectors_);
    return j;
}

} // namespace fastmda
