#include "measurements/MeasurementCatalog.hpp"

#include "Device.hpp"
#include "DeviceRegistry.hpp"
#include "measurements/MapMeasurement.hpp"
#include "measurements/TimeSeriesMeasurement.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

using json = nlohmann::json;

namespace fastmda {

namespace {

const json& require_key(const json& obj, const char* key, const std::string& where) {
    if (!obj.is_object() || !obj.contains(key)) {
        throw ConfigError(where + ": missing '" + key + "'");
    }
    return obj.at(key);
}

int require_int(const json& obj, const char* key, const std::string& where) {
    const auto& v = require_key(obj, key, where);
    if (!v.is_number_integer()) throw ConfigError(where + ": '" + key + "' must be an integer");
    if (v.is_number_unsigned() && v.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
        throw ConfigError(where + ": '" + key + "' is out of range");
    }
    const auto wide = v.get<std::int64_t>();
    if (wide < std::numeric_limits<int>::min() || wide > std::numeric_limits<int>::max()) {
        throw ConfigError(where + ": '" + key + "' is out of range");
    }
    return static_cast<int>(wide);
}

std::string require_string(const json& obj, const char* key, const std::string& where) {
    const auto& v = require_key(obj, key, where);
    if (!v.is_string()) throw ConfigError(where + ": '" + key + "' must be a string");
    return v.get<std::string>();
}

std::vector<DetectorRef> parse_detectors(const json& config, DeviceRegistry& registry) {
    const auto& list = require_key(config, "detectors", "measurement");
    if (!list.is_array() || list.empty()) {
        throw ConfigError("measurement: 'detectors' must be a non-empty array");
    }
    std::vector<DetectorRef> out;
    for (const auto& entry : list) {
        auto dev = registry.require_device(require_string(entry, "device", "detector"));
        auto det = dev->detector(require_int(entry, "detector", "detector"));
        out.push_back({dev, det});
    }
    return out;
}

std::vector<double> expand_range(const json& range, const std::string& where) {
    const auto& start = require_key(range, "start", where);
    const auto& stop = require_key(range, "stop", where);
    const int points = require_int(range, "points", where);
    if (!start.is_number() || !stop.is_number()) throw ConfigError(where + ": range bounds must be numbers");
    if (points < 1) throw ConfigError(where + ": range needs at least one point");

    const double a = start.get<double>();
    const double b = stop.get<double>();
    std::vector<double> out;
    out.reserve(points);
    if (points == 1) {
        out.push_back(a);
        return out;
    }
    const double step = (b - a) / (points - 1);
    for (int i = 0; i < points - 1; ++i) out.push_back(a + step * i);
    out.push_back(b);
    return out;
}

// Numeric targets pass through; discrete axes also accept option labels.
double parse_target(const json& t, const Actuator& actuator, const std::string& where) {
    const auto* discrete = dynamic_cast<const DiscreteActuator*>(&actuator);
    if (t.is_string()) {
        if (!discrete) throw ConfigError(where + ": label target on a continuous actuator");
        const auto options = discrete->get_position_values();
        const auto label = t.get<std::string>();
        auto it = std::find(options.begin(), options.end(), label);
        if (it == options.end()) throw ConfigError(where + ": unknown option '" + label + "'");
        return static_cast<double>(it - options.begin());
    }
    if (!t.is_number()) throw ConfigError(where + ": targets must be numbers or option labels");
    const double v = t.get<double>();
    if (discrete && (!std::isfinite(v) || std::floor(v) != v)) {
        throw ConfigError(where + ": discrete target must be an integral option index");
    }
    return v;
}

MapAxis parse_axis(const json& entry, DeviceRegistry& registry) {
    auto dev = registry.require_device(require_string(entry, "device", "axis"));
    auto act = dev->actuator(require_int(entry, "actuator", "axis"));
    const std::string where = "axis " + dev->id() + "/" + std::to_string(act->key());

    std::vector<json> raw;
    if (entry.contains("targets")) {
        const auto& targets = entry.at("targets");
        if (!targets.is_array()) throw ConfigError(where + ": 'targets' must be an array");
        raw.assign(targets.begin(), targets.end());
    } else if (entry.contains("range")) {
        for (double v : expand_range(entry.at("range"), where)) raw.emplace_back(v);
    } else {
        throw ConfigError(where + ": needs 'targets' or 'range'");
    }

    MapAxis axis;
    axis.actuator = {dev, act};
    for (const auto& t : raw) axis.targets.push_back(parse_target(t, *act, where));
    return axis;
}

} // namespace

MeasurementCatalog::MeasurementCatalog() {
    register_type("time_series", "Reads a set of detectors at a fixed interval", &MeasurementCatalog::build_time_series);
    register_type("map", "Scans one or more actuators and reads detectors at every point", &MeasurementCatalog::build_map);
}

void MeasurementCatalog::register_type(const std::string& type, const std::string& description, Builder builder) {
    if (type.empty() || !builder) throw ConfigError("MeasurementCatalog: invalid builder registration");
    std::lock_guard<std::mutex> lk(m_);
    builders_[type] = Entry{description, std::move(builder)};
}

bool MeasurementCatalog::has_type(const std::string& type) const {
    std::lock_guard<std::mutex> lk(m_);
    return builders_.count(type) > 0;
}

std::shared_ptr<Measurement> MeasurementCatalog::create(const json& config, DeviceRegistry& registry) const {
    const std::string type = require_string(config, "type", "measurement");
    Builder builder;
    {
        std::lock_guard<std::mutex> lk(m_);
        auto it = builders_.find(type);
        if (it == builders_.end()) throw ConfigError("unknown measurement type '" + type + "'");
        builder = it->second.builder;
    }
    auto m = builder(config, registry);
    if (!m) throw ConfigError("builder for '" + type + "' returned no measurement");
    return m;
}

json MeasurementCatalog::describe() const {
    std::lock_guard<std::mutex> lk(m_);
    json out = json::array();
    for (const auto& [name, entry] : builders_) {
        out.push_back({{"type", name}, {"description", entry.description}});
    }
    return out;
}

std::shared_ptr<Measurement> MeasurementCatalog::build_time_series(const json& config, DeviceRegistry& registry) {
    auto detectors = parse_detectors(config, registry);

    double interval = 0.0;
    if (config.contains("interval_s")) {
        const auto& v = config.at("interval_s");
        if (!v.is_number()) throw ConfigError("time_series: 'interval_s' must be a number");
        interval = v.get<double>();
    }

    std::optional<std::size_t> count;
    if (config.contains("count") && !config.at("count").is_null()) {
        const auto& v = config.at("count");
        if (!v.is_number_integer() || v.get<long long>() < 0) {
            throw ConfigError("time_series: 'count' must be a non-negative integer");
        }
        if (v.get<long long>() > 0) count = v.get<std::size_t>();
    }

    return std::make_shared<TimeSeriesMeasurement>(std::move(detectors), std::chrono::duration<double>(interval), count);
}

std::shared_ptr<Measurement> MeasurementCatalog::build_map(const json& config, DeviceRegistry& registry) {
    auto detectors = parse_detectors(config, registry);

    MapMode mode = MapMode::Grid;
    if (config.contains("mode")) {
        const auto& v = config.at("mode");
        if (v == "grid") mode = MapMode::Grid;
        else if (v == "zip") mode = MapMode::Zip;
        else throw ConfigError("map: 'mode' must be \"grid\" or \"zip\"");
    }

    const auto& axes_cfg = require_key(config, "axes", "map");
    if (!axes_cfg.is_array() || axes_cfg.empty()) throw ConfigError("map: 'axes' must be a non-empty array");
    std::vector<MapAxis> axes;
    for (const auto& entry : axes_cfg) axes.push_back(parse_axis(entry, registry));

    return std::make_shared<MapMeasurement>(std::move(axes), std::move(detectors), mode);
}

} // namespace fastmda
