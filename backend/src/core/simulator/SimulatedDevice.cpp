#include "simulator/SimulatedDevice.hpp"

#include <limits>
#include <mutex>

using json = nlohmann::json;

namespace fastmda {

namespace {

class SimDetector : public Detector {
public:
    SimDetector(SimulatedDevice& dev, const json& cfg)
    : Detector(cfg.at("key").get<int>(), dev, cfg.value("shape", json::array()).size()),
      dev_(dev),
      name_(cfg.value("name", "detector" + std::to_string(key()))),
      unit_(cfg.value("unit", "")),
      shape_(cfg.value("shape", std::vector<std::size_t>{})),
      mean_(cfg.value("mean", 1.0)),
      rel_noise_(cfg.value("noise", 0.05)) {
        if (shape_.size() > 2) throw ConfigError(dev.id() + ": detector shape must have at most 2 dimensions");
    }

    std::string name() const override { return name_; }
    std::string unit() const override { return unit_; }

protected:
    Reading do_read() override {
        Reading r;
        r.shape = shape_;
        const std::size_t n = r.element_count();
        r.values.reserve(n);
        for (std::size_t i = 0; i < n; ++i) r.values.push_back(dev_.noise().relative(mean_, rel_noise_));
        return r;
    }

private:
    SimulatedDevice& dev_;
    std::string name_;
    std::string unit_;
    std::vector<std::size_t> shape_;
    double mean_;
    double rel_noise_;
};

class SimContinuousActuator : public ContinuousActuator {
public:
    SimContinuousActuator(Device& dev, const json& cfg)
    : ContinuousActuator(cfg.at("key").get<int>(), dev),
      name_(cfg.value("name", "actuator" + std::to_string(key()))),
      unit_(cfg.value("unit", "")),
      settle_ms_(cfg.value("settle_ms", 0.0)) {
        limits_.lower = cfg.value("lower", -std::numeric_limits<double>::infinity());
        limits_.upper = cfg.value("upper", std::numeric_limits<double>::infinity());
        if (limits_.lower > limits_.upper) throw ConfigError(dev.id() + ": actuator lower limit above upper limit");
        position_ = cfg.value("position", limits_.contains(0.0) ? 0.0 : limits_.lower);
    }

    std::string name() const override { return name_; }
    std::string unit() const override { return unit_; }
    Limits get_hardware_limits() const override { return limits_; }

protected:
    double do_get_position() override {
        std::lock_guard<std::mutex> lk(m_);
        return position_;
    }
    void do_set_position(double value) override {
        simulate_delay(settle_ms_);
        std::lock_guard<std::mutex> lk(m_);
        position_ = value;
    }

private:
    std::string name_;
    std::string unit_;
    double settle_ms_;
    Limits limits_;
    std::mutex m_;
    double position_ = 0.0;
};

class SimDiscreteActuator : public DiscreteActuator {
public:
    SimDiscreteActuator(Device& dev, const json& cfg)
    : DiscreteActuator(cfg.at("key").get<int>(), dev),
      name_(cfg.value("name", "actuator" + std::to_string(key()))),
      options_(cfg.at("options").get<std::vector<std::string>>()),
      position_(cfg.value("position", std::size_t{0})) {
        if (options_.empty()) throw ConfigError(dev.id() + ": discrete actuator needs at least one option");
        if (position_ >= options_.size()) throw ConfigError(dev.id() + ": initial option out of range");
    }

    std::string name() const override { return name_; }
    std::vector<std::string> get_position_values() const override { return options_; }

protected:
    std::size_t do_get_position() override {
        std::lock_guard<std::mutex> lk(m_);
        return position_;
    }
    void do_set_position(std::size_t index) override {
        std::lock_guard<std::mutex> lk(m_);
        position_ = index;
    }

private:
    std::string name_;
    std::vector<std::string> options_;
    std::mutex m_;
    std::size_t position_;
};

class SimSetting : public ContinuousSetting {
public:
    SimSetting(Device& dev, const json& cfg)
    : ContinuousSetting(cfg.at("key").get<int>(), dev),
      name_(cfg.value("name", "setting" + std::to_string(key()))),
      unit_(cfg.value("unit", "")) {
        limits_.lower = cfg.value("lower", -std::numeric_limits<double>::infinity());
        limits_.upper = cfg.value("upper", std::numeric_limits<double>::infinity());
        value_ = cfg.value("value", 0.0);
    }

    std::string name() const override { return name_; }
    std::string unit() const override { return unit_; }
    Limits get_hardware_limits() const override { return limits_; }

protected:
    double do_get_value() override {
        std::lock_guard<std::mutex> lk(m_);
        return value_;
    }
    void do_set_value(double value) override {
        std::lock_guard<std::mutex> lk(m_);
        value_ = value;
    }

private:
    std::string name_;
    std::string unit_;
    Limits limits_;
    std::mutex m_;
    double value_ = 0.0;
};

} // namespace

SimulatedDevice::SimulatedDevice(const std::string& id, const std::string& type, const json& args)
: Device(id),
  dev_type(type),
  args(args),
  connect_fault(parse_connect_fault(args)),
  noise_(args.value("seed", uint64_t{0})) {
    for (const auto& d : args.value("detectors", json::array())) {
        add_detector(std::make_shared<SimDetector>(*this, d));
    }
    for (const auto& a : args.value("actuators", json::array())) {
        const auto kind = a.value("kind", "continuous");
        if (kind == "continuous") {
            add_actuator(std::make_shared<SimContinuousActuator>(*this, a));
        } else if (kind == "discrete") {
            add_actuator(std::make_shared<SimDiscreteActuator>(*this, a));
        } else {
            throw ConfigError(id + ": unknown actuator kind '" + kind + "'");
        }
    }
    for (const auto& s : args.value("settings", json::array())) {
        add_setting(std::make_shared<SimSetting>(*this, s));
    }
}

std::string SimulatedDevice::type() const { return dev_type; }

json SimulatedDevice::descriptor() const {
    json j = Device::descriptor();
    j["simulated"] = true;
    return j;
}

void SimulatedDevice::do_connect() {
    if (connect_fault) {
        throw ConnectionError(*connect_fault, "simulated " + std::string(to_string(*connect_fault)) + " on " + id());
    }
}

} // namespace fastmda
