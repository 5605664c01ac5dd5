#include "devices/LinearStageDevice.hpp"

#include <cmath>
#include <iostream>
#include <mutex>

using json = nlohmann::json;

namespace fastmda {

namespace {

class VelocitySetting : public ContinuousSetting {
public:
    VelocitySetting(Device& dev, double initial) : ContinuousSetting(LinearStageDevice::kVelocity, dev), value_(initial) {}

    std::string name() const override { return "velocity"; }
    std::string unit() const override { return "mm/s"; }
    Limits get_hardware_limits() const override { return {0.0, 50.0}; }

    double current() {
        std::lock_guard<std::mutex> lk(m_);
        return value_;
    }

protected:
    double do_get_value() override { return current(); }
    void do_set_value(double v) override {
        std::lock_guard<std::mutex> lk(m_);
        value_ = v;
    }

private:
    std::mutex m_;
    double value_;
};

class PositionActuator : public ContinuousActuator {
public:
    PositionActuator(Device& dev, double travel, double initial, double settle_ms, std::shared_ptr<VelocitySetting> velocity)
    : ContinuousActuator(LinearStageDevice::kPosition, dev),
      travel_(travel), settle_ms_(settle_ms), velocity_(std::move(velocity)), position_(initial) {}

    std::string name() const override { return "position"; }
    std::string unit() const override { return "mm"; }
    Limits get_hardware_limits() const override { return {0.0, travel_}; }

protected:
    double do_get_position() override {
        std::lock_guard<std::mutex> lk(m_);
        return position_;
    }
    void do_set_position(double target) override {
        const double distance = std::abs(target - do_get_position());
        const double v = velocity_->current();
        simulate_delay((v > 0.0 ? distance / v * 1000.0 : 0.0) + settle_ms_);
        std::lock_guard<std::mutex> lk(m_);
        position_ = target;
    }

private:
    double travel_;
    double settle_ms_;
    std::shared_ptr<VelocitySetting> velocity_;
    std::mutex m_;
    double position_;
};

} // namespace

LinearStageDevice::LinearStageDevice(std::string id, const json& args)
: Device(std::move(id)), connect_fault(parse_connect_fault(args)) {
    const double travel = args.value("travel_mm", 100.0);
    const double initial = args.value("position_mm", 0.0);
    if (!(travel > 0.0)) throw ConfigError(this->id() + ": travel_mm must be positive");
    if (initial < 0.0 || initial > travel) throw ConfigError(this->id() + ": position_mm outside travel");

    auto velocity = add_setting(std::make_shared<VelocitySetting>(*this, args.value("velocity_mm_s", 0.0)));
    add_actuator(std::make_shared<PositionActuator>(*this, travel, initial, args.value("settle_ms", 0.0), velocity));
}

void LinearStageDevice::do_connect() {
    if (connect_fault) throw ConnectionError(*connect_fault, "stage controller " + id() + " did not respond");
    std::cout << "LinearStageDevice " << id() << ": homed" << std::endl;
}

void LinearStageDevice::do_disconnect() {
    std::cout << "LinearStageDevice " << id() << ": motor released" << std::endl;
}

} // namespace fastmda
