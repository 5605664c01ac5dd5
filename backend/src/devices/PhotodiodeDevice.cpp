#include "devices/PhotodiodeDevice.hpp"

#include <cmath>

using json = nlohmann::json;

namespace fastmda {

namespace {

const std::vector<std::string> kGainOptions = {"1x", "10x", "100x"};

class GainSetting : public DiscreteSetting {
public:
    explicit GainSetting(Device& dev) : DiscreteSetting(PhotodiodeDevice::kGain, dev) {}

    std::string name() const override { return "gain"; }
    std::vector<std::string> get_options() const override { return kGainOptions; }

    std::size_t current() {
        std::lock_guard<std::mutex> lk(m_);
        return index_;
    }

protected:
    std::size_t do_get_value() override { return current(); }
    void do_set_value(std::size_t index) override {
        std::lock_guard<std::mutex> lk(m_);
        index_ = index;
    }

private:
    std::mutex m_;
    std::size_t index_ = 0;
};

class PhotocurrentDetector : public Detector {
public:
    PhotocurrentDetector(PhotodiodeDevice& dev, std::shared_ptr<GainSetting> gain)
    : Detector(PhotodiodeDevice::kPhotocurrent, dev, 0), dev_(dev), gain_(std::move(gain)) {}

    std::string name() const override { return "photocurrent"; }
    std::string unit() const override { return "A"; }

protected:
    Reading do_read() override {
        Reading r = Reading::scalar(name(), dev_.sample_current(gain_->current()), unit());
        r.long_name = "Photodiode current";
        return r;
    }

private:
    PhotodiodeDevice& dev_;
    std::shared_ptr<GainSetting> gain_;
};

} // namespace

PhotodiodeDevice::PhotodiodeDevice(std::string id, const json& args)
: Device(std::move(id)),
  power_W(args.value("power_W", 1e-3)),
  responsivity_A_W(args.value("responsivity_A_W", 0.5)),
  dark_current_A(args.value("dark_current_A", 1e-9)),
  rel_noise(args.value("noise", 0.01)),
  connect_fault(parse_connect_fault(args)),
  noise(args.value("seed", uint64_t{0})) {
    auto gain = add_setting(std::make_shared<GainSetting>(*this));
    add_detector(std::make_shared<PhotocurrentDetector>(*this, gain));
}

void PhotodiodeDevice::set_incident_power(double watts) {
    std::lock_guard<std::mutex> lk(state_m);
    power_W = watts;
}

double PhotodiodeDevice::sample_current(std::size_t gain_index) {
    double ideal;
    {
        std::lock_guard<std::mutex> lk(state_m);
        ideal = power_W * responsivity_A_W + dark_current_A;
    }
    return noise.relative(ideal * std::pow(10.0, static_cast<double>(gain_index)), rel_noise);
}

void PhotodiodeDevice::do_connect() {
    if (connect_fault) throw ConnectionError(*connect_fault, "photodiode " + id() + " did not respond");
}

} // namespace fastmda
