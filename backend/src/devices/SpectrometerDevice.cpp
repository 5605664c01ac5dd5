#include "devices/SpectrometerDevice.hpp"

#include <algorithm>
#include <cmath>

using json = nlohmann::json;

namespace fastmda {

namespace {

const std::vector<std::string> kGratings = {"150 l/mm", "600 l/mm", "1200 l/mm"};
// Spectral window covered by the CCD for each grating.
const double kSpanNm[] = {400.0, 100.0, 50.0};

class GratingActuator : public DiscreteActuator {
public:
    explicit GratingActuator(Device& dev) : DiscreteActuator(SpectrometerDevice::kGrating, dev) {}

    std::string name() const override { return "grating"; }
    std::vector<std::string> get_position_values() const override { return kGratings; }

    std::size_t current() {
        std::lock_guard<std::mutex> lk(m_);
        return index_;
    }

protected:
    std::size_t do_get_position() override { return current(); }
    void do_set_position(std::size_t index) override {
        simulate_delay(index == current() ? 0.0 : 20.0); // turret rotation
        std::lock_guard<std::mutex> lk(m_);
        index_ = index;
    }

private:
    std::mutex m_;
    std::size_t index_ = 1;
};

class CenterActuator : public ContinuousActuator {
public:
    CenterActuator(Device& dev, double initial) : ContinuousActuator(SpectrometerDevice::kCenter, dev), nm_(initial) {}

    std::string name() const override { return "center_wavelength"; }
    std::string unit() const override { return "nm"; }
    Limits get_hardware_limits() const override { return {200.0, 1100.0}; }

    double current() {
        std::lock_guard<std::mutex> lk(m_);
        return nm_;
    }

protected:
    double do_get_position() override { return current(); }
    void do_set_position(double nm) override {
        std::lock_guard<std::mutex> lk(m_);
        nm_ = nm;
    }

private:
    std::mutex m_;
    double nm_;
};

class IntegrationSetting : public ContinuousSetting {
public:
    IntegrationSetting(Device& dev, double initial) : ContinuousSetting(SpectrometerDevice::kIntegration, dev), ms_(initial) {}

    std::string name() const override { return "integration_time"; }
    std::string unit() const override { return "ms"; }
    Limits get_hardware_limits() const override { return {0.0, 10000.0}; }

    double current() {
        std::lock_guard<std::mutex> lk(m_);
        return ms_;
    }

protected:
    double do_get_value() override { return current(); }
    void do_set_value(double v) override {
        std::lock_guard<std::mutex> lk(m_);
        ms_ = v;
    }

private:
    std::mutex m_;
    double ms_;
};

class SpectrumDetector : public Detector {
public:
    SpectrumDetector(SpectrometerDevice& dev,
                     std::shared_ptr<GratingActuator> grating,
                     std::shared_ptr<CenterActuator> center,
                     std::shared_ptr<IntegrationSetting> integration)
    : Detector(SpectrometerDevice::kSpectrum, dev, 1),
      dev_(dev), grating_(std::move(grating)), center_(std::move(center)), integration_(std::move(integration)) {}

    std::string name() const override { return "spectrum"; }
    std::string unit() const override { return "counts"; }

protected:
    Reading do_read() override {
        auto wl = dev_.wavelengths(grating_->current(), center_->current());
        Reading r = Reading::vector(name(), dev_.expose(wl, integration_->current()), unit());
        r.long_name = "CCD spectrum";
        r.axes.push_back({"wavelength", "nm", std::move(wl)});
        return r;
    }

private:
    SpectrometerDevice& dev_;
    std::shared_ptr<GratingActuator> grating_;
    std::shared_ptr<CenterActuator> center_;
    std::shared_ptr<IntegrationSetting> integration_;
};

} // namespace

SpectrometerDevice::SpectrometerDevice(std::string id, const json& args)
: Device(std::move(id)),
  pixels_(args.value("pixels", std::size_t{256})),
  line_nm(args.value("line_nm", 532.0)),
  line_width_nm(args.value("line_width_nm", 0.5)),
  peak_rate(args.value("peak_counts_per_ms", 100.0)),
  background(args.value("background_counts_per_ms", 1.0)),
  connect_fault(parse_connect_fault(args)),
  noise(args.value("seed", uint64_t{0})) {
    if (pixels_ < 2) throw ConfigError(this->id() + ": spectrometer needs at least 2 pixels");
    auto grating = add_actuator(std::make_shared<GratingActuator>(*this));
    auto center = add_actuator(std::make_shared<CenterActuator>(*this, args.value("center_nm", 550.0)));
    auto integration = add_setting(std::make_shared<IntegrationSetting>(*this, args.value("integration_ms", 10.0)));
    add_detector(std::make_shared<SpectrumDetector>(*this, grating, center, integration));
}

std::vector<double> SpectrometerDevice::wavelengths(std::size_t grating, double center_nm) const {
    const double span = kSpanNm[grating < kGratings.size() ? grating : 0];
    const double start = center_nm - span / 2.0;
    std::vector<double> out(pixels_);
    for (std::size_t i = 0; i < pixels_; ++i) {
        out[i] = start + span * static_cast<double>(i) / static_cast<double>(pixels_ - 1);
    }
    return out;
}

std::vector<double> SpectrometerDevice::expose(const std::vector<double>& wavelengths, double integration_ms) {
    simulate_delay(integration_ms);
    std::vector<double> counts;
    counts.reserve(wavelengths.size());
    for (double wl : wavelengths) {
        const double d = (wl - line_nm) / line_width_nm;
        const double mean = (background + peak_rate * std::exp(-0.5 * d * d)) * integration_ms;
        // shot noise
        counts.push_back(std::max(0.0, noise.normal(mean, std::sqrt(std::max(mean, 1.0)))));
    }
    return counts;
}

void SpectrometerDevice::do_connect() {
    if (connect_fault) throw ConnectionError(*connect_fault, "spectrometer " + id() + " not found on bus");
}

} // namespace fastmda
