#pragma once
#include "Device.hpp"
#include "simulator/SimSupport.hpp"
#include <mutex>
#include <vector>

namespace fastmda {

/**
 * @brief Simulated grating spectrometer with a linear CCD.
 *
 * Detector 0 "spectrum": 1-D counts with a wavelength axis.
 * Actuator 0 "grating": discrete (line densities). Actuator 1 "center_wavelength": continuous, nm.
 * Setting 0 "integration_time": continuous, ms; a read blocks for the integration time.
 * The simulated source is a single gaussian line at `line_nm`.
 */
class SpectrometerDevice : public Device {
public:
    static constexpr int kSpectrum = 0;
    static constexpr int kGrating = 0;
    static constexpr int kCenter = 1;
    static constexpr int kIntegration = 0;

    SpectrometerDevice(std::string id, const nlohmann::json& args = nlohmann::json::object());

    std::string type() const override { return "spectrometer"; }

    std::size_t pixels() const { return pixels_; }
    // Wavelength of every pixel for the given grating and center.
    std::vector<double> wavelengths(std::size_t grating, double center_nm) const;
    std::vector<double> expose(const std::vector<double>& wavelengths, double integration_ms);

protected:
    void do_connect() override;
    void do_disconnect() override {}

private:
    std::size_t pixels_;
    double line_nm;
    double line_width_nm;
    double peak_rate;    // counts per ms at the line center
    double background;   // counts per ms
    std::optional<ConnectionCode> connect_fault;
    NoiseSource noise;
};

} // namespace fastmda
