#pragma once
#include "Device.hpp"
#include "simulator/SimSupport.hpp"
#include <mutex>

namespace fastmda {

/**
 * @brief Simulated amplified photodiode.
 *
 * Detector 0 "photocurrent" (A, 0-D); setting 0 "gain" (discrete 1x/10x/100x).
 * The incident power can be changed at runtime to emulate a changing source.
 */
class PhotodiodeDevice : public Device {
public:
    static constexpr int kPhotocurrent = 0;
    static constexpr int kGain = 0;

    PhotodiodeDevice(std::string id, const nlohmann::json& args = nlohmann::json::object());

    std::string type() const override { return "photodiode"; }

    void set_incident_power(double watts);
    double sample_current(std::size_t gain_index);

protected:
    void do_connect() override;
    void do_disconnect() override {}

private:
    std::mutex state_m;
    double power_W;
    double responsivity_A_W;
    double dark_current_A;
    double rel_noise;
    std::optional<ConnectionCode> connect_fault;
    NoiseSource noise;
};

} // namespace fastmda
