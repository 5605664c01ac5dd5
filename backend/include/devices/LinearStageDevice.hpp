#pragma once
#include "Device.hpp"
#include "simulator/SimSupport.hpp"

namespace fastmda {

/**
 * @brief Simulated single-axis motorized translation stage.
 *
 * Actuator 0 "position" (mm, hardware limits [0, travel_mm]);
 * setting 0 "velocity" (mm/s). A move blocks for distance / velocity plus
 * `settle_ms`; a zero velocity moves instantly.
 */
class LinearStageDevice : public Device {
public:
    static constexpr int kPosition = 0;
    static constexpr int kVelocity = 0;

    LinearStageDevice(std::string id, const nlohmann::json& args = nlohmann::json::object());

    std::string type() const override { return "linear_stage"; }

protected:
    void do_connect() override;
    void do_disconnect() override;

private:
    std::optional<ConnectionCode> connect_fault;
};

} // namespace fastmda
