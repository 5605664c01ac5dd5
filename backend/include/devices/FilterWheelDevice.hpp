#pragma once
#include "Device.hpp"
#include "simulator/SimSupport.hpp"
#include <vector>

namespace fastmda {

/**
 * @brief Simulated motorized filter wheel.
 *
 * Actuator 0 "filter": discrete, one option per slot label. Moving takes
 * `slot_ms` per slot travelled (shortest way around the wheel).
 */
class FilterWheelDevice : public Device {
public:
    static constexpr int kFilter = 0;

    FilterWheelDevice(std::string id, const nlohmann::json& args = nlohmann::json::object());

    std::string type() const override { return "filter_wheel"; }

protected:
    void do_connect() override;
    void do_disconnect() override {}

private:
    std::optional<ConnectionCode> connect_fault;
};

} // namespace fastmda
