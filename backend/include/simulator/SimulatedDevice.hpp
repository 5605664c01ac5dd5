#pragma once
#include "Device.hpp"
#include "simulator/SimSupport.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace fastmda {

/**
 * @brief Generic simulated device built entirely from its JSON args.
 *
 * args:
 *   detectors: [{key, name, unit, shape: [] | [n] | [rows, cols], mean, noise}]
 *   actuators: [{key, name, kind: "continuous", unit, lower, upper, position, settle_ms}
 *               | {key, name, kind: "discrete", options: [...], position}]
 *   settings:  [{key, name, unit, lower, upper, value}]
 *   seed, connect_error
 *
 * Detector values are gaussian around `mean` with relative sigma `noise`.
 */
class SimulatedDevice : public Device {
public:
    SimulatedDevice(const std::string& id, const std::string& type, const nlohmann::json& args);
    ~SimulatedDevice() override = default;

    std::string type() const override;
    nlohmann::json descriptor() const override;

    NoiseSource& noise() { return noise_; }

protected:
    void do_connect() override;
    void do_disconnect() override {}

private:
    std::string dev_type;
    nlohmann::json args;
    std::optional<ConnectionCode> connect_fault;
    NoiseSource noise_;
};

} // namespace fastmda
