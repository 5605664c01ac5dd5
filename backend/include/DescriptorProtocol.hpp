#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace fastmda {

class DeviceRegistry;
class MeasurementEngine;

// Builds the unsolicited messages pushed to control clients.
class DescriptorProtocol {
public:
    DescriptorProtocol(DeviceRegistry& reg, MeasurementEngine& engine);

    // {type: "descriptor", devices: [...]}, sent once per new client
    nlohmann::json build_descriptor_message();
    // {type: "runs_update", runs: [...]}, data-free run snapshots
    nlohmann::json build_runs_update();

private:
    DeviceRegistry& registry;
    MeasurementEngine& engine;
};

} // namespace fastmda
