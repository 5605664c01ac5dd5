#include "DescriptorProtocol.hpp"
#include "DeviceRegistry.hpp"
#include "core/Clock.hpp"
#include "core/MeasurementEngine.hpp"

namespace fastmda {

DescriptorProtocol::DescriptorProtocol(DeviceRegistry& reg, MeasurementEngine& engine)
: registry(reg), engine(engine) {}

nlohmann::json DescriptorProtocol::build_descriptor_message() {
    return {
        {"type", "descriptor"},
        {"devices", registry.get_descriptor_graph()}
    };
}

nlohmann::json DescriptorProtocol::build_runs_update() {
    nlohmann::json runs = nlohmann::json::array();
    for (const auto& s : engine.list_runs()) runs.push_back(s);
    return {
        {"type", "runs_update"},
        {"ts_ms", now_ms()},
        {"runs", runs}
    };
}

} // namespace fastmda
