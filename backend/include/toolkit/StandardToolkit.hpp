#pragma once
#include "toolkit/IDeviceToolkit.hpp"

namespace fastmda {

/**
 * @brief Built-in simulated instruments: photodiode, filter_wheel,
 * linear_stage, spectrometer, and the JSON-driven "simulated" type.
 */
class StandardToolkit : public IDeviceToolkit {
public:
    std::string name() const override { return "StandardToolkit"; }
    void register_types(DeviceTypeCatalog& catalog) override;
};

} // namespace fastmda
