#pragma once
#include <string>

namespace fastmda {

class DeviceTypeCatalog;

/**
 * @brief Abstract interface for device toolkits (plugins).
 * A toolkit contributes a family of device types to a DeviceTypeCatalog.
 */
class IDeviceToolkit {
public:
    virtual ~IDeviceToolkit() = default;
    /** @brief Toolkit name (for logging/discovery) */
    virtual std::string name() const = 0;
    /** @brief Register all device types this toolkit provides */
    virtual void register_types(DeviceTypeCatalog& catalog) = 0;
};

} // namespace fastmda
