#pragma once
#include <functional>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace fastmda {

class DeviceRegistry;
class DeviceTypeCatalog;
class MeasurementCatalog;
class MeasurementEngine;

/**
 * @brief Maps JSON-RPC style control requests onto the registries and engine.
 *
 * Request:  {type: "rpc", id, method, params}
 * Response: {type: "rpc_result", id, ok: true, result}
 *         | {type: "rpc_result", id, ok: false, error: {code, kind, message}}
 *
 * Direct hardware commands (actuator.*, detector.read) take the device lease
 * without waiting and fail with a busy error while a run owns the device.
 */
class RpcDispatcher {
public:
    RpcDispatcher(DeviceRegistry& registry,
                  const DeviceTypeCatalog& device_types,
                  MeasurementCatalog& measurements,
                  MeasurementEngine& engine);

    // Never throws; every failure becomes an error response.
    nlohmann::json handle(const nlohmann::json& request);
    nlohmann::json handle_text(const std::string& text);

    // Invokes one method directly; throws fastmda::Error.
    nlohmann::json call(const std::string& method, const nlohmann::json& params);

    std::vector<std::string> methods() const;

    static nlohmann::json error_payload(int code, const std::string& kind, const std::string& message);

private:
    using Handler = std::function<nlohmann::json(const nlohmann::json& params)>;

    void register_handlers();

    DeviceRegistry& registry_;
    const DeviceTypeCatalog& device_types_;
    MeasurementCatalog& measurements_;
    MeasurementEngine& engine_;
    std::map<std::string, Handler> handlers_;
};

} // namespace fastmda
