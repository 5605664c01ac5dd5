#include "net/RpcDispatcher.hpp"

#include "Device.hpp"
#include "DeviceRegistry.hpp"
#include "core/MeasurementEngine.hpp"
#include "measurements/MeasurementCatalog.hpp"
#include "toolkit/DeviceTypeCatalog.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <limits>

using json = nlohmann::json;

namespace fastmda {

namespace {

std::string require_string(const json& params, const char* key, const char* detail) {
    if (!params.contains(key) || !params.at(key).is_string() || params.at(key).get<std::string>().empty()) {
        throw ControlError(detail);
    }
    return params.at(key).get<std::string>();
}

int require_int(const json& params, const char* key, const char* detail) {
    if (!params.contains(key) || !params.at(key).is_number_integer()) throw ControlError(detail);
    const auto& v = params.at(key);
    if (v.is_number_unsigned() && v.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
        throw ControlError(detail);
    }
    const auto wide = v.get<std::int64_t>();
    if (wide < std::numeric_limits<int>::min() || wide > std::numeric_limits<int>::max()) throw ControlError(detail);
    return static_cast<int>(wide);
}

// Direct commands never wait for a run to finish.
std::unique_lock<std::timed_mutex> lease_now(Device& dev) {
    auto lease = dev.try_lease(std::chrono::milliseconds(0));
    if (!lease.owns_lock()) throw BusyError(dev.id() + ": " + errors::D1500_DEVICE_LEASED);
    return lease;
}

double target_from(const json& value, const Actuator& act) {
    if (value.is_number()) return value.get<double>();
    if (value.is_string()) {
        const auto* discrete = dynamic_cast<const DiscreteActuator*>(&act);
        if (!discrete) throw ConfigError("label target on a continuous actuator");
        const auto options = discrete->get_position_values();
        const auto label = value.get<std::string>();
        auto it = std::find(options.begin(), options.end(), label);
        if (it == options.end()) throw ConfigError("unknown option '" + label + "'");
        return static_cast<double>(it - options.begin());
    }
    throw ControlError(errors::D2400_MISSING_VALUE);
}

} // namespace

RpcDispatcher::RpcDispatcher(DeviceRegistry& registry,
                             const DeviceTypeCatalog& device_types,
                             MeasurementCatalog& measurements,
                             MeasurementEngine& engine)
: registry_(registry), device_types_(device_types), measurements_(measurements), engine_(engine) {
    register_handlers();
}

json RpcDispatcher::error_payload(int code, const std::string& kind, const std::string& message) {
    return {{"code", code}, {"kind", kind}, {"message", message}};
}

std::vector<std::string> RpcDispatcher::methods() const {
    std::vector<std::string> out;
    for (const auto& [name, h] : handlers_) out.push_back(name);
    return out;
}

json RpcDispatcher::call(const std::string& method, const json& params) {
    auto it = handlers_.find(method);
    if (it == handlers_.end()) {
        throw ControlError(std::string(errors::D2400_RPC_UNKNOWN_METHOD) + ": " + method);
    }
    return it->second(params);
}

json RpcDispatcher::handle_text(const std::string& text) {
    json request = json::parse(text, nullptr, false);
    if (request.is_discarded()) {
        return {
            {"type", "rpc_result"},
            {"id", nullptr},
            {"ok", false},
            {"error", error_payload(errors::E2400_CONTROL_REJECTED, to_string(ErrorKind::Control),
                                    errors::format_E2400_control_rejected(errors::D2400_INVALID_REQUEST))}
        };
    }
    return handle(request);
}

json RpcDispatcher::handle(const json& request) {
    json response = {{"type", "rpc_result"}, {"id", nullptr}};
    const bool has_id = request.is_object() && request.contains("id") &&
                        (request.at("id").is_string() || request.at("id").is_number());
    if (has_id) response["id"] = request.at("id");

    try {
        if (!request.is_object() || request.value("type", std::string{}) != "rpc") {
            throw ControlError(errors::D2400_INVALID_REQUEST);
        }
        if (!has_id) throw ControlError(errors::D2400_RPC_MISSING_ID);
        if (!request.contains("method") || !request.at("method").is_string()) {
            throw ControlError(errors::D2400_RPC_MISSING_METHOD);
        }
        json params = request.value("params", json::object());
        if (params.is_null()) params = json::object();
        if (!params.is_object()) throw ControlError(errors::D2400_PARAMS_NOT_OBJECT);

        response["result"] = call(request.at("method").get<std::string>(), params);
        response["ok"] = true;
    } catch (const Error& e) {
        response["ok"] = false;
        response["error"] = error_payload(e.code(), to_string(e.kind()), e.what());
    } catch (const json::exception& e) {
        response["ok"] = false;
        response["error"] = error_payload(errors::E2400_CONTROL_REJECTED, to_string(ErrorKind::Control),
                                          errors::format_E2400_control_rejected(std::string("invalid params: ") + e.what()));
    } catch (const std::exception& e) {
        std::cerr << "RpcDispatcher: " << request.value("method", std::string{"?"}) << " failed: " << e.what() << std::endl;
        response["ok"] = false;
        response["error"] = error_payload(errors::E1200_HARDWARE, to_string(ErrorKind::Hardware), e.what());
    }
    return response;
}

void RpcDispatcher::register_handlers() {
    handlers_["devices.list"] = [this](const json&) {
        return json{{"devices", registry_.get_descriptor_graph()}};
    };

    handlers_["devices.types"] = [this](const json&) {
        return json{{"types", device_types_.describe()}};
    };

    handlers_["device.status"] = [this](const json& p) {
        auto dev = registry_.require_device(require_string(p, "device_id", errors::D2400_MISSING_DEVICE_ID));
        return dev->descriptor();
    };

    handlers_["device.connect"] = [this](const json& p) {
        auto dev = registry_.require_device(require_string(p, "device_id", errors::D2400_MISSING_DEVICE_ID));
        json out = dev->connect();
        out["device_id"] = dev->id();
        out["connected"] = dev->is_connected();
        return out;
    };

    handlers_["device.disconnect"] = [this](const json& p) {
        auto dev = registry_.require_device(require_string(p, "device_id", errors::D2400_MISSING_DEVICE_ID));
        auto lease = lease_now(*dev);
        json out = dev->disconnect();
        out["device_id"] = dev->id();
        out["connected"] = dev->is_connected();
        return out;
    };

    handlers_["actuator.get"] = [this](const json& p) {
        auto dev = registry_.require_device(require_string(p, "device_id", errors::D2400_MISSING_DEVICE_ID));
        auto act = dev->actuator(require_int(p, "actuator_id", errors::D2400_MISSING_ACTUATOR_ID));
        auto lease = lease_now(*dev);
        return json(act->read_position());
    };

    handlers_["actuator.set"] = [this](const json& p) {
        auto dev = registry_.require_device(require_string(p, "device_id", errors::D2400_MISSING_DEVICE_ID));
        auto act = dev->actuator(require_int(p, "actuator_id", errors::D2400_MISSING_ACTUATOR_ID));
        if (!p.contains("value")) throw ControlError(errors::D2400_MISSING_VALUE);
        const double target = target_from(p.at("value"), *act);
        auto lease = lease_now(*dev);
        act->move_to(target);
        return json(act->read_position());
    };

    handlers_["detector.read"] = [this](const json& p) {
        auto dev = registry_.require_device(require_string(p, "device_id", errors::D2400_MISSING_DEVICE_ID));
        auto det = dev->detector(require_int(p, "detector_id", errors::D2400_MISSING_DETECTOR_ID));
        auto lease = lease_now(*dev);
        json out = det->read();
        out["device_id"] = dev->id();
        out["detector"] = det->key();
        return out;
    };

    handlers_["measurement.types"] = [this](const json&) {
        return json{{"types", measurements_.describe()}};
    };

    handlers_["measurement.start"] = [this](const json& p) {
        if (!p.contains("measurement") || !p.at("measurement").is_object()) {
            throw ControlError(errors::D2400_MISSING_MEASUREMENT);
        }
        auto handle = engine_.start(measurements_.create(p.at("measurement"), registry_));
        return json{{"run_id", handle.run_id}, {"measurement_type", handle.measurement_type}};
    };

    handlers_["measurement.cancel"] = [this](const json& p) {
        const auto id = require_string(p, "run_id", errors::D2400_MISSING_RUN_ID);
        const bool accepted = engine_.cancel(id);
        return json{{"run_id", id}, {"cancel_requested", accepted}};
    };

    handlers_["measurement.status"] = [this](const json& p) {
        const auto id = require_string(p, "run_id", errors::D2400_MISSING_RUN_ID);
        return json(engine_.get_status(id, p.value("include_data", true)));
    };

    handlers_["measurement.list"] = [this](const json&) {
        json runs = json::array();
        for (const auto& s : engine_.list_runs()) runs.push_back(s);
        return json{{"runs", runs}};
    };

    handlers_["measurement.purge"] = [this](const json& p) {
        const auto id = require_string(p, "run_id", errors::D2400_MISSING_RUN_ID);
        engine_.purge(id);
        return json{{"run_id", id}, {"purged", true}};
    };
}

} // namespace fastmda
