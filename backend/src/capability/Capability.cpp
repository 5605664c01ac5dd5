#include "capability/Capability.hpp"

#include "Device.hpp"
#include "core/Errors.hpp"

using json = nlohmann::json;

namespace fastmda {

void Capability::add_setting(std::shared_ptr<Setting> setting) {
    const int key = setting->key();
    if (!settings_.emplace(key, std::move(setting)).second) {
        throw ConfigError(label() + ": duplicate setting key " + std::to_string(key));
    }
}

void Capability::require_connected() const {
    if (!device_.is_connected()) {
        throw HardwareError(label() + ": " + errors::D1200_DEVICE_DISCONNECTED);
    }
}

std::string Capability::label() const {
    return device_.id() + "/" + std::to_string(key_) + " (" + name() + ")";
}

json Capability::settings_descriptor() const {
    json out = json::array();
    for (const auto& [key, s] : settings_) out.push_back(s->descriptor());
    return out;
}

} // namespace fastmda
