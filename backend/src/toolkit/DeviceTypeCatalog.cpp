#include "toolkit/DeviceTypeCatalog.hpp"

#include "Device.hpp"
#include "toolkit/IDeviceToolkit.hpp"

#include <iostream>

using json = nlohmann::json;

namespace fastmda {

void DeviceTypeCatalog::register_type(const std::string& type, const std::string& description, json args, Factory factory) {
    if (type.empty() || !factory) throw ConfigError("DeviceTypeCatalog: invalid registration");
    std::lock_guard<std::mutex> lk(m_);
    types_[type] = Entry{description, std::move(args), std::move(factory)};
}

void DeviceTypeCatalog::install(IDeviceToolkit& toolkit) {
    toolkit.register_types(*this);
    std::cout << "DeviceTypeCatalog: installed toolkit " << toolkit.name() << std::endl;
}

bool DeviceTypeCatalog::has_type(const std::string& type) const {
    std::lock_guard<std::mutex> lk(m_);
    return types_.count(type) > 0;
}

std::shared_ptr<Device> DeviceTypeCatalog::create(const std::string& id, const std::string& type, const json& args) const {
    Factory factory;
    {
        std::lock_guard<std::mutex> lk(m_);
        auto it = types_.find(type);
        if (it == types_.end()) throw ConfigError("unknown device type '" + type + "'");
        factory = it->second.factory;
    }
    if (id.empty()) throw ConfigError("device of type '" + type + "' has an empty id");

    std::shared_ptr<Device> dev;
    try {
        dev = factory(id, args.is_null() ? json::object() : args);
    } catch (const json::exception& e) {
        throw ConfigError("device " + id + " (" + type + "): bad args: " + e.what());
    }
    if (!dev) throw ConfigError("device " + id + " (" + type + "): factory returned no device");
    return dev;
}

json DeviceTypeCatalog::describe() const {
    std::lock_guard<std::mutex> lk(m_);
    json out = json::array();
    for (const auto& [name, e] : types_) {
        out.push_back({{"type", name}, {"description", e.description}, {"args", e.args}});
    }
    return out;
}

} // namespace fastmda
