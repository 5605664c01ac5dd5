#include "toolkit/DeviceConfigLoader.hpp"

#include "Device.hpp"
#include "DeviceRegistry.hpp"
#include "toolkit/DeviceTypeCatalog.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <set>

using json = nlohmann::json;

namespace fastmda {

DeviceConfigLoader::DeviceConfigLoader(const DeviceTypeCatalog& catalog) : catalog_(catalog) {}

std::vector<LoadedDevice> DeviceConfigLoader::load(const std::string& path, DeviceRegistry& registry) const {
    std::ifstream f(path);
    if (!f) throw ConfigError("DeviceConfigLoader: unable to open device config: " + path);
    json doc;
    try {
        doc = json::parse(f);
    } catch (const json::parse_error& e) {
        throw ConfigError("DeviceConfigLoader: " + path + ": " + e.what());
    }
    auto loaded = load_json(doc, registry);
    std::cout << "DeviceConfigLoader: loaded " << loaded.size() << " device(s) from " << path << std::endl;
    return loaded;
}

std::vector<LoadedDevice> DeviceConfigLoader::load_json(const json& doc, DeviceRegistry& registry) const {
    if (!doc.is_object() || !doc.contains("devices") || !doc.at("devices").is_array()) {
        throw ConfigError("DeviceConfigLoader: expected {\"devices\": [...]}");
    }

    struct Pending {
        std::shared_ptr<Device> dev;
        bool connect;
    };
    std::vector<Pending> created;
    std::set<std::string> ids;

    // Build everything first so a bad entry leaves the registry untouched.
    for (const auto& entry : doc.at("devices")) {
        if (!entry.is_object()) throw ConfigError("DeviceConfigLoader: device entry must be an object");
        if (!entry.contains("id") || !entry.at("id").is_string()) throw ConfigError("DeviceConfigLoader: device entry without string 'id'");
        if (!entry.contains("type") || !entry.at("type").is_string()) throw ConfigError("DeviceConfigLoader: device entry without string 'type'");
        const auto id = entry.at("id").get<std::string>();
        const auto type = entry.at("type").get<std::string>();
        if (!ids.insert(id).second || registry.get_device(id)) {
            throw ConfigError("DeviceConfigLoader: duplicate device id '" + id + "'");
        }
        const json args = entry.value("args", json::object());
        if (!args.is_object()) throw ConfigError("DeviceConfigLoader: " + id + ": 'args' must be an object");
        created.push_back({catalog_.create(id, type, args), entry.value("connect", true)});
    }

    std::vector<LoadedDevice> out;
    for (auto& p : created) {
        registry.register_device(p.dev);
        LoadedDevice info{p.dev->id(), p.dev->type(), false, {}};
        if (p.connect) {
            auto res = p.dev->connect();
            info.connected = res.ok();
            info.message = res.message;
            if (!res.ok()) {
                std::cerr << "DeviceConfigLoader: " << p.dev->id() << " registered but not connected: " << res.message << std::endl;
            }
        }
        out.push_back(std::move(info));
    }
    return out;
}

} // namespace fastmda
