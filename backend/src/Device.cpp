#include "Device.hpp"

#include <iostream>

using json = nlohmann::json;

namespace fastmda {

void to_json(json& j, const ConnectionResult& r) {
    j = json{{"ok", r.ok()}, {"code", to_string(r.code)}, {"message", r.message}};
}

Device::Device(std::string id) : dev_id(std::move(id)) {}

ConnectionResult Device::connect() {
    std::lock_guard<std::mutex> lk(connect_m);
    if (connected.load()) return {};
    try {
        do_connect();
    } catch (const ConnectionError& e) {
        std::cerr << "Device " << dev_id << ": connect failed (" << to_string(e.reason()) << "): " << e.what() << std::endl;
        return {e.reason(), e.what()};
    }
    connected.store(true);
    std::cout << "Device " << dev_id << ": connected" << std::endl;
    return {};
}

ConnectionResult Device::disconnect() {
    std::lock_guard<std::mutex> lk(connect_m);
    if (!connected.load()) return {};
    try {
        do_disconnect();
    } catch (const ConnectionError& e) {
        std::cerr << "Device " << dev_id << ": disconnect failed (" << to_string(e.reason()) << "): " << e.what() << std::endl;
        return {e.reason(), e.what()};
    }
    connected.store(false);
    std::cout << "Device " << dev_id << ": disconnected" << std::endl;
    return {};
}

std::shared_ptr<Detector> Device::detector(int key) const {
    auto it = detectors.find(key);
    if (it == detectors.end()) {
        throw NotFoundError("device " + dev_id + " has no detector " + std::to_string(key));
    }
    return it->second;
}

std::shared_ptr<Actuator> Device::actuator(int key) const {
    auto it = actuators.find(key);
    if (it == actuators.end()) {
        throw NotFoundError("device " + dev_id + " has no actuator " + std::to_string(key));
    }
    return it->second;
}

std::unique_lock<std::timed_mutex> Device::try_lease(std::chrono::milliseconds wait) {
    std::unique_lock<std::timed_mutex> lk(lease_m, std::defer_lock);
    if (wait.count() <= 0) {
        (void)lk.try_lock();
    } else {
        (void)lk.try_lock_for(wait);
    }
    return lk;
}

json Device::descriptor() const {
    json j;
    j["id"] = dev_id;
    j["type"] = type();
    j["connected"] = is_connected();
    j["detectors"] = json::array();
    for (const auto& [key, d] : detectors) j["detectors"].push_back(d->descriptor());
    j["actuators"] = json::array();
    for (const auto& [key, a] : actuators) j["actuators"].push_back(a->descriptor());
    j["settings"] = json::array();
    for (const auto& [key, s] : settings) j["settings"].push_back(s->descriptor());
    return j;
}

} // namespace fastmda
