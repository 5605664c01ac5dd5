#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

#include "capability/Actuator.hpp"
#include "capability/Detector.hpp"
#include "capability/Setting.hpp"
#include "core/Errors.hpp"

namespace fastmda {

struct ConnectionResult {
    ConnectionCode code = ConnectionCode::Ok;
    std::string message;

    bool ok() const { return code == ConnectionCode::Ok; }
};

void to_json(nlohmann::json& j, const ConnectionResult& r);

/**
 * @brief Abstract base class for all hardware devices.
 *
 * A device groups detector and actuator capabilities behind a connection
 * lifecycle. To add a new device:
 *  1. Inherit from Device; create capabilities in the constructor with
 *     add_detector()/add_actuator()/add_setting(). The set is fixed afterwards.
 *  2. Implement type(), do_connect() and do_disconnect(). Throw ConnectionError
 *     with the matching ConnectionCode on failure.
 *  3. Register a factory for the type in a DeviceTypeCatalog (see toolkit/).
 */
class Device {
public:
    explicit Device(std::string id);
    virtual ~Device() = default;

    Device(const Device&) = delete;
    Device& operator=(const Device&) = delete;

    /** @brief Unique device identifier (serial or name) */
    const std::string& id() const { return dev_id; }
    /** @brief Device type string (matches the catalog name) */
    virtual std::string type() const = 0;

    /** @brief Establish communication; a no-op success when already connected */
    ConnectionResult connect();
    /** @brief Release communication; safe on an already-disconnected device */
    ConnectionResult disconnect();
    /** @brief Cached connection state; never talks to hardware */
    bool is_connected() const { return connected.load(); }

    const DetectorMap& get_detectors() const { return detectors; }
    const ActuatorMap& get_actuators() const { return actuators; }
    const SettingMap& get_settings() const { return settings; }

    // Lookups by local key; throw NotFoundError.
    std::shared_ptr<Detector> detector(int key) const;
    std::shared_ptr<Actuator> actuator(int key) const;

    /**
     * @brief Exclusive access lease. Measurement runs hold it for their whole
     * lifetime; direct control commands take it for a single call.
     * The returned lock does not own the mutex if `wait` elapsed first.
     */
    std::unique_lock<std::timed_mutex> try_lease(std::chrono::milliseconds wait);

    /** @brief JSON descriptor for discovery */
    virtual nlohmann::json descriptor() const;

protected:
    virtual void do_connect() = 0;
    virtual void do_disconnect() = 0;

    template <typename T>
    std::shared_ptr<T> add_detector(std::shared_ptr<T> d) {
        insert_unique(detectors, d, "detector");
        return d;
    }
    template <typename T>
    std::shared_ptr<T> add_actuator(std::shared_ptr<T> a) {
        insert_unique(actuators, a, "actuator");
        return a;
    }
    template <typename T>
    std::shared_ptr<T> add_setting(std::shared_ptr<T> s) {
        insert_unique(settings, s, "setting");
        return s;
    }

private:
    template <typename Map, typename Ptr>
    void insert_unique(Map& map, const Ptr& p, const char* what) {
        const int key = p->key();
        if (!map.emplace(key, p).second) {
            throw ConfigError(dev_id + ": duplicate " + what + " key " + std::to_string(key));
        }
    }

    std::string dev_id;
    std::atomic<bool> connected{false};
    std::mutex connect_m;
    std::timed_mutex lease_m;

    DetectorMap detectors;
    ActuatorMap actuators;
    SettingMap settings;
};

} // namespace fastmda
