#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "core/Measurement.hpp"

namespace fastmda {

class DeviceRegistry;

/**
 * @brief Builds Measurements from JSON configuration objects.
 *
 * The configuration carries a "type" key naming a registered builder.
 * Builders resolve device and capability references through the registry and
 * throw ConfigError / NotFoundError for malformed configurations, before any
 * run exists. "time_series" and "map" are registered by the constructor.
 */
class MeasurementCatalog {
public:
    using Builder = std::function<std::shared_ptr<Measurement>(const nlohmann::json& config, DeviceRegistry& registry)>;

    MeasurementCatalog();

    // Replaces an existing builder of the same name.
    void register_type(const std::string& type, const std::string& description, Builder builder);
    bool has_type(const std::string& type) const;

    std::shared_ptr<Measurement> create(const nlohmann::json& config, DeviceRegistry& registry) const;

    // [{type, description}] in name order.
    nlohmann::json describe() const;

    static std::shared_ptr<Measurement> build_time_series(const nlohmann::json& config, DeviceRegistry& registry);
    static std::shared_ptr<Measurement> build_map(const nlohmann::json& config, DeviceRegistry& registry);

private:
    struct Entry {
        std::string description;
        Builder builder;
    };

    mutable std::mutex m_;
    std::map<std::string, Entry> builders_;
};

} // namespace fastmda
