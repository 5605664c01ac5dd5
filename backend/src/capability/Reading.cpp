#include "capability/Reading.hpp"

#include <utility>

using json = nlohmann::json;

namespace fastmda {

std::size_t Reading::element_count() const {
    std::size_t n = 1;
    for (auto d : shape) n *= d;
    return n;
}

bool Reading::is_consistent() const {
    if (values.size() != element_count()) return false;
    if (!axes.empty() && axes.size() != shape.size()) return false;
    for (std::size_t i = 0; i < axes.size(); ++i) {
        if (!axes[i].coords.empty() && axes[i].coords.size() != shape[i]) return false;
    }
    return true;
}

Reading Reading::scalar(std::string name, double value, std::string unit) {
    Reading r;
    r.name = std::move(name);
    r.unit = std::move(unit);
    r.values.push_back(value);
    return r;
}

Reading Reading::vector(std::string name, std::vector<double> values, std::string unit) {
    Reading r;
    r.name = std::move(name);
    r.unit = std::move(unit);
    r.shape.push_back(values.size());
    r.values = std::move(values);
    return r;
}

Reading Reading::image(std::string name, std::size_t rows, std::size_t cols, std::vector<double> values, std::string unit) {
    Reading r;
    r.name = std::move(name);
    r.unit = std::move(unit);
    r.shape = {rows, cols};
    r.values = std::move(values);
    return r;
}

void to_json(json& j, const ReadingAxis& axis) {
    j = json{{"name", axis.name}, {"unit", axis.unit}, {"coords", axis.coords}};
}

void to_json(json& j, const Reading& reading) {
    j = json{
        {"name", reading.name},
        {"long_name", reading.long_name},
        {"unit", reading.unit},
        {"ts_ms", reading.ts_ms},
        {"shape", reading.shape}
    };
    // 0-D readings serialize as a bare number
    if (reading.shape.empty() && reading.values.size() == 1) {
        j["value"] = reading.values.front();
    } else {
        j["values"] = reading.values;
    }
    if (!reading.axes.empty()) j["axes"] = reading.axes;
}

} // namespace fastmda
