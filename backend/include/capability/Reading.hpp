#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace fastmda {

struct ReadingAxis {
    std::string name;
    std::string unit;
    std::vector<double> coords; // optional; empty means unlabelled
};

/**
 * @brief One detector acquisition.
 *
 * `shape` has one entry per dimension (empty for a 0-D scalar); `values` holds
 * the data flattened row-major. `axes`, when present, labels each dimension.
 */
struct Reading {
    std::string name;
    std::string long_name;
    std::string unit;
    std::vector<std::size_t> shape;
    std::vector<double> values;
    std::vector<ReadingAxis> axes;
    int64_t ts_ms = 0;

    std::size_t dimensionality() const { return shape.size(); }
    std::size_t element_count() const;
    bool is_consistent() const;

    static Reading scalar(std::string name, double value, std::string unit = {});
    static Reading vector(std::string name, std::vector<double> values, std::string unit = {});
    static Reading image(std::string name, std::size_t rows, std::size_t cols, std::vector<double> values, std::string unit = {});
};

void to_json(nlohmann::json& j, const ReadingAxis& axis);
void to_json(nlohmann::json& j, const Reading& reading);

} // namespace fastmda
