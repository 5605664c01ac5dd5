#pragma once

#include <cstddef>
#include <limits>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace fastmda {

// Closed interval; an unbounded side is +/- infinity.
struct Limits {
    double lower = -std::numeric_limits<double>::infinity();
    double upper = std::numeric_limits<double>::infinity();

    bool contains(double v) const { return v >= lower && v <= upper; }
    bool within(const Limits& outer) const { return lower >= outer.lower && upper <= outer.upper; }
};

// Unbounded sides serialize as null.
void to_json(nlohmann::json& j, const Limits& limits);

/**
 * @brief Validation state shared by discrete actuators and discrete settings:
 * the index range plus a set of temporarily invalid option indices.
 */
class DiscreteDomain {
public:
    // Throws InvalidPositionError (hard when out of range, soft when temporarily invalid).
    void check(std::size_t index, std::size_t option_count, const std::string& what) const;

    void set_invalid(std::size_t index);
    void set_valid(std::size_t index);
    std::vector<std::size_t> invalid() const;

private:
    mutable std::mutex m_;
    std::set<std::size_t> invalid_;
};

/**
 * @brief Validation state shared by continuous actuators and continuous settings:
 * user software limits checked after the hardware limits.
 */
class ContinuousDomain {
public:
    void check(double value, const Limits& hardware, const std::string& what) const;

    Limits soft_limits() const;
    // Throws ConfigError unless `soft` lies within `hardware`.
    void set_soft_limits(const Limits& soft, const Limits& hardware);

private:
    mutable std::mutex m_;
    Limits soft_;
};

} // namespace fastmda
