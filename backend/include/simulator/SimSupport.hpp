#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <nlohmann/json.hpp>

#include "core/Errors.hpp"

namespace fastmda {

// Thread-safe gaussian noise for simulated hardware. A zero seed is time-based.
class NoiseSource {
public:
    explicit NoiseSource(uint64_t seed = 0);

    double normal(double mean, double sigma);
    // mean * (1 + N(0, rel))
    double relative(double mean, double rel);

private:
    std::mutex m_;
    std::mt19937_64 rng_;
};

// "connect_error": "timeout" | "not_found" | "in_use" | "transport" makes connect() fail.
std::optional<ConnectionCode> parse_connect_fault(const nlohmann::json& args);

// Blocks for a simulated motion/exposure time; non-positive values return immediately.
void simulate_delay(double ms);

} // namespace fastmda
