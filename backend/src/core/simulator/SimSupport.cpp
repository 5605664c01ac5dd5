#include "simulator/SimSupport.hpp"

#include <chrono>
#include <cmath>
#include <thread>

namespace fastmda {

NoiseSource::NoiseSource(uint64_t seed) {
    if (seed == 0) {
        rng_.seed(static_cast<unsigned>(std::chrono::high_resolution_clock::now().time_since_epoch().count()));
    } else {
        rng_.seed(seed);
    }
}

double NoiseSource::normal(double mean, double sigma) {
    if (!(sigma > 0.0)) return mean;
    std::lock_guard<std::mutex> lk(m_);
    std::normal_distribution<double> d(mean, sigma);
    return d(rng_);
}

double NoiseSource::relative(double mean, double rel) {
    return normal(mean, std::abs(mean) * rel);
}

std::optional<ConnectionCode> parse_connect_fault(const nlohmann::json& args) {
    if (!args.is_object() || !args.contains("connect_error")) return std::nullopt;
    const auto name = args.at("connect_error").get<std::string>();
    if (name == "timeout") return ConnectionCode::Timeout;
    if (name == "not_found") return ConnectionCode::NotFound;
    if (name == "in_use") return ConnectionCode::InUse;
    if (name == "transport") return ConnectionCode::Transport;
    throw ConfigError("unknown connect_error '" + name + "'");
}

void simulate_delay(double ms) {
    if (!(ms > 0.0)) return;
    std::this_thread::sleep_for(std::chrono::duration<double, std::milli>(ms));
}

} // namespace fastmda
