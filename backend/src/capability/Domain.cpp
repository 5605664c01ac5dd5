#include "capability/Domain.hpp"

#include "core/Errors.hpp"

#include <cmath>
#include <sstream>

using json = nlohmann::json;

namespace fastmda {

static json bound_json(double v) {
    if (std::isinf(v)) return nullptr;
    return v;
}

void to_json(json& j, const Limits& limits) {
    j = json::array({bound_json(limits.lower), bound_json(limits.upper)});
}

void DiscreteDomain::check(std::size_t index, std::size_t option_count, const std::string& what) const {
    if (index >= option_count) {
        std::ostringstream os;
        os << what << ": " << errors::D1300_INDEX_OUT_OF_RANGE << " (" << index << " not in [0, " << option_count << "))";
        throw InvalidPositionError(LimitKind::Hard, os.str());
    }
    std::lock_guard<std::mutex> lk(m_);
    if (invalid_.count(index)) {
        std::ostringstream os;
        os << what << ": " << errors::D1301_OPTION_INVALID << " (" << index << ")";
        throw InvalidPositionError(LimitKind::Soft, os.str());
    }
}

void DiscreteDomain::set_invalid(std::size_t index) {
    std::lock_guard<std::mutex> lk(m_);
    invalid_.insert(index);
}

void DiscreteDomain::set_valid(std::size_t index) {
    std::lock_guard<std::mutex> lk(m_);
    invalid_.erase(index);
}

std::vector<std::size_t> DiscreteDomain::invalid() const {
    std::lock_guard<std::mutex> lk(m_);
    return {invalid_.begin(), invalid_.end()};
}

void ContinuousDomain::check(double value, const Limits& hardware, const std::string& what) const {
    if (!std::isfinite(value)) {
        throw InvalidPositionError(LimitKind::Hard, what + ": " + errors::D1300_NOT_FINITE);
    }
    if (!hardware.contains(value)) {
        std::ostringstream os;
        os << what << ": " << errors::D1300_OUTSIDE_HARDWARE_LIMITS << " (" << value << " not in ["
           << hardware.lower << ", " << hardware.upper << "])";
        throw InvalidPositionError(LimitKind::Hard, os.str());
    }
    std::lock_guard<std::mutex> lk(m_);
    if (!soft_.contains(value)) {
        std::ostringstream os;
        os << what << ": " << errors::D1301_OUTSIDE_SOFTWARE_LIMITS << " (" << value << " not in ["
           << soft_.lower << ", " << soft_.upper << "])";
        throw InvalidPositionError(LimitKind::Soft, os.str());
    }
}

Limits ContinuousDomain::soft_limits() const {
    std::lock_guard<std::mutex> lk(m_);
    return soft_;
}

void ContinuousDomain::set_soft_limits(const Limits& soft, const Limits& hardware) {
    if (!(soft.lower <= soft.upper) || !soft.within(hardware)) {
        throw ConfigError(errors::D1600_SOFT_LIMITS_EXCEED_HARDWARE);
    }
    std::lock_guard<std::mutex> lk(m_);
    soft_ = soft;
}

} // namespace fastmda
