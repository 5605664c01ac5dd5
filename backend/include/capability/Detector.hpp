#pragma once

#include <cstddef>
#include <map>
#include <memory>

#include "capability/Capability.hpp"
#include "capability/Reading.hpp"

namespace fastmda {

/**
 * @brief Capability that yields a reading of fixed dimensionality on demand.
 *
 * To add a detector:
 *  1. Inherit from Detector, declare the dimensionality in the constructor.
 *  2. Implement name() and do_read(); throw HardwareError on communication failure.
 *  3. Override is_able_to_acquire() if the hardware can report being busy.
 */
class Detector : public Capability {
public:
    Detector(int key, Device& device, std::size_t dimensionality)
    : Capability(key, device), dimensionality_(dimensionality) {}

    std::size_t dimensionality() const { return dimensionality_; }
    virtual bool is_able_to_acquire() const { return true; }

    // Checks connection and busy state, acquires, and verifies the reading shape.
    Reading read();

    nlohmann::json descriptor() const override;

protected:
    virtual Reading do_read() = 0;

private:
    std::size_t dimensionality_;
};

using DetectorMap = std::map<int, std::shared_ptr<Detector>>;

} // namespace fastmda
