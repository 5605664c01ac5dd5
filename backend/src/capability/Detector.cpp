#include "capability/Detector.hpp"

#include "core/Clock.hpp"
#include "core/Errors.hpp"

using json = nlohmann::json;

namespace fastmda {

Reading Detector::read() {
    require_connected();
    if (!is_able_to_acquire()) {
        throw BusyError(label() + " is busy");
    }

    Reading r = do_read();
    if (r.dimensionality() != dimensionality_) {
        throw HardwareError(label() + ": " + errors::D1200_DIMENSIONALITY_MISMATCH +
                            " (got " + std::to_string(r.dimensionality()) +
                            ", declared " + std::to_string(dimensionality_) + ")");
    }
    if (!r.is_consistent()) {
        throw HardwareError(label() + ": " + errors::D1200_SHAPE_MISMATCH);
    }
    if (r.name.empty()) r.name = name();
    if (r.unit.empty()) r.unit = unit();
    if (r.ts_ms == 0) r.ts_ms = now_ms();
    return r;
}

json Detector::descriptor() const {
    return {
        {"key", key()},
        {"name", name()},
        {"unit", unit()},
        {"dimensionality", dimensionality_},
        {"settings", settings_descriptor()}
    };
}

} // namespace fastmda
