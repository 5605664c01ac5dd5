#include "toolkit/StandardToolkit.hpp"

#include "devices/FilterWheelDevice.hpp"
#include "devices/LinearStageDevice.hpp"
#include "devices/PhotodiodeDevice.hpp"
#include "devices/SpectrometerDevice.hpp"
#include "simulator/SimulatedDevice.hpp"
#include "toolkit/DeviceTypeCatalog.hpp"

using json = nlohmann::json;

namespace fastmda {

void StandardToolkit::register_types(DeviceTypeCatalog& catalog) {
    const json common = {
        {"seed", "noise seed (0 = time based)"},
        {"connect_error", "simulate a connect failure: timeout | not_found | in_use | transport"}
    };
    auto with_common = [&](json args) {
        for (auto it = common.begin(); it != common.end(); ++it) args[it.key()] = it.value();
        return args;
    };

    catalog.register_type("simulated", "Generic simulated device described by its args",
        with_common({
            {"detectors", "[{key, name, unit, shape, mean, noise}]"},
            {"actuators", "[{key, name, kind, unit, lower, upper, position, settle_ms, options}]"},
            {"settings", "[{key, name, unit, lower, upper, value}]"}
        }),
        [](const std::string& id, const json& args) {
            return std::make_shared<SimulatedDevice>(id, "simulated", args);
        });

    catalog.register_type("photodiode", "Amplified photodiode, scalar photocurrent",
        with_common({
            {"power_W", "incident optical power"},
            {"responsivity_A_W", "responsivity"},
            {"dark_current_A", "dark current"},
            {"noise", "relative noise"}
        }),
        [](const std::string& id, const json& args) {
            return std::make_shared<PhotodiodeDevice>(id, args);
        });

    catalog.register_type("filter_wheel", "Motorized filter wheel, discrete",
        with_common({
            {"filters", "slot labels"},
            {"position", "initial slot index"},
            {"slot_ms", "travel time per slot"}
        }),
        [](const std::string& id, const json& args) {
            return std::make_shared<FilterWheelDevice>(id, args);
        });

    catalog.register_type("linear_stage", "Single-axis translation stage, continuous (mm)",
        with_common({
            {"travel_mm", "travel range"},
            {"position_mm", "initial position"},
            {"velocity_mm_s", "move velocity (0 = instant)"},
            {"settle_ms", "settle time after each move"}
        }),
        [](const std::string& id, const json& args) {
            return std::make_shared<LinearStageDevice>(id, args);
        });

    catalog.register_type("spectrometer", "Grating spectrometer with linear CCD",
        with_common({
            {"pixels", "CCD pixel count"},
            {"center_nm", "initial center wavelength"},
            {"integration_ms", "initial integration time"},
            {"line_nm", "simulated emission line"},
            {"line_width_nm", "simulated line width (sigma)"},
            {"peak_counts_per_ms", "line peak rate"},
            {"background_counts_per_ms", "background rate"}
        }),
        [](const std::string& id, const json& args) {
            return std::make_shared<SpectrometerDevice>(id, args);
        });
}

} // namespace fastmda
