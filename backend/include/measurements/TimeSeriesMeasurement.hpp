#pragma once

#include <chrono>
#include <optional>
#include <vector>

#include "core/Measurement.hpp"

namespace fastmda {

/**
 * @brief Reads a fixed set of detectors on a fixed-rate schedule.
 *
 * Step i is scheduled at run start + i * interval; a slow step delays the
 * following ones but the schedule does not drift. Without a count the series
 * runs until cancelled.
 */
class TimeSeriesMeasurement : public Measurement {
public:
    // One day. Keeps every scheduled offset representable in nanoseconds.
    static constexpr double kMaxIntervalSeconds = 86400.0;

    TimeSeriesMeasurement(std::vector<DetectorRef> detectors,
                          std::chrono::duration<double> interval,
                          std::optional<std::size_t> count);

    std::string type() const override { return "time_series"; }
    std::vector<std::shared_ptr<Device>> devices() const override;
    std::optional<std::size_t> step_count() const override { return count_; }
    std::chrono::nanoseconds step_offset(std::size_t step) const override;
    DataPoint acquire_step(std::size_t step) override;
    nlohmann::json describe() const override;

    std::chrono::duration<double> interval() const { return interval_; }

private:
    std::vector<DetectorRef> detectors_;
    std::chrono::duration<double> interval_;
    std::optional<std::size_t> count_;
};

} // namespace fastmda
