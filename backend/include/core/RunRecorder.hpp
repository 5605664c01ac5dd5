#pragma once

#include <cstdint>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "core/Run.hpp"

namespace fastmda {

class MeasurementEngine;

/**
 * @brief Persists every terminal run as one JSON Lines file.
 *
 * Layout: <runs_dir>/<YYYY-MM-DD>/<type>_<run_id>.jsonl with a "fastmda_run"
 * header line, one "datapoint" line per step and a closing "end" line.
 * Write failures are logged and never reach the run.
 */
class RunRecorder {
public:
    // An empty `runs_dir` falls back to FASTMDA_RUNS_DIR, then "./runs".
    explicit RunRecorder(std::string runs_dir = {}, int port = 0);

    // Subscribes record() as a completion listener of `engine`.
    void attach(MeasurementEngine& engine);

    // Returns the written path, or an empty string on failure.
    std::string record(const RunSnapshot& snapshot);

    const std::string& runs_dir() const { return runs_dir_; }
    std::int64_t runs_written() const;

    static std::string resolve_runs_dir(const std::string& configured);

private:
    static std::string day_string(std::int64_t ts_ms);
    static std::string sanitize(std::string base);
    nlohmann::json header(const RunSnapshot& s) const;

    std::string runs_dir_;
    int port_;

    mutable std::mutex m_;
    std::int64_t runs_written_ = 0;
};

} // namespace fastmda
