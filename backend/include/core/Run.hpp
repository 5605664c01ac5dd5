#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/DataPoint.hpp"
#include "core/Errors.hpp"

namespace fastmda {

class Measurement;

/**
 * Pending -> Running -> Completed | Failed | Cancelled
 * Pending -> Failed      (validation failed before the first step)
 * Pending -> Cancelled   (cancelled while waiting for device leases)
 * Terminal states have no transitions out.
 */
enum class RunState {
    Pending,
    Running,
    Completed,
    Failed,
    Cancelled
};

const char* to_string(RunState state);
bool is_terminal(RunState state);

struct RunError {
    ErrorKind kind = ErrorKind::Hardware;
    int code = 0;
    std::string message;
    std::optional<std::size_t> step; // failing step, if a step had started
    std::string device_id;
};

struct RunSnapshot {
    std::string id;
    std::string measurement_type;
    nlohmann::json measurement;
    RunState state = RunState::Pending;
    int64_t created_ms = 0;
    int64_t started_ms = 0;
    int64_t ended_ms = 0;
    std::optional<std::size_t> steps_total;
    std::size_t steps_completed = 0;
    bool cancel_requested = false;
    std::optional<RunError> error;
    std::vector<DataPoint> data_points; // empty when taken without data
};

void to_json(nlohmann::json& j, const RunError& e);
void to_json(nlohmann::json& j, const RunSnapshot& s);

/**
 * @brief Engine-owned execution context of one Measurement.
 *
 * State and data are mutated only by the worker thread driving the run;
 * every accessor is safe to call from any thread and never waits on progress.
 */
class Run {
public:
    Run(std::string id, std::shared_ptr<Measurement> measurement);
    ~Run();

    Run(const Run&) = delete;
    Run& operator=(const Run&) = delete;

    const std::string& id() const { return id_; }
    const std::shared_ptr<Measurement>& measurement() const { return measurement_; }

    RunState state() const;
    // Returns false (and changes nothing) if the transition is not allowed.
    bool transition(RunState to);
    bool fail(RunError error);
    void append(DataPoint dp);

    void request_cancel();
    bool cancel_requested() const;
    // Sleeps until `deadline` or a cancel request; true if cancelled.
    bool wait_cancel_until(std::chrono::steady_clock::time_point deadline);
    // True once terminal; false if `timeout` elapsed first.
    bool wait_terminal(std::chrono::milliseconds timeout) const;

    RunSnapshot snapshot(bool include_data = true) const;

    void attach_worker(std::thread worker);
    void join();

private:
    static bool allowed(RunState from, RunState to);
    bool transition_locked(RunState to);

    const std::string id_;
    const std::shared_ptr<Measurement> measurement_;
    const std::string type_;
    const nlohmann::json description_;
    const std::optional<std::size_t> steps_total_;

    mutable std::mutex m_;
    mutable std::condition_variable cv_;
    RunState state_ = RunState::Pending;
    int64_t created_ms_ = 0;
    int64_t started_ms_ = 0;
    int64_t ended_ms_ = 0;
    bool cancel_requested_ = false;
    std::optional<RunError> error_;
    std::vector<DataPoint> data_;

    std::mutex worker_m_;
    std::thread worker_;
};

} // namespace fastmda
