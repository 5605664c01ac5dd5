#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/Run.hpp"

namespace fastmda {

class Measurement;
class RunRegistry;

struct RunHandle {
    std::string run_id;
    std::string measurement_type;
};

/**
 * @brief Runs Measurements as detached units of work.
 *
 * Each run gets its own worker thread, so start(), cancel() and get_status()
 * return immediately. A run first leases every device its measurement drives
 * (in device-id order), validates, then executes the steps strictly in
 * sequence. Cancellation is cooperative and observed only between steps.
 * Capability errors end the run in Failed and never leave the worker.
 */
class MeasurementEngine {
public:
    using CompletionListener = std::function<void(const RunSnapshot&)>;

    explicit MeasurementEngine(RunRegistry& runs);
    ~MeasurementEngine();

    MeasurementEngine(const MeasurementEngine&) = delete;
    MeasurementEngine& operator=(const MeasurementEngine&) = delete;

    RunHandle start(std::shared_ptr<Measurement> measurement);

    // NotFoundError for unknown ids. Returns false if the run was already terminal.
    bool cancel(const std::string& run_id);

    // NotFoundError for unknown ids.
    RunSnapshot get_status(const std::string& run_id, bool include_data = true) const;

    // Blocks until the run is terminal or `timeout` elapses; returns the latest snapshot.
    RunSnapshot wait(const std::string& run_id, std::chrono::milliseconds timeout) const;

    // Removes a terminal run. NotFoundError / ConfigError (still active).
    void purge(const std::string& run_id);

    std::vector<RunSnapshot> list_runs() const;

    // Invoked once per run, on its worker thread, after it became terminal.
    void add_completion_listener(CompletionListener listener);

    // Cancels all active runs and joins their workers. Further start() calls fail.
    void shutdown();

    // How long a pending run sleeps between lease attempts.
    static constexpr std::chrono::milliseconds kLeasePoll{50};

private:
    void execute(const std::shared_ptr<Run>& run);
    void notify_listeners(const std::shared_ptr<Run>& run);
    static std::string random_id();

    RunRegistry& runs_;
    std::atomic<bool> accepting_{true};

    std::mutex listeners_m_;
    std::vector<CompletionListener> listeners_;
};

} // namespace fastmda
