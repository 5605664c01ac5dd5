#include "core/MeasurementEngine.hpp"

#include "Device.hpp"
#include "core/Clock.hpp"
#include "core/Measurement.hpp"
#include "core/RunRegistry.hpp"

#include <algorithm>
#include <iostream>
#include <random>

namespace fastmda {

MeasurementEngine::MeasurementEngine(RunRegistry& runs) : runs_(runs) {}

MeasurementEngine::~MeasurementEngine() {
    shutdown();
}

std::string MeasurementEngine::random_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(16);
    for (int i = 0; i < 16; ++i) out.push_back(hex[(rng() >> ((i % 8) * 8)) & 0xF]);
    return out;
}

RunHandle MeasurementEngine::start(std::shared_ptr<Measurement> measurement) {
    if (!measurement) throw ConfigError("MeasurementEngine: null measurement");
    if (!accepting_.load()) throw ConfigError("MeasurementEngine: engine is shut down");

    auto run = std::make_shared<Run>(random_id(), std::move(measurement));
    runs_.insert(run);
    run->attach_worker(std::thread([this, run]() { execute(run); }));

    std::cout << "MeasurementEngine: run " << run->id() << " (" << run->measurement()->type() << ") scheduled" << std::endl;
    return {run->id(), run->measurement()->type()};
}

bool MeasurementEngine::cancel(const std::string& run_id) {
    auto run = runs_.require(run_id);
    if (is_terminal(run->state())) return false;
    run->request_cancel();
    std::cout << "MeasurementEngine: run " << run_id << " cancel requested" << std::endl;
    return true;
}

RunSnapshot MeasurementEngine::get_status(const std::string& run_id, bool include_data) const {
    return runs_.require(run_id)->snapshot(include_data);
}

RunSnapshot MeasurementEngine::wait(const std::string& run_id, std::chrono::milliseconds timeout) const {
    auto run = runs_.require(run_id);
    run->wait_terminal(timeout);
    return run->snapshot();
}

void MeasurementEngine::purge(const std::string& run_id) {
    auto run = runs_.remove_terminal(run_id);
    run->join();
}

std::vector<RunSnapshot> MeasurementEngine::list_runs() const {
    std::vector<RunSnapshot> out;
    for (const auto& r : runs_.all()) out.push_back(r->snapshot(false));
    return out;
}

void MeasurementEngine::add_completion_listener(CompletionListener listener) {
    std::lock_guard<std::mutex> lk(listeners_m_);
    listeners_.push_back(std::move(listener));
}

void MeasurementEngine::shutdown() {
    accepting_.store(false);
    auto all = runs_.all();
    for (const auto& r : all) r->request_cancel();
    for (const auto& r : all) r->join();
}

void MeasurementEngine::notify_listeners(const std::shared_ptr<Run>& run) {
    std::vector<CompletionListener> listeners;
    {
        std::lock_guard<std::mutex> lk(listeners_m_);
        listeners = listeners_;
    }
    if (listeners.empty()) return;
    const RunSnapshot snap = run->snapshot();
    for (const auto& fn : listeners) {
        try {
            fn(snap);
        } catch (const std::exception& e) {
            std::cerr << "MeasurementEngine: completion listener failed for run " << run->id() << ": " << e.what() << std::endl;
        }
    }
}

static RunError to_run_error(const Error& e, std::optional<std::size_t> step) {
    return {e.kind(), e.code(), e.what(), step, e.device_id()};
}

void MeasurementEngine::execute(const std::shared_ptr<Run>& run) {
    const auto& m = run->measurement();

    auto finish = [&](std::vector<std::unique_lock<std::timed_mutex>>& leases) {
        leases.clear();
        const auto snap = run->snapshot(false);
        if (snap.state == RunState::Failed && snap.error) {
            std::cerr << "MeasurementEngine: run " << run->id() << " failed ("
                      << to_string(snap.error->kind) << "): " << snap.error->message << std::endl;
        } else {
            std::cout << "MeasurementEngine: run " << run->id() << " " << to_string(snap.state)
                      << " after " << snap.steps_completed << " step(s)" << std::endl;
        }
        notify_listeners(run);
    };

    // Pending: lease every device, lowest id first, so concurrent runs cannot deadlock.
    auto devices = m->devices();
    std::sort(devices.begin(), devices.end(),
              [](const std::shared_ptr<Device>& a, const std::shared_ptr<Device>& b) { return a->id() < b->id(); });
    devices.erase(std::unique(devices.begin(), devices.end()), devices.end());

    std::vector<std::unique_lock<std::timed_mutex>> leases;
    for (const auto& d : devices) {
        for (;;) {
            if (run->cancel_requested()) {
                run->transition(RunState::Cancelled);
                finish(leases);
                return;
            }
            auto lease = d->try_lease(kLeasePoll);
            if (lease.owns_lock()) {
                leases.push_back(std::move(lease));
                break;
            }
        }
    }

    try {
        for (const auto& d : devices) {
            if (!d->is_connected()) {
                HardwareError e("device " + d->id() + ": " + errors::D1200_DEVICE_DISCONNECTED);
                e.set_device_id(d->id());
                throw e;
            }
        }
        m->validate();
    } catch (const Error& e) {
        run->fail(to_run_error(e, std::nullopt));
        finish(leases);
        return;
    } catch (const std::exception& e) {
        run->fail({ErrorKind::Config, errors::E1600_CONFIG, e.what(), std::nullopt, {}});
        finish(leases);
        return;
    }

    run->transition(RunState::Running);
    std::cout << "MeasurementEngine: run " << run->id() << " running" << std::endl;

    const auto t0 = std::chrono::steady_clock::now();
    const auto total = m->step_count();
    bool failed = false;
    std::size_t step = 0;
    for (; !total || step < *total; ++step) {
        if (run->cancel_requested()) break;
        const auto offset = m->step_offset(step);
        if (offset.count() > 0 && run->wait_cancel_until(t0 + offset)) break;

        const int64_t ts = now_ms();
        const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
        DataPoint dp;
        try {
            dp = m->acquire_step(step);
        } catch (const Error& e) {
            run->fail(to_run_error(e, step));
            failed = true;
            break;
        } catch (const std::exception& e) {
            run->fail({ErrorKind::Hardware, errors::E1200_HARDWARE, e.what(), step, {}});
            failed = true;
            break;
        }
        dp.step = step;
        dp.ts_ms = ts;
        dp.elapsed_s = elapsed;
        run->append(std::move(dp));
    }

    if (!failed) {
        const bool finished = total && step >= *total;
        run->transition(finished ? RunState::Completed : RunState::Cancelled);
    }
    finish(leases);
}

} // namespace fastmda
