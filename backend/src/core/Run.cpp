#include "core/Run.hpp"

#include "core/Clock.hpp"
#include "core/Measurement.hpp"

using json = nlohmann::json;

namespace fastmda {

const char* to_string(RunState state) {
    switch (state) {
        case RunState::Pending: return "pending";
        case RunState::Running: return "running";
        case RunState::Completed: return "completed";
        case RunState::Failed: return "failed";
        case RunState::Cancelled: return "cancelled";
    }
    return "unknown";
}

bool is_terminal(RunState state) {
    return state == RunState::Completed || state == RunState::Failed || state == RunState::Cancelled;
}

void to_json(json& j, const RunError& e) {
    j = json{
        {"kind", to_string(e.kind)},
        {"code", e.code},
        {"message", e.message},
        {"step", e.step ? json(*e.step) : json(nullptr)},
        {"device_id", e.device_id}
    };
}

void to_json(json& j, const RunSnapshot& s) {
    j = json{
        {"run_id", s.id},
        {"measurement_type", s.measurement_type},
        {"measurement", s.measurement},
        {"state", to_string(s.state)},
        {"created_ms", s.created_ms},
        {"started_ms", s.started_ms},
        {"ended_ms", s.ended_ms},
        {"steps_total", s.steps_total ? json(*s.steps_total) : json(nullptr)},
        {"steps_completed", s.steps_completed},
        {"cancel_requested", s.cancel_requested},
        {"error", s.error ? json(*s.error) : json(nullptr)},
        {"data_points", s.data_points}
    };
}

Run::Run(std::string id, std::shared_ptr<Measurement> measurement)
: id_(std::move(id)),
  measurement_(std::move(measurement)),
  type_(measurement_->type()),
  description_(measurement_->describe()),
  steps_total_(measurement_->step_count()),
  created_ms_(now_ms()) {}

Run::~Run() {
    join();
}

bool Run::allowed(RunState from, RunState to) {
    switch (from) {
        case RunState::Pending:
            return to == RunState::Running || to == RunState::Failed || to == RunState::Cancelled;
        case RunState::Running:
            return to == RunState::Completed || to == RunState::Failed || to == RunState::Cancelled;
        default:
            return false;
    }
}

RunState Run::state() const {
    std::lock_guard<std::mutex> lk(m_);
    return state_;
}

bool Run::transition_locked(RunState to) {
    if (!allowed(state_, to)) return false;
    state_ = to;
    if (to == RunState::Running) started_ms_ = now_ms();
    if (is_terminal(to)) ended_ms_ = now_ms();
    return true;
}

bool Run::transition(RunState to) {
    bool ok;
    {
        std::lock_guard<std::mutex> lk(m_);
        ok = transition_locked(to);
    }
    if (ok) cv_.notify_all();
    return ok;
}

bool Run::fail(RunError error) {
    bool ok;
    {
        std::lock_guard<std::mutex> lk(m_);
        ok = transition_locked(RunState::Failed);
        if (ok) error_ = std::move(error);
    }
    if (ok) cv_.notify_all();
    return ok;
}

void Run::append(DataPoint dp) {
    std::lock_guard<std::mutex> lk(m_);
    data_.push_back(std::move(dp));
}

void Run::request_cancel() {
    {
        std::lock_guard<std::mutex> lk(m_);
        if (is_terminal(state_)) return;
        cancel_requested_ = true;
    }
    cv_.notify_all();
}

bool Run::cancel_requested() const {
    std::lock_guard<std::mutex> lk(m_);
    return cancel_requested_;
}

bool Run::wait_cancel_until(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lk(m_);
    return cv_.wait_until(lk, deadline, [this] { return cancel_requested_; });
}

bool Run::wait_terminal(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lk(m_);
    return cv_.wait_for(lk, timeout, [this] { return is_terminal(state_); });
}

RunSnapshot Run::snapshot(bool include_data) const {
    RunSnapshot s;
    s.id = id_;
    s.measurement_type = type_;
    s.measurement = description_;
    s.steps_total = steps_total_;
    std::lock_guard<std::mutex> lk(m_);
    s.state = state_;
    s.created_ms = created_ms_;
    s.started_ms = started_ms_;
    s.ended_ms = ended_ms_;
    s.steps_completed = data_.size();
    s.cancel_requested = cancel_requested_;
    s.error = error_;
    if (include_data) s.data_points = data_;
    return s;
}

void Run::attach_worker(std::thread worker) {
    std::lock_guard<std::mutex> lk(worker_m_);
    worker_ = std::move(worker);
}

void Run::join() {
    std::thread t;
    {
        std::lock_guard<std::mutex> lk(worker_m_);
        t = std::move(worker_);
    }
    if (!t.joinable()) return;
    // a completion listener may purge its own run from the worker thread
    if (t.get_id() == std::this_thread::get_id()) {
        t.detach();
    } else {
        t.join();
    }
}

} // namespace fastmda
