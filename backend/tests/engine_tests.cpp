#include <gtest/gtest.h>

#include "core/MeasurementEngine.hpp"
#include "core/RunRegistry.hpp"
#include "fakes/FakeDevice.hpp"
#include "measurements/MapMeasurement.hpp"
#include "measurements/TimeSeriesMeasurement.hpp"

#include <algorithm>
#include <atomic>

using namespace fastmda;
using namespace fastmda::test;
using namespace std::chrono_literals;

namespace {

std::shared_ptr<FakeDevice> make_device(const std::string& id, FakeDevice::Options opts = {}) {
    auto dev = std::make_shared<FakeDevice>(id, std::move(opts));
    EXPECT_TRUE(dev->connect().ok());
    return dev;
}

DetectorRef det(const std::shared_ptr<FakeDevice>& dev, int key = 0) {
    return {dev, dev->detector(key)};
}

ActuatorRef act(const std::shared_ptr<FakeDevice>& dev, int key = 0) {
    return {dev, dev->actuator(key)};
}

std::shared_ptr<Measurement> series(const std::shared_ptr<FakeDevice>& dev, std::optional<std::size_t> count,
                                    std::chrono::duration<double> interval = 0s) {
    return std::make_shared<TimeSeriesMeasurement>(std::vector<DetectorRef>{det(dev)}, interval, count);
}

class EngineTest : public ::testing::Test {
protected:
    RunRegistry runs;
    MeasurementEngine engine{runs};

    RunSnapshot finish(const std::string& id) {
        auto s = engine.wait(id, 5s);
        EXPECT_TRUE(is_terminal(s.state)) << "run " << id << " still " << to_string(s.state);
        return s;
    }
};

} // namespace

TEST_F(EngineTest, TimeSeriesProducesOrderedSamples) {
    auto dev = make_device("dev");
    auto h = engine.start(series(dev, 3));
    EXPECT_EQ(h.measurement_type, "time_series");

    auto s = finish(h.run_id);
    EXPECT_EQ(s.state, RunState::Completed);
    ASSERT_EQ(s.data_points.size(), 3u);
    ASSERT_TRUE(s.steps_total.has_value());
    EXPECT_EQ(*s.steps_total, 3u);
    for (std::size_t i = 0; i < 3; ++i) {
        EXPECT_EQ(s.data_points[i].step, i);
        ASSERT_EQ(s.data_points[i].readings.size(), 1u);
        EXPECT_DOUBLE_EQ(s.data_points[i].readings[0].reading.values.at(0), static_cast<double>(i + 1));
        if (i > 0) EXPECT_GE(s.data_points[i].ts_ms, s.data_points[i - 1].ts_ms);
    }
    EXPECT_GT(s.started_ms, 0);
    EXPECT_GE(s.ended_ms, s.started_ms);
    EXPECT_FALSE(s.error.has_value());
}

TEST_F(EngineTest, TimeSeriesFollowsFixedRateSchedule) {
    auto dev = make_device("dev");
    auto h = engine.start(series(dev, 3, 50ms));
    auto s = finish(h.run_id);
    ASSERT_EQ(s.state, RunState::Completed);
    ASSERT_EQ(s.data_points.size(), 3u);
    EXPECT_GE(s.data_points[1].elapsed_s, 0.045);
    EXPECT_GE(s.data_points[2].elapsed_s, 0.095);
}

TEST_F(EngineTest, DiscreteMapVisitsEveryOptionInOrder) {
    FakeDevice::Options opts;
    opts.discrete_actuators = {{"A", "B"}};
    auto dev = make_device("wheel", opts);

    std::vector<MapAxis> axes{{act(dev), {0, 1}}};
    auto h = engine.start(std::make_shared<MapMeasurement>(axes, std::vector<DetectorRef>{det(dev)}));
    auto s = finish(h.run_id);

    ASSERT_EQ(s.state, RunState::Completed);
    ASSERT_EQ(s.data_points.size(), 2u);
    EXPECT_EQ(s.data_points[0].positions.at(0).label, "A");
    EXPECT_EQ(s.data_points[1].positions.at(0).label, "B");
    EXPECT_EQ(s.data_points[0].readings.size(), 1u);

    // set A, read, set B, read
    std::vector<std::string> ops;
    for (const auto& c : dev->log()->all()) {
        if (c.op != "get") ops.push_back(c.op + ":" + std::to_string(static_cast<int>(c.value)));
    }
    EXPECT_EQ(ops, (std::vector<std::string>{"set:0", "read:0", "set:1", "read:0"}));
}

TEST_F(EngineTest, GridMapMovesAxesInOrderBeforeReading) {
    FakeDevice::Options opts;
    opts.continuous_actuators = {{0.0, 10.0}, {0.0, 10.0}};
    auto dev = make_device("xy", opts);

    std::vector<MapAxis> axes{{act(dev, 0), {1.0, 2.0}}, {act(dev, 1), {5.0, 6.0}}};
    auto h = engine.start(std::make_shared<MapMeasurement>(axes, std::vector<DetectorRef>{det(dev)}));
    auto s = finish(h.run_id);
    ASSERT_EQ(s.state, RunState::Completed);
    ASSERT_EQ(s.data_points.size(), 4u);

    const double expect[4][2] = {{1, 5}, {1, 6}, {2, 5}, {2, 6}};
    for (std::size_t i = 0; i < 4; ++i) {
        EXPECT_DOUBLE_EQ(s.data_points[i].positions.at(0).value, expect[i][0]);
        EXPECT_DOUBLE_EQ(s.data_points[i].positions.at(1).value, expect[i][1]);
    }

    auto calls = dev->log()->all();
    calls.erase(std::remove_if(calls.begin(), calls.end(), [](const CallRecord& c) { return c.op == "get"; }), calls.end());
    ASSERT_EQ(calls.size(), 12u);
    for (std::size_t step = 0; step < 4; ++step) {
        EXPECT_EQ(calls[step * 3].op, "set");
        EXPECT_EQ(calls[step * 3].key, 0);
        EXPECT_EQ(calls[step * 3 + 1].op, "set");
        EXPECT_EQ(calls[step * 3 + 1].key, 1);
        EXPECT_EQ(calls[step * 3 + 2].op, "read");
    }
}

TEST_F(EngineTest, TargetOutsideLimitsFailsBeforeAnyMove) {
    FakeDevice::Options opts;
    opts.continuous_actuators = {{0.0, 10.0}};
    auto dev = make_device("stage", opts);

    std::vector<MapAxis> axes{{act(dev), {5.0, 15.0}}};
    auto h = engine.start(std::make_shared<MapMeasurement>(axes, std::vector<DetectorRef>{det(dev)}));
    auto s = finish(h.run_id);

    EXPECT_EQ(s.state, RunState::Failed);
    EXPECT_TRUE(s.data_points.empty());
    ASSERT_TRUE(s.error.has_value());
    EXPECT_EQ(s.error->kind, ErrorKind::InvalidPosition);
    EXPECT_EQ(s.error->code, errors::E1300_HARD_LIMIT);
    EXPECT_FALSE(s.error->step.has_value());
    EXPECT_EQ(s.started_ms, 0);
    EXPECT_TRUE(dev->log()->filter("set").empty());
}

TEST_F(EngineTest, SoftLimitViolationIsReportedAsSoft) {
    FakeDevice::Options opts;
    opts.continuous_actuators = {{0.0, 10.0}};
    auto dev = make_device("stage", opts);
    std::static_pointer_cast<ContinuousActuator>(dev->actuator(0))->set_soft_limits({0.0, 4.0});

    std::vector<MapAxis> axes{{act(dev), {1.0, 5.0}}};
    auto s = finish(engine.start(std::make_shared<MapMeasurement>(axes, std::vector<DetectorRef>{det(dev)})).run_id);
    EXPECT_EQ(s.state, RunState::Failed);
    ASSERT_TRUE(s.error.has_value());
    EXPECT_EQ(s.error->code, errors::E1301_SOFT_LIMIT);
}

TEST_F(EngineTest, CancelBetweenStepsKeepsCompletedSteps) {
    auto dev = make_device("dev");
    auto gate = std::make_shared<Gate>(false);
    dev->set_gate(gate);

    std::mutex id_m;
    std::string run_id;
    dev->set_hook([&](const std::string& op, std::size_t count) {
        if (op == "read" && count == 2) {
            std::lock_guard<std::mutex> lk(id_m);
            engine.cancel(run_id);
        }
    });

    auto h = engine.start(series(dev, 5));
    {
        std::lock_guard<std::mutex> lk(id_m);
        run_id = h.run_id;
    }
    gate->open();

    auto s = finish(h.run_id);
    EXPECT_EQ(s.state, RunState::Cancelled);
    EXPECT_TRUE(s.cancel_requested);
    EXPECT_EQ(s.data_points.size(), 2u);
    EXPECT_EQ(dev->reads(), 2u);
    EXPECT_FALSE(s.error.has_value());
}

TEST_F(EngineTest, CancelDuringMapStopsAtStepBoundary) {
    FakeDevice::Options opts;
    opts.continuous_actuators = {{0.0, 10.0}};
    auto dev = make_device("stage", opts);
    auto gate = std::make_shared<Gate>(false);
    dev->set_gate(gate);

    std::mutex id_m;
    std::string run_id;
    dev->set_hook([&](const std::string& op, std::size_t count) {
        if (op == "read" && count == 2) {
            std::lock_guard<std::mutex> lk(id_m);
            engine.cancel(run_id);
        }
    });

    std::vector<MapAxis> axes{{act(dev), {1.0, 2.0, 3.0, 4.0, 5.0}}};
    auto h = engine.start(std::make_shared<MapMeasurement>(axes, std::vector<DetectorRef>{det(dev)}));
    {
        std::lock_guard<std::mutex> lk(id_m);
        run_id = h.run_id;
    }
    gate->open();

    auto s = finish(h.run_id);
    EXPECT_EQ(s.state, RunState::Cancelled);
    ASSERT_EQ(s.data_points.size(), 2u);
    EXPECT_DOUBLE_EQ(s.data_points[0].positions.at(0).value, 1.0);
    EXPECT_DOUBLE_EQ(s.data_points[1].positions.at(0).value, 2.0);

    // no move toward the third target
    auto sets = dev->log()->filter("set");
    ASSERT_EQ(sets.size(), 2u);
    EXPECT_DOUBLE_EQ(sets[1].value, 2.0);
    EXPECT_EQ(dev->reads(), 2u);
}

TEST_F(EngineTest, OpenEndedSeriesRunsUntilCancelled) {
    auto dev = make_device("dev");
    auto h = engine.start(series(dev, std::nullopt, 5ms));

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (engine.get_status(h.run_id, false).steps_completed < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_TRUE(engine.cancel(h.run_id));

    auto s = finish(h.run_id);
    EXPECT_EQ(s.state, RunState::Cancelled);
    EXPECT_FALSE(s.steps_total.has_value());
    EXPECT_GE(s.data_points.size(), 3u);
    EXPECT_FALSE(engine.cancel(h.run_id));
}

TEST_F(EngineTest, HardwareFailureFailsOnlyThatRun) {
    auto bad = make_device("bad");
    auto good = make_device("good");
    bad->fail_read_on_call(2);

    auto hb = engine.start(series(bad, 4));
    auto hg = engine.start(series(good, 4));

    auto sb = finish(hb.run_id);
    auto sg = finish(hg.run_id);

    EXPECT_EQ(sb.state, RunState::Failed);
    EXPECT_EQ(sb.data_points.size(), 1u);
    ASSERT_TRUE(sb.error.has_value());
    EXPECT_EQ(sb.error->kind, ErrorKind::Hardware);
    ASSERT_TRUE(sb.error->step.has_value());
    EXPECT_EQ(*sb.error->step, 1u);
    EXPECT_EQ(sb.error->device_id, "bad");

    EXPECT_EQ(sg.state, RunState::Completed);
    EXPECT_EQ(sg.data_points.size(), 4u);
}

TEST_F(EngineTest, UnexpectedExceptionIsClassifiedAsHardware) {
    FakeDevice::Options opts;
    opts.continuous_actuators = {{0.0, 10.0}};
    auto dev = make_device("stage", opts);
    dev->fail_next_set_with([] { throw std::logic_error("driver bug"); });

    std::vector<MapAxis> axes{{act(dev), {1.0, 2.0}}};
    auto s = finish(engine.start(std::make_shared<MapMeasurement>(axes, std::vector<DetectorRef>{det(dev)})).run_id);
    EXPECT_EQ(s.state, RunState::Failed);
    ASSERT_TRUE(s.error.has_value());
    EXPECT_EQ(s.error->kind, ErrorKind::Hardware);
    EXPECT_EQ(s.error->message, "driver bug");
    EXPECT_TRUE(s.data_points.empty());
}

TEST_F(EngineTest, DisconnectedDeviceFailsBeforeRunning) {
    auto dev = std::make_shared<FakeDevice>("offline");
    auto s = finish(engine.start(series(dev, 3)).run_id);
    EXPECT_EQ(s.state, RunState::Failed);
    ASSERT_TRUE(s.error.has_value());
    EXPECT_EQ(s.error->kind, ErrorKind::Hardware);
    EXPECT_EQ(s.error->device_id, "offline");
    EXPECT_TRUE(dev->log()->all().empty());
}

TEST_F(EngineTest, DisjointDevicesRunConcurrently) {
    auto slow = make_device("slow");
    auto fast = make_device("fast");
    auto gate = std::make_shared<Gate>(false);
    slow->set_gate(gate);

    auto hs = engine.start(series(slow, 2));
    ASSERT_TRUE(gate->wait_arrived(1, 2s));

    // completes while the other run is parked inside a hardware call
    auto sf = engine.wait(engine.start(series(fast, 3)).run_id, 5s);
    EXPECT_EQ(sf.state, RunState::Completed);
    EXPECT_EQ(engine.get_status(hs.run_id, false).state, RunState::Running);

    gate->open();
    EXPECT_EQ(finish(hs.run_id).state, RunState::Completed);

    const auto slow_calls = slow->log()->all();
    const auto fast_calls = fast->log()->all();
    ASSERT_FALSE(slow_calls.empty());
    ASSERT_FALSE(fast_calls.empty());
    EXPECT_NE(slow_calls.front().thread, fast_calls.front().thread);
}

TEST_F(EngineTest, RunsOnSameDeviceAreSerialized) {
    auto log = std::make_shared<CallLog>();
    FakeDevice::Options opts;
    opts.log = log;
    opts.op_delay = 5ms;
    auto dev = make_device("shared", opts);
    auto gate = std::make_shared<Gate>(false);
    dev->set_gate(gate);

    auto h1 = engine.start(series(dev, 3));
    ASSERT_TRUE(gate->wait_arrived(1, 2s));
    auto h2 = engine.start(series(dev, 3));

    std::this_thread::sleep_for(3 * MeasurementEngine::kLeasePoll);
    EXPECT_EQ(engine.get_status(h2.run_id, false).state, RunState::Pending);

    gate->open();
    auto s1 = finish(h1.run_id);
    auto s2 = finish(h2.run_id);
    EXPECT_EQ(s1.state, RunState::Completed);
    EXPECT_EQ(s2.state, RunState::Completed);
    EXPECT_LE(s1.ended_ms, s2.started_ms);

    auto calls = log->all();
    ASSERT_EQ(calls.size(), 6u);
    std::sort(calls.begin(), calls.end(), [](const CallRecord& a, const CallRecord& b) { return a.begin < b.begin; });
    for (std::size_t i = 1; i < calls.size(); ++i) {
        EXPECT_LE(calls[i - 1].end, calls[i].begin) << "overlapping hardware calls at " << i;
    }
    // the first run's worker made the first three calls
    EXPECT_EQ(calls[0].thread, calls[2].thread);
    EXPECT_NE(calls[2].thread, calls[3].thread);
}

TEST_F(EngineTest, CancelWhilePendingNeverRuns) {
    auto dev = make_device("shared");
    auto gate = std::make_shared<Gate>(false);
    dev->set_gate(gate);

    auto h1 = engine.start(series(dev, 1));
    ASSERT_TRUE(gate->wait_arrived(1, 2s));
    auto h2 = engine.start(series(dev, 3));
    EXPECT_TRUE(engine.cancel(h2.run_id));

    auto s2 = finish(h2.run_id);
    EXPECT_EQ(s2.state, RunState::Cancelled);
    EXPECT_EQ(s2.started_ms, 0);
    EXPECT_TRUE(s2.data_points.empty());

    gate->open();
    EXPECT_EQ(finish(h1.run_id).state, RunState::Completed);
    EXPECT_EQ(dev->reads(), 1u);
}

TEST_F(EngineTest, UnknownRunIdsRaiseNotFound) {
    EXPECT_THROW(engine.cancel("nope"), NotFoundError);
    EXPECT_THROW(engine.get_status("nope"), NotFoundError);
    EXPECT_THROW(engine.purge("nope"), NotFoundError);
}

TEST_F(EngineTest, PurgeOnlyRemovesTerminalRuns) {
    auto dev = make_device("dev");
    auto gate = std::make_shared<Gate>(false);
    dev->set_gate(gate);

    auto h = engine.start(series(dev, 1));
    ASSERT_TRUE(gate->wait_arrived(1, 2s));
    EXPECT_THROW(engine.purge(h.run_id), ConfigError);

    gate->open();
    finish(h.run_id);
    engine.purge(h.run_id);
    EXPECT_EQ(runs.size(), 0u);
    EXPECT_THROW(engine.get_status(h.run_id), NotFoundError);
}

TEST_F(EngineTest, ListRunsOmitsData) {
    auto dev = make_device("dev");
    finish(engine.start(series(dev, 2)).run_id);
    finish(engine.start(series(dev, 1)).run_id);

    auto all = engine.list_runs();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].steps_completed, 2u);
    EXPECT_TRUE(all[0].data_points.empty());
    EXPECT_EQ(all[1].steps_completed, 1u);
}

TEST_F(EngineTest, ListenersRunOnceAndFailuresAreContained) {
    std::atomic<int> calls{0};
    engine.add_completion_listener([](const RunSnapshot&) { throw std::runtime_error("listener boom"); });
    engine.add_completion_listener([&](const RunSnapshot& s) {
        EXPECT_TRUE(is_terminal(s.state));
        EXPECT_EQ(s.data_points.size(), 2u);
        ++calls;
    });

    auto dev = make_device("dev");
    auto s = finish(engine.start(series(dev, 2)).run_id);
    EXPECT_EQ(s.state, RunState::Completed);
    engine.shutdown();
    EXPECT_EQ(calls.load(), 1);
}

TEST_F(EngineTest, ShutdownCancelsActiveRunsAndRejectsNewOnes) {
    auto dev = make_device("dev");
    auto h = engine.start(series(dev, std::nullopt, 10ms));
    engine.shutdown();

    EXPECT_EQ(engine.get_status(h.run_id, false).state, RunState::Cancelled);
    EXPECT_THROW(engine.start(series(dev, 1)), ConfigError);
}

TEST(RunStateMachine, RejectsTransitionsOutOfTerminalStates) {
    auto dev = std::make_shared<FakeDevice>("dev");
    fastmda::Run run("r1", series(dev, 1));
    EXPECT_EQ(run.state(), RunState::Pending);
    EXPECT_FALSE(run.transition(RunState::Completed));
    EXPECT_TRUE(run.transition(RunState::Running));
    EXPECT_FALSE(run.transition(RunState::Pending));
    EXPECT_TRUE(run.transition(RunState::Completed));
    EXPECT_FALSE(run.transition(RunState::Failed));
    EXPECT_FALSE(run.fail({ErrorKind::Hardware, errors::E1200_HARDWARE, "late", std::nullopt, {}}));
    run.request_cancel();
    EXPECT_FALSE(run.cancel_requested());
    EXPECT_EQ(run.state(), RunState::Completed);
}
