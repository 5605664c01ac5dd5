#include <gtest/gtest.h>

#include "devices/LinearStageDevice.hpp"
#include "devices/PhotodiodeDevice.hpp"
#include "fakes/FakeDevice.hpp"

#include <cmath>
#include <limits>

using namespace fastmda;
using namespace fastmda::test;

namespace {

// Declares 1-D but returns a scalar.
class MisshapedDevice : public Device {
public:
    explicit MisshapedDevice(std::string id) : Device(std::move(id)) {
        add_detector(std::make_shared<LyingDetector>(*this));
    }
    std::string type() const override { return "misshaped"; }

protected:
    void do_connect() override {}
    void do_disconnect() override {}

private:
    class LyingDetector : public Detector {
    public:
        explicit LyingDetector(Device& dev) : Detector(0, dev, 1) {}
        std::string name() const override { return "trace"; }

    protected:
        Reading do_read() override { return Reading::scalar("trace", 1.0); }
    };
};

std::shared_ptr<FakeDevice> stage_with_limits(double lo, double hi) {
    FakeDevice::Options opts;
    opts.continuous_actuators = {{lo, hi}};
    auto dev = std::make_shared<FakeDevice>("stage", opts);
    dev->connect();
    return dev;
}

template <typename Fn>
void expect_invalid_position(Fn&& fn, LimitKind limit) {
    try {
        fn();
        FAIL() << "expected InvalidPositionError";
    } catch (const InvalidPositionError& e) {
        EXPECT_EQ(e.limit(), limit);
        EXPECT_EQ(e.kind(), ErrorKind::InvalidPosition);
        EXPECT_EQ(e.code(), limit == LimitKind::Hard ? errors::E1300_HARD_LIMIT : errors::E1301_SOFT_LIMIT);
    }
}

} // namespace

TEST(Reading, ShapeConsistency) {
    EXPECT_TRUE(Reading::scalar("v", 1.0).is_consistent());
    EXPECT_EQ(Reading::scalar("v", 1.0).dimensionality(), 0u);

    auto img = Reading::image("img", 2, 3, std::vector<double>(6, 0.0));
    EXPECT_TRUE(img.is_consistent());
    EXPECT_EQ(img.dimensionality(), 2u);
    EXPECT_EQ(img.element_count(), 6u);

    img.values.pop_back();
    EXPECT_FALSE(img.is_consistent());

    auto vec = Reading::vector("trace", {1.0, 2.0, 3.0});
    vec.axes.push_back({"wavelength", "nm", {500.0, 501.0}});
    EXPECT_FALSE(vec.is_consistent());
    vec.axes[0].coords.push_back(502.0);
    EXPECT_TRUE(vec.is_consistent());
}

TEST(Detector, ReadStampsNameUnitAndTime) {
    auto dev = std::make_shared<FakeDevice>("d");
    dev->connect();
    auto r = dev->detector(0)->read();
    EXPECT_EQ(r.name, "det0");
    EXPECT_EQ(r.unit, "V");
    EXPECT_GT(r.ts_ms, 0);
    EXPECT_DOUBLE_EQ(r.values.at(0), 1.0);
}

TEST(Detector, DimensionalityMismatchIsHardwareError) {
    auto dev = std::make_shared<MisshapedDevice>("m");
    dev->connect();
    try {
        dev->detector(0)->read();
        FAIL() << "expected HardwareError";
    } catch (const HardwareError& e) {
        EXPECT_EQ(e.code(), errors::E1200_HARDWARE);
        EXPECT_NE(std::string(e.what()).find(errors::D1200_DIMENSIONALITY_MISMATCH), std::string::npos);
    }
}

TEST(Detector, DisconnectedAndBusyAreRejectedBeforeHardware) {
    auto dev = std::make_shared<FakeDevice>("d");
    EXPECT_THROW(dev->detector(0)->read(), HardwareError);

    dev->connect();
    dev->set_busy(true);
    EXPECT_THROW(dev->detector(0)->read(), BusyError);
    EXPECT_EQ(dev->reads(), 0u);
}

TEST(ContinuousActuator, HardLimitsLeavePositionUntouched) {
    auto dev = stage_with_limits(0.0, 10.0);
    auto act = std::static_pointer_cast<ContinuousActuator>(dev->actuator(0));

    act->set_position(4.0);
    expect_invalid_position([&] { act->set_position(10.5); }, LimitKind::Hard);
    expect_invalid_position([&] { act->set_position(-0.1); }, LimitKind::Hard);
    expect_invalid_position([&] { act->set_position(std::numeric_limits<double>::quiet_NaN()); }, LimitKind::Hard);
    expect_invalid_position([&] { act->set_position(std::numeric_limits<double>::infinity()); }, LimitKind::Hard);
    EXPECT_DOUBLE_EQ(act->get_position(), 4.0);
    EXPECT_EQ(dev->log()->count("set"), 1u);

    // limits are inclusive
    act->set_position(10.0);
    EXPECT_DOUBLE_EQ(act->get_position(), 10.0);
}

TEST(ContinuousActuator, SoftLimitsNarrowTheRange) {
    auto dev = stage_with_limits(0.0, 10.0);
    auto act = std::static_pointer_cast<ContinuousActuator>(dev->actuator(0));

    act->set_soft_limits({2.0, 8.0});
    expect_invalid_position([&] { act->set_position(9.0); }, LimitKind::Soft);
    expect_invalid_position([&] { act->set_position(11.0); }, LimitKind::Hard);
    act->set_position(8.0);
    EXPECT_DOUBLE_EQ(act->get_position(), 8.0);

    EXPECT_THROW(act->set_soft_limits({-1.0, 5.0}), ConfigError);
    EXPECT_THROW(act->set_soft_limits({6.0, 5.0}), ConfigError);
    EXPECT_DOUBLE_EQ(act->get_soft_limits().lower, 2.0);
}

TEST(ContinuousActuator, DisconnectedOrBusyRejectsValidTargets) {
    FakeDevice::Options opts;
    opts.continuous_actuators = {{0.0, 10.0}};
    auto dev = std::make_shared<FakeDevice>("stage", opts);
    auto act = dev->actuator(0);

    EXPECT_THROW(act->move_to(1.0), HardwareError);
    dev->connect();
    dev->set_busy(true);
    EXPECT_THROW(act->move_to(1.0), BusyError);
    // domain errors are reported before the busy state
    expect_invalid_position([&] { act->move_to(20.0); }, LimitKind::Hard);
    EXPECT_TRUE(dev->log()->filter("set").empty());
}

TEST(DiscreteActuator, OptionRangeAndTemporarilyInvalidOptions) {
    FakeDevice::Options opts;
    opts.discrete_actuators = {{"open", "ND1", "blocked"}};
    auto dev = std::make_shared<FakeDevice>("wheel", opts);
    dev->connect();
    auto act = std::static_pointer_cast<DiscreteActuator>(dev->actuator(0));

    act->set_position(2);
    EXPECT_EQ(act->get_position(), 2u);
    expect_invalid_position([&] { act->set_position(3); }, LimitKind::Hard);

    act->set_invalid_option(1);
    EXPECT_EQ(act->get_invalid_options(), std::vector<std::size_t>{1});
    expect_invalid_position([&] { act->set_position(1); }, LimitKind::Soft);
    EXPECT_EQ(act->get_position(), 2u);

    act->set_valid_option(1);
    act->set_position(1);
    auto pos = act->read_position();
    EXPECT_EQ(pos.label, "ND1");
    EXPECT_EQ(pos.kind, ActuatorKind::Discrete);
    EXPECT_DOUBLE_EQ(pos.value, 1.0);
}

TEST(DiscreteActuator, NonIntegralTargetsAreRejected) {
    FakeDevice::Options opts;
    opts.discrete_actuators = {{"A", "B"}};
    auto dev = std::make_shared<FakeDevice>("wheel", opts);
    dev->connect();
    auto act = dev->actuator(0);

    expect_invalid_position([&] { act->validate_target(0.5); }, LimitKind::Hard);
    expect_invalid_position([&] { act->validate_target(-1.0); }, LimitKind::Hard);
    EXPECT_NO_THROW(act->validate_target(1.0));
}

TEST(DiscreteActuator, HugeIndexIsOutOfRange) {
    FakeDevice::Options opts;
    opts.discrete_actuators = {{"A", "B"}};
    auto dev = std::make_shared<FakeDevice>("wheel", opts);
    dev->connect();
    auto act = dev->actuator(0);
    act->move_to(1.0);

    expect_invalid_position([&] { act->validate_target(1e30); }, LimitKind::Hard);
    expect_invalid_position([&] { act->move_to(1e30); }, LimitKind::Hard);
    expect_invalid_position([&] { act->move_to(2.0); }, LimitKind::Hard);
    EXPECT_EQ(dev->log()->count("set"), 1u);
    EXPECT_DOUBLE_EQ(act->read_position().value, 1.0);
}

TEST(Setting, DiscreteGainScalesPhotocurrent) {
    auto pd = std::make_shared<PhotodiodeDevice>("pd", nlohmann::json{{"noise", 0.0}, {"dark_current_A", 0.0}});
    pd->connect();
    auto gain = std::static_pointer_cast<DiscreteSetting>(pd->get_settings().at(PhotodiodeDevice::kGain));
    auto det = pd->detector(PhotodiodeDevice::kPhotocurrent);

    const double base = det->read().values.at(0);
    EXPECT_DOUBLE_EQ(base, 1e-3 * 0.5);
    gain->set_value(2);
    EXPECT_DOUBLE_EQ(det->read().values.at(0), base * 100.0);
    expect_invalid_position([&] { gain->set_value(3); }, LimitKind::Hard);
    EXPECT_EQ(gain->get_value(), 2u);
}

TEST(Setting, ContinuousVelocityHonoursLimitsAndConnection) {
    auto stage = std::make_shared<LinearStageDevice>("x");
    auto velocity = std::static_pointer_cast<ContinuousSetting>(stage->get_settings().at(LinearStageDevice::kVelocity));

    EXPECT_THROW(velocity->set_value(10.0), HardwareError);
    stage->connect();
    velocity->set_value(10.0);
    EXPECT_DOUBLE_EQ(velocity->get_value(), 10.0);
    expect_invalid_position([&] { velocity->set_value(51.0); }, LimitKind::Hard);

    auto desc = velocity->descriptor();
    EXPECT_EQ(desc.at("kind"), "continuous");
    EXPECT_EQ(desc.at("hardware_limits"), nlohmann::json::array({0.0, 50.0}));
    EXPECT_EQ(desc.at("software_limits"), nlohmann::json::array({nullptr, nullptr}));
}
