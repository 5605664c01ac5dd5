#include <gtest/gtest.h>

#include "DeviceRegistry.hpp"
#include "fakes/FakeDevice.hpp"
#include "measurements/MapMeasurement.hpp"
#include "measurements/MeasurementCatalog.hpp"
#include "measurements/TimeSeriesMeasurement.hpp"

using namespace fastmda;
using namespace fastmda::test;
using json = nlohmann::json;

namespace {

class MeasurementCatalogTest : public ::testing::Test {
protected:
    void SetUp() override {
        FakeDevice::Options stage;
        stage.continuous_actuators = {{0.0, 10.0}, {-5.0, 5.0}};
        registry.register_device(std::make_shared<FakeDevice>("stage", stage));

        FakeDevice::Options wheel;
        wheel.discrete_actuators = {{"open", "ND1", "blocked"}};
        registry.register_device(std::make_shared<FakeDevice>("wheel", wheel));

        FakeDevice::Options pd;
        pd.scalar_detectors = 2;
        registry.register_device(std::make_shared<FakeDevice>("pd", pd));
    }

    std::shared_ptr<MapMeasurement> map(const json& config) {
        auto m = std::dynamic_pointer_cast<MapMeasurement>(catalog.create(config, registry));
        EXPECT_NE(m, nullptr);
        return m;
    }

    static json pd_detector() { return json::array({{{"device", "pd"}, {"detector", 0}}}); }

    DeviceRegistry registry;
    MeasurementCatalog catalog;
};

} // namespace

TEST_F(MeasurementCatalogTest, DescribesBuiltInTypes) {
    auto types = catalog.describe();
    ASSERT_EQ(types.size(), 2u);
    EXPECT_EQ(types[0].at("type"), "map");
    EXPECT_EQ(types[1].at("type"), "time_series");
    EXPECT_TRUE(catalog.has_type("map"));
    EXPECT_FALSE(catalog.has_type("spiral"));
}

TEST_F(MeasurementCatalogTest, UnknownOrMissingTypeIsRejected) {
    EXPECT_THROW(catalog.create({{"type", "spiral"}}, registry), ConfigError);
    EXPECT_THROW(catalog.create({{"detectors", pd_detector()}}, registry), ConfigError);
    EXPECT_THROW(catalog.create(json::array(), registry), ConfigError);
}

TEST_F(MeasurementCatalogTest, TimeSeriesParsing) {
    auto m = std::dynamic_pointer_cast<TimeSeriesMeasurement>(catalog.create({
        {"type", "time_series"},
        {"detectors", json::array({{{"device", "pd"}, {"detector", 0}}, {{"device", "pd"}, {"detector", 1}}})},
        {"interval_s", 0.25},
        {"count", 4}
    }, registry));
    ASSERT_NE(m, nullptr);
    ASSERT_TRUE(m->step_count().has_value());
    EXPECT_EQ(*m->step_count(), 4u);
    EXPECT_DOUBLE_EQ(m->interval().count(), 0.25);
    EXPECT_EQ(m->step_offset(2), std::chrono::nanoseconds(500'000'000));
    ASSERT_EQ(m->devices().size(), 1u);

    auto d = m->describe();
    EXPECT_EQ(d.at("type"), "time_series");
    EXPECT_EQ(d.at("count"), 4);
    EXPECT_EQ(d.at("detectors").size(), 2u);
}

TEST_F(MeasurementCatalogTest, TimeSeriesWithoutCountIsOpenEnded) {
    for (const json& count : {json(nullptr), json(0)}) {
        auto m = catalog.create({{"type", "time_series"}, {"detectors", pd_detector()}, {"count", count}}, registry);
        EXPECT_FALSE(m->step_count().has_value());
    }
    auto m = catalog.create({{"type", "time_series"}, {"detectors", pd_detector()}}, registry);
    EXPECT_FALSE(m->step_count().has_value());
    EXPECT_TRUE(m->describe().at("count").is_null());
}

TEST_F(MeasurementCatalogTest, TimeSeriesRejectsBadFields) {
    EXPECT_THROW(catalog.create({{"type", "time_series"}, {"detectors", pd_detector()}, {"count", -1}}, registry), ConfigError);
    EXPECT_THROW(catalog.create({{"type", "time_series"}, {"detectors", pd_detector()}, {"count", 1.5}}, registry), ConfigError);
    EXPECT_THROW(catalog.create({{"type", "time_series"}, {"detectors", pd_detector()}, {"interval_s", "fast"}}, registry), ConfigError);
    EXPECT_THROW(catalog.create({{"type", "time_series"}, {"detectors", json::array()}}, registry), ConfigError);
    EXPECT_THROW(catalog.create({{"type", "time_series"}, {"detectors", pd_detector()}, {"interval_s", 1e10}}, registry), ConfigError);
}

TEST_F(MeasurementCatalogTest, LongestIntervalKeepsItsSchedule) {
    auto m = catalog.create({{"type", "time_series"}, {"detectors", pd_detector()},
                             {"interval_s", TimeSeriesMeasurement::kMaxIntervalSeconds}}, registry);
    EXPECT_EQ(m->step_offset(1), std::chrono::hours(24));
    EXPECT_GT(m->step_offset(1000).count(), 0);
}

TEST_F(MeasurementCatalogTest, OversizedKeysDoNotWrapAround) {
    EXPECT_THROW(catalog.create({{"type", "time_series"},
                                 {"detectors", json::array({{{"device", "pd"}, {"detector", 4294967296LL}}})}}, registry),
                 ConfigError);
    EXPECT_THROW(catalog.create({{"type", "time_series"},
                                 {"detectors", json::array({{{"device", "pd"}, {"detector", -4294967296LL}}})}}, registry),
                 ConfigError);
    EXPECT_THROW(catalog.create({{"type", "time_series"},
                                 {"detectors", json::array({{{"device", "pd"}, {"detector", 18446744073709551615ULL}}})}}, registry),
                 ConfigError);
    EXPECT_THROW(map({{"type", "map"}, {"detectors", pd_detector()},
                      {"axes", json::array({{{"device", "stage"}, {"actuator", 4294967296LL}, {"targets", {1}}}})}}),
                 ConfigError);
    EXPECT_THROW(map({{"type", "map"}, {"detectors", pd_detector()},
                      {"axes", json::array({{{"device", "stage"}, {"actuator", 0},
                                             {"range", {{"start", 0.0}, {"stop", 1.0}, {"points", 4294967297LL}}}}})}}),
                 ConfigError);
}

TEST_F(MeasurementCatalogTest, UnknownReferencesAreNotFound) {
    EXPECT_THROW(catalog.create({{"type", "time_series"},
                                 {"detectors", json::array({{{"device", "ghost"}, {"detector", 0}}})}}, registry),
                 NotFoundError);
    EXPECT_THROW(catalog.create({{"type", "time_series"},
                                 {"detectors", json::array({{{"device", "pd"}, {"detector", 9}}})}}, registry),
                 NotFoundError);
    EXPECT_THROW(map({{"type", "map"}, {"detectors", pd_detector()},
                      {"axes", json::array({{{"device", "stage"}, {"actuator", 5}, {"targets", {1}}}})}}),
                 NotFoundError);
}

TEST_F(MeasurementCatalogTest, RangeExpandsInclusively) {
    auto m = map({
        {"type", "map"},
        {"detectors", pd_detector()},
        {"axes", json::array({{{"device", "stage"}, {"actuator", 0},
                               {"range", {{"start", 0.0}, {"stop", 1.0}, {"points", 5}}}}})}
    });
    ASSERT_TRUE(m->step_count().has_value());
    EXPECT_EQ(*m->step_count(), 5u);
    EXPECT_DOUBLE_EQ(m->targets_for(0)[0], 0.0);
    EXPECT_DOUBLE_EQ(m->targets_for(1)[0], 0.25);
    EXPECT_DOUBLE_EQ(m->targets_for(4)[0], 1.0);

    EXPECT_THROW(map({{"type", "map"}, {"detectors", pd_detector()},
                      {"axes", json::array({{{"device", "stage"}, {"actuator", 0},
                                             {"range", {{"start", 0.0}, {"stop", 1.0}, {"points", 0}}}}})}}),
                 ConfigError);
}

TEST_F(MeasurementCatalogTest, DiscreteAxesAcceptLabels) {
    auto m = map({
        {"type", "map"},
        {"detectors", pd_detector()},
        {"axes", json::array({{{"device", "wheel"}, {"actuator", 0}, {"targets", json::array({"blocked", 0, "ND1"})}}})}
    });
    EXPECT_DOUBLE_EQ(m->targets_for(0)[0], 2.0);
    EXPECT_DOUBLE_EQ(m->targets_for(1)[0], 0.0);
    EXPECT_DOUBLE_EQ(m->targets_for(2)[0], 1.0);

    auto axis = [](json targets, const char* device) {
        return json::array({{{"device", device}, {"actuator", 0}, {"targets", targets}}});
    };
    EXPECT_THROW(map({{"type", "map"}, {"detectors", pd_detector()}, {"axes", axis(json::array({"ND9"}), "wheel")}}), ConfigError);
    EXPECT_THROW(map({{"type", "map"}, {"detectors", pd_detector()}, {"axes", axis(json::array({0.5}), "wheel")}}), ConfigError);
    EXPECT_THROW(map({{"type", "map"}, {"detectors", pd_detector()}, {"axes", axis(json::array({"open"}), "stage")}}), ConfigError);
}

TEST_F(MeasurementCatalogTest, GridOrdersLastAxisFastest) {
    auto m = map({
        {"type", "map"},
        {"detectors", pd_detector()},
        {"axes", json::array({
            {{"device", "stage"}, {"actuator", 0}, {"targets", {1, 2}}},
            {{"device", "stage"}, {"actuator", 1}, {"targets", {-1, 0, 1}}}
        })}
    });
    EXPECT_EQ(m->mode(), MapMode::Grid);
    ASSERT_EQ(*m->step_count(), 6u);
    EXPECT_EQ(m->targets_for(0), (std::vector<double>{1, -1}));
    EXPECT_EQ(m->targets_for(2), (std::vector<double>{1, 1}));
    EXPECT_EQ(m->targets_for(3), (std::vector<double>{2, -1}));
    EXPECT_EQ(m->targets_for(5), (std::vector<double>{2, 1}));
    // stage, then pd
    ASSERT_EQ(m->devices().size(), 2u);
    EXPECT_EQ(m->devices()[0]->id(), "stage");

    auto d = m->describe();
    EXPECT_EQ(d.at("mode"), "grid");
    EXPECT_EQ(d.at("steps"), 6);
    EXPECT_EQ(d.at("axes")[1].at("kind"), "continuous");
}

TEST_F(MeasurementCatalogTest, ZipRequiresEqualLengths) {
    auto m = map({
        {"type", "map"}, {"mode", "zip"},
        {"detectors", pd_detector()},
        {"axes", json::array({
            {{"device", "stage"}, {"actuator", 0}, {"targets", {1, 2, 3}}},
            {{"device", "wheel"}, {"actuator", 0}, {"targets", {0, 1, 2}}}
        })}
    });
    EXPECT_EQ(*m->step_count(), 3u);
    EXPECT_EQ(m->targets_for(1), (std::vector<double>{2, 1}));

    EXPECT_THROW(map({
        {"type", "map"}, {"mode", "zip"},
        {"detectors", pd_detector()},
        {"axes", json::array({
            {{"device", "stage"}, {"actuator", 0}, {"targets", {1, 2, 3}}},
            {{"device", "wheel"}, {"actuator", 0}, {"targets", {0, 1}}}
        })}
    }), ConfigError);
    EXPECT_THROW(map({{"type", "map"}, {"mode", "spiral"}, {"detectors", pd_detector()},
                      {"axes", json::array({{{"device", "stage"}, {"actuator", 0}, {"targets", {1}}}})}}),
                 ConfigError);
}

TEST_F(MeasurementCatalogTest, ValidationChecksEveryTarget) {
    auto m = map({
        {"type", "map"},
        {"detectors", pd_detector()},
        {"axes", json::array({{{"device", "stage"}, {"actuator", 0}, {"targets", {1, 20}}}})}
    });
    EXPECT_THROW(m->validate(), InvalidPositionError);

    // integral and finite, but far beyond the option list
    auto wheel = map({
        {"type", "map"},
        {"detectors", pd_detector()},
        {"axes", json::array({{{"device", "wheel"}, {"actuator", 0}, {"targets", json::array({0, 1e30})}}})}
    });
    EXPECT_THROW(wheel->validate(), InvalidPositionError);
}

TEST_F(MeasurementCatalogTest, CustomBuildersCanBeRegistered) {
    catalog.register_type("single_shot", "one reading", [](const json& config, DeviceRegistry& reg) {
        json ts = config;
        ts["count"] = 1;
        return MeasurementCatalog::build_time_series(ts, reg);
    });
    auto m = catalog.create({{"type", "single_shot"}, {"detectors", pd_detector()}}, registry);
    EXPECT_EQ(m->type(), "time_series");
    EXPECT_EQ(*m->step_count(), 1u);
    EXPECT_EQ(catalog.describe().size(), 3u);
}

TEST(MapMeasurement, ConstructorRejectsEmptyAxes) {
    auto dev = std::make_shared<FakeDevice>("pd");
    std::vector<DetectorRef> dets{{dev, dev->detector(0)}};
    EXPECT_THROW(MapMeasurement({}, dets), ConfigError);

    FakeDevice::Options opts;
    opts.continuous_actuators = {{0.0, 1.0}};
    auto stage = std::make_shared<FakeDevice>("stage", opts);
    EXPECT_THROW(MapMeasurement({{{stage, stage->actuator(0)}, {}}}, dets), ConfigError);
}
