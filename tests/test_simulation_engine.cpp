#include <gtest/gtest.h>

#include <cmath>
#include <variant>
#include <vector>

#include "points/point_loader.hpp"
#include "points/point_registry.hpp"
#include "simulation/simulation_engine.hpp"
#include "simulation/update_rules.hpp"
#include "test_support.hpp"

using namespace sim_engine;
using namespace sim_points;
using test_support::analog_def;
using test_support::binary_def;
using test_support::multistate_def;

class SimulationEngineTest : public ::testing::Test {
protected:
  PointRegistry registry;
  SimulationParams params;

  double analog(PointKind kind, uint32_t instance) const {
    return std::get<double>(registry.find(kind, instance).effective_value());
  }

  std::optional<PointValue> slot(PointKind kind, uint32_t instance,
                                 unsigned level) const {
    return (*registry.find(kind, instance)
                 .priority_array())[priority::slot_index(level)];
  }
};

// -----------------------------
// Priority handling
// -----------------------------

TEST_F(SimulationEngineTest, CommandShadowsSimulatorUntilRelinquished) {
  params.ao_priority16_variation = 0.25;
  registry.add(analog_def(PointKind::AnalogOutput, 5, 50.0));
  SimulationEngine engine(registry, params, 42u);

  registry.find(PointKind::AnalogOutput, 5).write_priority(8, PointValue(75.0));
  const TickReport first = engine.tick();

  EXPECT_DOUBLE_EQ(analog(PointKind::AnalogOutput, 5), 75.0);
  EXPECT_FALSE(slot(PointKind::AnalogOutput, 5, 16).has_value());
  EXPECT_EQ(first.held, 1u);
  EXPECT_EQ(first.updated, 0u);

  registry.find(PointKind::AnalogOutput, 5).write_priority(8, std::nullopt);
  engine.tick();

  const double v = analog(PointKind::AnalogOutput, 5);
  EXPECT_GE(v, 75.0 - 18.75);
  EXPECT_LE(v, 75.0 + 18.75);
  EXPECT_EQ(registry.find(PointKind::AnalogOutput, 5).active_level(), 16u);
  EXPECT_EQ(slot(PointKind::AnalogOutput, 5, 16), PointValue(v));
}

TEST_F(SimulationEngineTest, ReleaseAfterSimulatorRunResumesFromCommand) {
  params.ao_priority16_variation = 0.25;
  registry.add(analog_def(PointKind::AnalogOutput, 5, 50.0));
  SimulationEngine engine(registry, params, 42u);
  Point &ao = registry.find(PointKind::AnalogOutput, 5);

  // Slot 16 already holds an automatic value when the command arrives
  engine.tick();
  ASSERT_TRUE(slot(PointKind::AnalogOutput, 5, 16).has_value());

  ao.write_priority(8, PointValue(75.0));
  engine.tick();
  ao.write_priority(8, std::nullopt);
  engine.tick();

  const double v = analog(PointKind::AnalogOutput, 5);
  EXPECT_GE(v, 75.0 - 18.75);
  EXPECT_LE(v, 75.0 + 18.75);
  EXPECT_EQ(ao.active_level(), 16u);
}

TEST_F(SimulationEngineTest, Slot16WrittenWhileHeldWinsOnRelease) {
  params.ao_priority16_variation = 0.25;
  registry.add(analog_def(PointKind::AnalogOutput, 6, 50.0));
  SimulationEngine engine(registry, params, 3u);
  Point &ao = registry.find(PointKind::AnalogOutput, 6);

  engine.tick();
  ao.write_priority(8, PointValue(75.0));
  engine.tick();
  ao.write_priority(16, PointValue(20.0));
  ao.write_priority(8, std::nullopt);
  engine.tick();

  const double v = analog(PointKind::AnalogOutput, 6);
  EXPECT_GE(v, 20.0 - 5.0);
  EXPECT_LE(v, 20.0 + 5.0);
}

TEST_F(SimulationEngineTest, HeldPointsKeepSlot16Untouched) {
  auto def = analog_def(PointKind::AnalogValue, 1, 40.0);
  def.seed_priority = 16;
  registry.add(def);
  registry.add(binary_def(PointKind::BinaryOutput, 1, false));
  registry.add(multistate_def(PointKind::MultistateOutput, 1, 2));
  params.binary_flip_probability = 1.0;
  params.multistate_change_interval = 1.0;
  SimulationEngine engine(registry, params, 1u);

  registry.find(PointKind::AnalogValue, 1).write_priority(1, PointValue(10.0));
  registry.find(PointKind::BinaryOutput, 1)
      .write_priority(15, PointValue(false));
  registry.find(PointKind::MultistateOutput, 1)
      .write_priority(9, PointValue(uint32_t{3}));

  for (int i = 0; i < 20; ++i) {
    engine.tick();
  }

  EXPECT_EQ(slot(PointKind::AnalogValue, 1, 16), PointValue(40.0));
  EXPECT_FALSE(slot(PointKind::BinaryOutput, 1, 16).has_value());
  EXPECT_FALSE(slot(PointKind::MultistateOutput, 1, 16).has_value());
  EXPECT_EQ(registry.find(PointKind::MultistateOutput, 1).effective_value(),
            PointValue(uint32_t{3}));
}

TEST_F(SimulationEngineTest, OneTickChangesSlot16WhenUnshadowed) {
  registry.add(analog_def(PointKind::AnalogOutput, 1, 50.0));
  SimulationEngine engine(registry, params, 5u);

  const TickReport report = engine.tick();

  EXPECT_EQ(report.updated, 1u);
  ASSERT_TRUE(slot(PointKind::AnalogOutput, 1, 16).has_value());
  EXPECT_NE(analog(PointKind::AnalogOutput, 1), 50.0);
  EXPECT_EQ(slot(PointKind::AnalogOutput, 1, 16),
            PointValue(analog(PointKind::AnalogOutput, 1)));
}

TEST_F(SimulationEngineTest, LegacyModeWritesSlot16UnderCommand) {
  params.priority_aware_simulation = false;
  registry.add(analog_def(PointKind::AnalogOutput, 2, 50.0));
  SimulationEngine engine(registry, params, 9u);

  registry.find(PointKind::AnalogOutput, 2).write_priority(8, PointValue(75.0));
  engine.tick();

  EXPECT_TRUE(slot(PointKind::AnalogOutput, 2, 16).has_value());
  EXPECT_DOUBLE_EQ(analog(PointKind::AnalogOutput, 2), 75.0);
}

// -----------------------------
// Update rules
// -----------------------------

TEST_F(SimulationEngineTest, CertainFlipInvertsBinaryInput) {
  params.binary_flip_probability = 1.0;
  registry.add(binary_def(PointKind::BinaryInput, 1, false));
  SimulationEngine engine(registry, params, 3u);

  engine.tick();

  EXPECT_EQ(registry.find(PointKind::BinaryInput, 1).effective_value(),
            PointValue(true));
}

TEST_F(SimulationEngineTest, BinaryFlipRateMatchesProbability) {
  params.binary_flip_probability = 0.1;
  registry.add(binary_def(PointKind::BinaryInput, 1, false));
  SimulationEngine engine(registry, params, 2024u);

  constexpr int kTicks = 20000;
  int flips = 0;
  bool prev = false;
  for (int i = 0; i < kTicks; ++i) {
    engine.tick();
    const bool now =
        std::get<bool>(registry.find(PointKind::BinaryInput, 1).effective_value());
    if (now != prev) {
      ++flips;
    }
    prev = now;
  }

  EXPECT_NEAR(static_cast<double>(flips) / kTicks, 0.1, 0.01);
}

TEST_F(SimulationEngineTest, MultistateStaysInRangeForAnySeed) {
  params.multistate_change_interval = 1.0;
  params.step_interval = 0.5;

  for (uint32_t seed : {1u, 7u, 42u, 1000u, 65535u}) {
    PointRegistry reg;
    reg.add(multistate_def(PointKind::MultistateInput, 1, 1, {"A", "B", "C"}));
    reg.add(multistate_def(PointKind::MultistateValue, 1, 4));
    reg.add(multistate_def(PointKind::MultistateOutput, 1, 1, {"Only"}));
    SimulationEngine engine(reg, params, seed);

    for (int i = 0; i < 500; ++i) {
      engine.tick();
      for (const Point &p : reg.all()) {
        const uint32_t s = std::get<uint32_t>(p.effective_value());
        ASSERT_GE(s, 1u);
        ASSERT_LE(s, p.state_count());
      }
    }
  }
}

TEST_F(SimulationEngineTest, MultistateAdvancesCyclically) {
  params.multistate_change_interval = 1.0;
  params.step_interval = 0.5;
  registry.add(multistate_def(PointKind::MultistateValue, 1, 1));
  SimulationEngine engine(registry, params, 11u);

  uint32_t prev = 1;
  int changes = 0;
  for (int i = 0; i < 200; ++i) {
    engine.tick();
    const uint32_t now = std::get<uint32_t>(
        registry.find(PointKind::MultistateValue, 1).effective_value());
    if (now != prev) {
      EXPECT_EQ(now, prev % 4 + 1);
      ++changes;
    }
    prev = now;
  }
  // Interval is at most 1.5 s, i.e. 3 ticks
  EXPECT_GE(changes, 200 / 3);
}

TEST(UpdateRulesTest, NextStateWraps) {
  EXPECT_EQ(next_state(1, 3), 2u);
  EXPECT_EQ(next_state(2, 3), 3u);
  EXPECT_EQ(next_state(3, 3), 1u);
  EXPECT_EQ(next_state(1, 1), 1u);
}

TEST(UpdateRulesTest, ChangeIntervalWithinBand) {
  Rng rng(5);
  for (int i = 0; i < 1000; ++i) {
    const double d = draw_change_interval(rng, 20.0);
    ASSERT_GE(d, 10.0);
    ASSERT_LE(d, 30.0);
  }
}

TEST(UpdateRulesTest, EveryKindHasARule) {
  for (const PointKind kind : kAllPointKinds) {
    EXPECT_NE(rule_for(kind), nullptr) << kind_name(kind);
  }
}

TEST_F(SimulationEngineTest, OutdoorTemperatureInputTracksEnvironment) {
  registry.add(analog_def(PointKind::AnalogInput, 1, 21.0,
                          PointUnit::DegreesCelsius, "OutdoorTemperature"));
  registry.add(analog_def(PointKind::AnalogInput, 2, 69.8,
                          PointUnit::DegreesFahrenheit, "OutdoorTemperatureF"));
  SimulationEngine engine(registry, params, 8u);

  for (int i = 0; i < 50; ++i) {
    engine.tick();
    const double oat = engine.environment().outdoor_temperature_c;
    EXPECT_NEAR(analog(PointKind::AnalogInput, 1), oat,
                params.ai_variation_range + 1e-9);
    EXPECT_NEAR(analog(PointKind::AnalogInput, 2), oat * 9.0 / 5.0 + 32.0,
                params.ai_variation_range + 1e-9);
  }
}

TEST_F(SimulationEngineTest, SpaceTemperatureDriftsNearNominal) {
  registry.add(analog_def(PointKind::AnalogInput, 1, 72.0,
                          PointUnit::DegreesFahrenheit, "SpaceTemperature"));
  SimulationEngine engine(registry, params, 17u);

  for (int i = 0; i < 5000; ++i) {
    engine.tick();
    const double v = analog(PointKind::AnalogInput, 1);
    ASSERT_GT(v, 65.0);
    ASSERT_LT(v, 80.0);
  }
}

TEST_F(SimulationEngineTest, AnalogOutputsRespectBounds) {
  params.ao_priority16_variation = 1.0;
  registry.add(analog_def(PointKind::AnalogOutput, 1, 95.0, PointUnit::Percent,
                          "Damper"));
  registry.add(analog_def(PointKind::AnalogInput, 2, 5.0,
                          PointUnit::CubicFeetPerMinute, "Airflow"));
  SimulationEngine engine(registry, params, 23u);

  for (int i = 0; i < 1000; ++i) {
    engine.tick();
    const double damper = analog(PointKind::AnalogOutput, 1);
    ASSERT_GE(damper, 0.0);
    ASSERT_LE(damper, 100.0);
    ASSERT_GE(analog(PointKind::AnalogInput, 2), 0.0);
  }
}

// -----------------------------
// Engine state
// -----------------------------

TEST_F(SimulationEngineTest, BuiltinSetpointsStayInTheirRange) {
  for (const auto &def : vav_sim::builtin_vav_points()) {
    registry.add(def);
  }
  SimulationEngine engine(registry, params, 11u);

  for (int i = 0; i < 2000; ++i) {
    engine.tick();
  }

  for (const Point &sp : registry.all_of(PointKind::AnalogValue)) {
    ASSERT_TRUE(sp.definition().range.has_value()) << sp.name();
    const double v = std::get<double>(sp.effective_value());
    EXPECT_GE(v, sp.definition().range->first) << sp.name();
    EXPECT_LE(v, sp.definition().range->second) << sp.name();
  }
}

TEST_F(SimulationEngineTest, SameSeedSameTrajectory) {
  PointRegistry other;
  for (PointRegistry *reg : {&registry, &other}) {
    reg->add(analog_def(PointKind::AnalogInput, 1, 72.0,
                        PointUnit::DegreesFahrenheit, "SpaceTemperature"));
    reg->add(analog_def(PointKind::AnalogOutput, 1, 50.0));
    reg->add(binary_def(PointKind::BinaryValue, 1, true));
  }
  params.binary_flip_probability = 0.3;
  SimulationEngine a(registry, params, 77u);
  SimulationEngine b(other, params, 77u);

  for (int i = 0; i < 100; ++i) {
    a.tick();
    b.tick();
  }

  for (const Point &p : registry.all()) {
    EXPECT_EQ(p.effective_value(),
              other.find(p.kind(), p.instance()).effective_value());
  }
  EXPECT_DOUBLE_EQ(a.environment().outdoor_humidity,
                   b.environment().outdoor_humidity);
}

TEST_F(SimulationEngineTest, TickAdvancesClockAndCounter) {
  params.step_interval = 0.25;
  SimulationEngine engine(registry, params, 1u);

  for (int i = 0; i < 8; ++i) {
    engine.tick();
  }

  EXPECT_EQ(engine.tick_count(), 8u);
  EXPECT_NEAR(engine.environment().elapsed_s, 2.0, 1e-12);
  EXPECT_EQ(engine.seed(), 1u);
}
