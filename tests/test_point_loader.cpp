#include <gtest/gtest.h>

#include <string>

#include "points/point_error.hpp"
#include "points/point_loader.hpp"
#include "test_support.hpp"

using namespace vav_sim;
using sim_points::ErrorCode;
using sim_points::PointError;
using sim_points::PointKind;
using sim_points::PointRegistry;
using sim_points::PointUnit;
using sim_points::PointValue;

namespace {

SimulatorConfig config_from(const std::string &yaml) {
  return parse_config(YAML::Load(yaml), "test.yaml");
}

std::string data_file(const std::string &name) {
  return std::string(VAV_SIM_TEST_DATA_DIR) + "/" + name;
}

} // namespace

// -----------------------------
// Inline YAML entries
// -----------------------------

TEST(PointLoaderTest, DefinitionFromYaml) {
  const auto cfg = config_from(R"(
points:
  - type: Analog Value
    instance: 5
    name: HeatSetpoint
    description: Occupied heating setpoint
    units: degreesFahrenheit
    value: 70
    priority: 16
    range: [55, 85]
  - type: msv
    instance: 2
    name: Mode
    states: [Cooling, Heating]
    value: 2
  - type: binary_output
    instance: 1
    name: Fan
    value: active
)");
  ASSERT_EQ(cfg.points.size(), 3u);

  const auto av = definition_from_yaml(cfg.points[0]);
  EXPECT_EQ(av.kind, PointKind::AnalogValue);
  EXPECT_EQ(av.instance, 5u);
  EXPECT_EQ(av.description, "Occupied heating setpoint");
  EXPECT_EQ(av.unit, PointUnit::DegreesFahrenheit);
  EXPECT_EQ(av.initial_value, PointValue(70.0));
  EXPECT_EQ(av.seed_priority, 16u);
  ASSERT_TRUE(av.range.has_value());
  EXPECT_DOUBLE_EQ(av.range->first, 55.0);
  EXPECT_DOUBLE_EQ(av.range->second, 85.0);

  const auto msv = definition_from_yaml(cfg.points[1]);
  EXPECT_EQ(msv.kind, PointKind::MultistateValue);
  EXPECT_EQ(msv.initial_value, PointValue(uint32_t{2}));
  EXPECT_EQ(msv.state_text.size(), 2u);

  const auto bo = definition_from_yaml(cfg.points[2]);
  EXPECT_EQ(bo.initial_value, PointValue(true));
}

TEST(PointLoaderTest, YamlDefaultsAndUnitInference) {
  const auto cfg = config_from(R"(
points:
  - {type: AI, instance: 1, name: ZoneTemp}
  - {type: BI, instance: 1, name: Occupancy}
  - {type: MSI, instance: 1, name: Status, states: [A]}
)");

  const auto ai = definition_from_yaml(cfg.points[0]);
  EXPECT_EQ(ai.initial_value, PointValue(0.0));
  EXPECT_EQ(ai.unit, PointUnit::DegreesCelsius);
  EXPECT_EQ(ai.description, "ZoneTemp");

  EXPECT_EQ(definition_from_yaml(cfg.points[1]).initial_value,
            PointValue(false));
  EXPECT_EQ(definition_from_yaml(cfg.points[2]).initial_value,
            PointValue(uint32_t{1}));
}

TEST(PointLoaderTest, BadYamlEntriesAreInvalidDefinitions) {
  const auto cfg = config_from(R"(
points:
  - {instance: 1, name: NoType}
  - {type: AI, name: NoInstance}
  - {type: AI, instance: 1}
  - {type: widget, instance: 1, name: X}
  - {type: AI, instance: 1, name: X, value: warm}
  - {type: AI, instance: 1, name: X, units: furlongs}
  - {type: AO, instance: 1, name: X, range: [1, 2, 3]}
  - {type: MSV, instance: 1, name: X, states: Cooling}
  - {type: MSV, instance: 1, name: X, value: 0}
  - {type: AI, instance: -4, name: X}
)");

  for (const auto &spec : cfg.points) {
    try {
      definition_from_yaml(spec);
      ADD_FAILURE() << "entry " << spec.index << " should be rejected";
    } catch (const PointError &e) {
      EXPECT_EQ(e.code(), ErrorCode::InvalidDefinition);
      EXPECT_NE(std::string(e.what()).find("points[" +
                                           std::to_string(spec.index) + "]"),
                std::string::npos);
    }
  }
}

// -----------------------------
// Registration
// -----------------------------

TEST(PointLoaderTest, SkipsAndCountsFailures) {
  const auto cfg = config_from(R"(
points:
  - {type: AO, instance: 5, name: Damper, value: 50}
  - {type: AO, instance: 5, name: DamperAgain, value: 40}
  - {type: MSV, instance: 1, name: Empty, states: []}
  - {type: AI, instance: 2, name: Bad, value: hot}
  - {type: BV, instance: 3, name: Enable, value: true}
)");
  PointRegistry registry;
  const LoadResult result = load_points(cfg, registry);

  EXPECT_EQ(result.loaded, 2u);
  EXPECT_EQ(result.failed, 3u);
  EXPECT_EQ(result.errors.size(), 3u);
  EXPECT_FALSE(result.used_builtin);
  EXPECT_TRUE(registry.contains(PointKind::AnalogOutput, 5));
  EXPECT_TRUE(registry.contains(PointKind::BinaryValue, 3));
  EXPECT_EQ(registry.find(PointKind::AnalogOutput, 5).name(), "Damper");
}

TEST(PointLoaderTest, LoadsCsvExport) {
  PointRegistry registry;
  LoadResult result;
  load_csv_points(data_file("points.csv"), registry, result);

  EXPECT_EQ(result.loaded, 7u);
  EXPECT_EQ(result.failed, 3u);

  const auto &av = registry.find(PointKind::AnalogValue, 3);
  EXPECT_EQ(av.active_level(), 8u);
  EXPECT_EQ(av.effective_value(), PointValue(70.0));
  EXPECT_EQ(av.definition().unit, PointUnit::DegreesFahrenheit);

  EXPECT_EQ(registry.find(PointKind::MultistateValue, 1).effective_value(),
            PointValue(uint32_t{2}));
  EXPECT_EQ(registry.find(PointKind::AnalogInput, 1).name(),
            "SpaceTemperature");
  EXPECT_FALSE(registry.contains(PointKind::AnalogInput, 9));
}

TEST(PointLoaderTest, MissingCsvThrowsButLoadPointsContinues) {
  PointRegistry direct;
  LoadResult ignored;
  EXPECT_THROW(load_csv_points("/nonexistent/points.csv", direct, ignored),
               std::runtime_error);

  PointRegistry registry;
  const LoadResult result = load_points(SimulatorConfig{}, registry,
                                        std::string("/nonexistent/points.csv"));
  EXPECT_TRUE(result.used_builtin);
  EXPECT_EQ(registry.size(), builtin_vav_points().size());
}

TEST(PointLoaderTest, ConfigPointsFileIsRelativeToConfig) {
  const SimulatorConfig cfg = load_config(data_file("vav.yaml"));
  PointRegistry registry;
  const LoadResult result = load_points(cfg, registry);

  EXPECT_EQ(result.loaded, 7u);
  EXPECT_EQ(registry.size(), 7u);
}

TEST(PointLoaderTest, BuiltinSetWhenNothingConfigured) {
  PointRegistry registry;
  const LoadResult result = load_points(SimulatorConfig{}, registry);

  EXPECT_TRUE(result.used_builtin);
  EXPECT_EQ(result.failed, 0u);
  EXPECT_TRUE(registry.contains(PointKind::AnalogInput, 1));
  EXPECT_TRUE(registry.contains(PointKind::AnalogOutput, 1));
  EXPECT_TRUE(registry.contains(PointKind::MultistateValue, 1));
  for (const auto kind : sim_points::kAllPointKinds) {
    EXPECT_GT(registry.count(kind), 0u) << sim_points::kind_name(kind);
  }
}

TEST(PointLoaderTest, PlaceholdersFillMissingKinds) {
  const auto cfg = config_from(R"(
data:
  inject_placeholders: true
points:
  - {type: AI, instance: 7, name: SpaceTemp, value: 21}
  - {type: AO, instance: 3, name: Damper, value: 10}
)");
  PointRegistry registry;
  const LoadResult result = load_points(cfg, registry);

  EXPECT_EQ(result.placeholders, 7u);
  EXPECT_EQ(registry.size(), 9u);
  for (const auto kind : sim_points::kAllPointKinds) {
    EXPECT_EQ(registry.count(kind), 1u) << sim_points::kind_name(kind);
  }

  // Instances continue above the highest loaded one, in kind order
  const auto &av = *registry.all_of(PointKind::AnalogValue).begin();
  EXPECT_EQ(av.instance(), 8u);
  EXPECT_EQ(av.name(), "Placeholder analog-value");
  const auto &msv = *registry.all_of(PointKind::MultistateValue).begin();
  EXPECT_EQ(msv.instance(), 14u);
  EXPECT_EQ(msv.state_count(), 2u);
}

TEST(PointLoaderTest, InjectPlaceholdersIsNoOpWhenComplete) {
  PointRegistry registry;
  LoadResult result;
  register_definitions(builtin_vav_points(), registry, result);

  EXPECT_EQ(inject_placeholders(registry, result), 0u);
}

TEST(PointLoaderTest, PlaceholdersWrapPastHighestInstance) {
  PointRegistry registry;
  registry.add(test_support::analog_def(PointKind::AnalogInput,
                                        sim_points::kMaxInstance, 21.0));
  LoadResult result;

  EXPECT_EQ(inject_placeholders(registry, result), 8u);
  EXPECT_EQ(result.failed, 0u);
  EXPECT_EQ(registry.size(), 9u);
  EXPECT_TRUE(registry.contains(PointKind::AnalogOutput, 0));
  EXPECT_TRUE(registry.contains(PointKind::AnalogValue, 1));
  EXPECT_TRUE(registry.contains(PointKind::MultistateValue, 7));
}

TEST(PointLoaderTest, LoadPointsSurvivesFullInstanceRange) {
  const auto cfg = config_from(R"(
data:
  inject_placeholders: true
points:
  - {type: AI, instance: 4194302, name: SpaceTemp, value: 21}
)");
  PointRegistry registry;
  const LoadResult result = load_points(cfg, registry);

  EXPECT_EQ(result.loaded, 1u);
  EXPECT_EQ(result.placeholders, 8u);
  EXPECT_EQ(result.failed, 0u);
}
