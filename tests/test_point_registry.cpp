#include <gtest/gtest.h>

#include <vector>

#include "points/point_error.hpp"
#include "points/point_registry.hpp"
#include "test_support.hpp"

using namespace sim_points;
using test_support::analog_def;
using test_support::binary_def;
using test_support::multistate_def;

class PointRegistryTest : public ::testing::Test {
protected:
  PointRegistry registry;
};

TEST_F(PointRegistryTest, AddAndFind) {
  Point &added = registry.add(analog_def(PointKind::AnalogOutput, 5, 50.0));

  Point &found = registry.find(PointKind::AnalogOutput, 5);
  EXPECT_EQ(&added, &found);
  EXPECT_TRUE(registry.contains(PointKind::AnalogOutput, 5));
  EXPECT_EQ(registry.size(), 1u);
}

TEST_F(PointRegistryTest, SameInstanceAcrossKindsIsAllowed) {
  registry.add(analog_def(PointKind::AnalogInput, 1, 21.0));
  registry.add(analog_def(PointKind::AnalogOutput, 1, 50.0));
  registry.add(binary_def(PointKind::BinaryInput, 1, false));

  EXPECT_EQ(registry.size(), 3u);
  EXPECT_EQ(registry.count(PointKind::AnalogInput), 1u);
}

TEST_F(PointRegistryTest, DuplicateInstanceRejected) {
  registry.add(analog_def(PointKind::AnalogValue, 3, 1.0));

  try {
    registry.add(analog_def(PointKind::AnalogValue, 3, 2.0, PointUnit::NoUnits,
                            "Other"));
    FAIL() << "expected DuplicateInstance";
  } catch (const PointError &e) {
    EXPECT_EQ(e.code(), ErrorCode::DuplicateInstance);
  }

  EXPECT_EQ(registry.size(), 1u);
  EXPECT_EQ(registry.find(PointKind::AnalogValue, 3).effective_value(),
            PointValue(1.0));
}

TEST_F(PointRegistryTest, MissingPointIsNotFound) {
  registry.add(analog_def(PointKind::AnalogOutput, 5, 50.0));

  try {
    registry.find(PointKind::AnalogValue, 5);
    FAIL() << "expected NotFound";
  } catch (const PointError &e) {
    EXPECT_EQ(e.code(), ErrorCode::NotFound);
  }
  EXPECT_FALSE(registry.contains(PointKind::AnalogOutput, 6));
}

TEST_F(PointRegistryTest, MalformedDefinitionLeavesRegistryUnchanged) {
  registry.add(binary_def(PointKind::BinaryValue, 1, true));

  try {
    registry.add(multistate_def(PointKind::MultistateValue, 2, 1, {}));
    FAIL() << "expected InvalidDefinition";
  } catch (const PointError &e) {
    EXPECT_EQ(e.code(), ErrorCode::InvalidDefinition);
  }

  EXPECT_EQ(registry.size(), 1u);
  EXPECT_FALSE(registry.contains(PointKind::MultistateValue, 2));
  EXPECT_EQ(registry.count(PointKind::MultistateValue), 0u);

  // The instance is still free for a valid definition
  registry.add(multistate_def(PointKind::MultistateValue, 2, 1));
  EXPECT_EQ(registry.size(), 2u);
}

TEST_F(PointRegistryTest, ViewsFollowRegistrationOrder) {
  registry.add(analog_def(PointKind::AnalogInput, 9, 1.0));
  registry.add(binary_def(PointKind::BinaryInput, 1, false));
  registry.add(analog_def(PointKind::AnalogInput, 2, 1.0));
  registry.add(analog_def(PointKind::AnalogInput, 4, 1.0));

  std::vector<uint32_t> instances;
  for (const Point &p : registry.all_of(PointKind::AnalogInput)) {
    instances.push_back(p.instance());
  }
  EXPECT_EQ(instances, (std::vector<uint32_t>{9, 2, 4}));

  std::size_t all = 0;
  for (const Point &p : registry.all()) {
    (void)p;
    ++all;
  }
  EXPECT_EQ(all, 4u);

  EXPECT_TRUE(registry.all_of(PointKind::MultistateInput).empty());
  EXPECT_EQ(registry.max_instance(), 9u);
}

TEST_F(PointRegistryTest, EmptyRegistry) {
  EXPECT_EQ(registry.size(), 0u);
  EXPECT_EQ(registry.max_instance(), 0u);
  EXPECT_TRUE(registry.all().empty());
}
