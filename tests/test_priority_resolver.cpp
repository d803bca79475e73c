#include <gtest/gtest.h>

#include "points/priority_resolver.hpp"

using namespace sim_points;

TEST(PriorityResolverTest, EmptyArrayResolvesToRelinquishDefault) {
  PriorityArray slots{};

  EXPECT_EQ(priority::resolve(slots, PointValue(50.0)), PointValue(50.0));
  EXPECT_FALSE(priority::active_level(slots).has_value());
  EXPECT_TRUE(priority::simulator_may_drive(slots));
}

TEST(PriorityResolverTest, LowestNumberedSlotWins) {
  PriorityArray slots{};
  slots[priority::slot_index(16)] = PointValue(10.0);
  slots[priority::slot_index(8)] = PointValue(75.0);
  slots[priority::slot_index(12)] = PointValue(60.0);

  EXPECT_EQ(priority::resolve(slots, PointValue(50.0)), PointValue(75.0));
  EXPECT_EQ(priority::active_level(slots), 8u);
}

TEST(PriorityResolverTest, OnlySlot16LetsSimulatorDrive) {
  PriorityArray slots{};
  slots[priority::slot_index(16)] = PointValue(true);
  EXPECT_TRUE(priority::simulator_may_drive(slots));
  EXPECT_EQ(priority::active_level(slots), 16u);

  slots[priority::slot_index(15)] = PointValue(false);
  EXPECT_FALSE(priority::simulator_may_drive(slots));

  slots[priority::slot_index(15)].reset();
  slots[priority::slot_index(1)] = PointValue(false);
  EXPECT_FALSE(priority::simulator_may_drive(slots));
  EXPECT_EQ(priority::resolve(slots, PointValue(true)), PointValue(false));
}

TEST(PriorityResolverTest, ValidLevels) {
  EXPECT_FALSE(priority::is_valid_level(0));
  EXPECT_TRUE(priority::is_valid_level(1));
  EXPECT_TRUE(priority::is_valid_level(16));
  EXPECT_FALSE(priority::is_valid_level(17));
}
