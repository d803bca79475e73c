#include "points/priority_resolver.hpp"

namespace sim_points {
namespace priority {

PointValue resolve(const PriorityArray &slots,
                   const PointValue &relinquish_default) {
  for (const auto &slot : slots) {
    if (slot.has_value()) {
      return *slot;
    }
  }
  return relinquish_default;
}

std::optional<unsigned> active_level(const PriorityArray &slots) {
  for (unsigned level = 1; level <= kPriorityLevels; ++level) {
    if (slots[slot_index(level)].has_value()) {
      return level;
    }
  }
  return std::nullopt;
}

bool simulator_may_drive(const PriorityArray &slots) {
  for (unsigned level = 1; level < kLowestPriority; ++level) {
    if (slots[slot_index(level)].has_value()) {
      return false;
    }
  }
  return true;
}

bool is_valid_level(unsigned level) {
  return level >= 1 && level <= kPriorityLevels;
}

} // namespace priority
} // namespace sim_points
