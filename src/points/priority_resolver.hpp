#pragma once

#include <optional>

#include "points/point_types.hpp"

namespace sim_points {

/**
 * @brief BACnet command prioritization over a 16-slot priority array.
 *
 * Slot 1 is the highest priority, slot 16 the lowest. The simulator acts as
 * the local/automatic writer at slot 16 and only drives a point while no
 * command is active at slots 1..15.
 *
 * All functions are pure; callers hold the owning point's lock.
 */
namespace priority {

/**
 * @brief Effective value: first non-empty slot, else the relinquish default.
 */
PointValue resolve(const PriorityArray &slots,
                   const PointValue &relinquish_default);

/**
 * @brief 1-based level of the winning slot, or nullopt when relinquished.
 */
std::optional<unsigned> active_level(const PriorityArray &slots);

/**
 * @brief True when slots 1..15 are all empty, i.e. no command outranks the
 * simulator's slot 16 write.
 */
bool simulator_may_drive(const PriorityArray &slots);

// Level in 1..16
bool is_valid_level(unsigned level);

// Index into PriorityArray for a valid level
inline std::size_t slot_index(unsigned level) { return level - 1; }

} // namespace priority
} // namespace sim_points
