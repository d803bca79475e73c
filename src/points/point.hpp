#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "points/point_types.hpp"
#include "points/priority_resolver.hpp"

namespace sim_points {

// Snapshot handed to enumeration/discovery callers
struct PointSummary {
  PointKind kind = PointKind::AnalogInput;
  uint32_t instance = 0;
  std::string name;
  std::string description;
  PointUnit unit = PointUnit::NoUnits;
  std::vector<std::string> state_text;
  PointValue value = 0.0;
  std::optional<unsigned> active_level; // nullopt: relinquished or input
  bool commandable = false;
};

// Priority array of a commandable point together with what it resolves to,
// copied under one lock
struct PrioritySnapshot {
  PriorityArray slots{};
  PointValue relinquish_default = 0.0;
  PointValue effective_value = 0.0;
  std::optional<unsigned> active_level; // nullopt: relinquished
};

// Throws PointError(InvalidDefinition) describing the first problem found.
void validate_definition(const PointDefinition &def);

/**
 * @brief One simulated BACnet object.
 *
 * Inputs hold a simulator-driven present value. Outputs and values hold a
 * 16-slot priority array plus relinquish default; their effective value is
 * resolved on every read.
 *
 * Thread Safety:
 *   Every accessor and mutator takes the point's own mutex, so the
 *   simulation ticker and protocol writers never observe a torn update.
 */
class Point {
public:
  // Validates the definition; throws PointError(InvalidDefinition).
  explicit Point(PointDefinition def);

  Point(const Point &) = delete;
  Point &operator=(const Point &) = delete;

  // ---- Identity (immutable) ----

  const PointDefinition &definition() const { return def_; }
  PointKey key() const { return PointKey{def_.kind, def_.instance}; }
  PointKind kind() const { return def_.kind; }
  uint32_t instance() const { return def_.instance; }
  const std::string &name() const { return def_.name; }
  AnalogProfile profile() const { return profile_; }
  std::size_t state_count() const { return def_.state_text.size(); }

  // Analog simulation bounds (unit defaults unless the definition sets one)
  double lower_bound() const { return bounds_.first; }
  double upper_bound() const { return bounds_.second; }

  // Initial value of the definition, used as the drift anchor
  const PointValue &nominal_value() const { return def_.initial_value; }

  // ---- Read path ----

  PointValue effective_value() const;
  std::optional<unsigned> active_level() const;
  const PointValue &relinquish_default() const { return relinquish_default_; }

  // nullopt for input kinds
  std::optional<PriorityArray> priority_array() const;
  std::optional<PrioritySnapshot> priority_snapshot() const;

  PointSummary summary() const;

  std::chrono::steady_clock::time_point last_update_time() const;

  // ---- External write path ----

  /**
   * @brief Set (value) or clear (nullopt) one priority slot.
   *
   * @throws PointError ReadOnly for input kinds, InvalidPriority for a level
   *         outside 1..16, TypeMismatch for a value of the wrong family or a
   *         multistate state outside [1, state_count].
   */
  void write_priority(unsigned level, const std::optional<PointValue> &value);

  // ---- Simulator path ----

  /**
   * @brief Apply one simulated update atomically.
   *
   * For inputs the rule maps the present value to the next one. For
   * commandable kinds the rule maps slot 16 (or, when empty, the effective
   * value observed at the previous tick) to the new slot 16 value; with
   * priority_aware set, nothing is written while any of slots 1..15 is
   * occupied, and the first update after the command is released starts
   * from the commanded value unless slot 16 was written in between. The rule result is clamped/wrapped into range before it is
   * stored. If the rule throws, the point is left unchanged.
   *
   * @return true if the point was updated
   */
  template <typename Rule> bool drive(bool priority_aware, Rule &&rule);

  // Throws PointError(TypeMismatch) unless value fits this point.
  void check_value(const PointValue &value) const;

  // Clamp analog to bounds, wrap multistate into [1, state_count].
  PointValue coerce(const PointValue &value) const;

private:
  void mark_updated() { last_update_ = std::chrono::steady_clock::now(); }

  PointDefinition def_;
  AnalogProfile profile_ = AnalogProfile::Generic;
  std::pair<double, double> bounds_;

  PointValue relinquish_default_;
  PointValue present_value_; // inputs; last ticked effective value otherwise
  PriorityArray slots_{};    // commandable kinds

  // Held at the last tick and slot 16 not written since
  bool resume_from_held_ = false;

  std::chrono::steady_clock::time_point last_update_;

  mutable std::mutex mutex_;
};

template <typename Rule> bool Point::drive(bool priority_aware, Rule &&rule) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (is_input(def_.kind)) {
    present_value_ = coerce(rule(present_value_));
    mark_updated();
    return true;
  }

  if (priority_aware && !priority::simulator_may_drive(slots_)) {
    present_value_ = priority::resolve(slots_, relinquish_default_);
    resume_from_held_ = true;
    return false;
  }

  // After a command is released, continue from the commanded value unless
  // slot 16 was written since. Otherwise continue from slot 16, or from the
  // last ticked value when slot 16 is empty.
  auto &own = slots_[priority::slot_index(kLowestPriority)];
  const PointValue current =
      (own && !resume_from_held_) ? *own : present_value_;
  own = coerce(rule(current));
  resume_from_held_ = false;
  present_value_ = priority::resolve(slots_, relinquish_default_);
  mark_updated();
  return true;
}

} // namespace sim_points
