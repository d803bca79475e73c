#include "points/point.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include "points/point_error.hpp"

namespace sim_points {

static std::string describe(const PointDefinition &def) {
  return std::string(kind_abbrev(def.kind)) + ":" +
         std::to_string(def.instance) +
         (def.name.empty() ? "" : " '" + def.name + "'");
}

static PointError invalid(const PointDefinition &def, const std::string &why) {
  return PointError(ErrorCode::InvalidDefinition,
                    "invalid point " + describe(def) + ": " + why);
}

static std::pair<double, double> default_bounds(PointUnit unit) {
  constexpr double kInf = std::numeric_limits<double>::infinity();
  if (unit == PointUnit::Percent ||
      unit == PointUnit::PercentRelativeHumidity) {
    return {0.0, 100.0};
  }
  if (is_flow_unit(unit) || is_pressure_unit(unit)) {
    return {0.0, kInf};
  }
  return {-kInf, kInf};
}

// -----------------------------
// Validation
// -----------------------------

void validate_definition(const PointDefinition &def) {
  if (def.instance > kMaxInstance) {
    throw invalid(def, "instance exceeds " + std::to_string(kMaxInstance));
  }
  if (def.name.empty()) {
    throw invalid(def, "name is required");
  }

  const PointFamily family = family_of(def.kind);
  if (family_of(def.initial_value) != family) {
    throw invalid(def, "initial value '" + format_value(def.initial_value) +
                           "' does not match the object type");
  }

  switch (family) {
  case PointFamily::Analog: {
    const double v = std::get<double>(def.initial_value);
    if (!std::isfinite(v)) {
      throw invalid(def, "analog initial value must be finite");
    }
    if (def.range) {
      const auto [lo, hi] = *def.range;
      if (!(lo < hi)) {
        throw invalid(def, "range min must be < max");
      }
      if (v < lo || v > hi) {
        throw invalid(def, "initial value " + format_value(def.initial_value) +
                               " outside range [" + std::to_string(lo) + ", " +
                               std::to_string(hi) + "]");
      }
    }
    break;
  }
  case PointFamily::Binary:
    break;
  case PointFamily::Multistate: {
    if (def.state_text.empty()) {
      throw invalid(def, "multistate point needs at least one state");
    }
    const uint32_t state = std::get<uint32_t>(def.initial_value);
    if (state < 1 || state > def.state_text.size()) {
      throw invalid(def, "initial state " + std::to_string(state) +
                             " outside [1, " +
                             std::to_string(def.state_text.size()) + "]");
    }
    break;
  }
  }

  if (family != PointFamily::Analog && def.range) {
    throw invalid(def, "range applies to analog points only");
  }

  if (def.seed_priority) {
    if (is_input(def.kind)) {
      throw invalid(def, "input points have no priority array");
    }
    if (!priority::is_valid_level(*def.seed_priority)) {
      throw invalid(def, "priority level must be 1..16");
    }
  }
}

// -----------------------------
// Point
// -----------------------------

Point::Point(PointDefinition def)
    : def_(std::move(def)), relinquish_default_(def_.initial_value),
      present_value_(def_.initial_value),
      last_update_(std::chrono::steady_clock::now()) {
  validate_definition(def_);

  if (family_of(def_.kind) == PointFamily::Analog) {
    profile_ = classify_analog(def_.unit, def_.name);
  }
  bounds_ = def_.range ? *def_.range : default_bounds(def_.unit);

  if (def_.seed_priority) {
    slots_[priority::slot_index(*def_.seed_priority)] = def_.initial_value;
  }
}

PointValue Point::effective_value() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (is_input(def_.kind)) {
    return present_value_;
  }
  return priority::resolve(slots_, relinquish_default_);
}

std::optional<unsigned> Point::active_level() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (is_input(def_.kind)) {
    return std::nullopt;
  }
  return priority::active_level(slots_);
}

std::optional<PriorityArray> Point::priority_array() const {
  if (is_input(def_.kind)) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return slots_;
}

std::optional<PrioritySnapshot> Point::priority_snapshot() const {
  if (is_input(def_.kind)) {
    return std::nullopt;
  }
  PrioritySnapshot snap;
  snap.relinquish_default = relinquish_default_;

  std::lock_guard<std::mutex> lock(mutex_);
  snap.slots = slots_;
  snap.effective_value = priority::resolve(slots_, relinquish_default_);
  snap.active_level = priority::active_level(slots_);
  return snap;
}

PointSummary Point::summary() const {
  PointSummary s;
  s.kind = def_.kind;
  s.instance = def_.instance;
  s.name = def_.name;
  s.description = def_.description;
  s.unit = def_.unit;
  s.state_text = def_.state_text;
  s.commandable = is_commandable(def_.kind);

  std::lock_guard<std::mutex> lock(mutex_);
  if (is_input(def_.kind)) {
    s.value = present_value_;
  } else {
    s.value = priority::resolve(slots_, relinquish_default_);
    s.active_level = priority::active_level(slots_);
  }
  return s;
}

std::chrono::steady_clock::time_point Point::last_update_time() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_update_;
}

void Point::write_priority(unsigned level,
                           const std::optional<PointValue> &value) {
  if (is_input(def_.kind)) {
    throw PointError(ErrorCode::ReadOnly,
                     describe(def_) + " is an input and cannot be commanded");
  }
  if (!priority::is_valid_level(level)) {
    throw PointError(ErrorCode::InvalidPriority,
                     "priority " + std::to_string(level) +
                         " outside 1..16 for " + describe(def_));
  }
  if (value) {
    check_value(*value);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  slots_[priority::slot_index(level)] = value;
  if (level == kLowestPriority && value) {
    resume_from_held_ = false;
  }
}

void Point::check_value(const PointValue &value) const {
  if (family_of(value) != family_of(def_.kind)) {
    throw PointError(ErrorCode::TypeMismatch,
                     "value '" + format_value(value) + "' does not fit " +
                         describe(def_));
  }
  if (std::holds_alternative<double>(value) &&
      !std::isfinite(std::get<double>(value))) {
    throw PointError(ErrorCode::TypeMismatch,
                     "non-finite value for " + describe(def_));
  }
  if (std::holds_alternative<uint32_t>(value)) {
    const uint32_t state = std::get<uint32_t>(value);
    if (state < 1 || state > state_count()) {
      throw PointError(ErrorCode::TypeMismatch,
                       "state " + std::to_string(state) + " outside [1, " +
                           std::to_string(state_count()) + "] for " +
                           describe(def_));
    }
  }
}

PointValue Point::coerce(const PointValue &value) const {
  if (family_of(value) != family_of(def_.kind)) {
    throw PointError(ErrorCode::TypeMismatch,
                     "simulated value '" + format_value(value) +
                         "' does not fit " + describe(def_));
  }

  if (std::holds_alternative<double>(value)) {
    const double v = std::get<double>(value);
    if (!std::isfinite(v)) {
      throw PointError(ErrorCode::TypeMismatch,
                       "simulated value is not finite for " + describe(def_));
    }
    return std::min(std::max(v, bounds_.first), bounds_.second);
  }

  if (std::holds_alternative<uint32_t>(value)) {
    const auto count = static_cast<uint32_t>(state_count());
    const uint32_t state = std::get<uint32_t>(value);
    if (state < 1) {
      return uint32_t{1};
    }
    if (state > count) {
      return (state - 1) % count + 1;
    }
  }
  return value;
}

} // namespace sim_points
