#include "points/point_registry.hpp"

#include <algorithm>

#include "points/point_error.hpp"

namespace sim_points {

Point &PointRegistry::add(PointDefinition def) {
  // Construct first: validation failures must not touch the index.
  auto point = std::make_unique<Point>(std::move(def));
  const PointKey key = point->key();

  std::lock_guard<std::mutex> lock(mutex_);
  if (index_.count(key) > 0) {
    throw PointError(ErrorCode::DuplicateInstance,
                     std::string("duplicate instance ") +
                         kind_abbrev(key.kind) + ":" +
                         std::to_string(key.instance));
  }

  points_.reserve(points_.size() + 1);
  Point &ref = *point;
  index_.emplace(key, &ref);
  points_.push_back(std::move(point));
  return ref;
}

Point &PointRegistry::find(PointKind kind, uint32_t instance) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = index_.find(PointKey{kind, instance});
  if (it == index_.end()) {
    throw PointError(ErrorCode::NotFound, std::string("no such point ") +
                                              kind_abbrev(kind) + ":" +
                                              std::to_string(instance));
  }
  return *it->second;
}

bool PointRegistry::contains(PointKind kind, uint32_t instance) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return index_.count(PointKey{kind, instance}) > 0;
}

std::size_t PointRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return points_.size();
}

std::size_t PointRegistry::count(PointKind kind) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<std::size_t>(
      std::count_if(points_.begin(), points_.end(),
                    [kind](const auto &p) { return p->kind() == kind; }));
}

uint32_t PointRegistry::max_instance() const {
  std::lock_guard<std::mutex> lock(mutex_);
  uint32_t highest = 0;
  for (const auto &p : points_) {
    highest = std::max(highest, p->instance());
  }
  return highest;
}

} // namespace sim_points
