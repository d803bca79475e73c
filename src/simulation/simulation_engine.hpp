#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>

#include "points/point_registry.hpp"
#include "simulation/environment_model.hpp"
#include "simulation/update_rules.hpp"

namespace sim_engine {

// Outcome of one tick
struct TickReport {
  uint64_t tick = 0;
  std::size_t updated = 0; // points the simulator drove
  std::size_t held = 0;    // commandable points shadowed by slots 1..15
  std::size_t failed = 0;  // points whose update raised and were skipped
};

// All mutable simulation state, owned by one engine instance
struct SimulationState {
  explicit SimulationState(const EnvironmentConfig &env, uint32_t seed)
      : environment(env), rng(seed) {}

  EnvironmentModel environment;
  Rng rng;
  std::map<sim_points::PointKey, MultistateTimer> timers;
  uint64_t tick_count = 0;
};

/**
 * @brief Advances every registered point by one logical tick.
 *
 * Each tick advances the environment once, then applies the kind's update
 * rule to every eligible point. A failure on one point is logged and
 * skipped.
 *
 * Thread Safety:
 *   tick() and the read accessors are serialized by an internal mutex, so
 *   ticks never overlap. Point mutations go through the point's own lock.
 */
class SimulationEngine {
public:
  // Without a seed the generator is seeded from std::random_device.
  SimulationEngine(const sim_points::PointRegistry &registry,
                   const SimulationParams &params,
                   std::optional<uint32_t> seed = std::nullopt);

  SimulationEngine(const SimulationEngine &) = delete;
  SimulationEngine &operator=(const SimulationEngine &) = delete;

  TickReport tick();

  EnvironmentSnapshot environment() const;
  uint64_t tick_count() const;
  uint32_t seed() const { return seed_; }

  const SimulationParams &params() const { return params_; }

private:
  const sim_points::PointRegistry &registry_;
  const SimulationParams params_;
  const uint32_t seed_;

  SimulationState state_;
  std::set<sim_points::PointKey> reported_failures_;

  mutable std::mutex mutex_;
};

} // namespace sim_engine
