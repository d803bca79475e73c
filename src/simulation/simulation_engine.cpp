#include "simulation/simulation_engine.hpp"

#include <exception>
#include <iostream>
#include <random>

namespace sim_engine {

using sim_points::Point;
using sim_points::PointFamily;
using sim_points::PointValue;

static uint32_t resolve_seed(std::optional<uint32_t> seed) {
  if (seed) {
    return *seed;
  }
  return std::random_device{}();
}

SimulationEngine::SimulationEngine(const sim_points::PointRegistry &registry,
                                   const SimulationParams &params,
                                   std::optional<uint32_t> seed)
    : registry_(registry), params_(params), seed_(resolve_seed(seed)),
      state_(params.environment, seed_) {}

TickReport SimulationEngine::tick() {
  std::lock_guard<std::mutex> lock(mutex_);

  // Environment first: every rule this tick sees the same conditions.
  state_.environment.advance(params_.step_interval, state_.rng);
  const EnvironmentSnapshot env = state_.environment.snapshot();

  TickReport report;
  report.tick = state_.tick_count + 1;

  for (Point &point : registry_.all()) {
    try {
      MultistateTimer *timer = nullptr;
      if (sim_points::family_of(point.kind()) == PointFamily::Multistate) {
        timer = &state_.timers[point.key()];
      }

      const RuleContext ctx{params_, env, state_.rng, timer};
      const UpdateRule rule = rule_for(point.kind());

      const bool driven =
          point.drive(params_.priority_aware_simulation,
                      [&](const PointValue &current) {
                        return rule(ctx, point, current);
                      });
      if (driven) {
        ++report.updated;
      } else {
        ++report.held;
      }
    } catch (const std::exception &e) {
      ++report.failed;
      // One line per point; a persistently failing point must not flood.
      if (reported_failures_.insert(point.key()).second) {
        std::cerr << "[Engine] update failed for "
                  << sim_points::kind_abbrev(point.kind()) << ":"
                  << point.instance() << " '" << point.name()
                  << "': " << e.what() << " (skipping)\n";
      }
    }
  }

  state_.tick_count = report.tick;
  return report;
}

EnvironmentSnapshot SimulationEngine::environment() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.environment.snapshot();
}

uint64_t SimulationEngine::tick_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.tick_count;
}

} // namespace sim_engine
