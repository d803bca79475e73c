#pragma once

#include "points/point.hpp"
#include "simulation/environment_model.hpp"
#include "simulation/sim_math.hpp"

namespace sim_engine {

// Behaviour knobs of the per-tick update rules
struct SimulationParams {
  double step_interval = 0.5; // seconds per tick
  double ai_variation_range = 0.15;
  double ao_priority16_variation = 0.25;
  double binary_flip_probability = 0.01;
  double multistate_change_interval = 20.0; // mean seconds between changes
  double temperature_drift_rate = 0.05;
  double flow_variation_factor = 0.1;
  bool priority_aware_simulation = true;
  EnvironmentConfig environment;
};

// Time since the last multistate change and the randomized interval to wait
struct MultistateTimer {
  double elapsed_s = 0.0;
  double interval_s = 0.0; // 0 until first drawn
};

struct RuleContext {
  const SimulationParams &params;
  const EnvironmentSnapshot &env;
  Rng &rng;
  MultistateTimer *timer; // set for multistate points only
};

// Maps the point's current value to its next simulated value. Rules run
// under the point's lock and only read its immutable definition.
using UpdateRule = sim_points::PointValue (*)(const RuleContext &ctx,
                                              const sim_points::Point &point,
                                              const sim_points::PointValue &current);

// Dispatch table lookup, one rule per kind
UpdateRule rule_for(sim_points::PointKind kind);

// Exposed for tests

// Next state after a timed change: cyclic, state % count + 1
uint32_t next_state(uint32_t state, std::size_t count);

// Interval drawn uniformly from [0.5, 1.5] * mean
double draw_change_interval(Rng &rng, double mean_s);

} // namespace sim_engine
