#include "simulation/update_rules.hpp"

#include <array>
#include <cmath>

namespace sim_engine {

using sim_points::AnalogProfile;
using sim_points::Point;
using sim_points::PointKind;
using sim_points::PointUnit;
using sim_points::PointValue;

// Outdoor-to-space coupling for space temperature drift targets
static constexpr double kSpaceOutdoorCoupling = 0.25;
// Fractional swing of the slow airflow demand cycle
static constexpr double kFlowCycleDepth = 0.25;

// -----------------------------
// Helpers
// -----------------------------

uint32_t next_state(uint32_t state, std::size_t count) {
  if (count == 0) {
    return 1;
  }
  const auto n = static_cast<uint32_t>(count);
  if (state < 1 || state > n) {
    state = 1;
  }
  return state % n + 1;
}

double draw_change_interval(Rng &rng, double mean_s) {
  return uniform(rng, 0.5 * mean_s, 1.5 * mean_s);
}

static bool is_fahrenheit(const Point &point) {
  return point.definition().unit == PointUnit::DegreesFahrenheit;
}

// Noise scale (in point units) before ai_variation_range is applied
static double nominal_scale(AnalogProfile profile, double nominal) {
  switch (profile) {
  case AnalogProfile::SpaceTemperature:
  case AnalogProfile::OutdoorTemperature:
  case AnalogProfile::Humidity:
    return 1.0;
  case AnalogProfile::Pressure:
    return std::max(0.05 * std::fabs(nominal), 0.1);
  case AnalogProfile::Flow:
  case AnalogProfile::Generic:
    return std::max(0.05 * std::fabs(nominal), 1.0);
  }
  return 1.0;
}

// Timed transition shared by every multistate kind
static PointValue advance_multistate(const RuleContext &ctx, const Point &point,
                                     const PointValue &current) {
  const uint32_t state = std::get<uint32_t>(current);
  if (!ctx.timer) {
    return state;
  }

  MultistateTimer &timer = *ctx.timer;
  const double mean = ctx.params.multistate_change_interval;
  if (timer.interval_s <= 0.0) {
    timer.interval_s = draw_change_interval(ctx.rng, mean);
  }

  timer.elapsed_s += ctx.params.step_interval;
  if (timer.elapsed_s < timer.interval_s) {
    return state;
  }

  timer.elapsed_s = 0.0;
  timer.interval_s = draw_change_interval(ctx.rng, mean);
  return next_state(state, point.state_count());
}

// -----------------------------
// Rules
// -----------------------------

static PointValue update_analog_input(const RuleContext &ctx,
                                      const Point &point,
                                      const PointValue &current) {
  const SimulationParams &p = ctx.params;
  const double prev = std::get<double>(current);
  const double nominal = std::get<double>(point.nominal_value());
  const double noise = symmetric_noise(
      ctx.rng,
      p.ai_variation_range * nominal_scale(point.profile(), nominal));

  switch (point.profile()) {
  case AnalogProfile::OutdoorTemperature: {
    double oat = ctx.env.outdoor_temperature_c;
    if (is_fahrenheit(point)) {
      oat = celsius_to_fahrenheit(oat);
    }
    return oat + noise;
  }
  case AnalogProfile::SpaceTemperature: {
    double offset = kSpaceOutdoorCoupling * (ctx.env.outdoor_temperature_c -
                                             p.environment.outdoor_temp_base);
    if (is_fahrenheit(point)) {
      offset = celsius_delta_to_fahrenheit(offset);
    }
    const double target = nominal + offset;
    return prev + p.temperature_drift_rate * (target - prev) + noise;
  }
  case AnalogProfile::Humidity:
    return prev +
           p.temperature_drift_rate * (ctx.env.outdoor_humidity - prev) +
           noise;
  case AnalogProfile::Flow: {
    const double demand =
        1.0 + kFlowCycleDepth * std::sin(kTwoPi * ctx.env.elapsed_s /
                                         (2.0 * p.environment.cycle_period_s));
    return nominal * demand *
           (1.0 + uniform(ctx.rng, -p.flow_variation_factor,
                          p.flow_variation_factor));
  }
  case AnalogProfile::Pressure:
  case AnalogProfile::Generic:
    return prev + noise;
  }
  return prev;
}

static PointValue update_analog_commandable(const RuleContext &ctx,
                                            const Point & /*point*/,
                                            const PointValue &current) {
  const double prev = std::get<double>(current);
  return prev + symmetric_noise(ctx.rng, ctx.params.ao_priority16_variation *
                                             std::max(std::fabs(prev), 1.0));
}

static PointValue update_binary(const RuleContext &ctx, const Point & /*point*/,
                                const PointValue &current) {
  const bool state = std::get<bool>(current);
  if (bernoulli(ctx.rng, ctx.params.binary_flip_probability)) {
    return !state;
  }
  return state;
}

static PointValue update_multistate(const RuleContext &ctx, const Point &point,
                                    const PointValue &current) {
  return advance_multistate(ctx, point, current);
}

// -----------------------------
// Dispatch table
// -----------------------------

// No default case: adding a PointKind without a rule trips -Wswitch.
static constexpr UpdateRule select_rule(PointKind kind) {
  switch (kind) {
  case PointKind::AnalogInput:
    return &update_analog_input;
  case PointKind::AnalogOutput:
  case PointKind::AnalogValue:
    return &update_analog_commandable;
  case PointKind::BinaryInput:
  case PointKind::BinaryOutput:
  case PointKind::BinaryValue:
    return &update_binary;
  case PointKind::MultistateInput:
  case PointKind::MultistateOutput:
  case PointKind::MultistateValue:
    return &update_multistate;
  }
  return nullptr;
}

static constexpr std::array<UpdateRule, sim_points::kPointKindCount>
make_rule_table() {
  std::array<UpdateRule, sim_points::kPointKindCount> table{};
  for (const PointKind kind : sim_points::kAllPointKinds) {
    table[static_cast<std::size_t>(kind)] = select_rule(kind);
  }
  return table;
}

static constexpr auto kRuleTable = make_rule_table();

static constexpr bool table_complete() {
  for (const UpdateRule rule : kRuleTable) {
    if (rule == nullptr) {
      return false;
    }
  }
  return true;
}

static_assert(table_complete(), "every PointKind needs an update rule");

UpdateRule rule_for(PointKind kind) {
  return kRuleTable[static_cast<std::size_t>(kind)];
}

} // namespace sim_engine
