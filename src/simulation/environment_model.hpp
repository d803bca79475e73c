#pragma once

#include "simulation/sim_math.hpp"

namespace sim_engine {

// Parameters of the shared outdoor environment (temperatures in Celsius)
struct EnvironmentConfig {
  double cycle_period_s = 20.0 * 60.0;
  double outdoor_temp_base = 21.0;
  double outdoor_temp_amplitude = 6.0;
  double humidity_base = 50.0;
  double humidity_range = 25.0;
  double humidity_step = 0.2;
};

// Values published to the update rules for one tick
struct EnvironmentSnapshot {
  double elapsed_s = 0.0;
  double outdoor_temperature_c = 0.0;
  double outdoor_humidity = 0.0;
};

/**
 * @brief Slowly varying outdoor conditions shared by all points.
 *
 * Outdoor temperature is a deterministic sine of elapsed simulated time.
 * Humidity is a bounded random walk that advances once per tick.
 */
class EnvironmentModel {
public:
  explicit EnvironmentModel(const EnvironmentConfig &config = {});

  // Deterministic in t (seconds since engine start)
  double outdoor_temperature(double t) const;

  double outdoor_humidity() const { return humidity_; }
  double elapsed() const { return elapsed_s_; }

  double humidity_min() const;
  double humidity_max() const;

  // Move time forward by dt and take one humidity step.
  void advance(double dt, Rng &rng);

  EnvironmentSnapshot snapshot() const;

  const EnvironmentConfig &config() const { return config_; }

private:
  EnvironmentConfig config_;
  double elapsed_s_ = 0.0;
  double humidity_ = 0.0;
};

} // namespace sim_engine
