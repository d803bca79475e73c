#include "simulation/environment_model.hpp"

namespace sim_engine {

EnvironmentModel::EnvironmentModel(const EnvironmentConfig &config)
    : config_(config), humidity_(config.humidity_base) {}

double EnvironmentModel::outdoor_temperature(double t) const {
  return sine_cycle(config_.outdoor_temp_base, config_.outdoor_temp_amplitude,
                    t, config_.cycle_period_s);
}

double EnvironmentModel::humidity_min() const {
  return config_.humidity_base - config_.humidity_range;
}

double EnvironmentModel::humidity_max() const {
  return config_.humidity_base + config_.humidity_range;
}

void EnvironmentModel::advance(double dt, Rng &rng) {
  elapsed_s_ += dt;
  humidity_ = clamp(humidity_ + symmetric_noise(rng, config_.humidity_step),
                    humidity_min(), humidity_max());
}

EnvironmentSnapshot EnvironmentModel::snapshot() const {
  EnvironmentSnapshot s;
  s.elapsed_s = elapsed_s_;
  s.outdoor_temperature_c = outdoor_temperature(elapsed_s_);
  s.outdoor_humidity = humidity_;
  return s;
}

} // namespace sim_engine
