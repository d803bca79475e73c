#pragma once

#include <algorithm>
#include <cmath>
#include <random>

namespace sim_engine {

using Rng = std::mt19937;

constexpr double kTwoPi = 6.283185307179586476925286766559;

inline double clamp(double v, double lo, double hi) {
  return std::max(lo, std::min(hi, v));
}

// Uniform draw in [lo, hi]; degenerate ranges return lo
inline double uniform(Rng &rng, double lo, double hi) {
  if (!(hi > lo)) {
    return lo;
  }
  std::uniform_real_distribution<double> dist(lo, hi);
  return dist(rng);
}

// Uniform draw in [-1, 1] scaled by magnitude
inline double symmetric_noise(Rng &rng, double magnitude) {
  return uniform(rng, -1.0, 1.0) * magnitude;
}

// Independent Bernoulli trial; p outside [0, 1] is clamped
inline bool bernoulli(Rng &rng, double p) {
  std::bernoulli_distribution dist(clamp(p, 0.0, 1.0));
  return dist(rng);
}

// base + amplitude * sin(2*pi*t / period)
inline double sine_cycle(double base, double amplitude, double t,
                         double period) {
  if (period <= 0.0) {
    return base;
  }
  return base + amplitude * std::sin(kTwoPi * t / period);
}

inline double celsius_to_fahrenheit(double c) { return c * 9.0 / 5.0 + 32.0; }

// Temperature differences scale without the offset
inline double celsius_delta_to_fahrenheit(double dc) { return dc * 9.0 / 5.0; }

} // namespace sim_engine
