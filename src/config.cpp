#include "config.hpp"

#include <cmath>
#include <filesystem>
#include <iostream>
#include <set>
#include <stdexcept>

namespace vav_sim {

namespace fs = std::filesystem;

// -----------------------------
// Field helpers
// -----------------------------

static std::runtime_error config_error(const std::string &msg) {
  return std::runtime_error("[CONFIG] " + msg);
}

static void warn_unknown_keys(const YAML::Node &section,
                              const std::string &section_name,
                              const std::set<std::string> &known) {
  for (const auto &kv : section) {
    const std::string key = kv.first.as<std::string>();
    if (known.count(key) == 0) {
      std::cerr << "[CONFIG] Warning: unknown key '" << section_name << "."
                << key << "' ignored\n";
    }
  }
}

static YAML::Node section(const YAML::Node &root, const std::string &name) {
  const YAML::Node node = root[name];
  if (!node || node.IsNull()) {
    return YAML::Node();
  }
  if (!node.IsMap()) {
    throw config_error("'" + name + "' must be a map");
  }
  return node;
}

static double read_double(const YAML::Node &sec, const std::string &sec_name,
                          const std::string &key, double fallback, double lo,
                          double hi) {
  if (!sec || !sec[key]) {
    return fallback;
  }

  double v = 0.0;
  try {
    v = sec[key].as<double>();
  } catch (const YAML::Exception &) {
    throw config_error(sec_name + "." + key + " must be numeric");
  }
  if (!std::isfinite(v)) {
    throw config_error(sec_name + "." + key + " must be finite");
  }
  if (v < lo || v > hi) {
    throw config_error(sec_name + "." + key + " = " + std::to_string(v) +
                       " outside [" + std::to_string(lo) + ", " +
                       std::to_string(hi) + "]");
  }
  return v;
}

static bool read_bool(const YAML::Node &sec, const std::string &sec_name,
                      const std::string &key, bool fallback) {
  if (!sec || !sec[key]) {
    return fallback;
  }
  try {
    return sec[key].as<bool>();
  } catch (const YAML::Exception &) {
    throw config_error(sec_name + "." + key + " must be true or false");
  }
}

static std::string read_string(const YAML::Node &sec,
                               const std::string &sec_name,
                               const std::string &key,
                               const std::string &fallback) {
  if (!sec || !sec[key]) {
    return fallback;
  }
  try {
    return sec[key].as<std::string>();
  } catch (const YAML::Exception &) {
    throw config_error(sec_name + "." + key + " must be a string");
  }
}

static int64_t read_int(const YAML::Node &sec, const std::string &sec_name,
                        const std::string &key, int64_t fallback, int64_t lo,
                        int64_t hi) {
  if (!sec || !sec[key]) {
    return fallback;
  }

  int64_t v = 0;
  try {
    v = sec[key].as<int64_t>();
  } catch (const YAML::Exception &) {
    throw config_error(sec_name + "." + key + " must be an integer");
  }
  if (v < lo || v > hi) {
    throw config_error(sec_name + "." + key + " = " + std::to_string(v) +
                       " outside [" + std::to_string(lo) + ", " +
                       std::to_string(hi) + "]");
  }
  return v;
}

// -----------------------------
// Sections
// -----------------------------

static void parse_device(const YAML::Node &root, DeviceIdentity &device) {
  const YAML::Node sec = section(root, "device");
  if (!sec) {
    return;
  }
  warn_unknown_keys(sec, "device",
                    {"device_id", "name", "description", "port", "address"});

  device.device_id = static_cast<uint32_t>(
      read_int(sec, "device", "device_id", device.device_id, 0, 4194302));
  device.name = read_string(sec, "device", "name", device.name);
  device.description =
      read_string(sec, "device", "description", device.description);
  device.port = static_cast<uint16_t>(
      read_int(sec, "device", "port", device.port, 1024, 65535));

  if (device.name.empty()) {
    throw config_error("device.name cannot be empty");
  }
}

static void parse_simulation(const YAML::Node &root, SimulatorConfig &config) {
  const YAML::Node sec = section(root, "simulation");
  if (!sec) {
    return;
  }
  warn_unknown_keys(sec, "simulation",
                    {"step_interval", "ai_variation_range",
                     "ao_priority16_variation", "binary_flip_probability",
                     "multistate_change_interval", "temperature_drift_rate",
                     "flow_variation_factor", "priority_aware_simulation",
                     "seed"});

  auto &p = config.simulation;
  const std::string s = "simulation";

  p.step_interval = read_double(sec, s, "step_interval", p.step_interval,
                                0.01, 60.0);
  p.ai_variation_range = read_double(sec, s, "ai_variation_range",
                                     p.ai_variation_range, 0.0, 1.0);
  p.ao_priority16_variation = read_double(sec, s, "ao_priority16_variation",
                                          p.ao_priority16_variation, 0.0, 1.0);
  p.binary_flip_probability = read_double(sec, s, "binary_flip_probability",
                                          p.binary_flip_probability, 0.0, 1.0);
  p.multistate_change_interval =
      read_double(sec, s, "multistate_change_interval",
                  p.multistate_change_interval, 1.0, 3600.0);
  p.temperature_drift_rate = read_double(sec, s, "temperature_drift_rate",
                                         p.temperature_drift_rate, 0.0, 1.0);
  p.flow_variation_factor = read_double(sec, s, "flow_variation_factor",
                                        p.flow_variation_factor, 0.0, 1.0);
  p.priority_aware_simulation = read_bool(sec, s, "priority_aware_simulation",
                                          p.priority_aware_simulation);

  if (sec["seed"]) {
    config.seed = static_cast<uint32_t>(
        read_int(sec, s, "seed", 0, 0, 0xFFFFFFFFLL));
  }
}

static void parse_environment(const YAML::Node &root,
                              sim_engine::EnvironmentConfig &env) {
  const YAML::Node sec = section(root, "environment");
  if (!sec) {
    return;
  }
  warn_unknown_keys(sec, "environment",
                    {"outdoor_temp_cycle_minutes", "outdoor_temp_base",
                     "outdoor_temp_amplitude", "humidity_base",
                     "humidity_range", "humidity_step"});

  const std::string s = "environment";
  const double cycle_minutes =
      read_double(sec, s, "outdoor_temp_cycle_minutes",
                  env.cycle_period_s / 60.0, 0.1, 60.0 * 24.0 * 365.0);
  env.cycle_period_s = cycle_minutes * 60.0;
  env.outdoor_temp_base = read_double(sec, s, "outdoor_temp_base",
                                      env.outdoor_temp_base, -60.0, 60.0);
  env.outdoor_temp_amplitude = read_double(
      sec, s, "outdoor_temp_amplitude", env.outdoor_temp_amplitude, 0.0, 50.0);
  env.humidity_base =
      read_double(sec, s, "humidity_base", env.humidity_base, 0.0, 100.0);
  env.humidity_range =
      read_double(sec, s, "humidity_range", env.humidity_range, 0.0, 100.0);
  env.humidity_step =
      read_double(sec, s, "humidity_step", env.humidity_step, 0.0, 10.0);
}

static void parse_data(const YAML::Node &root, DataConfig &data) {
  const YAML::Node sec = section(root, "data");
  if (!sec) {
    return;
  }
  warn_unknown_keys(sec, "data", {"points_file", "inject_placeholders"});

  if (sec["points_file"]) {
    const std::string file = read_string(sec, "data", "points_file", "");
    if (file.empty()) {
      throw config_error("data.points_file cannot be empty");
    }
    data.points_file = file;
  }
  data.inject_placeholders =
      read_bool(sec, "data", "inject_placeholders", data.inject_placeholders);
}

static void parse_points(const YAML::Node &root,
                         std::vector<PointSpec> &points) {
  const YAML::Node list = root["points"];
  if (!list || list.IsNull()) {
    return;
  }
  if (!list.IsSequence()) {
    throw config_error("'points' must be a sequence");
  }

  for (std::size_t i = 0; i < list.size(); ++i) {
    const YAML::Node entry = list[i];
    if (!entry.IsMap()) {
      throw config_error("Invalid points[" + std::to_string(i) +
                         "]: entry must be a map");
    }

    PointSpec spec;
    spec.index = i;
    for (const auto &kv : entry) {
      spec.fields[kv.first.as<std::string>()] = kv.second;
    }
    points.push_back(std::move(spec));
  }
}

// -----------------------------
// Public API
// -----------------------------

SimulatorConfig parse_config(const YAML::Node &root,
                             const std::string &origin) {
  SimulatorConfig config;

  if (!root || root.IsNull()) {
    return config;
  }
  if (!root.IsMap()) {
    throw config_error(origin + ": top level must be a map");
  }

  try {
    parse_device(root, config.device);
    parse_simulation(root, config);
    parse_environment(root, config.simulation.environment);
    parse_data(root, config.data);
    parse_points(root, config.points);
  } catch (const YAML::Exception &e) {
    throw config_error(origin + ": " + e.what());
  }

  const auto &env = config.simulation.environment;
  if (env.humidity_base - env.humidity_range < 0.0 ||
      env.humidity_base + env.humidity_range > 100.0) {
    std::cerr << "[CONFIG] Warning: humidity band [" << env.humidity_base -
                     env.humidity_range
              << ", " << env.humidity_base + env.humidity_range
              << "] extends outside 0-100 %RH\n";
  }

  return config;
}

SimulatorConfig load_config(const std::string &path) {
  YAML::Node yaml;

  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("Failed to load config file '" + path +
                             "': " + e.what());
  }

  SimulatorConfig config = parse_config(yaml, path);
  config.config_file_path = fs::absolute(path).string();
  return config;
}

std::string resolve_config_path(const SimulatorConfig &config,
                                const std::string &path) {
  const fs::path p(path);
  if (p.is_absolute() || config.config_file_path.empty()) {
    return p.string();
  }
  return (fs::path(config.config_file_path).parent_path() / p).string();
}

} // namespace vav_sim
