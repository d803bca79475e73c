#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "simulation/update_rules.hpp"

namespace vav_sim {

// Identity reported to the BACnet host process
struct DeviceIdentity {
  uint32_t device_id = 3001;
  std::string name = "Virtual VAV Unit";
  std::string description = "Virtual BACnet VAV controller (simulated points)";
  uint16_t port = 47809; // informational; the host owns the socket
};

// Point sources
struct DataConfig {
  std::optional<std::string> points_file; // CSV, relative to the config file
  bool inject_placeholders = false;       // one placeholder per missing kind
};

// One entry of the inline `points:` list. Fields are parsed by the loader so
// a bad entry is skipped rather than failing the whole file.
struct PointSpec {
  std::size_t index = 0; // position in the list, for messages
  std::map<std::string, YAML::Node> fields;
};

// Complete simulator configuration
struct SimulatorConfig {
  std::string config_file_path; // absolute; empty when not loaded from file
  DeviceIdentity device;
  sim_engine::SimulationParams simulation;
  std::optional<uint32_t> seed;
  DataConfig data;
  std::vector<PointSpec> points;
};

// Load simulator configuration from YAML file
// Throws std::runtime_error if file cannot be read, parsed, or validated
SimulatorConfig load_config(const std::string &path);

// Parse an already loaded YAML document (origin is used in messages)
// Throws std::runtime_error on validation failure
SimulatorConfig parse_config(const YAML::Node &root,
                             const std::string &origin = "<memory>");

// Resolve a path from the config relative to the config file's directory
std::string resolve_config_path(const SimulatorConfig &config,
                                const std::string &path);

} // namespace vav_sim
