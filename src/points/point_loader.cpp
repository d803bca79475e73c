#include "points/point_loader.hpp"

#include <fstream>
#include <iostream>
#include <set>
#include <stdexcept>
#include <utility>

#include "points/csv_points.hpp"
#include "points/point_error.hpp"

namespace vav_sim {

using sim_points::ErrorCode;
using sim_points::PointDefinition;
using sim_points::PointError;
using sim_points::PointFamily;
using sim_points::PointKind;
using sim_points::PointUnit;

// -----------------------------
// YAML entries
// -----------------------------

static PointError entry_error(const PointSpec &spec, const std::string &why) {
  return PointError(ErrorCode::InvalidDefinition,
                    "points[" + std::to_string(spec.index) + "]: " + why);
}

static const YAML::Node *field(const PointSpec &spec, const std::string &key) {
  const auto it = spec.fields.find(key);
  if (it == spec.fields.end() || it->second.IsNull()) {
    return nullptr;
  }
  return &it->second;
}

static std::string required_string(const PointSpec &spec,
                                   const std::string &key) {
  const YAML::Node *node = field(spec, key);
  if (!node) {
    throw entry_error(spec, "missing required field '" + key + "'");
  }
  return node->as<std::string>();
}

// Expected format: sequence with 2 elements
static std::pair<double, double> parse_range(const PointSpec &spec,
                                             const YAML::Node &node) {
  if (!node.IsSequence() || node.size() != 2) {
    throw entry_error(spec, "range must be a 2-element sequence [min, max]");
  }
  return {node[0].as<double>(), node[1].as<double>()};
}

static sim_points::PointValue parse_value(const PointSpec &spec,
                                          PointFamily family,
                                          const YAML::Node *node) {
  switch (family) {
  case PointFamily::Analog:
    if (!node) {
      return 0.0;
    }
    try {
      return node->as<double>();
    } catch (const YAML::Exception &) {
      throw entry_error(spec, "non-numeric analog value '" +
                                  node->as<std::string>() + "'");
    }

  case PointFamily::Binary: {
    if (!node) {
      return false;
    }
    const std::string text = node->as<std::string>();
    if (const auto b = sim_points::parse_binary_text(text)) {
      return *b;
    }
    bool b = false;
    if (YAML::convert<bool>::decode(*node, b)) {
      return b;
    }
    throw entry_error(spec, "unrecognized binary value '" + text + "'");
  }

  case PointFamily::Multistate: {
    if (!node) {
      return uint32_t{1};
    }
    int64_t state = 0;
    try {
      state = node->as<int64_t>();
    } catch (const YAML::Exception &) {
      throw entry_error(spec, "multistate value must be a state number");
    }
    if (state < 1 || state > 0xFFFFFFFFLL) {
      throw entry_error(spec, "multistate value must be >= 1");
    }
    return static_cast<uint32_t>(state);
  }
  }
  return 0.0;
}

PointDefinition definition_from_yaml(const PointSpec &spec) {
  static const std::set<std::string> kKnown = {
      "type",  "instance", "name",     "value", "description",
      "units", "states",   "priority", "range"};
  for (const auto &kv : spec.fields) {
    if (kKnown.count(kv.first) == 0) {
      std::cerr << "[Loader] Warning: points[" << spec.index
                << "]: unknown field '" << kv.first << "' ignored\n";
    }
  }

  PointDefinition def;
  try {
    const std::string type = required_string(spec, "type");
    const auto kind = sim_points::parse_kind(type);
    if (!kind) {
      throw entry_error(spec, "unsupported object type '" + type + "'");
    }
    def.kind = *kind;

    const YAML::Node *instance = field(spec, "instance");
    if (!instance) {
      throw entry_error(spec, "missing required field 'instance'");
    }
    const int64_t inst = instance->as<int64_t>();
    if (inst < 0 || inst > sim_points::kMaxInstance) {
      throw entry_error(spec, "instance " + std::to_string(inst) +
                                  " out of range");
    }
    def.instance = static_cast<uint32_t>(inst);

    def.name = required_string(spec, "name");
    def.description = def.name;
    if (const YAML::Node *desc = field(spec, "description")) {
      def.description = desc->as<std::string>();
    }

    const PointFamily family = sim_points::family_of(def.kind);
    def.initial_value = parse_value(spec, family, field(spec, "value"));

    if (const YAML::Node *units = field(spec, "units")) {
      const std::string text = units->as<std::string>();
      const auto unit = sim_points::parse_unit(text);
      if (!unit) {
        throw entry_error(spec, "unknown units '" + text + "'");
      }
      def.unit = *unit;
    } else if (family == PointFamily::Analog) {
      def.unit = sim_points::infer_unit(def.name, "");
    }

    if (const YAML::Node *states = field(spec, "states")) {
      if (!states->IsSequence()) {
        throw entry_error(spec, "states must be a sequence of strings");
      }
      for (const auto &s : *states) {
        def.state_text.push_back(s.as<std::string>());
      }
    }

    if (const YAML::Node *priority = field(spec, "priority")) {
      def.seed_priority = priority->as<unsigned>();
    }
    if (const YAML::Node *range = field(spec, "range")) {
      def.range = parse_range(spec, *range);
    }
  } catch (const YAML::Exception &e) {
    throw entry_error(spec, e.what());
  }

  return def;
}

// -----------------------------
// Registration
// -----------------------------

static void record_failure(LoadResult &result, const std::string &what) {
  ++result.failed;
  result.errors.push_back(what);
  std::cerr << "[Loader] skipped: " << what << "\n";
}

void register_definitions(const std::vector<PointDefinition> &defs,
                          sim_points::PointRegistry &registry,
                          LoadResult &result) {
  for (const auto &def : defs) {
    try {
      registry.add(def);
      ++result.loaded;
    } catch (const PointError &e) {
      record_failure(result, std::string(sim_points::error_code_name(e.code())) +
                                 ": " + e.what());
    }
  }
}

void load_csv_points(const std::string &path,
                     sim_points::PointRegistry &registry, LoadResult &result) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("cannot open points file '" + path + "'");
  }

  const auto rows = sim_points::read_csv(in);
  std::vector<PointDefinition> defs;
  defs.reserve(rows.size());
  for (const auto &row : rows) {
    try {
      defs.push_back(sim_points::definition_from_csv(row));
    } catch (const std::exception &e) {
      record_failure(result, path + " " + e.what());
    }
  }

  register_definitions(defs, registry, result);
  std::cerr << "[Loader] " << path << ": " << rows.size() << " rows\n";
}

std::size_t inject_placeholders(sim_points::PointRegistry &registry,
                                LoadResult &result) {
  uint32_t next = registry.max_instance();
  std::size_t added = 0;

  for (const PointKind kind : sim_points::kAllPointKinds) {
    if (registry.count(kind) > 0) {
      continue;
    }

    // Instances are unique per kind, so an empty kind can take any number
    // once the top of the range is used up.
    next = next >= sim_points::kMaxInstance ? 0 : next + 1;

    PointDefinition def;
    def.kind = kind;
    def.instance = next;
    def.name = std::string("Placeholder ") + sim_points::kind_name(kind);
    def.description = "Not present on the physical VAV; added for testing.";
    switch (sim_points::family_of(kind)) {
    case PointFamily::Analog:
      def.initial_value = 0.0;
      break;
    case PointFamily::Binary:
      def.initial_value = false;
      break;
    case PointFamily::Multistate:
      def.initial_value = uint32_t{1};
      def.state_text = {"State1", "State2"};
      break;
    }

    try {
      registry.add(def);
      ++added;
    } catch (const PointError &e) {
      record_failure(result, std::string(sim_points::error_code_name(e.code())) +
                                 ": " + e.what());
    }
  }
  return added;
}

// -----------------------------
// Built-in point set
// -----------------------------

static PointDefinition analog(PointKind kind, uint32_t instance,
                              const std::string &name, PointUnit unit,
                              double value, const std::string &desc) {
  PointDefinition d;
  d.kind = kind;
  d.instance = instance;
  d.name = name;
  d.description = desc;
  d.unit = unit;
  d.initial_value = value;
  return d;
}

static PointDefinition bounded(PointDefinition def, double lo, double hi) {
  def.range = std::make_pair(lo, hi);
  return def;
}

static PointDefinition binary(PointKind kind, uint32_t instance,
                              const std::string &name, bool value,
                              const std::string &desc) {
  PointDefinition d;
  d.kind = kind;
  d.instance = instance;
  d.name = name;
  d.description = desc;
  d.initial_value = value;
  return d;
}

static PointDefinition multistate(PointKind kind, uint32_t instance,
                                  const std::string &name,
                                  std::vector<std::string> states,
                                  uint32_t value, const std::string &desc) {
  PointDefinition d;
  d.kind = kind;
  d.instance = instance;
  d.name = name;
  d.description = desc;
  d.state_text = std::move(states);
  d.initial_value = value;
  return d;
}

std::vector<PointDefinition> builtin_vav_points() {
  using K = PointKind;
  using U = PointUnit;
  return {
      analog(K::AnalogInput, 1, "SpaceTemperature", U::DegreesFahrenheit, 72.0,
             "Zone space temperature"),
      analog(K::AnalogInput, 2, "OutdoorTemperature", U::DegreesFahrenheit,
             69.8, "Outdoor air temperature"),
      analog(K::AnalogInput, 3, "DischargeTemperature", U::DegreesFahrenheit,
             55.0, "Discharge air temperature"),
      analog(K::AnalogInput, 4, "Airflow", U::CubicFeetPerMinute, 350.0,
             "Primary airflow"),
      analog(K::AnalogInput, 5, "SpaceHumidity", U::PercentRelativeHumidity,
             45.0, "Zone relative humidity"),
      analog(K::AnalogInput, 6, "DuctStaticPressure", U::InchesOfWater, 1.0,
             "Inlet duct static pressure"),
      analog(K::AnalogOutput, 1, "Damper", U::Percent, 30.0,
             "Primary air damper command"),
      analog(K::AnalogOutput, 2, "Reheat", U::Percent, 0.0,
             "Reheat valve command"),
      bounded(analog(K::AnalogValue, 1, "HeatSetpoint", U::DegreesFahrenheit,
                     70.0, "Occupied heating setpoint"),
              60.0, 78.0),
      bounded(analog(K::AnalogValue, 2, "CoolSetpoint", U::DegreesFahrenheit,
                     74.0, "Occupied cooling setpoint"),
              68.0, 85.0),
      binary(K::BinaryInput, 1, "OccupancySensor", false,
             "Zone occupancy sensor"),
      binary(K::BinaryOutput, 1, "OccupiedCommand", true,
             "Occupied/unoccupied command"),
      binary(K::BinaryValue, 1, "FanEnable", true, "Series fan enable"),
      multistate(K::MultistateInput, 1, "OperationStatus", {"OK", "Fault", "Off"},
                 1, "Controller operation status"),
      multistate(K::MultistateOutput, 1, "FanSpeed",
                 {"Off", "Low", "Medium", "High"}, 2, "Fan speed command"),
      multistate(K::MultistateValue, 1, "OperationMode",
                 {"Cooling", "Heating", "Ventilating", "Fault"}, 1,
                 "Active operating mode"),
  };
}

// -----------------------------
// Entry point
// -----------------------------

LoadResult load_points(const SimulatorConfig &config,
                       sim_points::PointRegistry &registry,
                       const std::optional<std::string> &points_file_override) {
  LoadResult result;

  std::optional<std::string> csv_path;
  if (points_file_override) {
    csv_path = *points_file_override;
  } else if (config.data.points_file) {
    csv_path = resolve_config_path(config, *config.data.points_file);
  }

  if (csv_path) {
    try {
      load_csv_points(*csv_path, registry, result);
    } catch (const std::runtime_error &e) {
      std::cerr << "[Loader] Warning: " << e.what() << "\n";
    }
  }

  std::vector<PointDefinition> inline_defs;
  for (const auto &spec : config.points) {
    try {
      inline_defs.push_back(definition_from_yaml(spec));
    } catch (const PointError &e) {
      record_failure(result, e.what());
    }
  }
  register_definitions(inline_defs, registry, result);

  if (registry.size() == 0) {
    std::cerr << "[Loader] no points configured; installing built-in VAV "
                 "point set\n";
    register_definitions(builtin_vav_points(), registry, result);
    result.used_builtin = true;
  }

  if (config.data.inject_placeholders) {
    result.placeholders = inject_placeholders(registry, result);
  }

  std::cerr << "[Loader] loaded " << result.loaded << " points ("
            << result.failed << " failed, " << result.placeholders
            << " placeholders)\n";
  return result;
}

} // namespace vav_sim
