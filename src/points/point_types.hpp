#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace sim_points {

// BACnet object kinds simulated by the device. Order is relied on by the
// update-rule dispatch table.
enum class PointKind : uint8_t {
  AnalogInput,
  AnalogOutput,
  AnalogValue,
  BinaryInput,
  BinaryOutput,
  BinaryValue,
  MultistateInput,
  MultistateOutput,
  MultistateValue
};

constexpr std::size_t kPointKindCount = 9;

constexpr std::array<PointKind, kPointKindCount> kAllPointKinds = {
    PointKind::AnalogInput,      PointKind::AnalogOutput,
    PointKind::AnalogValue,      PointKind::BinaryInput,
    PointKind::BinaryOutput,     PointKind::BinaryValue,
    PointKind::MultistateInput,  PointKind::MultistateOutput,
    PointKind::MultistateValue};

enum class PointFamily : uint8_t { Analog, Binary, Multistate };

// Engineering unit tags (BACnet names). Informational, but they select the
// simulation profile of analog points.
enum class PointUnit : uint8_t {
  NoUnits,
  DegreesFahrenheit,
  DegreesCelsius,
  Percent,
  PercentRelativeHumidity,
  CubicFeetPerMinute,
  LitersPerSecond,
  GallonsPerMinute,
  PoundsForcePerSquareInch,
  Pascals,
  InchesOfWater
};

// Simulation shape of an analog point, derived from unit and name.
enum class AnalogProfile : uint8_t {
  Generic,
  SpaceTemperature,
  OutdoorTemperature,
  Humidity,
  Flow,
  Pressure
};

// Point value: analog = double, binary = bool, multistate = 1-based state.
using PointValue = std::variant<double, bool, uint32_t>;

// Priority levels 1 (highest) .. 16 (lowest)
constexpr unsigned kPriorityLevels = 16;
constexpr unsigned kLowestPriority = 16;

using PriorityArray = std::array<std::optional<PointValue>, kPriorityLevels>;

// Largest valid BACnet object instance (4194303 is the wildcard).
constexpr uint32_t kMaxInstance = 4194302;

// Identity of a point inside the device
struct PointKey {
  PointKind kind = PointKind::AnalogInput;
  uint32_t instance = 0;

  bool operator<(const PointKey &other) const {
    if (kind != other.kind) {
      return kind < other.kind;
    }
    return instance < other.instance;
  }
  bool operator==(const PointKey &other) const {
    return kind == other.kind && instance == other.instance;
  }
};

// Definition record produced by the loader; validated on registration.
struct PointDefinition {
  PointKind kind = PointKind::AnalogInput;
  uint32_t instance = 0;
  std::string name;
  std::string description;
  PointValue initial_value = 0.0;
  PointUnit unit = PointUnit::NoUnits;
  std::vector<std::string> state_text;            // multistate only
  std::optional<unsigned> seed_priority;          // initial command level
  std::optional<std::pair<double, double>> range; // analog only
};

// ---- Kind helpers ----

PointFamily family_of(PointKind kind);
bool is_input(PointKind kind);
bool is_commandable(PointKind kind);
std::size_t kind_index(PointKind kind);

// "analog-input", "binary-value", ... (BACnet object type names)
const char *kind_name(PointKind kind);
// Short form used in logs: AI, AO, ..., MSV
const char *kind_abbrev(PointKind kind);

// Accepts "analog_input", "Analog Input", "analog-input", "AI",
// "Multi State Value", "multistatevalue", "MSV", ... (case-insensitive)
std::optional<PointKind> parse_kind(const std::string &text);

// ---- Unit helpers ----

const char *unit_name(PointUnit unit);
std::optional<PointUnit> parse_unit(const std::string &text);
bool is_temperature_unit(PointUnit unit);
bool is_flow_unit(PointUnit unit);
bool is_pressure_unit(PointUnit unit);

AnalogProfile classify_analog(PointUnit unit, const std::string &name);
const char *profile_name(AnalogProfile profile);

// ---- Value helpers ----

PointFamily family_of(const PointValue &value);
std::string format_value(const PointValue &value);

} // namespace sim_points
