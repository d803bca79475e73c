#include "points/point_types.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <sstream>

namespace sim_points {

// -----------------------------
// Text helpers
// -----------------------------

// Lowercase and drop separators so "Multi State Value" == "multistate_value"
static std::string normalize(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (const unsigned char c : text) {
    if (c == ' ' || c == '_' || c == '-') {
      continue;
    }
    out.push_back(static_cast<char>(std::tolower(c)));
  }
  return out;
}

static std::string lowercase(const std::string &text) {
  std::string out = text;
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return out;
}

static bool contains(const std::string &haystack, const char *needle) {
  return haystack.find(needle) != std::string::npos;
}

// -----------------------------
// Kinds
// -----------------------------

PointFamily family_of(PointKind kind) {
  switch (kind) {
  case PointKind::AnalogInput:
  case PointKind::AnalogOutput:
  case PointKind::AnalogValue:
    return PointFamily::Analog;
  case PointKind::BinaryInput:
  case PointKind::BinaryOutput:
  case PointKind::BinaryValue:
    return PointFamily::Binary;
  case PointKind::MultistateInput:
  case PointKind::MultistateOutput:
  case PointKind::MultistateValue:
    return PointFamily::Multistate;
  }
  return PointFamily::Analog;
}

bool is_input(PointKind kind) {
  return kind == PointKind::AnalogInput || kind == PointKind::BinaryInput ||
         kind == PointKind::MultistateInput;
}

bool is_commandable(PointKind kind) { return !is_input(kind); }

std::size_t kind_index(PointKind kind) {
  return static_cast<std::size_t>(kind);
}

const char *kind_name(PointKind kind) {
  switch (kind) {
  case PointKind::AnalogInput:
    return "analog-input";
  case PointKind::AnalogOutput:
    return "analog-output";
  case PointKind::AnalogValue:
    return "analog-value";
  case PointKind::BinaryInput:
    return "binary-input";
  case PointKind::BinaryOutput:
    return "binary-output";
  case PointKind::BinaryValue:
    return "binary-value";
  case PointKind::MultistateInput:
    return "multi-state-input";
  case PointKind::MultistateOutput:
    return "multi-state-output";
  case PointKind::MultistateValue:
    return "multi-state-value";
  }
  return "unknown";
}

const char *kind_abbrev(PointKind kind) {
  switch (kind) {
  case PointKind::AnalogInput:
    return "AI";
  case PointKind::AnalogOutput:
    return "AO";
  case PointKind::AnalogValue:
    return "AV";
  case PointKind::BinaryInput:
    return "BI";
  case PointKind::BinaryOutput:
    return "BO";
  case PointKind::BinaryValue:
    return "BV";
  case PointKind::MultistateInput:
    return "MSI";
  case PointKind::MultistateOutput:
    return "MSO";
  case PointKind::MultistateValue:
    return "MSV";
  }
  return "?";
}

std::optional<PointKind> parse_kind(const std::string &text) {
  static const std::map<std::string, PointKind> kNames = {
      {"analoginput", PointKind::AnalogInput},
      {"ai", PointKind::AnalogInput},
      {"analogoutput", PointKind::AnalogOutput},
      {"ao", PointKind::AnalogOutput},
      {"analogvalue", PointKind::AnalogValue},
      {"av", PointKind::AnalogValue},
      {"binaryinput", PointKind::BinaryInput},
      {"bi", PointKind::BinaryInput},
      {"binaryoutput", PointKind::BinaryOutput},
      {"bo", PointKind::BinaryOutput},
      {"binaryvalue", PointKind::BinaryValue},
      {"bv", PointKind::BinaryValue},
      {"multistateinput", PointKind::MultistateInput},
      {"msi", PointKind::MultistateInput},
      {"mi", PointKind::MultistateInput},
      {"multistateoutput", PointKind::MultistateOutput},
      {"mso", PointKind::MultistateOutput},
      {"mo", PointKind::MultistateOutput},
      {"multistatevalue", PointKind::MultistateValue},
      {"msv", PointKind::MultistateValue},
      {"mv", PointKind::MultistateValue},
  };

  const auto it = kNames.find(normalize(text));
  if (it == kNames.end()) {
    return std::nullopt;
  }
  return it->second;
}

// -----------------------------
// Units
// -----------------------------

const char *unit_name(PointUnit unit) {
  switch (unit) {
  case PointUnit::NoUnits:
    return "noUnits";
  case PointUnit::DegreesFahrenheit:
    return "degreesFahrenheit";
  case PointUnit::DegreesCelsius:
    return "degreesCelsius";
  case PointUnit::Percent:
    return "percent";
  case PointUnit::PercentRelativeHumidity:
    return "percentRelativeHumidity";
  case PointUnit::CubicFeetPerMinute:
    return "cubicFeetPerMinute";
  case PointUnit::LitersPerSecond:
    return "litersPerSecond";
  case PointUnit::GallonsPerMinute:
    return "usGallonsPerMinute";
  case PointUnit::PoundsForcePerSquareInch:
    return "poundsForcePerSquareInch";
  case PointUnit::Pascals:
    return "pascals";
  case PointUnit::InchesOfWater:
    return "inchesOfWater";
  }
  return "noUnits";
}

std::optional<PointUnit> parse_unit(const std::string &text) {
  static const std::map<std::string, PointUnit> kUnits = {
      {"nounits", PointUnit::NoUnits},
      {"", PointUnit::NoUnits},
      {"degreesfahrenheit", PointUnit::DegreesFahrenheit},
      {"f", PointUnit::DegreesFahrenheit},
      {"°f", PointUnit::DegreesFahrenheit},
      {"degreescelsius", PointUnit::DegreesCelsius},
      {"c", PointUnit::DegreesCelsius},
      {"°c", PointUnit::DegreesCelsius},
      {"percent", PointUnit::Percent},
      {"%", PointUnit::Percent},
      {"percentrelativehumidity", PointUnit::PercentRelativeHumidity},
      {"%rh", PointUnit::PercentRelativeHumidity},
      {"rh", PointUnit::PercentRelativeHumidity},
      {"cubicfeetperminute", PointUnit::CubicFeetPerMinute},
      {"cfm", PointUnit::CubicFeetPerMinute},
      {"literspersecond", PointUnit::LitersPerSecond},
      {"l/s", PointUnit::LitersPerSecond},
      {"usgallonsperminute", PointUnit::GallonsPerMinute},
      {"gallonsperminute", PointUnit::GallonsPerMinute},
      {"gpm", PointUnit::GallonsPerMinute},
      {"poundsforcepersquareinch", PointUnit::PoundsForcePerSquareInch},
      {"psi", PointUnit::PoundsForcePerSquareInch},
      {"pascals", PointUnit::Pascals},
      {"pa", PointUnit::Pascals},
      {"inchesofwater", PointUnit::InchesOfWater},
      {"inwc", PointUnit::InchesOfWater},
      {"\"wc", PointUnit::InchesOfWater},
  };

  const auto it = kUnits.find(normalize(text));
  if (it == kUnits.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool is_temperature_unit(PointUnit unit) {
  return unit == PointUnit::DegreesFahrenheit ||
         unit == PointUnit::DegreesCelsius;
}

bool is_flow_unit(PointUnit unit) {
  return unit == PointUnit::CubicFeetPerMinute ||
         unit == PointUnit::LitersPerSecond ||
         unit == PointUnit::GallonsPerMinute;
}

bool is_pressure_unit(PointUnit unit) {
  return unit == PointUnit::PoundsForcePerSquareInch ||
         unit == PointUnit::Pascals || unit == PointUnit::InchesOfWater;
}

AnalogProfile classify_analog(PointUnit unit, const std::string &name) {
  const std::string n = lowercase(name);

  if (is_temperature_unit(unit) || contains(n, "temp")) {
    if (contains(n, "outdoor") || contains(n, "outside") ||
        n.rfind("oat", 0) == 0) {
      return AnalogProfile::OutdoorTemperature;
    }
    return AnalogProfile::SpaceTemperature;
  }
  if (unit == PointUnit::PercentRelativeHumidity || contains(n, "humid")) {
    return AnalogProfile::Humidity;
  }
  if (is_flow_unit(unit) || contains(n, "flow") || contains(n, "cfm")) {
    return AnalogProfile::Flow;
  }
  if (is_pressure_unit(unit) || contains(n, "pressure") ||
      contains(n, "static")) {
    return AnalogProfile::Pressure;
  }
  return AnalogProfile::Generic;
}

const char *profile_name(AnalogProfile profile) {
  switch (profile) {
  case AnalogProfile::Generic:
    return "generic";
  case AnalogProfile::SpaceTemperature:
    return "space_temperature";
  case AnalogProfile::OutdoorTemperature:
    return "outdoor_temperature";
  case AnalogProfile::Humidity:
    return "humidity";
  case AnalogProfile::Flow:
    return "flow";
  case AnalogProfile::Pressure:
    return "pressure";
  }
  return "generic";
}

// -----------------------------
// Values
// -----------------------------

PointFamily family_of(const PointValue &value) {
  if (std::holds_alternative<bool>(value)) {
    return PointFamily::Binary;
  }
  if (std::holds_alternative<uint32_t>(value)) {
    return PointFamily::Multistate;
  }
  return PointFamily::Analog;
}

std::string format_value(const PointValue &value) {
  if (std::holds_alternative<bool>(value)) {
    return std::get<bool>(value) ? "active" : "inactive";
  }
  if (std::holds_alternative<uint32_t>(value)) {
    return std::to_string(std::get<uint32_t>(value));
  }
  std::ostringstream os;
  os << std::get<double>(value);
  return os.str();
}

} // namespace sim_points
