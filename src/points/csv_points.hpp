#pragma once

#include <cstddef>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "points/point_types.hpp"

namespace sim_points {

// One data row of a point export, keyed by header name
struct CsvRow {
  std::size_t line = 0; // 1-based line in the source
  std::map<std::string, std::string> fields;

  std::string get(const std::string &key) const;
};

// Split one CSV record; double quotes protect commas, "" is a literal quote.
std::vector<std::string> split_csv_line(const std::string &line);

// Read a header row plus data rows. Blank lines are skipped.
// Throws std::runtime_error if the header lacks Type, Instance or Name.
std::vector<CsvRow> read_csv(std::istream &in);

/**
 * @brief Build a point definition from an export row
 *        (Type,Instance,Name,PresentValue,Override,Description).
 *
 * @throws PointError(InvalidDefinition) for unknown types, bad instances or
 *         non-numeric analog values.
 */
PointDefinition definition_from_csv(const CsvRow &row);

// ---- Cell parsers (exposed for tests) ----

// "72.9 °F" -> 72.9, "100 %" -> 100
std::optional<double> leading_number(const std::string &text);

// "[2] Heating" -> 2
std::optional<uint32_t> bracket_state(const std::string &text);

// active/inactive, on/off, true/false, 1/0
std::optional<bool> parse_binary_text(const std::string &text);

// "Level 16", "Priority 8", "16" -> level; empty -> nullopt
std::optional<unsigned> parse_override_level(const std::string &text);

// "[1]=Cooling, [2]=Heating" -> {"Cooling", "Heating"} ordered by index
std::vector<std::string> parse_state_text(const std::string &description);

// Unit from the value suffix, falling back to name keywords
PointUnit infer_unit(const std::string &name, const std::string &value_text);

} // namespace sim_points
