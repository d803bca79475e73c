#include "points/csv_points.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <stdexcept>

#include "points/point_error.hpp"

namespace sim_points {

// -----------------------------
// Text helpers
// -----------------------------

static std::string trim(const std::string &s) {
  const auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

static std::string lowercase(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

static bool has_word(const std::string &lower, const char *word) {
  return lower.find(word) != std::string::npos;
}

// Export tools write an em dash or hyphen for "no value"
static bool is_placeholder_cell(const std::string &trimmed) {
  return trimmed.empty() || trimmed == "-" || trimmed == "\xE2\x80\x94";
}

std::string CsvRow::get(const std::string &key) const {
  const auto it = fields.find(key);
  return it == fields.end() ? std::string() : it->second;
}

// -----------------------------
// CSV reading
// -----------------------------

std::vector<std::string> split_csv_line(const std::string &line) {
  std::vector<std::string> out;
  std::string cell;
  bool quoted = false;

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quoted) {
      if (c == '"') {
        if (i + 1 < line.size() && line[i + 1] == '"') {
          cell.push_back('"');
          ++i;
        } else {
          quoted = false;
        }
      } else {
        cell.push_back(c);
      }
    } else if (c == '"') {
      quoted = true;
    } else if (c == ',') {
      out.push_back(cell);
      cell.clear();
    } else if (c != '\r') {
      cell.push_back(c);
    }
  }
  out.push_back(cell);
  return out;
}

std::vector<CsvRow> read_csv(std::istream &in) {
  std::vector<CsvRow> rows;
  std::vector<std::string> header;
  std::string line;
  std::size_t line_no = 0;

  while (std::getline(in, line)) {
    ++line_no;
    if (trim(line).empty()) {
      continue;
    }

    std::vector<std::string> cells = split_csv_line(line);
    if (header.empty()) {
      // Strip a UTF-8 byte order mark from the first header cell
      if (cells[0].rfind("\xEF\xBB\xBF", 0) == 0) {
        cells[0] = cells[0].substr(3);
      }
      for (auto &cell : cells) {
        header.push_back(trim(cell));
      }
      for (const char *required : {"Type", "Instance", "Name"}) {
        if (std::find(header.begin(), header.end(), required) ==
            header.end()) {
          throw std::runtime_error(
              std::string("points CSV header is missing column '") +
              required + "'");
        }
      }
      continue;
    }

    CsvRow row;
    row.line = line_no;
    for (std::size_t i = 0; i < header.size(); ++i) {
      row.fields[header[i]] = i < cells.size() ? trim(cells[i]) : "";
    }
    rows.push_back(std::move(row));
  }

  if (header.empty()) {
    throw std::runtime_error("points CSV is empty (no header row)");
  }
  return rows;
}

// -----------------------------
// Cell parsers
// -----------------------------

std::optional<double> leading_number(const std::string &text) {
  static const std::regex kNumber(
      R"(^\s*([-+]?(?:\d+\.?\d*|\.\d+)(?:[eE][-+]?\d+)?))");
  std::smatch m;
  if (!std::regex_search(text, m, kNumber)) {
    return std::nullopt;
  }
  try {
    return std::stod(m[1].str());
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

std::optional<uint32_t> bracket_state(const std::string &text) {
  static const std::regex kBracket(R"(^\s*\[\s*(\d+)\s*\])");
  std::smatch m;
  if (!std::regex_search(text, m, kBracket)) {
    return std::nullopt;
  }
  try {
    return static_cast<uint32_t>(std::stoul(m[1].str()));
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

std::optional<bool> parse_binary_text(const std::string &text) {
  const std::string t = lowercase(trim(text));
  if (t == "active" || t == "on" || t == "true" || t == "1") {
    return true;
  }
  if (t == "inactive" || t == "off" || t == "false" || t == "0") {
    return false;
  }
  return std::nullopt;
}

std::optional<unsigned> parse_override_level(const std::string &text) {
  static const std::regex kLevel(R"(^\s*(?:(?:level|priority)\s*)?(\d+))",
                                 std::regex::icase);
  std::smatch m;
  if (!std::regex_search(text, m, kLevel)) {
    return std::nullopt;
  }
  try {
    return static_cast<unsigned>(std::stoul(m[1].str()));
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

std::vector<std::string> parse_state_text(const std::string &description) {
  static const std::regex kState(R"(\[\s*(\d+)\s*\]\s*=\s*([^,\]]+))");

  std::vector<std::pair<unsigned long, std::string>> found;
  for (auto it = std::sregex_iterator(description.begin(), description.end(),
                                      kState);
       it != std::sregex_iterator(); ++it) {
    found.emplace_back(std::stoul((*it)[1].str()), trim((*it)[2].str()));
  }

  std::stable_sort(found.begin(), found.end(),
                   [](const auto &a, const auto &b) { return a.first < b.first; });

  std::vector<std::string> states;
  states.reserve(found.size());
  for (auto &entry : found) {
    states.push_back(std::move(entry.second));
  }
  return states;
}

PointUnit infer_unit(const std::string &name, const std::string &value_text) {
  const std::string lname = lowercase(name);

  // Suffix after the number, e.g. "72.9 °F" -> "°F"
  static const std::regex kSuffix(
      R"(^\s*[-+]?(?:\d+\.?\d*|\.\d+)(?:[eE][-+]?\d+)?\s*(.*)$)");
  std::smatch m;
  if (std::regex_match(value_text, m, kSuffix)) {
    const std::string suffix = trim(m[1].str());
    if (!suffix.empty()) {
      if (auto unit = parse_unit(suffix)) {
        if (*unit == PointUnit::Percent && has_word(lname, "humid")) {
          return PointUnit::PercentRelativeHumidity;
        }
        return *unit;
      }
    }
  }

  if (has_word(lname, "temp")) {
    return PointUnit::DegreesCelsius;
  }
  if (has_word(lname, "humid")) {
    return PointUnit::PercentRelativeHumidity;
  }
  if (has_word(lname, "flow") || has_word(lname, "cfm")) {
    return PointUnit::CubicFeetPerMinute;
  }
  if (has_word(lname, "percent") || has_word(lname, "speed") ||
      has_word(lname, "damper") || has_word(lname, "valve")) {
    return PointUnit::Percent;
  }
  if (has_word(lname, "pressure") || has_word(lname, "static")) {
    return PointUnit::Pascals;
  }
  return PointUnit::NoUnits;
}

// -----------------------------
// Row -> definition
// -----------------------------

static PointError row_error(const CsvRow &row, const std::string &why) {
  return PointError(ErrorCode::InvalidDefinition,
                    "line " + std::to_string(row.line) + ": " + why);
}

static std::vector<std::string> default_states() {
  return {"State1", "State2", "State3", "State4"};
}

PointDefinition definition_from_csv(const CsvRow &row) {
  PointDefinition def;

  const std::string type = row.get("Type");
  const auto kind = parse_kind(type);
  if (!kind) {
    throw row_error(row, "unsupported object type '" + type + "'");
  }
  def.kind = *kind;

  const std::string instance = row.get("Instance");
  if (instance.empty() ||
      !std::all_of(instance.begin(), instance.end(),
                   [](unsigned char c) { return std::isdigit(c); })) {
    throw row_error(row, "invalid instance '" + instance + "'");
  }
  try {
    const unsigned long long v = std::stoull(instance);
    if (v > kMaxInstance) {
      throw row_error(row, "instance " + instance + " out of range");
    }
    def.instance = static_cast<uint32_t>(v);
  } catch (const std::out_of_range &) {
    throw row_error(row, "instance " + instance + " out of range");
  }

  def.name = row.get("Name");
  if (def.name.empty()) {
    throw row_error(row, "name is required");
  }
  def.description = row.get("Description");
  if (def.description.empty()) {
    def.description = def.name;
  }

  const std::string value_text = row.get("PresentValue");
  const std::string trimmed = trim(value_text);

  switch (family_of(def.kind)) {
  case PointFamily::Analog: {
    def.unit = infer_unit(def.name, trimmed);
    if (is_placeholder_cell(trimmed)) {
      def.initial_value = 0.0;
      break;
    }
    const auto v = leading_number(trimmed);
    if (!v) {
      throw row_error(row, "non-numeric analog value '" + trimmed + "'");
    }
    def.initial_value = *v;
    break;
  }
  case PointFamily::Binary: {
    if (is_placeholder_cell(trimmed)) {
      def.initial_value = false;
      break;
    }
    if (const auto b = parse_binary_text(trimmed)) {
      def.initial_value = *b;
    } else if (const auto v = leading_number(trimmed)) {
      def.initial_value = (*v != 0.0);
    } else {
      throw row_error(row, "unrecognized binary value '" + trimmed + "'");
    }
    break;
  }
  case PointFamily::Multistate: {
    def.state_text = parse_state_text(def.description);
    if (def.state_text.empty()) {
      def.state_text = default_states();
    }
    uint32_t state = 1;
    if (const auto s = bracket_state(trimmed)) {
      state = *s;
    } else if (const auto v = leading_number(trimmed)) {
      state = *v < 1.0 ? 1u : static_cast<uint32_t>(*v);
    }
    def.initial_value = std::max<uint32_t>(state, 1);
    break;
  }
  }

  if (is_commandable(def.kind)) {
    def.seed_priority = parse_override_level(row.get("Override"));
  }
  return def;
}

} // namespace sim_points
