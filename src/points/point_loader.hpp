#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "points/point_registry.hpp"

namespace vav_sim {

// Outcome of populating the registry
struct LoadResult {
  std::size_t loaded = 0;       // definitions registered
  std::size_t failed = 0;       // rows/entries rejected and skipped
  std::size_t placeholders = 0; // injected placeholder points
  bool used_builtin = false;    // nothing configured, built-in set installed
  std::vector<std::string> errors;
};

// Build a definition from one inline YAML entry.
// Throws sim_points::PointError(InvalidDefinition).
sim_points::PointDefinition definition_from_yaml(const PointSpec &spec);

/**
 * @brief Register each definition, skipping failures.
 *
 * A definition that is malformed or duplicates an existing (kind, instance)
 * is logged, counted in result.failed and skipped; loading continues.
 */
void register_definitions(const std::vector<sim_points::PointDefinition> &defs,
                          sim_points::PointRegistry &registry,
                          LoadResult &result);

// Read a CSV point export and register its rows.
// Throws std::runtime_error if the file cannot be opened or has no header.
void load_csv_points(const std::string &path,
                     sim_points::PointRegistry &registry, LoadResult &result);

// Add one "Placeholder <kind>" point for every kind with no points, at
// instances above the highest one in use (wrapping to 0 past the maximum).
// A placeholder that cannot be added is recorded in result and skipped.
// Returns the number added.
std::size_t inject_placeholders(sim_points::PointRegistry &registry,
                                LoadResult &result);

// Minimal VAV point set used when no points are configured
std::vector<sim_points::PointDefinition> builtin_vav_points();

/**
 * @brief Populate the registry from configuration.
 *
 * Order: CSV file (points_file_override or data.points_file), inline
 * `points:` entries, built-in set if still empty, then placeholders when
 * data.inject_placeholders is set.
 */
LoadResult load_points(const SimulatorConfig &config,
                       sim_points::PointRegistry &registry,
                       const std::optional<std::string> &points_file_override =
                           std::nullopt);

} // namespace vav_sim
