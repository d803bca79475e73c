#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "points/point_loader.hpp"
#include "points/point_registry.hpp"
#include "simulation/sim_runner.hpp"
#include "simulation/simulation_engine.hpp"

namespace sim_devices {

// Runtime counters reported through GetHealth
struct DeviceHealth {
  uint64_t ticks = 0;
  uint64_t overruns = 0;
  uint64_t failed_updates = 0;
  double last_tick_ms = 0.0;
  bool running = false;
  std::size_t point_count = 0;
  std::size_t load_failures = 0;
};

/**
 * @brief The virtual VAV controller: point registry, simulation engine and
 *        ticker behind one facade.
 *
 * This is the surface the protocol handlers (and an embedding BACnet stack)
 * talk to. Points are added before start(); after that the set is fixed and
 * only values change.
 *
 * Thread Safety:
 *   Reads and writes may come from any thread while the ticker runs. Each
 *   point serializes its own state; engine ticks are serialized internally.
 */
class VirtualDevice {
public:
  VirtualDevice(const vav_sim::DeviceIdentity &identity,
                const sim_engine::SimulationParams &params,
                std::optional<uint32_t> seed = std::nullopt);
  ~VirtualDevice();

  VirtualDevice(const VirtualDevice &) = delete;
  VirtualDevice &operator=(const VirtualDevice &) = delete;

  /**
   * @brief Build a device from configuration and populate its points.
   *
   * Overrides come from the command line and take precedence over the file.
   */
  static std::unique_ptr<VirtualDevice>
  from_config(const vav_sim::SimulatorConfig &config,
              const std::optional<std::string> &points_file_override =
                  std::nullopt,
              std::optional<uint32_t> seed_override = std::nullopt);

  // Register one point. Throws PointError (InvalidDefinition,
  // DuplicateInstance), or std::runtime_error once the ticker has started.
  sim_points::Point &add_point(const sim_points::PointDefinition &def);

  // ---- Point access ----

  // @throws PointError NotFound
  sim_points::PointValue get_effective_value(sim_points::PointKind kind,
                                             uint32_t instance) const;

  // Set (value) or clear (nullopt) one priority slot.
  // Errors checked in order: NotFound, ReadOnly, InvalidPriority,
  // TypeMismatch.
  void write_priority(sim_points::PointKind kind, uint32_t instance,
                      unsigned level,
                      const std::optional<sim_points::PointValue> &value);

  // @throws PointError NotFound
  sim_points::PointSummary read_point(sim_points::PointKind kind,
                                      uint32_t instance) const;

  // Slots with the value they resolve to, taken atomically.
  // nullopt for input kinds. @throws PointError NotFound
  std::optional<sim_points::PrioritySnapshot>
  priority_array(sim_points::PointKind kind, uint32_t instance) const;

  // Registration order; empty when no point of the kind exists
  std::vector<sim_points::PointSummary>
  list_points(sim_points::PointKind kind) const;
  std::vector<sim_points::PointSummary> list_all_points() const;

  // ---- Simulation ----

  void start();
  void stop();
  bool running() const { return runner_.running(); }

  // Run one tick on the caller's thread (tests, single-step tools)
  sim_engine::TickReport step();

  sim_engine::EnvironmentSnapshot environment() const;
  DeviceHealth health() const;

  const vav_sim::DeviceIdentity &identity() const { return identity_; }
  const sim_engine::SimulationParams &params() const {
    return engine_.params();
  }
  uint32_t seed() const { return engine_.seed(); }

  const sim_points::PointRegistry &registry() const { return registry_; }
  const vav_sim::LoadResult &load_result() const { return load_result_; }

private:
  vav_sim::DeviceIdentity identity_;
  sim_points::PointRegistry registry_;
  sim_engine::SimulationEngine engine_;
  sim_engine::SimulationRunner runner_;
  vav_sim::LoadResult load_result_;
};

} // namespace sim_devices
