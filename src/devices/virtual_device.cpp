#include "devices/virtual_device.hpp"

#include <iostream>
#include <stdexcept>

namespace sim_devices {

using sim_points::PointKind;
using sim_points::PointSummary;

VirtualDevice::VirtualDevice(const vav_sim::DeviceIdentity &identity,
                             const sim_engine::SimulationParams &params,
                             std::optional<uint32_t> seed)
    : identity_(identity), engine_(registry_, params, seed),
      runner_(engine_) {}

VirtualDevice::~VirtualDevice() { runner_.stop(); }

std::unique_ptr<VirtualDevice>
VirtualDevice::from_config(const vav_sim::SimulatorConfig &config,
                           const std::optional<std::string> &points_file_override,
                           std::optional<uint32_t> seed_override) {
  const std::optional<uint32_t> seed =
      seed_override ? seed_override : config.seed;

  auto device =
      std::make_unique<VirtualDevice>(config.device, config.simulation, seed);
  device->load_result_ =
      vav_sim::load_points(config, device->registry_, points_file_override);

  std::cerr << "[Device] " << config.device.name << " (device "
            << config.device.device_id << "): " << device->registry_.size()
            << " points, seed " << device->seed() << "\n";
  return device;
}

sim_points::Point &
VirtualDevice::add_point(const sim_points::PointDefinition &def) {
  if (runner_.running()) {
    throw std::runtime_error("cannot add points while the simulation runs");
  }
  return registry_.add(def);
}

// -----------------------------
// Point access
// -----------------------------

sim_points::PointValue VirtualDevice::get_effective_value(PointKind kind,
                                                          uint32_t instance) const {
  return registry_.find(kind, instance).effective_value();
}

void VirtualDevice::write_priority(
    PointKind kind, uint32_t instance, unsigned level,
    const std::optional<sim_points::PointValue> &value) {
  registry_.find(kind, instance).write_priority(level, value);
}

PointSummary VirtualDevice::read_point(PointKind kind, uint32_t instance) const {
  return registry_.find(kind, instance).summary();
}

std::optional<sim_points::PrioritySnapshot>
VirtualDevice::priority_array(PointKind kind, uint32_t instance) const {
  return registry_.find(kind, instance).priority_snapshot();
}

std::vector<PointSummary> VirtualDevice::list_points(PointKind kind) const {
  std::vector<PointSummary> out;
  for (const auto &point : registry_.all_of(kind)) {
    out.push_back(point.summary());
  }
  return out;
}

std::vector<PointSummary> VirtualDevice::list_all_points() const {
  std::vector<PointSummary> out;
  out.reserve(registry_.size());
  for (const auto &point : registry_.all()) {
    out.push_back(point.summary());
  }
  return out;
}

// -----------------------------
// Simulation
// -----------------------------

void VirtualDevice::start() { runner_.start(); }

void VirtualDevice::stop() { runner_.stop(); }

sim_engine::TickReport VirtualDevice::step() { return engine_.tick(); }

sim_engine::EnvironmentSnapshot VirtualDevice::environment() const {
  return engine_.environment();
}

DeviceHealth VirtualDevice::health() const {
  const sim_engine::RunnerStats stats = runner_.stats();

  DeviceHealth h;
  h.ticks = engine_.tick_count();
  h.overruns = stats.overruns;
  h.failed_updates = stats.failed_updates;
  h.last_tick_ms = stats.last_tick_ms;
  h.running = stats.running;
  h.point_count = registry_.size();
  h.load_failures = load_result_.failed;
  return h;
}

} // namespace sim_devices
