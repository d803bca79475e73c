#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

#include "simulation/simulation_engine.hpp"

namespace sim_engine {

struct RunnerStats {
  uint64_t ticks = 0;
  uint64_t overruns = 0;       // ticks that outlasted step_interval
  uint64_t failed_updates = 0; // point updates skipped, summed over ticks
  double last_tick_ms = 0.0;
  bool running = false;
};

/**
 * @brief Fixed-cadence driver for a SimulationEngine.
 *
 * Runs one engine tick per step_interval on a dedicated thread. Ticks never
 * overlap: when a tick overruns its period the next one is deferred to the
 * following period boundary. stop() lets the in-flight tick finish, then
 * joins the thread.
 */
class SimulationRunner {
public:
  explicit SimulationRunner(SimulationEngine &engine);
  ~SimulationRunner();

  SimulationRunner(const SimulationRunner &) = delete;
  SimulationRunner &operator=(const SimulationRunner &) = delete;

  void start();
  void stop();

  bool running() const { return running_.load(); }
  RunnerStats stats() const;

private:
  void run();

  SimulationEngine &engine_;
  std::thread thread_;
  std::atomic<bool> running_{false};

  // Stop handshake
  std::mutex wake_mutex_;
  std::condition_variable wake_;
  bool stop_requested_ = false;

  mutable std::mutex stats_mutex_;
  RunnerStats stats_;
};

} // namespace sim_engine
