#include "simulation/sim_runner.hpp"

#include <chrono>
#include <exception>
#include <iostream>

namespace sim_engine {

SimulationRunner::SimulationRunner(SimulationEngine &engine)
    : engine_(engine) {}

SimulationRunner::~SimulationRunner() { stop(); }

void SimulationRunner::start() {
  if (running_.load()) {
    std::cerr << "[Runner] start: already running, skipping\n";
    return;
  }

  {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    stop_requested_ = false;
  }
  running_ = true;
  thread_ = std::thread(&SimulationRunner::run, this);
  std::cerr << "[Runner] started (step=" << engine_.params().step_interval
            << "s)\n";
}

void SimulationRunner::stop() {
  {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    stop_requested_ = true;
  }
  wake_.notify_all();

  if (thread_.joinable()) {
    thread_.join();
    std::cerr << "[Runner] stopped after " << stats().ticks << " ticks\n";
  }
  running_ = false;
}

RunnerStats SimulationRunner::stats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  RunnerStats s = stats_;
  s.running = running_.load();
  return s;
}

void SimulationRunner::run() {
  using clock = std::chrono::steady_clock;

  const auto period = std::chrono::duration_cast<clock::duration>(
      std::chrono::duration<double>(engine_.params().step_interval));
  auto next_tick = clock::now();

  while (true) {
    const auto tick_start = clock::now();

    TickReport report;
    try {
      report = engine_.tick();
    } catch (const std::exception &e) {
      std::cerr << "[Runner] tick failed: " << e.what() << "\n";
    }

    const auto tick_end = clock::now();
    const double tick_ms =
        std::chrono::duration<double, std::milli>(tick_end - tick_start)
            .count();

    // Always advance by whole periods so the phase stays fixed; an overrun
    // defers the next tick instead of running two back to back.
    next_tick += period;
    bool overrun = false;
    while (next_tick <= tick_end) {
      next_tick += period;
      overrun = true;
    }

    {
      std::lock_guard<std::mutex> lock(stats_mutex_);
      ++stats_.ticks;
      stats_.failed_updates += report.failed;
      stats_.last_tick_ms = tick_ms;
      if (overrun) {
        ++stats_.overruns;
      }
    }

    if (report.tick > 0 && report.tick <= 2) {
      std::cerr << "[Runner] tick #" << report.tick << ": updated "
                << report.updated << ", held " << report.held << ", failed "
                << report.failed << " (" << tick_ms << "ms)\n";
    }

    std::unique_lock<std::mutex> lock(wake_mutex_);
    if (wake_.wait_until(lock, next_tick, [this] { return stop_requested_; })) {
      break;
    }
  }
}

} // namespace sim_engine
