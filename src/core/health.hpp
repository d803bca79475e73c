#pragma once

#include <string>

#include "devices/virtual_device.hpp"
#include "protocol.pb.h"

namespace sim_health {

using vav_sim::protocol::v1::GetHealthResponse;

// STOPPED while the ticker is not running, DEGRADED once any point update
// has failed, otherwise OK.
inline GetHealthResponse::State
health_state(const sim_devices::DeviceHealth &h) {
  if (!h.running) {
    return GetHealthResponse::STATE_STOPPED;
  }
  if (h.failed_updates > 0) {
    return GetHealthResponse::STATE_DEGRADED;
  }
  return GetHealthResponse::STATE_OK;
}

inline void fill_health(const sim_devices::DeviceHealth &h,
                        GetHealthResponse &out) {
  out.set_state(health_state(h));
  switch (out.state()) {
  case GetHealthResponse::STATE_STOPPED:
    out.set_message("simulation stopped");
    break;
  case GetHealthResponse::STATE_DEGRADED:
    out.set_message(std::to_string(h.failed_updates) +
                    " point updates failed");
    break;
  default:
    out.set_message("ok");
    break;
  }

  out.set_ticks(h.ticks);
  out.set_overruns(h.overruns);
  out.set_failed_updates(h.failed_updates);
  out.set_last_tick_ms(h.last_tick_ms);
  out.set_running(h.running);
  out.set_point_count(static_cast<uint32_t>(h.point_count));

  (*out.mutable_metrics())["impl"] = "sim";
  (*out.mutable_metrics())["load_failures"] = std::to_string(h.load_failures);
}

} // namespace sim_health
