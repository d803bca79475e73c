#pragma once

#include <optional>

#include "devices/virtual_device.hpp"
#include "points/point_error.hpp"
#include "protocol.pb.h"

namespace handlers {

namespace pb = vav_sim::protocol::v1;

// ---- Conversions ----

pb::PointKind to_proto_kind(sim_points::PointKind kind);
// nullopt for POINT_KIND_UNSPECIFIED or unknown enum values
std::optional<sim_points::PointKind> from_proto_kind(pb::PointKind kind);

pb::Value to_proto_value(const sim_points::PointValue &value);
// nullopt when no member of the oneof is set
std::optional<sim_points::PointValue> from_proto_value(const pb::Value &value);

void to_proto_summary(const sim_points::PointSummary &summary,
                      pb::PointSummary &out);

pb::Status::Code status_for(sim_points::ErrorCode code);

// ---- Handlers ----
// Each handler fills resp (payload and status). Point errors propagate as
// PointError; dispatch() turns them and any other exception into a status.

void handle_hello(sim_devices::VirtualDevice &device,
                  const pb::HelloRequest &req, pb::Response &resp);

void handle_list_points(sim_devices::VirtualDevice &device,
                        const pb::ListPointsRequest &req, pb::Response &resp);

void handle_read_point(sim_devices::VirtualDevice &device,
                       const pb::ReadPointRequest &req, pb::Response &resp);

void handle_write_priority(sim_devices::VirtualDevice &device,
                           const pb::WritePriorityRequest &req,
                           pb::Response &resp);

void handle_read_priority_array(sim_devices::VirtualDevice &device,
                                const pb::ReadPriorityArrayRequest &req,
                                pb::Response &resp);

void handle_get_environment(sim_devices::VirtualDevice &device,
                            const pb::GetEnvironmentRequest &req,
                            pb::Response &resp);

void handle_get_health(sim_devices::VirtualDevice &device,
                       const pb::GetHealthRequest &req, pb::Response &resp);

void handle_unimplemented(pb::Response &resp);

// Route one request to its handler. Always returns a response with
// request_id echoed and a status set.
pb::Response dispatch(sim_devices::VirtualDevice &device,
                      const pb::Request &req);

} // namespace handlers
