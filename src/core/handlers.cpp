#include "core/handlers.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <variant>

#include "core/health.hpp"
#include "core/transport/framed_stdio.hpp"

namespace handlers {

using sim_points::ErrorCode;
using sim_points::PointError;
using sim_points::PointKind;

// -----------------------------
// Conversions
// -----------------------------

pb::PointKind to_proto_kind(PointKind kind) {
  switch (kind) {
  case PointKind::AnalogInput:
    return pb::POINT_KIND_ANALOG_INPUT;
  case PointKind::AnalogOutput:
    return pb::POINT_KIND_ANALOG_OUTPUT;
  case PointKind::AnalogValue:
    return pb::POINT_KIND_ANALOG_VALUE;
  case PointKind::BinaryInput:
    return pb::POINT_KIND_BINARY_INPUT;
  case PointKind::BinaryOutput:
    return pb::POINT_KIND_BINARY_OUTPUT;
  case PointKind::BinaryValue:
    return pb::POINT_KIND_BINARY_VALUE;
  case PointKind::MultistateInput:
    return pb::POINT_KIND_MULTISTATE_INPUT;
  case PointKind::MultistateOutput:
    return pb::POINT_KIND_MULTISTATE_OUTPUT;
  case PointKind::MultistateValue:
    return pb::POINT_KIND_MULTISTATE_VALUE;
  }
  return pb::POINT_KIND_UNSPECIFIED;
}

std::optional<PointKind> from_proto_kind(pb::PointKind kind) {
  switch (kind) {
  case pb::POINT_KIND_ANALOG_INPUT:
    return PointKind::AnalogInput;
  case pb::POINT_KIND_ANALOG_OUTPUT:
    return PointKind::AnalogOutput;
  case pb::POINT_KIND_ANALOG_VALUE:
    return PointKind::AnalogValue;
  case pb::POINT_KIND_BINARY_INPUT:
    return PointKind::BinaryInput;
  case pb::POINT_KIND_BINARY_OUTPUT:
    return PointKind::BinaryOutput;
  case pb::POINT_KIND_BINARY_VALUE:
    return PointKind::BinaryValue;
  case pb::POINT_KIND_MULTISTATE_INPUT:
    return PointKind::MultistateInput;
  case pb::POINT_KIND_MULTISTATE_OUTPUT:
    return PointKind::MultistateOutput;
  case pb::POINT_KIND_MULTISTATE_VALUE:
    return PointKind::MultistateValue;
  default:
    return std::nullopt;
  }
}

pb::Value to_proto_value(const sim_points::PointValue &value) {
  pb::Value out;
  if (const auto *d = std::get_if<double>(&value)) {
    out.set_analog(*d);
  } else if (const auto *b = std::get_if<bool>(&value)) {
    out.set_binary(*b);
  } else {
    out.set_state(std::get<uint32_t>(value));
  }
  return out;
}

std::optional<sim_points::PointValue> from_proto_value(const pb::Value &value) {
  switch (value.kind_case()) {
  case pb::Value::kAnalog:
    return sim_points::PointValue(value.analog());
  case pb::Value::kBinary:
    return sim_points::PointValue(value.binary());
  case pb::Value::kState:
    return sim_points::PointValue(value.state());
  default:
    return std::nullopt;
  }
}

void to_proto_summary(const sim_points::PointSummary &s, pb::PointSummary &out) {
  out.mutable_point()->set_kind(to_proto_kind(s.kind));
  out.mutable_point()->set_instance(s.instance);
  out.set_name(s.name);
  out.set_description(s.description);
  out.set_units(sim_points::unit_name(s.unit));
  for (const auto &text : s.state_text) {
    out.add_state_text(text);
  }
  *out.mutable_value() = to_proto_value(s.value);
  out.set_active_priority(s.active_level.value_or(0));
  out.set_commandable(s.commandable);
}

pb::Status::Code status_for(ErrorCode code) {
  switch (code) {
  case ErrorCode::NotFound:
    return pb::Status::CODE_NOT_FOUND;
  case ErrorCode::DuplicateInstance:
    return pb::Status::CODE_ALREADY_EXISTS;
  case ErrorCode::InvalidPriority:
  case ErrorCode::TypeMismatch:
    return pb::Status::CODE_INVALID_ARGUMENT;
  case ErrorCode::ReadOnly:
    return pb::Status::CODE_PERMISSION_DENIED;
  case ErrorCode::InvalidDefinition:
    return pb::Status::CODE_FAILED_PRECONDITION;
  }
  return pb::Status::CODE_INTERNAL;
}

// -----------------------------
// Helpers
// -----------------------------

static inline void set_status_ok(pb::Response &resp) {
  resp.mutable_status()->set_code(pb::Status::CODE_OK);
  resp.mutable_status()->set_message("ok");
}

static inline void set_status(pb::Response &resp, pb::Status::Code code,
                              const std::string &msg) {
  resp.mutable_status()->set_code(code);
  resp.mutable_status()->set_message(msg);
}

// Validates a point reference; on failure sets INVALID_ARGUMENT.
static bool parse_ref(bool present, const pb::PointRef &ref, PointKind &kind,
                      pb::Response &resp) {
  if (!present) {
    set_status(resp, pb::Status::CODE_INVALID_ARGUMENT, "point is required");
    return false;
  }
  const auto k = from_proto_kind(ref.kind());
  if (!k) {
    set_status(resp, pb::Status::CODE_INVALID_ARGUMENT,
               "point.kind is required");
    return false;
  }
  kind = *k;
  return true;
}

// -----------------------------
// Handlers
// -----------------------------

void handle_hello(sim_devices::VirtualDevice &device,
                  const pb::HelloRequest &req, pb::Response &resp) {
  if (req.protocol_version() != "v1") {
    set_status(resp, pb::Status::CODE_FAILED_PRECONDITION,
               "unsupported protocol_version; expected v1");
    return;
  }

  const auto &id = device.identity();
  auto *hello = resp.mutable_hello();
  hello->set_protocol_version("v1");
  hello->set_device_name(id.name);
  hello->set_device_id(id.device_id);
  hello->set_description(id.description);

  auto &meta = *hello->mutable_metadata();
  meta["transport"] = "stdio+uint32_le";
  meta["max_frame_bytes"] = std::to_string(transport::kMaxFrameBytes);
  meta["point_count"] = std::to_string(device.registry().size());
  meta["step_interval"] = std::to_string(device.params().step_interval);
  meta["priority_aware"] =
      device.params().priority_aware_simulation ? "true" : "false";
  meta["seed"] = std::to_string(device.seed());

  set_status_ok(resp);
}

void handle_list_points(sim_devices::VirtualDevice &device,
                        const pb::ListPointsRequest &req, pb::Response &resp) {
  std::vector<sim_points::PointSummary> points;
  if (req.kind() == pb::POINT_KIND_UNSPECIFIED) {
    points = device.list_all_points();
  } else {
    const auto kind = from_proto_kind(req.kind());
    if (!kind) {
      set_status(resp, pb::Status::CODE_INVALID_ARGUMENT, "unknown kind");
      return;
    }
    points = device.list_points(*kind);
  }

  auto *out = resp.mutable_list_points();
  for (const auto &p : points) {
    to_proto_summary(p, *out->add_points());
  }
  set_status_ok(resp);
}

void handle_read_point(sim_devices::VirtualDevice &device,
                       const pb::ReadPointRequest &req, pb::Response &resp) {
  PointKind kind;
  if (!parse_ref(req.has_point(), req.point(), kind, resp)) {
    return;
  }

  const auto summary = device.read_point(kind, req.point().instance());
  to_proto_summary(summary, *resp.mutable_read_point()->mutable_point());
  set_status_ok(resp);
}

void handle_write_priority(sim_devices::VirtualDevice &device,
                           const pb::WritePriorityRequest &req,
                           pb::Response &resp) {
  PointKind kind;
  if (!parse_ref(req.has_point(), req.point(), kind, resp)) {
    return;
  }

  std::optional<sim_points::PointValue> value;
  switch (req.action_case()) {
  case pb::WritePriorityRequest::kValue:
    value = from_proto_value(req.value());
    if (!value) {
      set_status(resp, pb::Status::CODE_INVALID_ARGUMENT,
                 "value has no member set");
      return;
    }
    break;
  case pb::WritePriorityRequest::kClear:
    if (!req.clear()) {
      set_status(resp, pb::Status::CODE_INVALID_ARGUMENT,
                 "clear must be true when set");
      return;
    }
    break;
  default:
    set_status(resp, pb::Status::CODE_INVALID_ARGUMENT,
               "either value or clear is required");
    return;
  }

  const uint32_t instance = req.point().instance();
  device.write_priority(kind, instance, req.priority(), value);

  to_proto_summary(device.read_point(kind, instance),
                   *resp.mutable_write_priority()->mutable_point());
  set_status_ok(resp);
}

void handle_read_priority_array(sim_devices::VirtualDevice &device,
                                const pb::ReadPriorityArrayRequest &req,
                                pb::Response &resp) {
  PointKind kind;
  if (!parse_ref(req.has_point(), req.point(), kind, resp)) {
    return;
  }

  const auto snap = device.priority_array(kind, req.point().instance());
  if (!snap) {
    set_status(resp, pb::Status::CODE_FAILED_PRECONDITION,
               "input points have no priority array");
    return;
  }

  auto *out = resp.mutable_read_priority_array();
  *out->mutable_point() = req.point();
  for (unsigned level = 1; level <= sim_points::kPriorityLevels; ++level) {
    const auto &slot = snap->slots[sim_points::priority::slot_index(level)];
    if (slot) {
      auto *entry = out->add_slots();
      entry->set_priority(level);
      *entry->mutable_value() = to_proto_value(*slot);
    }
  }
  *out->mutable_relinquish_default() = to_proto_value(snap->relinquish_default);
  *out->mutable_effective_value() = to_proto_value(snap->effective_value);
  out->set_active_priority(snap->active_level.value_or(0));

  set_status_ok(resp);
}

void handle_get_environment(sim_devices::VirtualDevice &device,
                            const pb::GetEnvironmentRequest & /*req*/,
                            pb::Response &resp) {
  const auto env = device.environment();
  auto *out = resp.mutable_get_environment();
  out->set_elapsed_seconds(env.elapsed_s);
  out->set_outdoor_temperature_c(env.outdoor_temperature_c);
  out->set_outdoor_humidity(env.outdoor_humidity);
  set_status_ok(resp);
}

void handle_get_health(sim_devices::VirtualDevice &device,
                       const pb::GetHealthRequest & /*req*/,
                       pb::Response &resp) {
  sim_health::fill_health(device.health(), *resp.mutable_get_health());
  set_status_ok(resp);
}

void handle_unimplemented(pb::Response &resp) {
  set_status(resp, pb::Status::CODE_UNIMPLEMENTED, "operation not implemented");
}

// -----------------------------
// Dispatch
// -----------------------------

pb::Response dispatch(sim_devices::VirtualDevice &device,
                      const pb::Request &req) {
  pb::Response resp;
  resp.set_request_id(req.request_id());
  set_status(resp, pb::Status::CODE_INTERNAL, "uninitialized");

  try {
    switch (req.request_case()) {
    case pb::Request::kHello:
      handle_hello(device, req.hello(), resp);
      break;
    case pb::Request::kListPoints:
      handle_list_points(device, req.list_points(), resp);
      break;
    case pb::Request::kReadPoint:
      handle_read_point(device, req.read_point(), resp);
      break;
    case pb::Request::kWritePriority:
      handle_write_priority(device, req.write_priority(), resp);
      break;
    case pb::Request::kReadPriorityArray:
      handle_read_priority_array(device, req.read_priority_array(), resp);
      break;
    case pb::Request::kGetEnvironment:
      handle_get_environment(device, req.get_environment(), resp);
      break;
    case pb::Request::kGetHealth:
      handle_get_health(device, req.get_health(), resp);
      break;
    default:
      handle_unimplemented(resp);
      break;
    }
  } catch (const PointError &e) {
    // Drop any partially filled payload; the status carries the answer.
    resp.clear_response();
    set_status(resp, status_for(e.code()), e.what());
  } catch (const std::exception &e) {
    resp.clear_response();
    set_status(resp, pb::Status::CODE_INTERNAL, e.what());
    std::cerr << "[Handlers] request " << req.request_id()
              << " failed: " << e.what() << "\n";
  }

  return resp;
}

} // namespace handlers
