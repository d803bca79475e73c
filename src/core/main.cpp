#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#ifdef _WIN32
#include <fcntl.h>
#include <io.h>
#endif

#include "config.hpp"
#include "core/handlers.hpp"
#include "core/transport/framed_stdio.hpp"
#include "devices/virtual_device.hpp"
#include "protocol.pb.h"

static void set_binary_mode_stdio() {
#ifdef _WIN32
  _setmode(_fileno(stdin), _O_BINARY);
  _setmode(_fileno(stdout), _O_BINARY);
#endif
}

static void log_err(const std::string &msg) {
  std::cerr << "vav-sim: " << msg << "\n";
}

static void print_usage() {
  log_err("Usage: vav-sim [--config <config.yaml>] [--points <points.csv>] "
          "[--seed <n>]");
}

int main(int argc, char **argv) {
  std::optional<std::string> config_path;
  std::optional<std::string> points_path;
  std::optional<uint32_t> seed;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--points" && i + 1 < argc) {
      points_path = argv[++i];
    } else if (arg == "--seed" && i + 1 < argc) {
      const std::string text = argv[++i];
      try {
        std::size_t used = 0;
        const unsigned long long v = std::stoull(text, &used);
        if (used != text.size() || v > 0xFFFFFFFFull) {
          throw std::out_of_range("seed");
        }
        seed = static_cast<uint32_t>(v);
      } catch (const std::exception &) {
        log_err("invalid --seed value: " + text);
        return 1;
      }
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else {
      log_err("unknown argument: " + arg);
      print_usage();
      return 1;
    }
  }

  std::unique_ptr<sim_devices::VirtualDevice> device;
  try {
    vav_sim::SimulatorConfig config;
    if (config_path) {
      log_err("loading configuration from: " + *config_path);
      config = vav_sim::load_config(*config_path);
    } else {
      log_err("no --config given; using built-in defaults");
    }

    device = sim_devices::VirtualDevice::from_config(config, points_path, seed);
    log_err("initialized " + std::to_string(device->registry().size()) +
            " points (" + std::to_string(device->load_result().failed) +
            " skipped)");

    device->start();
  } catch (const std::exception &e) {
    log_err("FATAL: Failed to initialize simulation: " + std::string(e.what()));
    return 1;
  }

  set_binary_mode_stdio();
  log_err("starting (transport=stdio+uint32_le)");

  std::vector<uint8_t> frame;
  std::string io_err;

  while (true) {
    const auto status = transport::read_frame(std::cin, frame, io_err);
    if (status == transport::ReadStatus::Eof) {
      log_err("EOF on stdin; exiting cleanly");
      device->stop();
      return 0;
    }
    if (status == transport::ReadStatus::Error) {
      log_err("read_frame error: " + io_err);
      device->stop();
      return 2;
    }

    vav_sim::protocol::v1::Request req;
    if (!req.ParseFromArray(frame.data(), static_cast<int>(frame.size()))) {
      log_err("failed to parse Request protobuf");
      device->stop();
      return 3;
    }

    const auto resp = handlers::dispatch(*device, req);

    std::string resp_bytes;
    if (!resp.SerializeToString(&resp_bytes)) {
      log_err("failed to serialize Response protobuf");
      device->stop();
      return 4;
    }

    if (!transport::write_frame(std::cout, resp_bytes, io_err)) {
      log_err("write_frame error: " + io_err);
      device->stop();
      return 5;
    }
  }
}
