#include "libusb_device.hpp"
#include "tcp_transport.hpp"
#include "camera_client.hpp"
#include "logging.hpp"
#include "orchestrator.hpp"
#include "util.hpp"
#include <asio.hpp>
#include <csignal>
#include <cstdlib>
#include <iostream>

using namespace shotlink;

namespace {

struct CameraWatch {
  asio::io_context &io;
  BridgeConfig cfg;
  uint16_t vendor_id;
  std::shared_ptr<Orchestrator> orch;
  std::shared_ptr<CameraClient> camera;
  asio::steady_timer timer;
  bool attaching{false};

  void arm() {
    timer.expires_after(std::chrono::seconds(2));
    timer.async_wait([this](std::error_code ec) {
      if (ec)
        return;
      check();
    });
  }

  void check() {
    if (!attaching && (!camera || camera->gone()))
      try_attach();
    arm();
  }

  void try_attach() {
    std::string err;
    auto dev = LibusbDevice::open_first(io, vendor_id, err);
    if (!dev) {
      Logger::instance().log(LogLevel::DEBUG, "main", "no camera: %s",
                             err.c_str());
      return;
    }
    auto client = std::make_shared<CameraClient>(io, dev, cfg);
    attaching = true;
    camera = client;
    client->attach([this, client](CameraError e) {
      attaching = false;
      if (e) {
        Logger::instance().log(LogLevel::ERROR, "main",
                               "camera attach failed: %s",
                               e.message().c_str());
        client->detach();
        if (camera == client)
          camera.reset();
        return;
      }
      orch->set_camera(client);
    });
  }
};

} // namespace

int main(int argc, char **argv) {
  BridgeConfig cfg;
  std::string listen = "0.0.0.0:46090";
  std::string vendor_hex;

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](int &i) -> std::string {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      std::exit(1);
    };
    if (a == "--listen") {
      listen = next(i);
    } else if (a == "--log-level") {
      LogLevel lvl;
      if (!parse_log_level(next(i), lvl)) {
        std::cerr << "bad log level" << std::endl;
        return 1;
      }
      Logger::instance().set_level(lvl);
    } else if (a == "--vendor") {
      vendor_hex = next(i);
    } else if (a.size() > 2 && a.compare(0, 2, "--") == 0) {
      std::string err;
      if (!apply_option(cfg, a.substr(2), next(i), err)) {
        std::cerr << err << std::endl;
        return 1;
      }
    } else {
      std::cerr << "unknown argument " << a << std::endl;
      return 1;
    }
  }

  if (!parse_host_port(listen, cfg.listen_host, cfg.listen_port)) {
    std::cerr << "bad listen" << std::endl;
    return 1;
  }
  uint16_t vendor_id = 0;
  if (!vendor_hex.empty()) {
    char *end = nullptr;
    unsigned long v = std::strtoul(vendor_hex.c_str(), &end, 16);
    if (*end != '\0' || v > 0xFFFF) {
      std::cerr << "bad vendor id" << std::endl;
      return 1;
    }
    vendor_id = (uint16_t)v;
  }
  std::string err;
  if (!validate_config(cfg, err)) {
    std::cerr << err << std::endl;
    return 1;
  }
  if (cfg.connection_type != ConnectionType::WiFi) {
    std::cerr << "this build has no GATT peripheral backend, use --transport "
                 "wifi"
              << std::endl;
    return 1;
  }

  asio::io_context io;
  auto orch = std::make_shared<Orchestrator>(io, cfg);
  auto transport =
      std::make_shared<TcpTransport>(io, cfg.listen_host, cfg.listen_port);
  if (!transport->open([orch](std::error_code ec, ConnectionPtr conn) {
        orch->on_connection(ec, std::move(conn));
      }))
    return 1;

  CameraWatch watch{io, cfg, vendor_id, orch, nullptr, asio::steady_timer(io)};
  watch.check();

  asio::signal_set signals(io, SIGINT, SIGTERM);
  signals.async_wait([&](std::error_code, int sig) {
    Logger::instance().log(LogLevel::INFO, "main", "signal %d, stopping", sig);
    std::error_code ignored;
    watch.timer.cancel(ignored);
    transport->shutdown();
    orch->shutdown();
    io.stop();
  });

  Logger::instance().log(LogLevel::INFO, "main",
                         "%s listening on %s:%u (window %u, ttl %llds)",
                         cfg.device_name.c_str(), cfg.listen_host.c_str(),
                         (unsigned)cfg.listen_port, (unsigned)cfg.window_size,
                         (long long)std::chrono::duration_cast<std::chrono::seconds>(
                             cfg.session_ttl)
                             .count());
  io.run();
  return 0;
}
