// Copyright (c) 2024 NatForward
// Distributed under the MIT software license

#pragma once

#include "config/network_configuration.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace natforward {

namespace config {
class ConfigStore;
}

namespace nat {
class UPnPDiscovery;
}

namespace forwarding {
class PortForwardingService;
class StaticServerHost;
} // namespace forwarding

namespace app {

struct AppConfig {
  std::string config_path{"natforward.json"};

  // Local server being exposed
  uint16_t http_port{config::DEFAULT_PUBLIC_HTTP_PORT};
  uint16_t https_port{config::DEFAULT_PUBLIC_HTTPS_PORT};
  bool listen_with_https{false};
  std::string name{"natforward"};
};

/**
 * Application - daemon shell
 *
 * Loads the configuration file, starts the port forwarding service and
 * runs until SIGINT/SIGTERM. SIGHUP reloads the configuration file.
 */
class Application {
public:
  explicit Application(const AppConfig &config);
  ~Application();

  bool initialize();
  bool start();
  void stop();

  // Block until a shutdown signal arrives
  void wait_for_shutdown();

  // Async-signal-safe: only set flags polled by wait_for_shutdown()
  void request_shutdown() { shutdown_requested_ = true; }
  void request_reload() { reload_requested_ = true; }

private:
  void shutdown();
  void setup_signal_handlers();
  static void signal_handler(int signal);

  AppConfig config_;

  std::unique_ptr<config::ConfigStore> config_store_;
  std::unique_ptr<forwarding::StaticServerHost> server_host_;
  std::unique_ptr<nat::UPnPDiscovery> discovery_;
  std::unique_ptr<forwarding::PortForwardingService> forwarding_service_;

  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};
  std::atomic<bool> reload_requested_{false};

  static Application *instance_;
};

} // namespace app
} // namespace natforward
