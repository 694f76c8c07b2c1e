// Copyright (c) 2024 NatForward
// Distributed under the MIT software license

#include "application.hpp"
#include "config/config_store.hpp"
#include "forwarding/port_forwarding_service.hpp"
#include "forwarding/server_host.hpp"
#include "nat/upnp_discovery.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <chrono>
#include <csignal>
#include <thread>

namespace natforward {
namespace app {

// Static instance for signal handling
Application *Application::instance_ = nullptr;

Application::Application(const AppConfig &config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

bool Application::initialize() {
  LOG_INFO("Initializing {}...", GetFullVersionString());

  config_store_ = std::make_unique<config::ConfigStore>(config_.config_path);
  if (!config_store_->Load()) {
    LOG_ERROR("Failed to load configuration from {}", config_.config_path);
    return false;
  }

  server_host_ = std::make_unique<forwarding::StaticServerHost>(
      config_.http_port, config_.https_port, config_.listen_with_https,
      config_.name);

  discovery_ = std::make_unique<nat::UPnPDiscovery>();

  forwarding_service_ = std::make_unique<forwarding::PortForwardingService>(
      *config_store_, *server_host_, *discovery_);

  LOG_INFO("Initialization complete");
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_ERROR("Application already running");
    return false;
  }

  setup_signal_handlers();

  try {
    forwarding_service_->Start();
  } catch (const std::exception &e) {
    LOG_ERROR("Failed to start port forwarding service: {}", e.what());
    return false;
  }

  running_ = true;

  const config::NetworkConfiguration cfg =
      config_store_->GetNetworkConfiguration();
  LOG_INFO("Exposing local port {} as public port {}", config_.http_port,
           cfg.public_http_port);
  if (config_.listen_with_https) {
    LOG_INFO("Exposing local port {} as public port {}", config_.https_port,
             cfg.public_https_port);
  }
  if (!cfg.enable_upnp || !cfg.enable_remote_access) {
    LOG_INFO("Port forwarding disabled by configuration");
  }
  LOG_INFO("Press Ctrl+C to stop, send SIGHUP to reload {}",
           config_.config_path);
  return true;
}

void Application::stop() {
  if (!running_) {
    return;
  }
  shutdown();
}

void Application::wait_for_shutdown() {
  while (running_ && !shutdown_requested_) {
    if (reload_requested_.exchange(false)) {
      LOG_INFO("Reloading configuration from {}", config_.config_path);
      if (!config_store_->Reload()) {
        LOG_ERROR("Configuration reload failed, keeping current settings");
      }
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (shutdown_requested_) {
    shutdown();
  }
}

void Application::shutdown() {
  if (!running_) {
    return;
  }

  LOG_INFO("Shutting down...");
  running_ = false;

  if (forwarding_service_) {
    try {
      forwarding_service_->Stop();
    } catch (const std::exception &e) {
      LOG_ERROR("Error stopping port forwarding service: {}", e.what());
    }
    forwarding_service_->Dispose();
  }

  LOG_INFO("Shutdown complete");
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
  std::signal(SIGHUP, Application::signal_handler);
}

void Application::signal_handler(int signal) {
  if (!instance_) {
    return;
  }
  if (signal == SIGHUP) {
    instance_->request_reload();
  } else {
    instance_->request_shutdown();
  }
}

} // namespace app
} // namespace natforward
