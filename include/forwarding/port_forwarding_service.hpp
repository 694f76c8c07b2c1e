// Copyright (c) 2024 NatForward
// Distributed under the MIT software license

#pragma once

#include "forwarding/discovery_controller.hpp"
#include "util/event_source.hpp"
#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <memory>
#include <mutex>
#include <thread>

namespace natforward {
namespace config {
class ConfigurationProvider;
}

namespace nat {
class NatDiscovery;
}

namespace forwarding {

class ServerHost;

/**
 * PortForwardingService - keeps the gateway port forwarding rules in place
 *
 * Hosted-service shell around DiscoveryController: the host calls Start()
 * once at startup and Stop() once at shutdown, then Dispose() (or lets the
 * destructor do it). While running, configuration updates restart
 * discovery when the forwarding settings changed.
 *
 * Only Start() and Stop() surface errors to the host; configuration
 * update handling logs them.
 */
class PortForwardingService {
public:
  using Config = DiscoveryController::Config;

  PortForwardingService(config::ConfigurationProvider &config,
                        const ServerHost &host, nat::NatDiscovery &discovery,
                        const Config &service_config = Config{});
  ~PortForwardingService();

  PortForwardingService(const PortForwardingService &) = delete;
  PortForwardingService &operator=(const PortForwardingService &) = delete;

  // Returns false if already running. Throws ObjectDisposedError after
  // Dispose(); configuration read errors propagate.
  bool Start();

  void Stop();

  // Idempotent
  void Dispose();

  bool IsRunning() const { return running_.load(std::memory_order_acquire); }
  bool IsDisposed() const { return disposed_.load(std::memory_order_acquire); }

  DiscoveryController &controller() { return *controller_; }
  const DiscoveryController &controller() const { return *controller_; }

private:
  void OnConfigurationUpdated();
  void StartIoThread();
  void StopIoThread();

  config::ConfigurationProvider &config_;

  boost::asio::io_context io_context_;
  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::thread io_thread_;

  std::unique_ptr<DiscoveryController> controller_;
  util::Subscription config_sub_;

  std::mutex lifecycle_mutex_;
  std::atomic<bool> running_{false};
  std::atomic<bool> disposed_{false};
};

} // namespace forwarding
} // namespace natforward
