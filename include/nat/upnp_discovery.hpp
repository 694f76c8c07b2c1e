// Copyright (c) 2024 NatForward
// Distributed under the MIT software license
// UPnP IGD discovery backend (miniupnpc)

#pragma once

#include "nat/nat_device.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace natforward {
namespace nat {

// Internet Gateway Device found through SSDP
class UPnPDevice : public NatDevice {
public:
  UPnPDevice(GatewayEndpoint endpoint, std::string control_url,
             std::string service_type, std::string lan_address);

  GatewayEndpoint DeviceEndpoint() const override { return endpoint_; }

  // Each AddPortMapping call runs on its own thread, so a gateway that never
  // answers holds up nobody else. Errors surface as MappingError. As with
  // any std::async future, destroying it waits for the request.
  std::future<void> CreatePortMapAsync(const Mapping &mapping) override;

private:
  GatewayEndpoint endpoint_;
  std::string control_url_;
  std::string service_type_;
  std::string lan_address_;
};

class UPnPDiscovery : public NatDiscovery {
public:
  struct Config {
    std::chrono::seconds search_interval; // Time between SSDP searches
    int discover_timeout_ms;              // SSDP wait per search

    Config()
        : search_interval(std::chrono::seconds(30)), discover_timeout_ms(2000) {}
  };

  explicit UPnPDiscovery(const Config &config = Config{});
  ~UPnPDiscovery() override;

  void StartDiscovery() override;
  void StopDiscovery() override;

  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  // Host and port of an IGD description/control URL
  // ("http://192.168.1.1:5000/rootDesc.xml" -> 192.168.1.1:5000)
  static std::optional<GatewayEndpoint> ParseUrlEndpoint(const std::string &url);

private:
  void DiscoveryLoop();
  void SearchOnce();

  Config config_;

  std::atomic<bool> running_{false};
  std::mutex start_stop_mutex_;
  std::thread discovery_thread_;
  std::mutex wait_mutex_;
  std::condition_variable wait_cv_;
};

} // namespace nat
} // namespace natforward
