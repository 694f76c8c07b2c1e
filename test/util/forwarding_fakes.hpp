// Copyright (c) 2024 NatForward
// Distributed under the MIT software license
// Test doubles for the forwarding collaborators

#pragma once

#include "config/configuration_provider.hpp"
#include "forwarding/server_host.hpp"
#include "nat/nat_device.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace natforward {
namespace test {

// Poll until pred() holds or the timeout expires
inline bool WaitFor(const std::function<bool()> &pred,
                    std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return pred();
}

class FakeConfigurationProvider : public config::ConfigurationProvider {
public:
  explicit FakeConfigurationProvider(config::NetworkConfiguration cfg = {})
      : config_(cfg) {}

  config::NetworkConfiguration GetNetworkConfiguration() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_reads_) {
      throw config::ConfigError("configuration store unavailable");
    }
    return config_;
  }

  // Replace the settings and raise ConfigurationUpdated
  void Set(const config::NetworkConfiguration &cfg) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      config_ = cfg;
    }
    NotifyConfigurationUpdated();
  }

  // Replace the settings without notifying anyone
  void SetSilently(const config::NetworkConfiguration &cfg) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = cfg;
  }

  void RaiseUpdated() { NotifyConfigurationUpdated(); }

  void SetFailReads(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_reads_ = fail;
  }

private:
  mutable std::mutex mutex_;
  config::NetworkConfiguration config_;
  bool fail_reads_{false};
};

class FakeServerHost : public forwarding::ServerHost {
public:
  std::atomic<uint16_t> http_port{8096};
  std::atomic<uint16_t> https_port{8920};
  std::atomic<bool> listen_with_https{false};

  uint16_t HttpPort() const override { return http_port; }
  uint16_t HttpsPort() const override { return https_port; }
  bool ListenWithHttps() const override { return listen_with_https; }
  std::string Name() const override { return "natforward-test"; }
};

class FakeNatDevice : public nat::NatDevice {
public:
  explicit FakeNatDevice(const std::string &ip, uint16_t port = 0)
      : endpoint_{boost::asio::ip::make_address(ip), port} {}

  nat::GatewayEndpoint DeviceEndpoint() const override { return endpoint_; }

  std::future<void> CreatePortMapAsync(const nat::Mapping &mapping) override {
    bool fail = false;
    bool throw_now = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      requests_.push_back(mapping);
      fail = failing_ports_.count(mapping.private_port) > 0;
      throw_now = throw_synchronously_;
    }

    if (fail && throw_now) {
      throw nat::MappingError("gateway unreachable", 501);
    }

    std::promise<void> promise;
    if (fail) {
      promise.set_exception(std::make_exception_ptr(
          nat::MappingError("ConflictInMappingEntry", 718)));
    } else {
      promise.set_value();
    }
    return promise.get_future();
  }

  // Requests for this private port fail
  void FailPort(uint16_t private_port, bool synchronously = false) {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_ports_.insert(private_port);
    throw_synchronously_ = synchronously;
  }

  std::vector<nat::Mapping> requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

  size_t request_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
  }

private:
  nat::GatewayEndpoint endpoint_;
  mutable std::mutex mutex_;
  std::vector<nat::Mapping> requests_;
  std::set<uint16_t> failing_ports_;
  bool throw_synchronously_{false};
};

// Gateway that accepts requests but only answers them after Release()
class HangingNatDevice : public nat::NatDevice {
public:
  explicit HangingNatDevice(const std::string &ip, uint16_t port = 0)
      : endpoint_{boost::asio::ip::make_address(ip), port} {}

  nat::GatewayEndpoint DeviceEndpoint() const override { return endpoint_; }

  std::future<void> CreatePortMapAsync(const nat::Mapping &mapping) override {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.push_back(mapping);
    std::promise<void> promise;
    std::future<void> result = promise.get_future();
    if (released_) {
      promise.set_value();
    } else {
      pending_.push_back(std::move(promise));
    }
    return result;
  }

  // Answer every outstanding request; later requests answer immediately
  void Release() {
    std::lock_guard<std::mutex> lock(mutex_);
    released_ = true;
    for (auto &promise : pending_) {
      promise.set_value();
    }
    pending_.clear();
  }

  size_t request_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
  }

private:
  nat::GatewayEndpoint endpoint_;
  mutable std::mutex mutex_;
  std::vector<nat::Mapping> requests_;
  std::vector<std::promise<void>> pending_;
  bool released_{false};
};

class FakeNatDiscovery : public nat::NatDiscovery {
public:
  std::atomic<int> start_calls{0};
  std::atomic<int> stop_calls{0};
  std::atomic<bool> running{false};

  void StartDiscovery() override {
    ++start_calls;
    running = true;
  }

  void StopDiscovery() override {
    ++stop_calls;
    running = false;
  }

  // What the backend loop would do when a gateway answers
  void EmitDeviceFound(std::shared_ptr<nat::NatDevice> device) {
    NotifyDeviceFound(std::move(device));
  }

  size_t SubscriberCountForTest() const { return DeviceFoundSubscriberCount(); }
};

} // namespace test
} // namespace natforward
