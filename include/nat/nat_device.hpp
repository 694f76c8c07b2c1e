// Copyright (c) 2024 NatForward
// Distributed under the MIT software license

#pragma once

#include "util/event_source.hpp"
#include <boost/asio/ip/address.hpp>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <tuple>

namespace natforward {
namespace nat {

// Network identity of a discovered gateway. Deduplication key.
struct GatewayEndpoint {
  boost::asio::ip::address address;
  uint16_t port{0};

  // "a.b.c.d:port" or "[v6]:port"
  std::string ToString() const;

  bool operator==(const GatewayEndpoint &other) const {
    return address == other.address && port == other.port;
  }
  bool operator!=(const GatewayEndpoint &other) const {
    return !(*this == other);
  }
  bool operator<(const GatewayEndpoint &other) const {
    return std::tie(address, port) < std::tie(other.address, other.port);
  }
};

enum class Protocol { Tcp, Udp };

const char *ProtocolName(Protocol protocol);

// A forwarding rule request: public_port on the gateway -> private_port here
struct Mapping {
  Protocol protocol{Protocol::Tcp};
  uint16_t private_port{0};
  uint16_t public_port{0};
  uint32_t lifetime_seconds{0}; // 0 = no expiry
  std::string description;
};

// The gateway refused or failed a mapping request
class MappingError : public std::runtime_error {
public:
  MappingError(const std::string &what, int code = 0)
      : std::runtime_error(what), code_(code) {}

  int code() const { return code_; }

private:
  int code_;
};

/**
 * A gateway able to create port mappings.
 */
class NatDevice {
public:
  virtual ~NatDevice() = default;

  virtual GatewayEndpoint DeviceEndpoint() const = 0;

  // Submit a mapping request. The future becomes ready when the gateway
  // answered; failures are reported through it (MappingError or another
  // std::exception).
  virtual std::future<void> CreatePortMapAsync(const Mapping &mapping) = 0;
};

/**
 * Gateway discovery backend.
 *
 * Runs its own background loop between StartDiscovery() and
 * StopDiscovery() and raises DeviceFound from that loop, possibly
 * several times for the same gateway.
 */
class NatDiscovery {
public:
  using DeviceFoundCallback = std::function<void(std::shared_ptr<NatDevice>)>;

  virtual ~NatDiscovery() = default;

  virtual void StartDiscovery() = 0;
  virtual void StopDiscovery() = 0;

  util::Subscription SubscribeDeviceFound(DeviceFoundCallback callback) {
    return device_found_.Subscribe(std::move(callback));
  }

protected:
  void NotifyDeviceFound(std::shared_ptr<NatDevice> device) {
    device_found_.Notify(std::move(device));
  }

  size_t DeviceFoundSubscriberCount() const {
    return device_found_.SubscriberCount();
  }

private:
  util::EventSource<std::shared_ptr<NatDevice>> device_found_;
};

} // namespace nat
} // namespace natforward
