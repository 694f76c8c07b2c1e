// Copyright (c) 2024 NatForward
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <future>
#include <vector>

namespace natforward {
namespace config {
class ConfigurationProvider;
}

namespace nat {
class NatDevice;
}

namespace forwarding {

class ServerHost;

// One forwarding rule to request: gateway public_port -> local private_port
struct PortPair {
  uint16_t private_port;
  uint16_t public_port;

  bool operator==(const PortPair &other) const = default;
};

/**
 * RuleCreator - issues the port mapping requests for one gateway
 *
 * Mapping failures are logged and swallowed here; a failed port never
 * aborts the attempt for its sibling port.
 */
class RuleCreator {
public:
  RuleCreator(const config::ConfigurationProvider &config,
              const ServerHost &host);

  // HTTP pair always, HTTPS pair when the server listens with HTTPS.
  // Reads live configuration on every call.
  std::vector<PortPair> PortsToMap() const;

  // Submit one TCP mapping (no expiry, application name as description)
  // and wait for the gateway. Returns false if the mapping failed.
  bool CreatePortMap(nat::NatDevice &device, uint16_t private_port,
                     uint16_t public_port) const;

  // Submit every pair of PortsToMap() before waiting on any, so the
  // requests overlap. Returns the number of mappings that succeeded.
  size_t CreatePortMaps(nat::NatDevice &device) const;

private:
  std::future<void> Submit(nat::NatDevice &device, const PortPair &ports) const;
  void LogFailure(const nat::NatDevice &device, const PortPair &ports,
                  const std::exception &e) const;

  const config::ConfigurationProvider &config_;
  const ServerHost &host_;
};

} // namespace forwarding
} // namespace natforward
