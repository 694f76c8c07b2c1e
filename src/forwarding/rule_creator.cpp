// Copyright (c) 2024 NatForward
// Distributed under the MIT software license

#include "forwarding/rule_creator.hpp"
#include "config/configuration_provider.hpp"
#include "forwarding/server_host.hpp"
#include "nat/nat_device.hpp"
#include "util/logging.hpp"

namespace natforward {
namespace forwarding {

RuleCreator::RuleCreator(const config::ConfigurationProvider &config,
                         const ServerHost &host)
    : config_(config), host_(host) {}

std::vector<PortPair> RuleCreator::PortsToMap() const {
  const config::NetworkConfiguration cfg = config_.GetNetworkConfiguration();

  std::vector<PortPair> ports;
  ports.push_back(PortPair{host_.HttpPort(), cfg.public_http_port});

  if (host_.ListenWithHttps()) {
    ports.push_back(PortPair{host_.HttpsPort(), cfg.public_https_port});
  }
  return ports;
}

bool RuleCreator::CreatePortMap(nat::NatDevice &device, uint16_t private_port,
                                uint16_t public_port) const {
  const PortPair ports{private_port, public_port};
  try {
    Submit(device, ports).get();
    return true;
  } catch (const std::exception &e) {
    LogFailure(device, ports, e);
    return false;
  }
}

size_t RuleCreator::CreatePortMaps(nat::NatDevice &device) const {
  struct PendingMap {
    PortPair ports;
    std::future<void> result;
  };

  std::vector<PendingMap> pending;
  for (const auto &ports : PortsToMap()) {
    try {
      pending.push_back(PendingMap{ports, Submit(device, ports)});
    } catch (const std::exception &e) {
      LogFailure(device, ports, e);
    }
  }

  size_t mapped = 0;
  for (auto &map : pending) {
    try {
      map.result.get();
      ++mapped;
    } catch (const std::exception &e) {
      LogFailure(device, map.ports, e);
    }
  }
  return mapped;
}

std::future<void> RuleCreator::Submit(nat::NatDevice &device,
                                      const PortPair &ports) const {
  LOG_FWD_DEBUG("Creating port map on local port {} to public port {} with "
                "device {}",
                ports.private_port, ports.public_port,
                device.DeviceEndpoint().ToString());

  nat::Mapping mapping;
  mapping.protocol = nat::Protocol::Tcp;
  mapping.private_port = ports.private_port;
  mapping.public_port = ports.public_port;
  mapping.lifetime_seconds = 0;
  mapping.description = host_.Name();

  return device.CreatePortMapAsync(mapping);
}

void RuleCreator::LogFailure(const nat::NatDevice &device,
                             const PortPair &ports,
                             const std::exception &e) const {
  LOG_FWD_ERROR("Error creating port map on local port {} to public port {} "
                "with device {}: {}",
                ports.private_port, ports.public_port,
                device.DeviceEndpoint().ToString(), e.what());
}

} // namespace forwarding
} // namespace natforward
