// Copyright (c) 2024 NatForward
// Distributed under the MIT software license

#include "nat/nat_device.hpp"

namespace natforward {
namespace nat {

std::string GatewayEndpoint::ToString() const {
  if (address.is_v6()) {
    return "[" + address.to_string() + "]:" + std::to_string(port);
  }
  return address.to_string() + ":" + std::to_string(port);
}

const char *ProtocolName(Protocol protocol) {
  switch (protocol) {
  case Protocol::Tcp:
    return "TCP";
  case Protocol::Udp:
    return "UDP";
  }
  return "TCP";
}

} // namespace nat
} // namespace natforward
