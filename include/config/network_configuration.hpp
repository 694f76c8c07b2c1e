// Copyright (c) 2024 NatForward
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace natforward {
namespace config {

// Default public ports, matching the media server defaults
constexpr uint16_t DEFAULT_PUBLIC_HTTP_PORT = 8096;
constexpr uint16_t DEFAULT_PUBLIC_HTTPS_PORT = 8920;

// Persisted forwarding settings
struct NetworkConfiguration {
  bool enable_upnp{true};          // Automatic port forwarding on the gateway
  bool enable_remote_access{true}; // Server may be reached from outside the LAN
  uint16_t public_http_port{DEFAULT_PUBLIC_HTTP_PORT};
  uint16_t public_https_port{DEFAULT_PUBLIC_HTTPS_PORT};

  bool operator==(const NetworkConfiguration &other) const = default;
};

// Configuration could not be read, parsed or validated
class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string &what) : std::runtime_error(what) {}
};

} // namespace config
} // namespace natforward
