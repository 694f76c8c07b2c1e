// Copyright (c) 2024 NatForward
// Distributed under the MIT software license

#pragma once

#include <optional>
#include <string>

namespace natforward {
namespace config {
class ConfigurationProvider;
}

namespace forwarding {

class ServerHost;

/**
 * ConfigWatcher - change detection for the forwarding-relevant settings
 *
 * The fingerprint covers the UPnP and remote access switches, both public
 * ports, both local ports and the HTTPS switch. Anything else in the
 * configuration may change without restarting discovery.
 */
class ConfigWatcher {
public:
  static constexpr char SEPARATOR = '|';

  ConfigWatcher(const config::ConfigurationProvider &config,
                const ServerHost &host);

  // Deterministic serialization of the current settings.
  // Throws config::ConfigError if the configuration cannot be read.
  std::string ComputeFingerprint() const;

  // Case-insensitive comparison; an unset previous value counts as a change
  static bool HasChanged(const std::optional<std::string> &previous,
                         const std::string &current);

private:
  const config::ConfigurationProvider &config_;
  const ServerHost &host_;
};

} // namespace forwarding
} // namespace natforward
