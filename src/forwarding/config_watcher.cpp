// Copyright (c) 2024 NatForward
// Distributed under the MIT software license

#include "forwarding/config_watcher.hpp"
#include "config/configuration_provider.hpp"
#include "forwarding/server_host.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace natforward {
namespace forwarding {

namespace {
const char *FormatBool(bool value) { return value ? "True" : "False"; }
}

ConfigWatcher::ConfigWatcher(const config::ConfigurationProvider &config,
                             const ServerHost &host)
    : config_(config), host_(host) {}

std::string ConfigWatcher::ComputeFingerprint() const {
  const config::NetworkConfiguration cfg = config_.GetNetworkConfiguration();

  std::ostringstream out;
  out << FormatBool(cfg.enable_upnp) << SEPARATOR
      << cfg.public_http_port << SEPARATOR
      << cfg.public_https_port << SEPARATOR
      << host_.HttpPort() << SEPARATOR
      << host_.HttpsPort() << SEPARATOR
      << FormatBool(host_.ListenWithHttps()) << SEPARATOR
      << FormatBool(cfg.enable_remote_access) << SEPARATOR;
  return out.str();
}

bool ConfigWatcher::HasChanged(const std::optional<std::string> &previous,
                               const std::string &current) {
  if (!previous) {
    return true;
  }
  return !std::equal(previous->begin(), previous->end(), current.begin(),
                     current.end(), [](char a, char b) {
                       return std::tolower(static_cast<unsigned char>(a)) ==
                              std::tolower(static_cast<unsigned char>(b));
                     });
}

} // namespace forwarding
} // namespace natforward
