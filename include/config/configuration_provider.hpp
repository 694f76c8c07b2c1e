// Copyright (c) 2024 NatForward
// Distributed under the MIT software license

#pragma once

#include "config/network_configuration.hpp"
#include "util/event_source.hpp"
#include <functional>

namespace natforward {
namespace config {

/**
 * Source of the persisted network configuration.
 *
 * Implementations raise ConfigurationUpdated (no payload) whenever any
 * setting changes; subscribers re-read what they need.
 */
class ConfigurationProvider {
public:
  using ConfigurationUpdatedCallback = std::function<void()>;

  virtual ~ConfigurationProvider() = default;

  // Current settings. Throws ConfigError if they cannot be read.
  virtual NetworkConfiguration GetNetworkConfiguration() const = 0;

  util::Subscription
  SubscribeConfigurationUpdated(ConfigurationUpdatedCallback callback) {
    return updated_.Subscribe(std::move(callback));
  }

protected:
  void NotifyConfigurationUpdated() { updated_.Notify(); }

private:
  util::EventSource<> updated_;
};

} // namespace config
} // namespace natforward
