// Copyright (c) 2024 NatForward
// Distributed under the MIT software license

#pragma once

#include "config/configuration_provider.hpp"
#include <mutex>
#include <nlohmann/json_fwd.hpp>
#include <string>

namespace natforward {
namespace config {

/**
 * ConfigStore - JSON file backed ConfigurationProvider
 *
 * File layout:
 *   {
 *     "enable_upnp": true,
 *     "enable_remote_access": true,
 *     "public_http_port": 8096,
 *     "public_https_port": 8920
 *   }
 *
 * Missing keys take their defaults. With an empty path the store is
 * memory only (Load/Save are no-ops).
 */
class ConfigStore : public ConfigurationProvider {
public:
  explicit ConfigStore(std::string path = "", bool auto_save = true);

  NetworkConfiguration GetNetworkConfiguration() const override;

  // Read the file. A missing file is not an error (defaults are kept).
  // Returns false and keeps current settings on parse/validation errors.
  bool Load();

  // Write current settings atomically (temp file + rename)
  bool Save() const;

  // Replace settings. Throws ConfigError on invalid values. Raises
  // ConfigurationUpdated when the value actually changed.
  void Update(const NetworkConfiguration &config);

  // Load() and raise ConfigurationUpdated if the file changed anything.
  bool Reload();

  const std::string &GetPath() const { return path_; }

  // JSON conversion (throws ConfigError on invalid values)
  static NetworkConfiguration FromJson(const nlohmann::json &j);
  static nlohmann::json ToJson(const NetworkConfiguration &config);
  static void Validate(const NetworkConfiguration &config);

private:
  bool SaveInternal(const NetworkConfiguration &config) const;

  std::string path_;
  bool auto_save_;

  mutable std::mutex mutex_;
  NetworkConfiguration config_;
};

} // namespace config
} // namespace natforward
