// Copyright (c) 2024 NatForward
// Distributed under the MIT software license

#include "config/config_store.hpp"
#include "util/logging.hpp"
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <unistd.h>

using json = nlohmann::json;

namespace natforward {
namespace config {

namespace {

uint16_t ReadPort(const json &j, const char *key, uint16_t fallback) {
  if (!j.contains(key)) {
    return fallback;
  }
  const auto &value = j.at(key);
  if (!value.is_number_integer()) {
    throw ConfigError(std::string(key) + " must be an integer");
  }
  int64_t port = value.get<int64_t>();
  if (port < 1 || port > 65535) {
    throw ConfigError(std::string(key) + " out of range: " +
                      std::to_string(port));
  }
  return static_cast<uint16_t>(port);
}

bool ReadFlag(const json &j, const char *key, bool fallback) {
  if (!j.contains(key)) {
    return fallback;
  }
  const auto &value = j.at(key);
  if (!value.is_boolean()) {
    throw ConfigError(std::string(key) + " must be a boolean");
  }
  return value.get<bool>();
}

} // namespace

ConfigStore::ConfigStore(std::string path, bool auto_save)
    : path_(std::move(path)), auto_save_(auto_save) {
  LOG_CONFIG_TRACE("ConfigStore initialized (path: {}, auto_save: {})",
                   path_.empty() ? "<none>" : path_, auto_save_);
}

NetworkConfiguration ConfigStore::GetNetworkConfiguration() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return config_;
}

NetworkConfiguration ConfigStore::FromJson(const json &j) {
  if (!j.is_object()) {
    throw ConfigError("configuration root must be an object");
  }

  NetworkConfiguration config;
  config.enable_upnp = ReadFlag(j, "enable_upnp", config.enable_upnp);
  config.enable_remote_access =
      ReadFlag(j, "enable_remote_access", config.enable_remote_access);
  config.public_http_port =
      ReadPort(j, "public_http_port", config.public_http_port);
  config.public_https_port =
      ReadPort(j, "public_https_port", config.public_https_port);
  return config;
}

json ConfigStore::ToJson(const NetworkConfiguration &config) {
  return json{{"enable_upnp", config.enable_upnp},
              {"enable_remote_access", config.enable_remote_access},
              {"public_http_port", config.public_http_port},
              {"public_https_port", config.public_https_port}};
}

void ConfigStore::Validate(const NetworkConfiguration &config) {
  if (config.public_http_port == 0) {
    throw ConfigError("public_http_port must not be 0");
  }
  if (config.public_https_port == 0) {
    throw ConfigError("public_https_port must not be 0");
  }
}

bool ConfigStore::Load() {
  if (path_.empty()) {
    LOG_CONFIG_TRACE("ConfigStore: no path specified, skipping load");
    return true;
  }

  std::ifstream file(path_);
  if (!file.is_open()) {
    LOG_CONFIG_DEBUG("ConfigStore: no existing configuration at {}, using defaults",
                     path_);
    return true; // Not an error - first run
  }

  NetworkConfiguration loaded;
  try {
    json j;
    file >> j;
    loaded = FromJson(j);
  } catch (const std::exception &e) {
    LOG_CONFIG_ERROR("ConfigStore: failed to parse {}: {}", path_, e.what());
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = loaded;
  }

  LOG_CONFIG_DEBUG("ConfigStore: loaded {} (upnp: {}, remote access: {}, "
                   "public http: {}, public https: {})",
                   path_, loaded.enable_upnp, loaded.enable_remote_access,
                   loaded.public_http_port, loaded.public_https_port);
  return true;
}

bool ConfigStore::Save() const {
  NetworkConfiguration snapshot = GetNetworkConfiguration();
  return SaveInternal(snapshot);
}

bool ConfigStore::SaveInternal(const NetworkConfiguration &config) const {
  if (path_.empty()) {
    LOG_CONFIG_TRACE("ConfigStore: no path specified, skipping save");
    return true;
  }

  std::filesystem::path dest(path_);
  std::filesystem::path tmp = dest;
  tmp += ".tmp";

  std::string data = ToJson(config).dump(2);

  int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
  if (fd < 0) {
    LOG_CONFIG_ERROR("ConfigStore: failed to open {} for writing", tmp.string());
    return false;
  }
  size_t total = 0;
  while (total < data.size()) {
    ssize_t n = ::write(fd, data.data() + total, data.size() - total);
    if (n <= 0) {
      LOG_CONFIG_ERROR("ConfigStore: write error to {}", tmp.string());
      ::close(fd);
      std::error_code ec_remove;
      std::filesystem::remove(tmp, ec_remove);
      return false;
    }
    total += static_cast<size_t>(n);
  }
  if (::fsync(fd) != 0) {
    LOG_CONFIG_ERROR("ConfigStore: fsync failed for {}", tmp.string());
    ::close(fd);
    std::error_code ec_remove;
    std::filesystem::remove(tmp, ec_remove);
    return false;
  }
  ::close(fd);

  std::error_code ec;
  std::filesystem::rename(tmp, dest, ec);
  if (ec) {
    LOG_CONFIG_ERROR("ConfigStore: failed to rename {} -> {}: {}", tmp.string(),
                     dest.string(), ec.message());
    std::filesystem::remove(tmp, ec);
    return false;
  }

  LOG_CONFIG_TRACE("ConfigStore: saved configuration to {}", path_);
  return true;
}

void ConfigStore::Update(const NetworkConfiguration &config) {
  Validate(config);

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_ == config) {
      return;
    }
    config_ = config;
  }

  if (auto_save_ && !SaveInternal(config)) {
    LOG_CONFIG_WARN("ConfigStore: updated configuration was not persisted");
  }

  NotifyConfigurationUpdated();
}

bool ConfigStore::Reload() {
  NetworkConfiguration before = GetNetworkConfiguration();
  if (!Load()) {
    return false;
  }
  if (GetNetworkConfiguration() != before) {
    LOG_CONFIG_INFO("Configuration reloaded from {}", path_);
    NotifyConfigurationUpdated();
  }
  return true;
}

} // namespace config
} // namespace natforward
