// Copyright (c) 2024 NatForward
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace natforward {
namespace forwarding {

// Read-only view of the local server whose ports are exposed
class ServerHost {
public:
  virtual ~ServerHost() = default;

  virtual uint16_t HttpPort() const = 0;
  virtual uint16_t HttpsPort() const = 0;
  virtual bool ListenWithHttps() const = 0;
  // Application name, used as the mapping description on the gateway
  virtual std::string Name() const = 0;
};

// ServerHost with fixed values (from the command line)
class StaticServerHost : public ServerHost {
public:
  StaticServerHost(uint16_t http_port, uint16_t https_port,
                   bool listen_with_https, std::string name)
      : http_port_(http_port), https_port_(https_port),
        listen_with_https_(listen_with_https), name_(std::move(name)) {}

  uint16_t HttpPort() const override { return http_port_; }
  uint16_t HttpsPort() const override { return https_port_; }
  bool ListenWithHttps() const override { return listen_with_https_; }
  std::string Name() const override { return name_; }

private:
  uint16_t http_port_;
  uint16_t https_port_;
  bool listen_with_https_;
  std::string name_;
};

} // namespace forwarding
} // namespace natforward
