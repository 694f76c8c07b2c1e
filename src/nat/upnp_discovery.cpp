// Copyright (c) 2024 NatForward
// Distributed under the MIT software license

#include "nat/upnp_discovery.hpp"
#include "util/logging.hpp"
#include <future>

#ifndef DISABLE_NAT_SUPPORT
#include <miniupnpc/miniupnpc.h>
#include <miniupnpc/upnpcommands.h>
#include <miniupnpc/upnperrors.h>
#endif

namespace natforward {
namespace nat {

namespace {
// miniupnpc API version compatibility
// Version 2.1+ uses 7-argument UPNP_GetValidIGD (with wanaddr)
// Earlier versions use 5-argument UPNP_GetValidIGD (without wanaddr)
#ifndef DISABLE_NAT_SUPPORT
#if MINIUPNPC_API_VERSION >= 17
#define UPNP_GETVALIDIGD_ARGS(devlist, urls, data, lanaddr) \
    devlist, urls, data, lanaddr, sizeof(lanaddr), nullptr, 0
#else
#define UPNP_GETVALIDIGD_ARGS(devlist, urls, data, lanaddr) \
    devlist, urls, data, lanaddr, sizeof(lanaddr)
#endif
#endif
}

// ============================================================================
// UPnPDevice
// ============================================================================

UPnPDevice::UPnPDevice(GatewayEndpoint endpoint, std::string control_url,
                       std::string service_type, std::string lan_address)
    : endpoint_(std::move(endpoint)), control_url_(std::move(control_url)),
      service_type_(std::move(service_type)),
      lan_address_(std::move(lan_address)) {}

std::future<void> UPnPDevice::CreatePortMapAsync(const Mapping &mapping) {
  // Copy everything the request needs; the device may go away first
  std::string control_url = control_url_;
  std::string service_type = service_type_;
  std::string lan_address = lan_address_;
  std::string endpoint = endpoint_.ToString();

  return std::async(std::launch::async, [control_url, service_type,
                                         lan_address, endpoint, mapping]() {
#ifdef DISABLE_NAT_SUPPORT
    throw MappingError("NAT support disabled at compile time");
#else
    const std::string internal_port_str = std::to_string(mapping.private_port);
    const std::string external_port_str = std::to_string(mapping.public_port);
    const std::string duration_str = std::to_string(mapping.lifetime_seconds);

    int ret = UPNP_AddPortMapping(
        control_url.c_str(),
        service_type.c_str(),
        external_port_str.c_str(),     // external port
        internal_port_str.c_str(),     // internal port
        lan_address.c_str(),           // internal client
        mapping.description.c_str(),   // description
        ProtocolName(mapping.protocol),
        nullptr,                       // remote host (any)
        duration_str.c_str()           // lease duration, 0 = permanent
    );

    if (ret != UPNPCOMMAND_SUCCESS) {
      const char *reason = strupnperror(ret);
      throw MappingError("AddPortMapping failed on " + endpoint + ": " +
                             (reason ? reason : "unknown error") + " (" +
                             std::to_string(ret) + ")",
                         ret);
    }

    LOG_NAT_TRACE("UPnP port mapping created: {} {} -> {}:{} on {}",
                  ProtocolName(mapping.protocol), mapping.public_port,
                  lan_address, mapping.private_port, endpoint);
#endif
  });
}

// ============================================================================
// UPnPDiscovery
// ============================================================================

UPnPDiscovery::UPnPDiscovery(const Config &config) : config_(config) {}

UPnPDiscovery::~UPnPDiscovery() { StopDiscovery(); }

void UPnPDiscovery::StartDiscovery() {
  std::lock_guard<std::mutex> lock(start_stop_mutex_);
  if (running_.load(std::memory_order_acquire)) {
    LOG_NAT_TRACE("UPnP discovery already running");
    return;
  }

#ifdef DISABLE_NAT_SUPPORT
  LOG_NAT_WARN("NAT support disabled at compile time, no gateways will be found");
#endif

  running_.store(true, std::memory_order_release);
  discovery_thread_ = std::thread(&UPnPDiscovery::DiscoveryLoop, this);
  LOG_NAT_TRACE("UPnP discovery started (search interval: {}s)",
                config_.search_interval.count());
}

void UPnPDiscovery::StopDiscovery() {
  std::lock_guard<std::mutex> lock(start_stop_mutex_);
  if (!running_.exchange(false)) {
    return;
  }

  {
    std::lock_guard<std::mutex> wait_lock(wait_mutex_);
  }
  wait_cv_.notify_all();

  if (discovery_thread_.joinable()) {
    discovery_thread_.join();
  }
  LOG_NAT_TRACE("UPnP discovery stopped");
}

void UPnPDiscovery::DiscoveryLoop() {
  std::unique_lock<std::mutex> lock(wait_mutex_);
  while (running_.load(std::memory_order_acquire)) {
    // Search outside the lock
    lock.unlock();
    SearchOnce();
    lock.lock();

    if (wait_cv_.wait_for(lock, config_.search_interval, [this]() {
          return !running_.load(std::memory_order_acquire);
        })) {
      break; // stop requested
    }
  }
}

void UPnPDiscovery::SearchOnce() {
#ifdef DISABLE_NAT_SUPPORT
  return;
#else
  int error = 0;
  UPNPDev *devlist = upnpDiscover(
      config_.discover_timeout_ms,
      nullptr,  // multicast interface
      nullptr,  // minissdpd socket path
      0,        // sameport
      0,        // ipv6
      2,        // ttl
      &error
  );

  if (!devlist) {
    LOG_NAT_DEBUG("UPnP discovery found no devices (error code {})", error);
    return;
  }

  // Get first valid IGD (Internet Gateway Device)
  UPNPUrls urls{};
  IGDdatas data{};
  char lanaddr[64] = {0};

  int result = UPNP_GetValidIGD(UPNP_GETVALIDIGD_ARGS(devlist, &urls, &data, lanaddr));

  freeUPNPDevlist(devlist);

  if (result != 1) {
    LOG_NAT_DEBUG("no connected IGD found (result: {})", result);
    FreeUPNPUrls(&urls);
    return;
  }

  std::string control_url = urls.controlURL ? urls.controlURL : "";
  std::string root_url = urls.rootdescURL ? urls.rootdescURL : control_url;
  std::string service_type = data.first.servicetype;
  FreeUPNPUrls(&urls);

  auto endpoint = ParseUrlEndpoint(root_url);
  if (!endpoint || control_url.empty() || service_type.empty() ||
      lanaddr[0] == '\0') {
    LOG_NAT_DEBUG("ignoring IGD with unusable description URL: {}", root_url);
    return;
  }

  if (!running_.load(std::memory_order_acquire)) {
    return;
  }

  LOG_NAT_TRACE("gateway found at {} (LAN address: {})", endpoint->ToString(),
                lanaddr);

  NotifyDeviceFound(std::make_shared<UPnPDevice>(
      *endpoint, control_url, service_type, lanaddr));
#endif // DISABLE_NAT_SUPPORT
}

std::optional<GatewayEndpoint>
UPnPDiscovery::ParseUrlEndpoint(const std::string &url) {
  size_t host_start = url.find("://");
  host_start = (host_start == std::string::npos) ? 0 : host_start + 3;

  size_t authority_end = url.find('/', host_start);
  std::string authority = url.substr(host_start, authority_end == std::string::npos
                                                     ? std::string::npos
                                                     : authority_end - host_start);
  if (authority.empty()) {
    return std::nullopt;
  }

  std::string host;
  std::string port_str;
  if (authority.front() == '[') {
    size_t close = authority.find(']');
    if (close == std::string::npos) {
      return std::nullopt;
    }
    host = authority.substr(1, close - 1);
    if (close + 1 < authority.size()) {
      if (authority[close + 1] != ':') {
        return std::nullopt;
      }
      port_str = authority.substr(close + 2);
    }
  } else {
    size_t colon = authority.rfind(':');
    host = authority.substr(0, colon);
    if (colon != std::string::npos) {
      port_str = authority.substr(colon + 1);
    }
  }

  boost::system::error_code ec;
  auto address = boost::asio::ip::make_address(host, ec);
  if (ec) {
    return std::nullopt;
  }

  uint16_t port = 80;
  if (!port_str.empty()) {
    if (port_str.size() > 5 ||
        port_str.find_first_not_of("0123456789") != std::string::npos) {
      return std::nullopt;
    }
    int value = std::stoi(port_str);
    if (value > 65535) {
      return std::nullopt;
    }
    port = static_cast<uint16_t>(value);
  }

  return GatewayEndpoint{address, port};
}

} // namespace nat
} // namespace natforward
