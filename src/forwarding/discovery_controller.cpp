// Copyright (c) 2024 NatForward
// Distributed under the MIT software license

#include "forwarding/discovery_controller.hpp"
#include "config/configuration_provider.hpp"
#include "forwarding/errors.hpp"
#include "forwarding/server_host.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <boost/asio/post.hpp>

namespace natforward {
namespace forwarding {

DiscoveryController::DiscoveryController(
    boost::asio::io_context &io_context,
    const config::ConfigurationProvider &config, const ServerHost &host,
    nat::NatDiscovery &discovery, const Config &controller_config)
    : io_context_(io_context), config_(config), discovery_(discovery),
      controller_config_(controller_config), watcher_(config, host),
      rule_creator_(config, host) {}

DiscoveryController::~DiscoveryController() {
  Dispose();
  // Handlers in flight still use the members below
  WaitForHandlers();
}

void DiscoveryController::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  ThrowIfDisposed();

  fingerprint_ = watcher_.ComputeFingerprint();
  started_ = true;
  StartLocked();
}

void DiscoveryController::Stop() {
  std::lock_guard<std::mutex> lock(mutex_);
  StopLocked();
}

void DiscoveryController::OnConfigurationChanged() {
  std::lock_guard<std::mutex> lock(mutex_);
  ThrowIfDisposed();

  std::optional<std::string> previous = fingerprint_;
  std::string current = watcher_.ComputeFingerprint();
  fingerprint_ = current;

  // The first recorded value is a baseline, not a change
  if (!previous || !started_) {
    return;
  }

  if (!ConfigWatcher::HasChanged(previous, current)) {
    LOG_FWD_TRACE("configuration updated, forwarding settings unchanged");
    return;
  }

  LOG_FWD_DEBUG("forwarding settings changed ({} -> {}), restarting NAT discovery",
                *previous, current);
  StopLocked();
  StartLocked();
}

void DiscoveryController::OnGatewayFound(nat::NatDevice &device) {
  ThrowIfDisposed();

  try {
    // On some networks the gateway answers every search. Map it once per
    // discovery window.
    if (!created_rules_.TryInsert(device.DeviceEndpoint())) {
      LOG_FWD_TRACE("ignoring repeated discovery of {}",
                    device.DeviceEndpoint().ToString());
      return;
    }

    size_t mapped = rule_creator_.CreatePortMaps(device);
    LOG_FWD_DEBUG("{} port map(s) created with device {}", mapped,
                  device.DeviceEndpoint().ToString());
  } catch (const std::exception &e) {
    LOG_FWD_ERROR("Error creating port forwarding rules: {}", e.what());
  }
}

void DiscoveryController::Dispose() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (disposed_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }

  StopLocked();
  DisarmCleanupTimer();
  created_rules_.Clear();
}

void DiscoveryController::ClearCreatedRules() {
  if (!created_rules_.Empty()) {
    LOG_FWD_TRACE("clearing {} handled gateway(s)", created_rules_.Size());
  }
  created_rules_.Clear();
}

bool DiscoveryController::HasCleanupTimer() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cleanup_timer_ != nullptr;
}

std::optional<std::string> DiscoveryController::CurrentFingerprint() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return fingerprint_;
}

size_t DiscoveryController::ActiveHandlerCount() const {
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  return static_cast<size_t>(
      std::count_if(handlers_.begin(), handlers_.end(),
                    [](const std::future<void> &handler) {
                      return handler.wait_for(std::chrono::seconds(0)) !=
                             std::future_status::ready;
                    }));
}

void DiscoveryController::StartLocked() {
  if (discovering_.load(std::memory_order_acquire)) {
    return;
  }

  const config::NetworkConfiguration cfg = config_.GetNetworkConfiguration();
  if (!cfg.enable_upnp || !cfg.enable_remote_access) {
    return;
  }

  LOG_FWD_INFO("Starting NAT discovery");

  // A new session is a new discovery window
  created_rules_.Clear();

  device_found_sub_ = discovery_.SubscribeDeviceFound(
      [this](std::shared_ptr<nat::NatDevice> device) {
        DispatchGatewayFound(std::move(device));
      });

  try {
    discovery_.StartDiscovery();
  } catch (const std::exception &) {
    device_found_sub_.Unsubscribe();
    throw;
  }

  discovering_.store(true, std::memory_order_release);

  DisarmCleanupTimer();
  ArmCleanupTimer();
}

void DiscoveryController::StopLocked() {
  DisarmCleanupTimer();

  if (!discovering_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }

  LOG_FWD_INFO("Stopping NAT discovery");

  // Detach first so no notification slips in while the backend winds down
  device_found_sub_.Unsubscribe();
  discovery_.StopDiscovery();
}

void DiscoveryController::ArmCleanupTimer() {
  auto timer = std::make_shared<boost::asio::steady_timer>(io_context_);
  cleanup_timer_ = timer;
  ScheduleNextCleanup(timer);
}

void DiscoveryController::DisarmCleanupTimer() {
  if (!cleanup_timer_) {
    return;
  }

  // Cancel on the io thread; the handler also checks it is still current
  TimerPtr timer = std::move(cleanup_timer_);
  cleanup_timer_.reset();
  boost::asio::post(io_context_, [timer]() { timer->cancel(); });
}

void DiscoveryController::ScheduleNextCleanup(const TimerPtr &timer) {
  timer->expires_after(controller_config_.rule_cleanup_interval);
  timer->async_wait([this, timer](const boost::system::error_code &ec) {
    if (ec) {
      return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (cleanup_timer_ != timer) {
      return; // torn down by Stop()/Dispose()
    }

    ClearCreatedRules();
    ScheduleNextCleanup(timer);
  });
}

void DiscoveryController::DispatchGatewayFound(
    std::shared_ptr<nat::NatDevice> device) {
  if (!device) {
    return;
  }

  std::lock_guard<std::mutex> lock(handlers_mutex_);
  handlers_.erase(std::remove_if(handlers_.begin(), handlers_.end(),
                                 [](const std::future<void> &handler) {
                                   return handler.wait_for(std::chrono::seconds(
                                              0)) == std::future_status::ready;
                                 }),
                  handlers_.end());

  try {
    handlers_.push_back(std::async(std::launch::async, [this, device]() {
      try {
        OnGatewayFound(*device);
      } catch (const ObjectDisposedError &e) {
        LOG_FWD_ERROR("device found event for {} after dispose: {}",
                      device->DeviceEndpoint().ToString(), e.what());
      }
    }));
  } catch (const std::exception &e) {
    LOG_FWD_ERROR("failed to dispatch device found event for {}: {}",
                  device->DeviceEndpoint().ToString(), e.what());
  }
}

void DiscoveryController::WaitForHandlers() {
  std::vector<std::future<void>> handlers;
  {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handlers.swap(handlers_);
  }
  for (auto &handler : handlers) {
    handler.wait();
  }
}

void DiscoveryController::ThrowIfDisposed() const {
  if (disposed_.load(std::memory_order_acquire)) {
    throw ObjectDisposedError("DiscoveryController");
  }
}

} // namespace forwarding
} // namespace natforward
