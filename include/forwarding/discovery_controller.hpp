// Copyright (c) 2024 NatForward
// Distributed under the MIT software license

#pragma once

#include "forwarding/config_watcher.hpp"
#include "forwarding/rule_creator.hpp"
#include "nat/nat_device.hpp"
#include "util/event_source.hpp"
#include "util/threadsafe_containers.hpp"
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace natforward {
namespace config {
class ConfigurationProvider;
}

namespace forwarding {

class ServerHost;

/**
 * DiscoveryController - owns one gateway discovery session at a time
 *
 * States: Stopped (initial/terminal) and Discovering.
 *
 * While discovering, every gateway reported by the discovery backend is
 * mapped at most once per discovery window. The window ends when the
 * periodic cleanup timer clears the set of handled gateways, or when
 * discovery is restarted.
 *
 * Each device-found notification is handled on its own task, so the
 * backend thread never waits on a gateway and a gateway that never answers
 * does not hold up any other. The destructor waits for handlers still in
 * flight. The cleanup timer runs on the supplied io_context, which must run
 * on a single thread.
 */
class DiscoveryController {
public:
  static constexpr std::chrono::minutes DEFAULT_RULE_CLEANUP_INTERVAL{10};

  struct Config {
    std::chrono::milliseconds rule_cleanup_interval; // Period and initial delay

    Config() : rule_cleanup_interval(DEFAULT_RULE_CLEANUP_INTERVAL) {}
  };

  DiscoveryController(boost::asio::io_context &io_context,
                      const config::ConfigurationProvider &config,
                      const ServerHost &host, nat::NatDiscovery &discovery,
                      const Config &controller_config = Config{});
  ~DiscoveryController();

  DiscoveryController(const DiscoveryController &) = delete;
  DiscoveryController &operator=(const DiscoveryController &) = delete;

  // Begin discovery unless UPnP or remote access is disabled. Records the
  // configuration fingerprint. No-op while already discovering.
  // Throws ObjectDisposedError after Dispose(), config::ConfigError if
  // the configuration cannot be read.
  void Start();

  // End the discovery session. Idempotent.
  void Stop();

  // Restart discovery if the forwarding-relevant settings changed since the
  // last recorded fingerprint. Only restarts once Start() has been called.
  void OnConfigurationChanged();

  // Map the exposed ports on a newly reported gateway. Duplicate reports
  // within the discovery window are ignored. Mapping errors are logged,
  // never thrown. Throws ObjectDisposedError after Dispose().
  void OnGatewayFound(nat::NatDevice &device);

  // Stop discovery and release the timer; further events fail fast.
  // Safe to call more than once.
  void Dispose();

  // Forget every handled gateway (what the cleanup timer does)
  void ClearCreatedRules();

  bool IsDiscovering() const {
    return discovering_.load(std::memory_order_acquire);
  }
  bool IsDisposed() const { return disposed_.load(std::memory_order_acquire); }
  bool HasCleanupTimer() const;
  size_t CreatedRuleCount() const { return created_rules_.Size(); }
  bool HasCreatedRules(const nat::GatewayEndpoint &endpoint) const {
    return created_rules_.Contains(endpoint);
  }
  std::optional<std::string> CurrentFingerprint() const;

  // Device-found handlers not yet finished
  size_t ActiveHandlerCount() const;

private:
  using TimerPtr = std::shared_ptr<boost::asio::steady_timer>;

  // Require mutex_ held
  void StartLocked();
  void StopLocked();
  void ArmCleanupTimer();
  void DisarmCleanupTimer();
  void ThrowIfDisposed() const;

  void ScheduleNextCleanup(const TimerPtr &timer);
  void DispatchGatewayFound(std::shared_ptr<nat::NatDevice> device);
  void WaitForHandlers();

  boost::asio::io_context &io_context_;
  const config::ConfigurationProvider &config_;
  nat::NatDiscovery &discovery_;
  Config controller_config_;

  ConfigWatcher watcher_;
  RuleCreator rule_creator_;

  mutable std::mutex mutex_; // Serializes start/stop/restart/dispose
  std::atomic<bool> discovering_{false};
  std::atomic<bool> disposed_{false};
  bool started_{false}; // Start() called at least once
  std::optional<std::string> fingerprint_;

  // Gateways already handled in the current discovery window
  util::ThreadSafeSet<nat::GatewayEndpoint> created_rules_;

  util::Subscription device_found_sub_;
  TimerPtr cleanup_timer_;

  // One entry per dispatched notification; finished ones are reaped on the
  // next dispatch
  mutable std::mutex handlers_mutex_;
  std::vector<std::future<void>> handlers_;
};

} // namespace forwarding
} // namespace natforward
