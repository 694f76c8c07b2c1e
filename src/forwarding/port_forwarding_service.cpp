// Copyright (c) 2024 NatForward
// Distributed under the MIT software license

#include "forwarding/port_forwarding_service.hpp"
#include "config/configuration_provider.hpp"
#include "forwarding/errors.hpp"
#include "util/logging.hpp"

namespace natforward {
namespace forwarding {

PortForwardingService::PortForwardingService(
    config::ConfigurationProvider &config, const ServerHost &host,
    nat::NatDiscovery &discovery, const Config &service_config)
    : config_(config),
      controller_(std::make_unique<DiscoveryController>(
          io_context_, config, host, discovery, service_config)) {
  LOG_FWD_TRACE("PortForwardingService initialized (rule cleanup every {}ms)",
                service_config.rule_cleanup_interval.count());
}

PortForwardingService::~PortForwardingService() { Dispose(); }

bool PortForwardingService::Start() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (disposed_.load(std::memory_order_acquire)) {
    throw ObjectDisposedError("PortForwardingService");
  }
  if (running_.load(std::memory_order_acquire)) {
    return false;
  }

  StartIoThread();

  try {
    controller_->Start();
  } catch (const std::exception &) {
    StopIoThread();
    throw;
  }

  config_sub_ = config_.SubscribeConfigurationUpdated(
      [this]() { OnConfigurationUpdated(); });

  running_.store(true, std::memory_order_release);
  return true;
}

void PortForwardingService::Stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (!running_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }

  // No restarts once the host asked us to stop
  config_sub_.Unsubscribe();
  controller_->Stop();
  StopIoThread();
}

void PortForwardingService::Dispose() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (disposed_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }

  config_sub_.Unsubscribe();
  controller_->Dispose();
  StopIoThread();
  running_.store(false, std::memory_order_release);
}

void PortForwardingService::OnConfigurationUpdated() {
  try {
    controller_->OnConfigurationChanged();
  } catch (const std::exception &e) {
    LOG_FWD_ERROR("Failed to apply forwarding configuration change: {}",
                  e.what());
  }
}

void PortForwardingService::StartIoThread() {
  if (io_thread_.joinable()) {
    return;
  }

  io_context_.restart();
  work_guard_ = std::make_unique<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
      boost::asio::make_work_guard(io_context_));
  io_thread_ = std::thread([this]() { io_context_.run(); });
}

void PortForwardingService::StopIoThread() {
  if (!io_thread_.joinable()) {
    return;
  }

  work_guard_.reset();
  io_context_.stop();
  io_thread_.join();
}

} // namespace forwarding
} // namespace natforward
