// Copyright (c) 2024 NatForward
// Distributed under the MIT software license

#include "util/logging.hpp"
#include <iostream>
#include <map>
#include <mutex>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace natforward {
namespace util {

bool LogManager::initialized_ = false;

namespace {

constexpr const char *LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";

std::recursive_mutex g_log_mutex;
std::map<std::string, std::shared_ptr<spdlog::logger>> g_loggers;

spdlog::sink_ptr MakeSink(bool log_to_file, const std::string &path) {
  spdlog::sink_ptr sink;
  if (log_to_file) {
    sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path,
                                                               true); // append
  } else {
    sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  }
  sink->set_pattern(LOG_PATTERN);
  return sink;
}

} // namespace

void LogManager::Initialize(const std::string &log_level, bool log_to_file,
                            const std::string &log_file_path) {
  std::lock_guard<std::recursive_mutex> lock(g_log_mutex);
  if (initialized_) {
    return;
  }

  try {
    spdlog::sink_ptr sink = MakeSink(log_to_file, log_file_path);
    const auto level = spdlog::level::from_str(log_level);

    for (const char *component : COMPONENTS) {
      auto logger = std::make_shared<spdlog::logger>(component, sink);
      logger->set_level(level);
      // Daemon output is mostly lifecycle events; keep the file current
      logger->flush_on(spdlog::level::info);
      spdlog::drop(component);
      spdlog::register_logger(logger);
      g_loggers[component] = logger;
    }

    spdlog::set_default_logger(g_loggers["default"]);
    initialized_ = true;

    LOG_DEBUG("Logging initialized (level: {}, sink: {})", log_level,
              log_to_file ? log_file_path : "console");
  } catch (const spdlog::spdlog_ex &ex) {
    std::cerr << "Log initialization failed: " << ex.what() << std::endl;
  }
}

void LogManager::Shutdown() {
  std::lock_guard<std::recursive_mutex> lock(g_log_mutex);
  if (!initialized_) {
    return;
  }

  LOG_DEBUG("Shutting down logging");
  spdlog::shutdown();
  g_loggers.clear();
  initialized_ = false;
}

bool LogManager::IsInitialized() {
  std::lock_guard<std::recursive_mutex> lock(g_log_mutex);
  return initialized_;
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string &name) {
  std::lock_guard<std::recursive_mutex> lock(g_log_mutex);
  if (!initialized_) {
    Initialize();
  }

  auto it = g_loggers.find(name);
  return it != g_loggers.end() ? it->second : g_loggers["default"];
}

void LogManager::SetLogLevel(const std::string &level) {
  std::lock_guard<std::recursive_mutex> lock(g_log_mutex);
  if (!initialized_) {
    return;
  }

  const auto log_level = spdlog::level::from_str(level);
  for (auto &[name, logger] : g_loggers) {
    logger->set_level(log_level);
  }
  LOG_INFO("Log level changed to: {}", level);
}

bool LogManager::SetComponentLevel(const std::string &component,
                                   const std::string &level) {
  std::lock_guard<std::recursive_mutex> lock(g_log_mutex);
  if (!initialized_) {
    return false;
  }

  auto it = g_loggers.find(component);
  if (it == g_loggers.end()) {
    LOG_WARN("Unknown log component: {}", component);
    return false;
  }

  it->second->set_level(spdlog::level::from_str(level));
  LOG_INFO("Component '{}' log level set to: {}", component, level);
  return true;
}

} // namespace util
} // namespace natforward
