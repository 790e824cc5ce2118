// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/logging.hpp"

#include <array>
#include <map>
#include <mutex>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace tangle {
namespace util {

namespace {

constexpr std::array<const char*, 6> kComponents = {"default", "network", "pool", "pow", "wallet", "client"};

std::once_flag g_init_flag;
std::mutex g_mutex;

// Guarded by g_mutex
std::vector<spdlog::sink_ptr> g_sinks;
std::map<std::string, std::shared_ptr<spdlog::logger>> g_loggers;
spdlog::level::level_enum g_level = spdlog::level::off;

// Requires g_mutex
void CreateLoggersLocked() {
  if (g_sinks.empty()) {
    g_sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }
  for (const char* name : kComponents) {
    auto logger = std::make_shared<spdlog::logger>(name, g_sinks.begin(), g_sinks.end());
    logger->set_level(g_level);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    logger->flush_on(spdlog::level::warn);
    g_loggers[name] = std::move(logger);
  }
}

}  // namespace

void LogManager::Initialize(const std::string& log_level, bool log_to_file, const std::string& log_file_path) {
  std::call_once(g_init_flag, [&]() {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_level = spdlog::level::from_str(log_level);
    g_sinks.clear();
    g_sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (log_to_file && !log_file_path.empty()) {
      try {
        g_sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file_path, false));
      } catch (const spdlog::spdlog_ex& e) {
        // Console logging still works; report through it once loggers exist
        CreateLoggersLocked();
        g_loggers["default"]->error("Failed to open log file {}: {}", log_file_path, e.what());
        return;
      }
    }
    CreateLoggersLocked();
  });
}

void LogManager::Shutdown() {
  std::lock_guard<std::mutex> lock(g_mutex);
  for (auto& [name, logger] : g_loggers) {
    logger->flush();
  }
  g_loggers.clear();
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string& name) {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_loggers.empty()) {
    CreateLoggersLocked();
  }
  auto it = g_loggers.find(name);
  if (it == g_loggers.end()) {
    return g_loggers["default"];
  }
  return it->second;
}

void LogManager::SetLogLevel(const std::string& level) {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_loggers.empty()) {
    CreateLoggersLocked();
  }
  g_level = spdlog::level::from_str(level);
  for (auto& [name, logger] : g_loggers) {
    logger->set_level(g_level);
  }
}

void LogManager::SetComponentLevel(const std::string& component, const std::string& level) {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_loggers.empty()) {
    CreateLoggersLocked();
  }
  auto it = g_loggers.find(component);
  if (it != g_loggers.end()) {
    it->second->set_level(spdlog::level::from_str(level));
  }
}

}  // namespace util
}  // namespace tangle
