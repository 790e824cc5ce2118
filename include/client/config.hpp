// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace tangle {

struct ClientConfig {
  std::vector<std::string> nodes;
  std::chrono::milliseconds node_sync_interval{std::chrono::seconds(60)};
  bool node_sync_enabled{true};
  bool local_pow{true};
  std::chrono::milliseconds request_timeout{std::chrono::seconds(30)};
  unsigned pow_worker_count{0};  // 0 = hardware concurrency
};

// Overlay the keys present in j onto config. Durations are in seconds.
// Throws Error(InvalidParameter) on a wrongly typed or unknown key.
void ApplyConfigJson(const nlohmann::json& j, ClientConfig& config);

// Read a JSON config file and overlay it onto config
void LoadConfigFile(const std::string& path, ClientConfig& config);

}  // namespace tangle
