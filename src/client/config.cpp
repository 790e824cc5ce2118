// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "client/config.hpp"

#include "client/error.hpp"
#include "util/logging.hpp"

#include <fstream>

namespace tangle {

using json = nlohmann::json;

namespace {

std::chrono::milliseconds Seconds(const json& v, const char* key) {
  if (!v.is_number() || v.get<double>() <= 0.0) {
    throw Error(ErrorKind::InvalidParameter, std::string("config: '") + key + "' must be a positive number of seconds");
  }
  return std::chrono::milliseconds(static_cast<int64_t>(v.get<double>() * 1000.0));
}

}  // namespace

void ApplyConfigJson(const json& j, ClientConfig& config) {
  if (!j.is_object()) {
    throw Error(ErrorKind::InvalidParameter, "config: top level must be an object");
  }
  try {
    for (const auto& [key, value] : j.items()) {
      if (key == "nodes") {
        config.nodes = value.get<std::vector<std::string>>();
      } else if (key == "node_sync_interval") {
        config.node_sync_interval = Seconds(value, "node_sync_interval");
      } else if (key == "node_sync_enabled") {
        config.node_sync_enabled = value.get<bool>();
      } else if (key == "local_pow") {
        config.local_pow = value.get<bool>();
      } else if (key == "request_timeout") {
        config.request_timeout = Seconds(value, "request_timeout");
      } else if (key == "pow_worker_count") {
        config.pow_worker_count = value.get<unsigned>();
      } else {
        throw Error(ErrorKind::InvalidParameter, "config: unknown key '" + key + "'");
      }
    }
  } catch (const json::exception& e) {
    throw Error(ErrorKind::InvalidParameter, std::string("config: ") + e.what());
  }
}

void LoadConfigFile(const std::string& path, ClientConfig& config) {
  std::ifstream file(path);
  if (!file) {
    throw Error(ErrorKind::InvalidParameter, "config: cannot open " + path);
  }
  json j = json::parse(file, nullptr, false);
  if (j.is_discarded()) {
    throw Error(ErrorKind::InvalidParameter, "config: " + path + " is not valid JSON");
  }
  ApplyConfigJson(j, config);
  LOG_DEBUG("loaded config from {}", path);
}

}  // namespace tangle
