// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "client/config.hpp"

#include <string>
#include <vector>

namespace tangle {

struct CliOptions {
  ClientConfig config;
  std::string log_level{"info"};
  std::vector<std::string> debug_components;
  bool help{false};
  bool version{false};
  std::string command;
  std::vector<std::string> params;
};

// Parse tangle-cli arguments (without argv[0]). A --conf file is applied
// first; every other flag overrides it regardless of position.
// Throws Error(InvalidParameter) on malformed flags.
CliOptions ParseCliArgs(const std::vector<std::string>& args);

}  // namespace tangle
