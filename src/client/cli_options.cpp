// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "client/cli_options.hpp"

#include "client/error.hpp"

#include <charconv>
#include <optional>

namespace tangle {

namespace {

uint64_t ParseCount(const std::string& flag, const std::string& value) {
  uint64_t n = 0;
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), n);
  if (value.empty() || ec != std::errc{} || ptr != value.data() + value.size()) {
    throw Error(ErrorKind::InvalidParameter, flag + " expects a non-negative integer, got '" + value + "'");
  }
  return n;
}

std::chrono::milliseconds ParseSeconds(const std::string& flag, const std::string& value) {
  const uint64_t secs = ParseCount(flag, value);
  if (secs == 0) {
    throw Error(ErrorKind::InvalidParameter, flag + " must be positive");
  }
  return std::chrono::seconds(secs);
}

}  // namespace

CliOptions ParseCliArgs(const std::vector<std::string>& args) {
  CliOptions out;

  // Config file first so that flags win
  for (const auto& arg : args) {
    if (arg.starts_with("--conf=")) {
      const std::string path = arg.substr(7);
      if (path.empty()) {
        throw Error(ErrorKind::InvalidParameter, "--conf requires a path");
      }
      LoadConfigFile(path, out.config);
    }
  }

  std::vector<std::string> flag_nodes;
  for (const auto& arg : args) {
    if (arg == "--help" || arg == "-h") {
      out.help = true;
    } else if (arg == "--version" || arg == "-v") {
      out.version = true;
    } else if (arg.starts_with("--conf=")) {
      continue;
    } else if (arg.starts_with("--node=")) {
      const std::string node = arg.substr(7);
      if (node.empty()) {
        throw Error(ErrorKind::InvalidParameter, "--node requires a URL");
      }
      flag_nodes.push_back(node);
    } else if (arg.starts_with("--sync-interval=")) {
      out.config.node_sync_interval = ParseSeconds("--sync-interval", arg.substr(16));
    } else if (arg == "--no-sync") {
      out.config.node_sync_enabled = false;
    } else if (arg == "--remote-pow") {
      out.config.local_pow = false;
    } else if (arg.starts_with("--pow-workers=")) {
      out.config.pow_worker_count = static_cast<unsigned>(ParseCount("--pow-workers", arg.substr(14)));
    } else if (arg.starts_with("--timeout=")) {
      out.config.request_timeout = ParseSeconds("--timeout", arg.substr(10));
    } else if (arg.starts_with("--loglevel=")) {
      out.log_level = arg.substr(11);
    } else if (arg.starts_with("--debug=")) {
      out.debug_components.push_back(arg.substr(8));
    } else if (arg.starts_with("--")) {
      throw Error(ErrorKind::InvalidParameter, "unknown option " + arg);
    } else if (out.command.empty()) {
      out.command = arg;
    } else {
      out.params.push_back(arg);
    }
  }

  if (!flag_nodes.empty()) {
    out.config.nodes = std::move(flag_nodes);
  }
  return out;
}

}  // namespace tangle
