// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Node URL handling

 Purpose:
 - Validate node endpoints supplied by callers or configuration files
 - Normalize IP literal hosts so the same node is never listed twice
 - Give the node pool a totally ordered value type to keep in a std::set

 Accepted form: http://host[:port][/base/path]
 - host is a DNS name, an IPv4 literal, or a bracketed IPv6 literal
 - port defaults to 80
 - https is rejected: the transport has no TLS
*/

#include <compare>
#include <cstdint>
#include <optional>
#include <string>

namespace tangle {
namespace util {

/**
 * Validate and normalize an IP address string
 *
 * IPv4-mapped IPv6 addresses become plain IPv4 (::ffff:1.2.3.4 -> 1.2.3.4),
 * everything else is returned in asio's canonical text form.
 *
 * @return Normalized address, or std::nullopt if not a numeric IP
 */
std::optional<std::string> ValidateAndNormalizeIP(const std::string& address);

bool IsValidIPAddress(const std::string& address);

class NodeUrl {
public:
  // Throws Error(InvalidParameter) on anything not in the accepted form
  static NodeUrl Parse(const std::string& url);

  // Non-throwing variant used where bad input is merely skipped
  static std::optional<NodeUrl> TryParse(const std::string& url);

  const std::string& host() const { return host_; }
  uint16_t port() const { return port_; }
  // Base path without trailing slash ("" when none)
  const std::string& base_path() const { return base_path_; }
  bool is_ipv6() const { return ipv6_; }

  // Canonical text form: http://host:port[/base]
  const std::string& str() const { return canonical_; }

  // Host header value / resolver input
  std::string host_for_connect() const;

  // base_path + path, path must start with '/'
  std::string Target(const std::string& path) const;

  bool operator==(const NodeUrl& other) const { return canonical_ == other.canonical_; }
  std::strong_ordering operator<=>(const NodeUrl& other) const { return canonical_ <=> other.canonical_; }

private:
  NodeUrl() = default;

  std::string host_;
  uint16_t port_{80};
  std::string base_path_;
  bool ipv6_{false};
  std::string canonical_;
};

}  // namespace util
}  // namespace tangle
