// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/node_url.hpp"

#include "client/error.hpp"
#include "util/logging.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

#include <asio/ip/address.hpp>

namespace tangle {
namespace util {

namespace {

constexpr size_t MAX_URL_LENGTH = 2048;
constexpr size_t MAX_HOST_LENGTH = 253;

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::optional<uint16_t> ParsePort(const std::string& s) {
  if (s.empty() || s.size() > 5) {
    return std::nullopt;
  }
  unsigned value = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc{} || ptr != s.data() + s.size() || value == 0 || value > 65535) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(value);
}

bool IsValidHostname(const std::string& host) {
  if (host.empty() || host.size() > MAX_HOST_LENGTH) {
    return false;
  }
  if (host.front() == '.' || host.back() == '.' || host.front() == '-' || host.back() == '-') {
    return false;
  }
  char prev = 0;
  for (char c : host) {
    const bool ok = std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '.';
    if (!ok)
      return false;
    if (c == '.' && prev == '.')
      return false;  // empty label
    prev = c;
  }
  return true;
}

[[noreturn]] void Reject(const std::string& url, const std::string& why) {
  throw Error(ErrorKind::InvalidParameter, "node url '" + url + "': " + why);
}

}  // namespace

std::optional<std::string> ValidateAndNormalizeIP(const std::string& address) {
  if (address.empty()) {
    return std::nullopt;
  }

  asio::error_code ec;
  auto ip = asio::ip::make_address(address, ec);
  if (ec) {
    return std::nullopt;
  }

  // ::ffff:192.168.1.1 -> 192.168.1.1
  if (ip.is_v6() && ip.to_v6().is_v4_mapped()) {
    return asio::ip::make_address_v4(asio::ip::v4_mapped, ip.to_v6()).to_string();
  }
  return ip.to_string();
}

bool IsValidIPAddress(const std::string& address) {
  return ValidateAndNormalizeIP(address).has_value();
}

NodeUrl NodeUrl::Parse(const std::string& url) {
  if (url.empty()) {
    Reject(url, "empty");
  }
  if (url.size() > MAX_URL_LENGTH) {
    Reject(url.substr(0, 64) + "...", "too long");
  }

  const size_t scheme_end = url.find("://");
  if (scheme_end == std::string::npos) {
    Reject(url, "missing scheme");
  }
  const std::string scheme = ToLower(url.substr(0, scheme_end));
  if (scheme == "https") {
    Reject(url, "https is not supported");
  }
  if (scheme != "http") {
    Reject(url, "unsupported scheme '" + scheme + "'");
  }

  const std::string rest = url.substr(scheme_end + 3);
  const size_t path_start = rest.find('/');
  const std::string authority = rest.substr(0, path_start);
  std::string path = path_start == std::string::npos ? std::string() : rest.substr(path_start);

  if (authority.find('@') != std::string::npos) {
    Reject(url, "credentials are not supported");
  }
  if (rest.find_first_of("?#") != std::string::npos) {
    Reject(url, "query and fragment are not supported");
  }
  if (path.find_first_of(" \t\r\n") != std::string::npos) {
    Reject(url, "whitespace in path");
  }

  NodeUrl out;
  std::string host;
  std::string port_str;

  if (!authority.empty() && authority[0] == '[') {
    const size_t close = authority.find(']');
    if (close == std::string::npos || close < 2) {
      Reject(url, "malformed IPv6 literal");
    }
    host = authority.substr(1, close - 1);
    if (close + 1 < authority.size()) {
      if (authority[close + 1] != ':') {
        Reject(url, "malformed IPv6 literal");
      }
      port_str = authority.substr(close + 2);
      if (port_str.empty()) {
        Reject(url, "empty port");
      }
    }
    auto normalized = ValidateAndNormalizeIP(host);
    if (!normalized) {
      Reject(url, "invalid IPv6 address");
    }
    host = *normalized;
  } else {
    const size_t colon = authority.find(':');
    if (colon != std::string::npos && authority.find(':', colon + 1) != std::string::npos) {
      Reject(url, "IPv6 literal must be bracketed");
    }
    host = authority.substr(0, colon);
    if (colon != std::string::npos) {
      port_str = authority.substr(colon + 1);
      if (port_str.empty()) {
        Reject(url, "empty port");
      }
    }
    if (host.empty()) {
      Reject(url, "empty host");
    }
    if (auto normalized = ValidateAndNormalizeIP(host)) {
      host = *normalized;
    } else if (!IsValidHostname(host)) {
      Reject(url, "invalid host");
    } else {
      host = ToLower(host);
    }
  }

  if (!port_str.empty()) {
    auto port = ParsePort(port_str);
    if (!port) {
      Reject(url, "invalid port '" + port_str + "'");
    }
    out.port_ = *port;
  }

  while (!path.empty() && path.back() == '/') {
    path.pop_back();
  }

  out.ipv6_ = host.find(':') != std::string::npos;
  out.host_ = std::move(host);
  out.base_path_ = std::move(path);
  out.canonical_ = "http://" + out.host_for_connect() + ":" + std::to_string(out.port_) + out.base_path_;
  return out;
}

std::optional<NodeUrl> NodeUrl::TryParse(const std::string& url) {
  try {
    return Parse(url);
  } catch (const Error& e) {
    LOG_TRACE("NodeUrl::TryParse: {}", e.what());
    return std::nullopt;
  }
}

std::string NodeUrl::host_for_connect() const {
  return ipv6_ ? "[" + host_ + "]" : host_;
}

std::string NodeUrl::Target(const std::string& path) const {
  return base_path_ + path;
}

}  // namespace util
}  // namespace tangle
