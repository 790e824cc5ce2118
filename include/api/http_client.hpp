// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/node_url.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace tangle {
namespace api {

struct HttpResponse {
  int status{0};
  std::string body;
};

// Parse a complete HTTP/1.x response (status line, headers, body framed by
// Content-Length, chunked encoding, or connection close). Returns nullopt
// when the framing is malformed.
std::optional<HttpResponse> ParseHttpResponse(const std::string& raw);

/**
 * HttpClient - minimal blocking HTTP/1.1 client over asio
 *
 * Each request opens a fresh connection with "Connection: close" and runs
 * its own io_context on the calling thread, so concurrent callers never
 * share state. The whole exchange (resolve, connect, write, read) is
 * bounded by one deadline.
 *
 * Throws Error(NetworkError) on transport failure or timeout.
 */
class HttpClient {
public:
  static constexpr size_t MAX_RESPONSE_SIZE = 10 * 1024 * 1024;

  explicit HttpClient(std::chrono::milliseconds timeout);

  HttpResponse Get(const util::NodeUrl& node, const std::string& path) const;
  HttpResponse Post(const util::NodeUrl& node, const std::string& path, const std::string& body) const;

  std::chrono::milliseconds timeout() const { return timeout_; }

private:
  HttpResponse Execute(const util::NodeUrl& node, const std::string& request) const;

  std::chrono::milliseconds timeout_;
};

}  // namespace api
}  // namespace tangle
