// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "api/http_client.hpp"

#include "client/error.hpp"
#include "util/logging.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <functional>
#include <sstream>

#include <asio/connect.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/write.hpp>

namespace tangle {
namespace api {

namespace {

constexpr size_t MAX_HEADER_SIZE = 64 * 1024;

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string Trim(const std::string& s) {
  const size_t b = s.find_first_not_of(" \t");
  if (b == std::string::npos)
    return "";
  const size_t e = s.find_last_not_of(" \t\r");
  return s.substr(b, e - b + 1);
}

// Decode a chunked body; nullopt on malformed framing
std::optional<std::string> DecodeChunked(const std::string& data) {
  std::string out;
  size_t pos = 0;
  while (true) {
    const size_t line_end = data.find("\r\n", pos);
    if (line_end == std::string::npos)
      return std::nullopt;
    std::string size_line = data.substr(pos, line_end - pos);
    const size_t ext = size_line.find(';');
    if (ext != std::string::npos)
      size_line.resize(ext);
    size_line = Trim(size_line);

    size_t chunk = 0;
    auto [ptr, ec] = std::from_chars(size_line.data(), size_line.data() + size_line.size(), chunk, 16);
    if (size_line.empty() || ec != std::errc{} || ptr != size_line.data() + size_line.size())
      return std::nullopt;

    pos = line_end + 2;
    if (chunk == 0)
      return out;  // trailers, if any, are ignored
    if (chunk > data.size() - pos || data.size() - pos - chunk < 2)
      return std::nullopt;
    out.append(data, pos, chunk);
    pos += chunk;
    if (data.compare(pos, 2, "\r\n") != 0)
      return std::nullopt;
    pos += 2;
  }
}

}  // namespace

std::optional<HttpResponse> ParseHttpResponse(const std::string& raw) {
  const size_t header_end = raw.find("\r\n\r\n");
  if (header_end == std::string::npos || header_end > MAX_HEADER_SIZE) {
    return std::nullopt;
  }

  // Status line: HTTP/1.x SP code SP reason
  const size_t line_end = raw.find("\r\n");
  const std::string status_line = raw.substr(0, line_end);
  if (!status_line.starts_with("HTTP/1.")) {
    return std::nullopt;
  }
  const size_t sp = status_line.find(' ');
  if (sp == std::string::npos || sp + 4 > status_line.size()) {
    return std::nullopt;
  }
  int status = 0;
  auto [ptr, ec] = std::from_chars(status_line.data() + sp + 1, status_line.data() + sp + 4, status);
  if (ec != std::errc{} || ptr != status_line.data() + sp + 4 || status < 100 || status > 599) {
    return std::nullopt;
  }

  std::optional<size_t> content_length;
  bool chunked = false;
  std::istringstream headers(raw.substr(line_end + 2, header_end - line_end - 2));
  std::string line;
  while (std::getline(headers, line)) {
    const size_t colon = line.find(':');
    if (colon == std::string::npos)
      continue;
    const std::string name = ToLower(Trim(line.substr(0, colon)));
    const std::string value = Trim(line.substr(colon + 1));
    if (name == "content-length") {
      size_t len = 0;
      auto [p, e] = std::from_chars(value.data(), value.data() + value.size(), len);
      if (value.empty() || e != std::errc{} || p != value.data() + value.size()) {
        return std::nullopt;
      }
      if (content_length && *content_length != len) {
        return std::nullopt;
      }
      content_length = len;
    } else if (name == "transfer-encoding" && ToLower(value).find("chunked") != std::string::npos) {
      chunked = true;
    }
  }

  // Ambiguous framing
  if (chunked && content_length) {
    return std::nullopt;
  }

  HttpResponse response;
  response.status = status;
  const std::string rest = raw.substr(header_end + 4);
  if (chunked) {
    auto body = DecodeChunked(rest);
    if (!body)
      return std::nullopt;
    response.body = std::move(*body);
  } else if (content_length) {
    if (rest.size() < *content_length)
      return std::nullopt;  // truncated
    response.body = rest.substr(0, *content_length);
  } else {
    response.body = rest;
  }
  return response;
}

HttpClient::HttpClient(std::chrono::milliseconds timeout) : timeout_(timeout) {}

HttpResponse HttpClient::Get(const util::NodeUrl& node, const std::string& path) const {
  std::ostringstream req;
  req << "GET " << node.Target(path) << " HTTP/1.1\r\n"
      << "Host: " << node.host_for_connect() << ":" << node.port() << "\r\n"
      << "Accept: application/json\r\n"
      << "Connection: close\r\n\r\n";
  return Execute(node, req.str());
}

HttpResponse HttpClient::Post(const util::NodeUrl& node, const std::string& path, const std::string& body) const {
  std::ostringstream req;
  req << "POST " << node.Target(path) << " HTTP/1.1\r\n"
      << "Host: " << node.host_for_connect() << ":" << node.port() << "\r\n"
      << "Accept: application/json\r\n"
      << "Content-Type: application/json\r\n"
      << "Content-Length: " << body.size() << "\r\n"
      << "Connection: close\r\n\r\n"
      << body;
  return Execute(node, req.str());
}

HttpResponse HttpClient::Execute(const util::NodeUrl& node, const std::string& request) const {
  // io must outlive the socket and resolver declared after it
  asio::io_context io;
  asio::ip::tcp::resolver resolver(io);
  asio::ip::tcp::socket socket(io);

  asio::error_code failure;
  bool done = false;
  std::string raw;
  std::array<char, 4096> buf;

  std::function<void()> read_more = [&]() {
    socket.async_read_some(asio::buffer(buf), [&](const asio::error_code& ec, size_t n) {
      raw.append(buf.data(), n);
      if (raw.size() > MAX_RESPONSE_SIZE) {
        failure = asio::error::message_size;
        done = true;
        return;
      }
      if (ec == asio::error::eof) {
        done = true;  // server closed: response complete
        return;
      }
      if (ec) {
        failure = ec;
        done = true;
        return;
      }
      read_more();
    });
  };

  resolver.async_resolve(
      node.host(), std::to_string(node.port()),
      [&](const asio::error_code& ec, asio::ip::tcp::resolver::results_type results) {
        if (ec) {
          failure = ec;
          done = true;
          return;
        }
        asio::async_connect(socket, results, [&](const asio::error_code& ec2, const asio::ip::tcp::endpoint&) {
          if (ec2) {
            failure = ec2;
            done = true;
            return;
          }
          asio::async_write(socket, asio::buffer(request), [&](const asio::error_code& ec3, size_t) {
            if (ec3) {
              failure = ec3;
              done = true;
              return;
            }
            read_more();
          });
        });
      });

  io.run_for(timeout_);

  if (!done) {
    asio::error_code ignored;
    socket.close(ignored);
    LOG_NET_DEBUG("HTTP request to {} timed out after {}ms", node.str(), timeout_.count());
    throw Error(ErrorKind::NetworkError, node.str() + ": request timed out");
  }
  if (failure) {
    LOG_NET_DEBUG("HTTP request to {} failed: {}", node.str(), failure.message());
    throw Error(ErrorKind::NetworkError, node.str() + ": " + failure.message());
  }

  auto response = ParseHttpResponse(raw);
  if (!response) {
    throw Error(ErrorKind::NetworkError, node.str() + ": malformed HTTP response");
  }
  LOG_NET_TRACE("HTTP {} from {} ({} bytes)", response->status, node.str(), response->body.size());
  return *response;
}

}  // namespace api
}  // namespace tangle
