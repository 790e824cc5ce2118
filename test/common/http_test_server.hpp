// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Loopback HTTP server for transport tests

#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <asio.hpp>

namespace tangle {
namespace test {

/**
 * HttpTestServer - answers each connection on 127.0.0.1 with the raw
 * response returned by the handler
 *
 * Connections are served one at a time on the server's own thread. An
 * empty response leaves the connection open and silent until the server
 * is destroyed.
 */
class HttpTestServer {
public:
  using Handler =
      std::function<std::string(const std::string& method, const std::string& target, const std::string& body)>;

  explicit HttpTestServer(Handler handler)
      : handler_(std::move(handler)),
        acceptor_(io_, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)) {
    port_ = acceptor_.local_endpoint().port();
    Accept();
    thread_ = std::thread([this]() { io_.run(); });
  }

  ~HttpTestServer() {
    io_.stop();
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  HttpTestServer(const HttpTestServer&) = delete;
  HttpTestServer& operator=(const HttpTestServer&) = delete;

  uint16_t port() const { return port_; }
  std::string url() const { return "http://127.0.0.1:" + std::to_string(port_); }

  // "METHOD target" of every request served so far
  std::vector<std::string> requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

  std::string last_body() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_body_;
  }

  static std::string Response(int status, const std::string& body, const std::string& reason = "OK") {
    return "HTTP/1.1 " + std::to_string(status) + " " + reason +
           "\r\nContent-Type: application/json\r\nContent-Length: " + std::to_string(body.size()) + "\r\n\r\n" +
           body;
  }

private:
  void Accept() {
    acceptor_.async_accept([this](const asio::error_code& ec, asio::ip::tcp::socket socket) {
      if (ec) {
        return;
      }
      Serve(std::make_shared<asio::ip::tcp::socket>(std::move(socket)));
      Accept();
    });
  }

  void Serve(std::shared_ptr<asio::ip::tcp::socket> socket) {
    asio::error_code ec;
    asio::streambuf buf;
    const size_t header_len = asio::read_until(*socket, buf, "\r\n\r\n", ec);
    if (ec) {
      return;
    }
    std::string data(asio::buffers_begin(buf.data()), asio::buffers_end(buf.data()));
    const std::string head = data.substr(0, header_len);
    std::string body = data.substr(header_len);

    size_t content_length = 0;
    const auto cl = head.find("Content-Length: ");
    if (cl != std::string::npos) {
      content_length = std::stoul(head.substr(cl + 16));
    }
    if (body.size() < content_length) {
      std::string rest(content_length - body.size(), '\0');
      asio::read(*socket, asio::buffer(rest), ec);
      body += rest;
    }

    const auto sp1 = head.find(' ');
    const auto sp2 = head.find(' ', sp1 + 1);
    const std::string method = head.substr(0, sp1);
    const std::string target = head.substr(sp1 + 1, sp2 - sp1 - 1);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      requests_.push_back(method + " " + target);
      last_body_ = body;
    }

    const std::string response = handler_(method, target, body);
    if (response.empty()) {
      held_.push_back(socket);
      return;
    }
    asio::write(*socket, asio::buffer(response), ec);
    socket->shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket->close(ec);
  }

  Handler handler_;
  asio::io_context io_;
  asio::ip::tcp::acceptor acceptor_;
  uint16_t port_{0};
  std::thread thread_;
  std::vector<std::shared_ptr<asio::ip::tcp::socket>> held_;

  mutable std::mutex mutex_;
  std::vector<std::string> requests_;
  std::string last_body_;
};

}  // namespace test
}  // namespace tangle
