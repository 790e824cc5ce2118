// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// HTTP response parsing and loopback transport

#include <catch2/catch_test_macros.hpp>
#include "api/http_client.hpp"
#include "client/error.hpp"
#include "common/http_test_server.hpp"
#include <chrono>

using namespace tangle;
using namespace tangle::api;
using namespace std::chrono_literals;

TEST_CASE("HttpResponse: Parsing", "[http]") {
    SECTION("Content-Length body") {
        auto r = ParseHttpResponse("HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\nhelloEXTRA");
        REQUIRE(r.has_value());
        REQUIRE(r->status == 200);
        REQUIRE(r->body == "hello");
    }

    SECTION("Header names are case-insensitive") {
        auto r = ParseHttpResponse("HTTP/1.0 404 Not Found\r\ncontent-length: 2\r\n\r\n{}");
        REQUIRE(r.has_value());
        REQUIRE(r->status == 404);
        REQUIRE(r->body == "{}");
    }

    SECTION("Chunked body") {
        auto r = ParseHttpResponse(
            "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n4\r\n{\"da\r\nA;ext=1\r\nta\":null}\r\n0\r\n\r\n");
        REQUIRE(r.has_value());
        REQUIRE(r->body == "{\"data\":null}");
    }

    SECTION("Body read to close") {
        auto r = ParseHttpResponse("HTTP/1.1 200 OK\r\n\r\n{\"data\":{}}");
        REQUIRE(r.has_value());
        REQUIRE(r->body == "{\"data\":{}}");
    }

    SECTION("Malformed responses") {
        REQUIRE_FALSE(ParseHttpResponse("").has_value());
        REQUIRE_FALSE(ParseHttpResponse("HTTP/1.1 200 OK\r\n").has_value());
        REQUIRE_FALSE(ParseHttpResponse("SPDY/3 200 OK\r\n\r\n").has_value());
        REQUIRE_FALSE(ParseHttpResponse("HTTP/1.1 abc OK\r\n\r\n").has_value());
        REQUIRE_FALSE(ParseHttpResponse("HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nshort").has_value());
        REQUIRE_FALSE(ParseHttpResponse("HTTP/1.1 200 OK\r\nContent-Length: x\r\n\r\n").has_value());
        REQUIRE_FALSE(
            ParseHttpResponse("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\nab\r\n0\r\n\r\n").has_value());
    }

    SECTION("Ambiguous framing is rejected") {
        REQUIRE_FALSE(ParseHttpResponse("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\nContent-Length: 2\r\n\r\n"
                                        "2\r\nab\r\n0\r\n\r\n")
                          .has_value());
        REQUIRE_FALSE(
            ParseHttpResponse("HTTP/1.1 200 OK\r\nContent-Length: 2\r\nContent-Length: 3\r\n\r\nabc").has_value());

        // Repeating the same length is harmless
        auto r = ParseHttpResponse("HTTP/1.1 200 OK\r\nContent-Length: 2\r\nContent-Length: 2\r\n\r\nab");
        REQUIRE(r.has_value());
        REQUIRE(r->body == "ab");
    }
}

TEST_CASE("HttpClient: Loopback requests", "[http]") {
    test::HttpTestServer server([](const std::string& method, const std::string& target, const std::string& body) {
        if (method == "POST") {
            return test::HttpTestServer::Response(201, body, "Created");
        }
        return test::HttpTestServer::Response(200, "{\"target\":\"" + target + "\"}");
    });
    HttpClient client(2000ms);

    SECTION("GET sends the base path") {
        auto node = util::NodeUrl::Parse(server.url() + "/base");
        auto r = client.Get(node, "/health");
        REQUIRE(r.status == 200);
        REQUIRE(r.body == "{\"target\":\"/base/health\"}");
        REQUIRE(server.requests().back() == "GET /base/health");
    }

    SECTION("POST carries the body") {
        auto r = client.Post(util::NodeUrl::Parse(server.url()), "/api/v1/messages", "{\"x\":1}");
        REQUIRE(r.status == 201);
        REQUIRE(r.body == "{\"x\":1}");
        REQUIRE(server.last_body() == "{\"x\":1}");
    }
}

TEST_CASE("HttpClient: Transport failures", "[http]") {
    SECTION("Silent server times out") {
        test::HttpTestServer silent([](const std::string&, const std::string&, const std::string&) {
            return std::string();
        });
        HttpClient client(200ms);
        auto start = std::chrono::steady_clock::now();
        try {
            client.Get(util::NodeUrl::Parse(silent.url()), "/health");
            FAIL("silent server answered");
        } catch (const Error& e) {
            REQUIRE(e.kind() == ErrorKind::NetworkError);
        }
        REQUIRE(std::chrono::steady_clock::now() - start < 5s);
    }

    SECTION("Connection refused") {
        uint16_t port = 0;
        {
            asio::io_context io;
            asio::ip::tcp::acceptor acceptor(io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
            port = acceptor.local_endpoint().port();
        }
        HttpClient client(2000ms);
        try {
            client.Get(util::NodeUrl::Parse("http://127.0.0.1:" + std::to_string(port)), "/health");
            FAIL("closed port answered");
        } catch (const Error& e) {
            REQUIRE(e.kind() == ErrorKind::NetworkError);
        }
    }

    SECTION("Garbage response") {
        test::HttpTestServer garbage([](const std::string&, const std::string&, const std::string&) {
            return std::string("this is not http\r\n\r\n");
        });
        HttpClient client(2000ms);
        REQUIRE_THROWS_AS(client.Get(util::NodeUrl::Parse(garbage.url()), "/health"), Error);
    }
}
