// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// REST endpoints against a loopback node

#include <catch2/catch_test_macros.hpp>
#include "api/http_node_api.hpp"
#include "api/json_codec.hpp"
#include "client/error.hpp"
#include "common/http_test_server.hpp"
#include <chrono>

using namespace tangle;
using namespace tangle::api;
using namespace std::chrono_literals;
using json = nlohmann::json;

namespace {

const std::string kId(64, 'c');

std::string Data(const json& data) { return test::HttpTestServer::Response(200, json{{"data", data}}.dump()); }

std::string Route(const std::string& method, const std::string& target, const std::string& body) {
    if (target == "/health") {
        return test::HttpTestServer::Response(200, "");
    }
    if (target == "/api/v1/info") {
        return Data({{"name", "HORNET"},
                     {"version", "0.5.3"},
                     {"isHealthy", true},
                     {"networkId", "testnet"},
                     {"minPowScore", 4000}});
    }
    if (target == "/api/v1/tips") {
        return Data({{"tip1MessageId", kId}, {"tip2MessageId", kId}});
    }
    if (method == "POST" && target == "/api/v1/messages") {
        // Echo back the id the client computed
        auto msg = MessageFromJson(json::parse(body));
        return test::HttpTestServer::Response(201, json{{"data", {{"messageId", message::ToHex(msg.id())}}}}.dump(),
                                              "Created");
    }
    if (target.starts_with("/api/v1/messages?index=")) {
        return Data({{"index", target.substr(23)}, {"messageIds", json::array({kId})}});
    }
    if (target.starts_with("/api/v1/addresses/ed25519/") && target.ends_with("/outputs")) {
        return Data({{"outputIds", json::array({kId + "0000"})}});
    }
    if (target.starts_with("/api/v1/addresses/ed25519/")) {
        return Data({{"balance", 1500}});
    }
    if (target == "/api/v1/milestones/3") {
        return Data({{"milestoneIndex", 3}, {"messageId", kId}, {"timestamp", 1609459200}});
    }
    if (target == "/api/v1/milestones/4") {
        return test::HttpTestServer::Response(200, "{\"oops\":true}");
    }
    return test::HttpTestServer::Response(404, "{\"error\":{\"code\":\"404\",\"message\":\"not found\"}}",
                                          "Not Found");
}

}  // namespace

TEST_CASE("HttpNodeApi: Endpoints", "[http][node_api]") {
    test::HttpTestServer server(Route);
    HttpNodeApi api(2000ms);
    const auto node = util::NodeUrl::Parse(server.url());

    SECTION("Health") {
        REQUIRE(api.GetHealth(node));
    }

    SECTION("Info and tips") {
        REQUIRE(api.GetInfo(node).network_id == "testnet");
        REQUIRE(message::ToHex(api.GetTips(node).tip1) == kId);
    }

    SECTION("Post message returns the node's id") {
        message::Message msg;
        msg.network_id = 1;
        msg.nonce = 7;
        REQUIRE(api.PostMessage(node, msg) == msg.id());
        REQUIRE(server.requests().back() == "POST /api/v1/messages");
    }

    SECTION("Index key is hex encoded") {
        auto ids = api.GetMessageIdsByIndex(node, {'t', 'a', 'n', 'g', 'l', 'e'});
        REQUIRE(ids.size() == 1);
        REQUIRE(server.requests().back() == "GET /api/v1/messages?index=74616e676c65");
    }

    SECTION("Address endpoints") {
        message::Address address;
        address.bytes.fill(0x01);
        REQUIRE(api.GetAddressBalance(node, address) == 1500);
        REQUIRE(api.GetAddressOutputs(node, address).size() == 1);
        REQUIRE(server.requests().back() == "GET /api/v1/addresses/ed25519/" + address.ToHex() + "/outputs");
    }

    SECTION("Milestone") {
        REQUIRE(api.GetMilestone(node, 3).timestamp == 1609459200);
    }

    SECTION("Non-200 status is a response error") {
        try {
            api.GetMessage(node, message::MessageIdFromHex(kId));
            FAIL("404 accepted");
        } catch (const Error& e) {
            REQUIRE(e.kind() == ErrorKind::ResponseError);
            REQUIRE(std::string(e.what()).find("404") != std::string::npos);
        }
    }

    SECTION("Body without data is an invalid response") {
        try {
            api.GetMilestone(node, 4);
            FAIL("malformed body accepted");
        } catch (const Error& e) {
            REQUIRE(e.kind() == ErrorKind::InvalidResponse);
        }
    }
}

TEST_CASE("HttpNodeApi: Unhealthy node", "[http][node_api]") {
    test::HttpTestServer server([](const std::string&, const std::string&, const std::string&) {
        return test::HttpTestServer::Response(503, "", "Service Unavailable");
    });
    HttpNodeApi api(2000ms);
    REQUIRE_FALSE(api.GetHealth(util::NodeUrl::Parse(server.url())));
}
