// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Promote, reattach and retry

#include <catch2/catch_test_macros.hpp>
#include "client/error.hpp"
#include "client/message_lifecycle.hpp"
#include "client/network_id.hpp"
#include "common/fake_node_api.hpp"
#include "pow/score.hpp"
#include <functional>

using namespace tangle;
using test::MakeId;

namespace {

struct LifecycleFixture {
    test::FakeNodeApi api;
    NodePool pool{api, {util::NodeUrl::Parse("http://node-a:14265")}};
    MessageLifecycle lifecycle{api, pool, pow::PowProvider(false)};
    message::MessageId stuck = MakeId(0x5C);

    LifecycleFixture() {
        pool.SyncNow();
        api.tips_sequence = {{MakeId(0xA1), MakeId(0xA2)}, {MakeId(0xB1), MakeId(0xB2)}};
    }

    void AddStuckMessage(bool with_payload) {
        message::Message msg;
        msg.network_id = NetworkIdFromString("testnet");
        msg.parent1 = MakeId(0x01);
        msg.parent2 = MakeId(0x02);
        if (with_payload) {
            msg.payload = std::make_shared<message::IndexationPayload>(std::vector<uint8_t>{'k'},
                                                                       std::vector<uint8_t>{'v'});
        }
        api.messages[stuck] = msg;
    }

    void SetFlags(std::optional<bool> promote, std::optional<bool> reattach) {
        message::MessageMetadata meta;
        meta.message_id = stuck;
        meta.should_promote = promote;
        meta.should_reattach = reattach;
        api.metadata[stuck] = meta;
    }
};

ErrorKind KindOf(const std::function<void()>& f) {
    try {
        f();
    } catch (const Error& e) {
        return e.kind();
    }
    FAIL("expected an error");
    return ErrorKind::NetworkError;
}

}  // namespace

TEST_CASE("MessageLifecycle: Promote", "[lifecycle]") {
    LifecycleFixture f;

    auto [id, msg] = f.lifecycle.Promote(f.stuck);
    REQUIRE(msg.parent1 == MakeId(0xA1));
    REQUIRE(msg.parent2 == f.stuck);
    REQUIRE(msg.payload == nullptr);
    REQUIRE(msg.network_id == NetworkIdFromString("testnet"));
    REQUIRE(id == msg.id());
    REQUIRE(f.api.posted().size() == 1);

    SECTION("Every promotion fetches fresh tips") {
        auto [id2, msg2] = f.lifecycle.Promote(f.stuck);
        REQUIRE(msg2.parent1 == MakeId(0xB1));
        REQUIRE(f.api.tips_calls() == 2);
        REQUIRE(f.api.info_calls == 2);
    }
}

TEST_CASE("MessageLifecycle: Reattach", "[lifecycle]") {
    LifecycleFixture f;

    SECTION("Payload reissued on fresh tips") {
        f.AddStuckMessage(true);
        auto [id, msg] = f.lifecycle.Reattach(f.stuck);
        REQUIRE(msg.parent1 == MakeId(0xA1));
        REQUIRE(msg.parent2 == MakeId(0xA2));
        REQUIRE(msg.payload->serialize() == f.api.messages[f.stuck].payload->serialize());
        REQUIRE(id != f.stuck);
    }

    SECTION("Message without payload") {
        f.AddStuckMessage(false);
        REQUIRE(KindOf([&] { f.lifecycle.Reattach(f.stuck); }) == ErrorKind::MissingPayload);
        REQUIRE(f.api.posted().empty());
        REQUIRE(f.api.tips_calls() == 0);
    }

    SECTION("Unknown message") {
        REQUIRE(KindOf([&] { f.lifecycle.Reattach(f.stuck); }) == ErrorKind::ResponseError);
    }
}

TEST_CASE("MessageLifecycle: Retry follows node advice", "[lifecycle]") {
    LifecycleFixture f;
    f.AddStuckMessage(true);

    SECTION("Promote when advised") {
        f.SetFlags(true, true);
        auto [id, msg] = f.lifecycle.Retry(f.stuck);
        REQUIRE(msg.parent2 == f.stuck);
        REQUIRE(msg.payload == nullptr);
    }

    SECTION("Reattach when advised") {
        f.SetFlags(false, true);
        auto [id, msg] = f.lifecycle.Retry(f.stuck);
        REQUIRE(msg.parent2 == MakeId(0xA2));
        REQUIRE(msg.payload != nullptr);
    }

    SECTION("Nothing to do") {
        f.SetFlags(std::nullopt, false);
        REQUIRE(KindOf([&] { f.lifecycle.Retry(f.stuck); }) == ErrorKind::NoNeedPromoteOrReattach);
        REQUIRE(f.api.posted().empty());
    }
}

TEST_CASE("MessageLifecycle: Local proof of work", "[lifecycle][pow]") {
    test::FakeNodeApi api;
    api.min_pow_score = 50.0;
    NodePool pool(api, {util::NodeUrl::Parse("http://node-a:14265")});
    pool.SyncNow();
    MessageLifecycle lifecycle(api, pool, pow::PowProvider(true, 2));

    auto payload = std::make_shared<message::IndexationPayload>(std::vector<uint8_t>{'p', 'o', 'w'},
                                                                std::vector<uint8_t>(40, 0x01));
    auto [id, msg] = lifecycle.Submit(payload);
    REQUIRE(pow::Score(msg.pow_bytes(), msg.nonce) >= 50.0);
    REQUIRE(api.posted().at(0).nonce == msg.nonce);
}
