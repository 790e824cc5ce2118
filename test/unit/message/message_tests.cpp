// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Message encoding, id and builder validation

#include <catch2/catch_test_macros.hpp>
#include "client/error.hpp"
#include "message/message.hpp"
#include "util/hex.hpp"
#include <algorithm>
#include <string>

using namespace tangle;
using namespace tangle::message;

namespace {

std::vector<uint8_t> Bytes(const std::string& s) { return std::vector<uint8_t>(s.begin(), s.end()); }

MessageId Filled(uint8_t b) {
    MessageId id{};
    id.fill(b);
    return id;
}

Message IndexedMessage() {
    return MessageBuilder()
        .with_network_id(1)
        .with_parent1(Filled(0x11))
        .with_parent2(Filled(0x22))
        .with_payload(std::make_shared<IndexationPayload>(Bytes("tangle"), Bytes("hello")))
        .with_nonce(42)
        .build();
}

ErrorKind BuildError(const MessageBuilder& builder) {
    try {
        builder.build();
    } catch (const Error& e) {
        return e.kind();
    }
    FAIL("build() accepted an invalid message");
    return ErrorKind::InvalidResponse;
}

}  // namespace

TEST_CASE("Message: Wire encoding and id", "[message]") {
    SECTION("Indexation message") {
        const Message msg = IndexedMessage();
        const auto bytes = msg.serialize();
        REQUIRE(bytes.size() == 105);
        REQUIRE(bytes[0] == 0x01);
        REQUIRE(bytes[8] == 0x11);
        REQUIRE(bytes[40] == 0x22);
        REQUIRE(bytes[bytes.size() - 8] == 42);
        REQUIRE(util::HexStr(msg.id()) == "d303c092384fce690cfab61f454c64fb96840fc1b6f705bdad6f35233ab6a4e1");
    }

    SECTION("Message without payload") {
        const Message msg =
            MessageBuilder().with_network_id(1).with_parent1(Filled(0x11)).with_parent2(Filled(0x22)).build();
        REQUIRE(msg.serialize().size() == 84);
        REQUIRE(util::HexStr(msg.id()) == "24b154bbb4f21be48ac23fd97d0bf230bd498423880c86ba76ecae878b8020f9");
    }

    SECTION("PoW bytes exclude the nonce") {
        const Message msg = IndexedMessage();
        auto full = msg.serialize();
        auto pow = msg.pow_bytes();
        REQUIRE(pow.size() == full.size() - 8);
        REQUIRE(std::equal(pow.begin(), pow.end(), full.begin()));
    }

    SECTION("Nonce changes the id") {
        Message a = IndexedMessage();
        Message b = a;
        b.nonce = 43;
        REQUIRE(a.id() != b.id());
        REQUIRE(a.pow_bytes() == b.pow_bytes());
    }
}

TEST_CASE("Message: Deserialize", "[message]") {
    const Message original = IndexedMessage();
    const auto bytes = original.serialize();

    SECTION("Decodes what serialize produced") {
        const Message decoded = Message::Deserialize(bytes);
        REQUIRE(decoded.id() == original.id());
        auto payload = std::dynamic_pointer_cast<const IndexationPayload>(decoded.payload);
        REQUIRE(payload);
        REQUIRE(payload->index == Bytes("tangle"));
        REQUIRE(payload->data == Bytes("hello"));
    }

    SECTION("Truncated input rejected") {
        std::vector<uint8_t> truncated(bytes.begin(), bytes.end() - 1);
        REQUIRE_THROWS_AS(Message::Deserialize(truncated), Error);
    }

    SECTION("Trailing bytes rejected") {
        auto extended = bytes;
        extended.push_back(0);
        REQUIRE_THROWS_AS(Message::Deserialize(extended), Error);
    }

    SECTION("Unknown payload type rejected") {
        auto corrupted = bytes;
        corrupted[76] = 9;  // payload type tag follows the u32 length at offset 72
        try {
            Message::Deserialize(corrupted);
            FAIL("corrupted payload accepted");
        } catch (const Error& e) {
            REQUIRE(e.kind() == ErrorKind::InvalidResponse);
        }
    }
}

TEST_CASE("MessageBuilder: Validation", "[message]") {
    SECTION("Network id required") {
        REQUIRE(BuildError(MessageBuilder().with_parent1(Filled(1)).with_parent2(Filled(2))) ==
                ErrorKind::TransactionError);
    }

    SECTION("Both parents required") {
        REQUIRE(BuildError(MessageBuilder().with_network_id(1).with_parent1(Filled(1))) ==
                ErrorKind::TransactionError);
        REQUIRE(BuildError(MessageBuilder().with_network_id(1).with_parent2(Filled(2))) ==
                ErrorKind::TransactionError);
    }

    SECTION("Indexation key length") {
        auto base = MessageBuilder().with_network_id(1).with_parent1(Filled(1)).with_parent2(Filled(2));
        REQUIRE(BuildError(MessageBuilder(base).with_payload(
                    std::make_shared<IndexationPayload>(std::vector<uint8_t>{}, Bytes("x")))) ==
                ErrorKind::TransactionError);
        REQUIRE(BuildError(MessageBuilder(base).with_payload(
                    std::make_shared<IndexationPayload>(std::vector<uint8_t>(65, 'k'), Bytes("x")))) ==
                ErrorKind::TransactionError);
        REQUIRE_NOTHROW(MessageBuilder(base)
                            .with_payload(std::make_shared<IndexationPayload>(std::vector<uint8_t>(64, 'k'), Bytes("x")))
                            .build());
    }

    SECTION("Encoding over the size limit") {
        auto builder = MessageBuilder().with_network_id(1).with_parent1(Filled(1)).with_parent2(Filled(2));
        builder.with_payload(std::make_shared<IndexationPayload>(Bytes("big"), std::vector<uint8_t>(MAX_MESSAGE_LENGTH)));
        REQUIRE(BuildError(builder) == ErrorKind::TransactionError);
    }
}
