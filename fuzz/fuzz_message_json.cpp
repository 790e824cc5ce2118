// Fuzz target for node responses carrying messages
// Tests ParseData, MessageFromJson and the binary message codec
//
// Every byte of a response is controlled by the node. Bugs here can:
// - Crash the client on a hostile node (uncaught nlohmann exceptions)
// - Accept a message whose binary form does not decode back
//
// Target code:
// - src/api/json_codec.cpp
// - src/message/message.cpp, src/message/payload.cpp

#include "api/json_codec.hpp"
#include "client/error.hpp"
#include "message/message.hpp"
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

using namespace tangle;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    if (size < 1) return 0;

    // First byte selects JSON or binary decoding
    const uint8_t mode = data[0];
    std::span<const uint8_t> rest(data + 1, size - 1);

    if ((mode & 0x01) == 0) {
        const std::string body(reinterpret_cast<const char *>(rest.data()), rest.size());
        try {
            auto msg = api::MessageFromJson(api::ParseData(body));
            // A decoded message re-encodes to JSON that decodes to the same bytes
            auto again = api::MessageFromJson(api::MessageToJson(msg));
            if (again.serialize() != msg.serialize()) __builtin_trap();
        } catch (const Error &e) {
            if (e.kind() != ErrorKind::InvalidResponse && e.kind() != ErrorKind::InvalidParameter &&
                e.kind() != ErrorKind::ResponseError) {
                __builtin_trap();
            }
        }
        return 0;
    }

    try {
        auto msg = message::Message::Deserialize(rest);
        auto bytes = msg.serialize();
        if (bytes.size() != rest.size()) __builtin_trap();
        if (!std::equal(bytes.begin(), bytes.end(), rest.begin())) __builtin_trap();
    } catch (const Error &e) {
        if (e.kind() != ErrorKind::InvalidResponse) __builtin_trap();
    }
    return 0;
}
