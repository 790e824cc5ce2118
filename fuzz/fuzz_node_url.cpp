// Fuzz target for node URL parsing
// Tests NodeUrl::Parse, NodeUrl::TryParse and ValidateAndNormalizeIP
//
// Node URLs come from configuration files and command lines. Bugs here can:
// - Crash the client on a malformed --node value
// - List the same node twice under two spellings (canonical form unstable)
//
// Target code: src/util/node_url.cpp

#include "client/error.hpp"
#include "util/node_url.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

using namespace tangle;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    const std::string text(reinterpret_cast<const char *>(data), size);

    // TryParse never throws and agrees with Parse
    auto parsed = util::NodeUrl::TryParse(text);
    bool threw = false;
    try {
        auto strict = util::NodeUrl::Parse(text);
        if (!parsed || !(strict == *parsed)) __builtin_trap();
    } catch (const Error &e) {
        if (e.kind() != ErrorKind::InvalidParameter) __builtin_trap();
        threw = true;
    }
    if (threw == parsed.has_value()) __builtin_trap();

    if (parsed) {
        // Canonical form is a fixed point
        auto again = util::NodeUrl::Parse(parsed->str());
        if (again.str() != parsed->str()) __builtin_trap();
        if (parsed->port() == 0) __builtin_trap();
    }

    // Normalized IPs normalize to themselves
    if (auto ip = util::ValidateAndNormalizeIP(text)) {
        auto twice = util::ValidateAndNormalizeIP(*ip);
        if (!twice || *twice != *ip) __builtin_trap();
    }

    return 0;
}
