// Fuzz target for BIP-32 style derivation path parsing
// Tests DerivationPath::Parse and ToString round trips
//
// Target code: src/wallet/derivation_path.cpp

#include "client/error.hpp"
#include "wallet/derivation_path.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

using namespace tangle;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    if (size > 4096) return 0;
    const std::string text(reinterpret_cast<const char *>(data), size);

    wallet::DerivationPath path;
    try {
        path = wallet::DerivationPath::Parse(text);
    } catch (const Error &e) {
        if (e.kind() != ErrorKind::InvalidParameter) __builtin_trap();
        return 0;
    }

    for (const auto &segment : path.segments()) {
        if (segment.index >= 0x80000000u) __builtin_trap();
    }

    // Printing then parsing yields the same path
    if (!(wallet::DerivationPath::Parse(path.ToString()) == path)) __builtin_trap();
    return 0;
}
