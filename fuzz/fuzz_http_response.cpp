// Fuzz target for HTTP response framing
// Tests ParseHttpResponse with Content-Length, chunked and close-delimited bodies
//
// Target code: src/api/http_client.cpp

#include "api/http_client.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

using namespace tangle;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    const std::string raw(reinterpret_cast<const char *>(data), size);

    auto response = api::ParseHttpResponse(raw);
    if (response) {
        if (response->status < 100 || response->status > 599) __builtin_trap();
        if (response->body.size() > raw.size()) __builtin_trap();
    }
    return 0;
}
