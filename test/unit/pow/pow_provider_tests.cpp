// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Nonce search

#include <catch2/catch_test_macros.hpp>
#include "client/error.hpp"
#include "pow/pow_provider.hpp"
#include "pow/score.hpp"
#include <vector>

using namespace tangle;
using namespace tangle::pow;

namespace {

const std::vector<uint8_t> kPayload{'t', 'a', 'n', 'g', 'l', 'e'};

}  // namespace

TEST_CASE("PowProvider: Remote mode", "[pow]") {
    PowProvider remote(false);
    REQUIRE_FALSE(remote.is_local());
    REQUIRE(remote.Nonce(kPayload, 4000.0) == 0);
    // The node does the work, so the target is not checked locally
    REQUIRE(remote.Nonce(kPayload, -1.0) == 0);
}

TEST_CASE("PowProvider: Local search", "[pow]") {
    SECTION("Single worker finds the first qualifying nonce") {
        PowProvider pow(true, 1);
        REQUIRE(pow.worker_count() == 1);
        REQUIRE(pow.Nonce(kPayload, 70.0) == 2940);
    }

    SECTION("Several workers find a nonce meeting the target") {
        PowProvider pow(true, 4);
        const std::vector<uint8_t> payload(200, 0x5a);
        const double target = 100.0;
        const uint64_t nonce = pow.Nonce(payload, target);
        REQUIRE(Score(payload, nonce) >= target);
    }

    SECTION("Trivial target accepts the first nonce tried") {
        PowProvider pow(true, 1);
        REQUIRE(pow.Nonce(kPayload, 0.01) == 0);
    }

    SECTION("Default worker count is at least one") {
        REQUIRE(PowProvider().worker_count() >= 1);
        REQUIRE(PowProvider().is_local());
    }
}

TEST_CASE("PowProvider: Unusable target", "[pow]") {
    PowProvider pow(true, 2);
    for (double target : {0.0, -1.0, 1e300}) {
        try {
            pow.Nonce(kPayload, target);
            FAIL("target " << target << " accepted");
        } catch (const Error& e) {
            REQUIRE(e.kind() == ErrorKind::ProofOfWorkFailed);
        }
    }
}
