// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// SLIP-10 derivation, Ed25519 and address generation

#include <catch2/catch_test_macros.hpp>
#include "client/error.hpp"
#include "util/hex.hpp"
#include "wallet/address_generator.hpp"
#include "wallet/ed25519.hpp"
#include "wallet/seed.hpp"
#include "wallet/slip10.hpp"
#include <string>

using namespace tangle;
using namespace tangle::wallet;

namespace {

template <size_t N>
std::array<uint8_t, N> Fixed(const std::string& hex) {
    return *util::ParseHexFixed<N>(hex);
}

const std::string kSeedHex = "256a818b2aac458941f7274985a410e57fb750f3a3a67969ece5bd9ae7eef5b2";

}  // namespace

TEST_CASE("Slip10: Ed25519 test vector 1", "[wallet][slip10]") {
    const auto seed = *util::ParseHex("000102030405060708090a0b0c0d0e0f");

    const auto master = ExtendedKey::FromSeed(seed);
    REQUIRE(util::HexStr(master.key()) == "2b4be7f19ee27bbf30c667b642d5f4aa69fd169872f8fc3059c08ebae2eb19e7");
    REQUIRE(util::HexStr(master.chain_code()) == "90046a93de5380a72b5e45010748567d5ea02bbf6522f979e05c0d8d8ca9fffb");
    REQUIRE(util::HexStr(Ed25519DerivePublicKey(master.key())) ==
            "a4b2856bfec510abab89753fac1ac0e1112364e7d250545963f135f2a33188ed");

    const auto child = master.DeriveChild(0, true);
    REQUIRE(util::HexStr(child.key()) == "68e0fe46dfb67e368c75379acec591dad19df3cde26e63b93a8e704f1dade7a3");
    REQUIRE(util::HexStr(child.chain_code()) == "8b59aa11380b624e81507a27fedda59fea6d0b779a778918a2fd3590e16e9c69");

    const auto deep = master.Derive(DerivationPath::Parse("m/0'/1'"));
    REQUIRE(util::HexStr(deep.key()) == "b1d0bad404bf35da785a64ca1ac54b2617211d2777696fbffaf208f746ae84f2");

    SECTION("Non-hardened children are rejected") {
        REQUIRE_THROWS_AS(master.DeriveChild(0, false), Error);
        REQUIRE_THROWS_AS(master.Derive(DerivationPath::Parse("m/0'/1")), Error);
    }
}

TEST_CASE("Ed25519: RFC 8032 test 1", "[wallet][ed25519]") {
    const auto secret = Fixed<32>("9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60");
    const auto pub = Ed25519DerivePublicKey(secret);
    REQUIRE(util::HexStr(pub) == "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a");

    const auto sig = Ed25519Sign(secret, {});
    REQUIRE(util::HexStr(sig) ==
            "e5564300c360ac729086e2cc806e828a84877f1eb8e5d974d873e065224901555fb8821590a33bacc61e39701cf9b46bd25bf5f0595bbe24655141438e7a100b");
    REQUIRE(Ed25519Verify(pub, {}, sig));

    SECTION("Tampered message fails verification") {
        const std::vector<uint8_t> msg{0x01};
        REQUIRE_FALSE(Ed25519Verify(pub, msg, sig));
    }

    SECTION("Address is Blake2b-256 of the public key") {
        REQUIRE(AddressFromPublicKey(pub).ToHex() == "7849ac3049680be1ef762efe0d36e01733c3464eb0c7c558138acf24bb263bd3");
    }
}

TEST_CASE("Seed: Validation", "[wallet][seed]") {
    REQUIRE(Seed::FromHex(kSeedHex).bytes().size() == 32);
    REQUIRE_THROWS_AS(Seed(std::vector<uint8_t>(31, 1)), Error);
    REQUIRE_THROWS_AS(Seed::FromHex("not hex"), Error);
    REQUIRE_THROWS_AS(Seed::FromHex("abcd"), Error);
}

TEST_CASE("AddressGenerator: Deterministic addresses", "[wallet][address]") {
    const Seed seed = Seed::FromHex(kSeedHex);
    const auto path = DerivationPath::Parse("m/44'/4218'/0'/0'");

    SECTION("Range matches single derivations") {
        const auto batch = DeriveAddresses(seed, path, 3, 8);
        REQUIRE(batch.size() == 5);
        for (uint64_t i = 0; i < batch.size(); ++i) {
            REQUIRE(batch[i] == DeriveAddress(seed, path, 3 + i));
        }
    }

    SECTION("Distinct indices give distinct addresses") {
        const auto batch = DeriveAddresses(seed, path, 0, 20);
        for (size_t i = 0; i < batch.size(); ++i) {
            for (size_t j = i + 1; j < batch.size(); ++j) {
                REQUIRE(batch[i] != batch[j]);
            }
        }
    }

    SECTION("Same inputs, same output") {
        REQUIRE(DeriveAddress(seed, path, 0) == DeriveAddress(Seed::FromHex(kSeedHex), path, 0));
        REQUIRE(DeriveAddress(seed, path, 0) != DeriveAddress(seed, DerivationPath::Parse("m/44'/4218'/1'/0'"), 0));
    }

    SECTION("Empty and reversed ranges") {
        REQUIRE(DeriveAddresses(seed, path, 5, 5).empty());
        REQUIRE_THROWS_AS(DeriveAddresses(seed, path, 6, 5), Error);
    }

    SECTION("Key pair signs for its address") {
        const auto keys = DeriveKeyPair(seed, path, 2);
        REQUIRE(AddressFromPublicKey(keys.public_key) == DeriveAddress(seed, path, 2));
        const std::vector<uint8_t> msg{'t', 'x'};
        REQUIRE(Ed25519Verify(keys.public_key, msg, Ed25519Sign(keys.private_key, msg)));
    }

    SECTION("Index out of hardened range") {
        REQUIRE_THROWS_AS(DeriveAddress(seed, path, HARDENED_OFFSET), Error);
    }
}
