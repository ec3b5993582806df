// Copyright 2025 The Saltmine Authors
// SPDX-License-Identifier: Apache-2.0

#include "salt_source.hpp"

#include <set>

#include <catch2/catch_test_macros.hpp>

#include <saltmine/core/common/endian.hpp>
#include <saltmine/core/common/util.hpp>
#include <saltmine/core/types/evmc_bytes32.hpp>

namespace saltmine::vanity {

using namespace evmc::literals;

TEST_CASE("splitmix64") {
    // Reference outputs of SplitMix64 seeded with 0: next() advances the state then mixes
    CHECK(splitmix64(0) == 0xe220a8397b1dcdaf);
    CHECK(splitmix64(0x9e3779b97f4a7c15) == 0x6e789e6aa1b965f4);
}

TEST_CASE("derive_salt") {
    SECTION("is a pure function of seed and attempt") {
        CHECK(derive_salt(42, 7) == derive_salt(42, 7));
        CHECK(derive_salt(42, 7) != derive_salt(42, 8));
        CHECK(derive_salt(42, 7) != derive_salt(43, 7));
    }

    SECTION("chains rounds over the whole salt") {
        const evmc::bytes32 salt{derive_salt(0, 0)};
        CHECK(to_hex(salt).starts_with("afcd1d7b39a820e2"));  // splitmix64(0), little endian

        uint64_t state{0};
        for (size_t offset{0}; offset < 32; offset += 8) {
            state = splitmix64(state);
            CHECK(endian::load_little_u64(&salt.bytes[offset]) == state);
        }

        // Only seed ^ attempt matters
        CHECK(derive_salt(5, 5) == salt);
    }

    SECTION("distinct attempts give distinct salts") {
        std::set<std::string> salts;
        for (uint64_t attempt{0}; attempt < 4096; ++attempt) {
            salts.insert(to_hex(derive_salt(0x5eed, attempt)));
        }
        CHECK(salts.size() == 4096);
    }
}

TEST_CASE("normalize_salt") {
    SECTION("left pads short salts") {
        const auto salt{normalize_salt(*from_hex("0xcafebabe"))};
        REQUIRE(salt);
        CHECK(*salt == 0x00000000000000000000000000000000000000000000000000000000cafebabe_bytes32);
    }
    SECTION("empty salt is zero") {
        const auto salt{normalize_salt(Bytes{})};
        REQUIRE(salt);
        CHECK(*salt == evmc::bytes32{});
    }
    SECTION("rejects salts longer than 32 bytes") {
        const auto salt{normalize_salt(Bytes(33, 0x01))};
        REQUIRE(!salt);
        CHECK(salt.error().code == SetupErrorCode::kInvalidInputLength);
    }
}

TEST_CASE("parse_salt") {
    SECTION("odd length salt is left padded") {
        const auto salt{parse_salt("0xc261bc78b72af4a03d00448cc9230d0a861eef6a85ab9a0ef33e0432b868a52")};
        REQUIRE(salt);
        CHECK(*salt == 0x0c261bc78b72af4a03d00448cc9230d0a861eef6a85ab9a0ef33e0432b868a52_bytes32);
    }
    SECTION("invalid hex") {
        const auto salt{parse_salt("0xsalt")};
        REQUIRE(!salt);
        CHECK(salt.error().code == SetupErrorCode::kInvalidHexPattern);
    }
    SECTION("too long") {
        const auto salt{parse_salt("0x" + std::string(66, 'a'))};
        REQUIRE(!salt);
        CHECK(salt.error().code == SetupErrorCode::kInvalidInputLength);
    }
}

}  // namespace saltmine::vanity
