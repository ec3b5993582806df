// Copyright 2025 The Saltmine Authors
// SPDX-License-Identifier: Apache-2.0

#include "match_spec.hpp"

#include <catch2/catch_test_macros.hpp>

namespace saltmine::vanity {

using namespace evmc::literals;

// EIP-55 form: 0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed
static constexpr auto kAddress{0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed_address};

TEST_CASE("MatchSpec validation") {
    SECTION("empty patterns") {
        const auto spec{MatchSpec::make(std::nullopt, std::nullopt, false)};
        REQUIRE(spec);
        CHECK(spec->empty());
        CHECK(spec->matches(kAddress));
        CHECK(spec->to_string() == "<any>");

        const auto blank{MatchSpec::make("", "", true)};
        REQUIRE(blank);
        CHECK(blank->empty());
    }

    SECTION("0x is stripped from the prefix only") {
        const auto spec{MatchSpec::make("0xcafe", std::nullopt, false)};
        REQUIRE(spec);
        CHECK(spec->prefix() == "cafe");

        const auto bad_suffix{MatchSpec::make(std::nullopt, "0xcafe", false)};
        REQUIRE(!bad_suffix);
        CHECK(bad_suffix.error().code == SetupErrorCode::kInvalidHexPattern);
    }

    SECTION("non-hex characters") {
        const auto spec{MatchSpec::make("cafz", std::nullopt, false)};
        REQUIRE(!spec);
        CHECK(spec.error().code == SetupErrorCode::kInvalidHexPattern);
    }

    SECTION("longer than an address") {
        const auto prefix{MatchSpec::make(std::string(41, 'a'), std::nullopt, false)};
        REQUIRE(!prefix);
        CHECK(prefix.error().code == SetupErrorCode::kInvalidHexPattern);

        const auto combined{MatchSpec::make(std::string(21, 'a'), std::string(20, 'b'), false)};
        REQUIRE(!combined);
        CHECK(combined.error().code == SetupErrorCode::kInvalidHexPattern);

        CHECK(MatchSpec::make(std::string(20, 'a'), std::string(20, 'b'), false));
    }

    SECTION("raw mode lower-cases patterns") {
        const auto spec{MatchSpec::make("CAFE", "BeEf", false)};
        REQUIRE(spec);
        CHECK(spec->prefix() == "cafe");
        CHECK(spec->suffix() == "beef");
        CHECK(spec->to_string() == "cafe...beef");
    }

    SECTION("checksum mode keeps the case") {
        const auto spec{MatchSpec::make("CaFe", "BEEF", true)};
        REQUIRE(spec);
        CHECK(spec->prefix() == "CaFe");
        CHECK(spec->suffix() == "BEEF");
        CHECK(spec->to_string() == "CaFe...BEEF (checksum)");
    }
}

TEST_CASE("MatchSpec matching") {
    SECTION("raw mode compares the lowercase form") {
        CHECK(MatchSpec::make("5aae", "1beaed", false)->matches(kAddress));
        CHECK(MatchSpec::make("5AAE", std::nullopt, false)->matches(kAddress));
        CHECK(MatchSpec::make(std::nullopt, "BEAED", false)->matches(kAddress));
        CHECK_FALSE(MatchSpec::make("5aaf", std::nullopt, false)->matches(kAddress));
        CHECK_FALSE(MatchSpec::make("5aae", "beaee", false)->matches(kAddress));
    }

    SECTION("both constraints must hold") {
        CHECK_FALSE(MatchSpec::make("5aae", "0000", false)->matches(kAddress));
        CHECK_FALSE(MatchSpec::make("0000", "beaed", false)->matches(kAddress));
    }

    SECTION("checksum mode compares the EIP-55 form") {
        CHECK(MatchSpec::make("5aAe", "BeAed", true)->matches(kAddress));
        CHECK(MatchSpec::make("5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed", std::nullopt, true)->matches(kAddress));
        // The lowercase form satisfies these, the checksum form does not
        CHECK_FALSE(MatchSpec::make("5aae", std::nullopt, true)->matches(kAddress));
        CHECK_FALSE(MatchSpec::make(std::nullopt, "beaed", true)->matches(kAddress));
        CHECK_FALSE(MatchSpec::make("5AAE", std::nullopt, true)->matches(kAddress));
    }

    SECTION("digit-only patterns behave alike in both modes") {
        CHECK(MatchSpec::make("5", std::nullopt, true)->matches(kAddress));
        CHECK(MatchSpec::make("5", std::nullopt, false)->matches(kAddress));
    }

    SECTION("full-length pattern") {
        CHECK(MatchSpec::make("5aaeb6053f3e94c9b9a09f33669435e7ef1beaed", std::nullopt, false)->matches(kAddress));
        CHECK(MatchSpec::make("5aaeb6053f3e94c9b9a0", "9f33669435e7ef1beaed", false)->matches(kAddress));
    }

    SECTION("matches_hex") {
        const auto spec{MatchSpec::make("ab", "cd", false)};
        CHECK(spec->matches_hex("ab00000000000000000000000000000000000ccd"));
        CHECK_FALSE(spec->matches_hex("ba00000000000000000000000000000000000ccd"));
    }
}

TEST_CASE("MatchSpec expected attempts") {
    CHECK(MatchSpec::make(std::nullopt, std::nullopt, false)->expected_attempts() == 1.0);
    CHECK(MatchSpec::make("cafe", "beef", false)->expected_attempts() == 4294967296.0);
    // 4 hex digits, every one a letter
    CHECK(MatchSpec::make("cafe", std::nullopt, true)->expected_attempts() == 65536.0 * 16.0);
    CHECK(MatchSpec::make("c0fe", std::nullopt, true)->expected_attempts() == 65536.0 * 8.0);
    CHECK(MatchSpec::make("1234", std::nullopt, true)->expected_attempts() == 65536.0);
}

}  // namespace saltmine::vanity
