// Copyright 2025 The Saltmine Authors
// SPDX-License-Identifier: Apache-2.0

#include "endian.hpp"

#include <catch2/catch_test_macros.hpp>

namespace saltmine::endian {

TEST_CASE("64-bit Endian") {
    uint8_t bytes[8];
    uint64_t value{0x123456789abcdef0};

    store_big_u64(bytes, value);
    CHECK(bytes[0] == 0x12);
    CHECK(bytes[7] == 0xf0);
    CHECK(load_big_u64(bytes) == value);
    CHECK(load_little_u64(bytes) == 0xf0debc9a78563412);

    store_little_u64(bytes, value);
    CHECK(bytes[0] == 0xf0);
    CHECK(bytes[7] == 0x12);
    CHECK(load_little_u64(bytes) == value);
}

}  // namespace saltmine::endian
