// Copyright 2025 The Saltmine Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string_view>

#include <evmc/evmc.hpp>

#include <saltmine/core/common/bytes.hpp>
#include <saltmine/vanity/errors.hpp>

namespace saltmine::vanity {

//! \brief One round of the SplitMix64 generator (Steele, Lea, Flood 2014)
constexpr uint64_t splitmix64(uint64_t x) noexcept {
    x += 0x9e3779b97f4a7c15;
    uint64_t z{x};
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9;
    z = (z ^ (z >> 27)) * 0x94d049bb133111eb;
    return z ^ (z >> 31);
}

//! \brief Derives the candidate salt for the given attempt index of a run seeded with seed
//! \details The state seed ^ attempt goes through four chained SplitMix64 rounds, each filling 8 salt bytes
//! (little endian). Pure function: any attempt of a past run can be re-derived from its seed.
evmc::bytes32 derive_salt(uint64_t seed, uint64_t attempt) noexcept;

//! \brief Left-pads a salt of up to 32 bytes with zeros
//! \return kInvalidInputLength if longer than 32 bytes
SetupResult<evmc::bytes32> normalize_salt(ByteView salt);

//! \brief Decodes an hex salt (0x prefix optional, up to 64 digits) and left-pads it with zeros
//! \return kInvalidInputLength if longer than 32 bytes, kInvalidHexPattern if not hex
SetupResult<evmc::bytes32> parse_salt(std::string_view hex);

}  // namespace saltmine::vanity
