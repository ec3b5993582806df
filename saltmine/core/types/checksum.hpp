// Copyright 2025 The Saltmine Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>
#include <string_view>

#include <evmc/evmc.hpp>

namespace saltmine {

// https://eips.ethereum.org/EIPS/eip-55

//! \brief Applies the mixed-case checksum in place to the 40 lowercase hex digits of an address
//! \param hex [in/out] : exactly kAddressHexLength lowercase hex chars, no 0x prefix
void apply_checksum_case(char* hex) noexcept;

//! \brief Writes the 40 mixed-case hex digits of the address (no 0x prefix, no terminating null) into dest
void to_checksum_hex(const evmc::address& address, char* dest) noexcept;

//! \brief Returns the 0x-prefixed mixed-case checksum form of the address
std::string to_checksum_address(const evmc::address& address);

//! \brief Whether the input (0x prefix optional) is a 40 hex digit address whose letter case matches its checksum
bool is_valid_checksum_address(std::string_view text);

}  // namespace saltmine
