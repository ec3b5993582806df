// Copyright 2025 The Saltmine Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ostream>
#include <string>

#include <evmc/evmc.hpp>

#include <saltmine/core/common/bytes.hpp>

namespace saltmine {

// https://eips.ethereum.org/EIPS/eip-1014
// address = keccak256(0xff ‖ deployer ‖ salt ‖ init_code_hash)[12:]
evmc::address create2_address(const evmc::address& deployer, const evmc::bytes32& salt,
                              const evmc::bytes32& init_code_hash) noexcept;

// Converts bytes to evmc::address; input is cropped if necessary.
// Short inputs are left-padded with 0s.
evmc::address bytes_to_address(ByteView bytes);

//! \brief Lowercase hex form of the address with 0x prefix
std::string address_to_hex(const evmc::address& address);

}  // namespace saltmine

namespace evmc {

std::ostream& operator<<(std::ostream& out, const evmc::address& address);

}  // namespace evmc
