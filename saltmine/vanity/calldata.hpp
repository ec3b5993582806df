// Copyright 2025 The Saltmine Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <evmc/evmc.hpp>

#include <saltmine/core/common/bytes.hpp>
#include <saltmine/vanity/errors.hpp>

namespace saltmine::vanity {

using namespace evmc::literals;

//! Deterministic deployment proxy, the CREATE2 factory deployed at the same address on most EVM chains
inline constexpr auto kDeterministicDeploymentProxy{0x4e59b44847b379578588920ca78fbf26c0b4956c_address};

//! \brief Builds the calldata accepted by the deterministic deployment proxy: salt followed by init code
//! \return kInvalidInputLength when the init code is empty
SetupResult<Bytes> build_create2_calldata(const evmc::bytes32& salt, ByteView init_code);

}  // namespace saltmine::vanity
