// Copyright 2025 The Saltmine Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// Sizes and limits shared across the code base.

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>

namespace saltmine {

using namespace std::string_view_literals;

inline constexpr size_t kAddressLength{20};

inline constexpr size_t kHashLength{32};

inline constexpr size_t kSaltLength{32};

// Number of hex digits in the textual form of an address (without 0x)
inline constexpr size_t kAddressHexLength{2 * kAddressLength};

// 0xff ‖ deployer ‖ salt ‖ keccak256(init_code), see EIP-1014
inline constexpr size_t kCreate2PreimageLength{1 + kAddressLength + kSaltLength + kHashLength};

inline constexpr uint64_t kUnlimitedAttempts{std::numeric_limits<uint64_t>::max()};

}  // namespace saltmine
