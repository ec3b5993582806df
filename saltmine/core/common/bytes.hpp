// Copyright 2025 The Saltmine Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>

#include <evmc/bytes.hpp>

namespace saltmine {

using Bytes = evmc::bytes;

//! \brief Non-owning view over contiguous bytes, implicitly built from Bytes and fixed-size byte arrays
//! (e.g. evmc::address::bytes)
class ByteView : public evmc::bytes_view {
  public:
    constexpr ByteView() noexcept = default;

    constexpr ByteView(const evmc::bytes_view& other) noexcept : evmc::bytes_view{other} {}

    ByteView(const Bytes& bytes) noexcept : evmc::bytes_view{bytes.data(), bytes.size()} {}

    constexpr ByteView(const uint8_t* data, size_type size) noexcept : evmc::bytes_view{data, size} {}

    template <size_t N>
    constexpr ByteView(const uint8_t (&array)[N]) noexcept : evmc::bytes_view{array, N} {}

  private:
    // size() only
    using evmc::bytes_view::length;
};

}  // namespace saltmine
