// Copyright 2025 The Saltmine Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstring>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <ethash/keccak.hpp>

#include <saltmine/core/common/base.hpp>
#include <saltmine/core/common/bytes.hpp>

namespace saltmine {

inline bool has_hex_prefix(std::string_view s) {
    return s.length() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X');
}

//! \brief Returns the input without its leading 0x/0X (if any)
inline std::string_view strip_hex_prefix(std::string_view s) {
    if (has_hex_prefix(s)) s.remove_prefix(2);
    return s;
}

//! \brief Whether every character of s is an hex digit (either case); an empty string qualifies
bool is_hex_digits(std::string_view s) noexcept;

//! \brief Returns a string representing the hex form of provided string of bytes
std::string to_hex(ByteView bytes, bool with_prefix = false);

//! \brief Writes the lowercase hex form of bytes into dest, which must hold 2 * bytes.size() chars
//! \remarks No allocation, no terminating null
void to_hex(ByteView bytes, char* dest) noexcept;

//! \brief Abridges a string to given length and eventually adds an ellipsis if input length is gt required length
std::string abridge(std::string_view input, size_t length);

std::optional<uint8_t> decode_hex_digit(char ch) noexcept;

//! \brief Decodes an hex string (0x prefix optional); odd lengths are left-padded with a 0 nibble
std::optional<Bytes> from_hex(std::string_view hex) noexcept;

// Compares two strings for equality with case insensitivity
bool iequals(std::string_view a, std::string_view b);

inline ethash::hash256 keccak256(ByteView view) { return ethash::keccak256(view.data(), view.size()); }

inline ethash::hash256 keccak256(std::string_view text) {
    return ethash::keccak256(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

inline std::ostream& operator<<(std::ostream& out, const Bytes& bytes) {
    out << to_hex(bytes);
    return out;
}

}  // namespace saltmine
