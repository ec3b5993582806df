// Copyright 2025 The Saltmine Authors
// SPDX-License-Identifier: Apache-2.0

#include "checksum.hpp"

#include <saltmine/core/common/base.hpp>
#include <saltmine/core/common/util.hpp>
#include <saltmine/core/types/address.hpp>

namespace saltmine {

void apply_checksum_case(char* hex) noexcept {
    const ethash::hash256 hash{keccak256(std::string_view{hex, kAddressHexLength})};
    for (size_t i{0}; i < kAddressHexLength; ++i) {
        if (hex[i] < 'a') continue;  // digits have no case
        const uint8_t nibble = (i % 2 == 0) ? (hash.bytes[i / 2] >> 4) : (hash.bytes[i / 2] & 0x0f);
        if (nibble >= 8) {
            hex[i] = static_cast<char>(hex[i] - 'a' + 'A');
        }
    }
}

void to_checksum_hex(const evmc::address& address, char* dest) noexcept {
    to_hex(ByteView{address.bytes}, dest);
    apply_checksum_case(dest);
}

std::string to_checksum_address(const evmc::address& address) {
    std::string out(2 + kAddressHexLength, '\0');
    out[0] = '0';
    out[1] = 'x';
    to_checksum_hex(address, &out[2]);
    return out;
}

bool is_valid_checksum_address(std::string_view text) {
    text = strip_hex_prefix(text);
    if (text.length() != kAddressHexLength || !is_hex_digits(text)) {
        return false;
    }
    const auto bytes{from_hex(text)};
    if (!bytes) {
        return false;
    }
    char expected[kAddressHexLength];
    to_checksum_hex(bytes_to_address(*bytes), expected);
    return text == std::string_view(expected, kAddressHexLength);
}

}  // namespace saltmine
