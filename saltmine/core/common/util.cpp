// Copyright 2025 The Saltmine Authors
// SPDX-License-Identifier: Apache-2.0

#include "util.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace saltmine {

// ASCII -> hex value (0xff means bad [hex] char)
static constexpr std::array<uint8_t, 256> kUnhexTable{[] {
    std::array<uint8_t, 256> table{};
    table.fill(0xff);
    for (uint8_t c{'0'}; c <= '9'; ++c) table[c] = static_cast<uint8_t>(c - '0');
    for (uint8_t c{'a'}; c <= 'f'; ++c) table[c] = static_cast<uint8_t>(c - 'a' + 10);
    for (uint8_t c{'A'}; c <= 'F'; ++c) table[c] = static_cast<uint8_t>(c - 'A' + 10);
    return table;
}()};

static constexpr const char* kHexDigits{"0123456789abcdef"};

static inline uint8_t unhex_lut(uint8_t x) { return kUnhexTable[x]; }

bool is_hex_digits(std::string_view s) noexcept {
    return std::ranges::all_of(s, [](char c) { return unhex_lut(static_cast<uint8_t>(c)) != 0xff; });
}

void to_hex(ByteView bytes, char* dest) noexcept {
    for (const auto& b : bytes) {
        *dest++ = kHexDigits[b >> 4];    // Hi
        *dest++ = kHexDigits[b & 0x0f];  // Lo
    }
}

std::string to_hex(ByteView bytes, bool with_prefix) {
    std::string out(bytes.size() * 2 + (with_prefix ? 2 : 0), '\0');
    char* dest{&out[0]};
    if (with_prefix) {
        *dest++ = '0';
        *dest++ = 'x';
    }
    to_hex(bytes, dest);
    return out;
}

std::string abridge(std::string_view input, size_t length) {
    if (input.length() <= length) {
        return std::string(input);
    }
    return std::string(input.substr(0, length)) + "...";
}

std::optional<uint8_t> decode_hex_digit(char ch) noexcept {
    auto ret{unhex_lut(static_cast<uint8_t>(ch))};
    if (ret == 0xff) {
        return std::nullopt;
    }
    return ret;
}

std::optional<Bytes> from_hex(std::string_view hex) noexcept {
    hex = strip_hex_prefix(hex);
    if (hex.empty()) {
        return Bytes{};
    }

    size_t pos(hex.length() & 1);  // "[0x]1" is legit and has to be treated as "[0x]01"
    Bytes out((hex.length() + pos) / 2, '\0');
    const char* src{hex.data()};
    const char* last = src + hex.length();
    uint8_t* dst{&out[0]};

    if (pos) {
        auto b{unhex_lut(static_cast<uint8_t>(*src++))};
        if (b == 0xff) {
            return std::nullopt;
        }
        *dst++ = b;
    }

    while (src < last) {
        auto hi{unhex_lut(static_cast<uint8_t>(*src++))};
        auto lo{unhex_lut(static_cast<uint8_t>(*src++))};
        if (hi == 0xff || lo == 0xff) {
            return std::nullopt;
        }
        *dst++ = static_cast<uint8_t>(hi << 4) | lo;
    }
    return out;
}

inline bool case_insensitive_char_comparer(char a, char b) { return (tolower(a) == tolower(b)); }

bool iequals(const std::string_view a, const std::string_view b) {
    return (a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), case_insensitive_char_comparer));
}

}  // namespace saltmine
