// Copyright 2025 The Saltmine Authors
// SPDX-License-Identifier: Apache-2.0

#include "match_spec.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

#include <saltmine/core/common/base.hpp>
#include <saltmine/core/common/util.hpp>
#include <saltmine/core/types/checksum.hpp>
#include <saltmine/infra/common/log.hpp>

namespace saltmine::vanity {

static std::string to_lower(std::string_view s) {
    std::string out{s};
    std::ranges::transform(out, out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

static bool has_upper(std::string_view s) {
    return std::ranges::any_of(s, [](unsigned char c) { return std::isupper(c) != 0; });
}

static bool has_letters(std::string_view s) {
    return std::ranges::any_of(s, [](unsigned char c) { return std::isalpha(c) != 0; });
}

static SetupResult<std::string> validate_pattern(std::string_view name, std::string_view pattern, bool checksum) {
    if (!is_hex_digits(pattern)) {
        return setup_error(SetupErrorCode::kInvalidHexPattern,
                           std::string{name} + " '" + std::string{pattern} + "' contains non-hex characters");
    }
    if (pattern.length() > kAddressHexLength) {
        return setup_error(SetupErrorCode::kInvalidHexPattern,
                           std::string{name} + " '" + std::string{pattern} + "' is longer than " +
                               std::to_string(kAddressHexLength) + " hex digits");
    }
    if (checksum) {
        if (!pattern.empty() && !has_letters(pattern)) {
            SALT_WARN << "Checksum mode has no effect on digit-only " << name << " '" << pattern << "'";
        }
        return std::string{pattern};
    }
    if (has_upper(pattern)) {
        SALT_WARN << "Lower-casing " << name << " '" << pattern << "': enable checksum mode to match letter case";
    }
    return to_lower(pattern);
}

SetupResult<MatchSpec> MatchSpec::make(std::optional<std::string_view> prefix, std::optional<std::string_view> suffix,
                                       bool checksum) {
    const auto valid_prefix{validate_pattern("prefix", strip_hex_prefix(prefix.value_or("")), checksum)};
    if (!valid_prefix) {
        return tl::make_unexpected(valid_prefix.error());
    }
    const auto valid_suffix{validate_pattern("suffix", suffix.value_or(""), checksum)};
    if (!valid_suffix) {
        return tl::make_unexpected(valid_suffix.error());
    }
    if (valid_prefix->length() + valid_suffix->length() > kAddressHexLength) {
        return setup_error(SetupErrorCode::kInvalidHexPattern,
                           "prefix and suffix together exceed " + std::to_string(kAddressHexLength) + " hex digits");
    }
    return MatchSpec{*valid_prefix, *valid_suffix, checksum};
}

MatchSpec::MatchSpec(std::string prefix, std::string suffix, bool checksum)
    : prefix_{std::move(prefix)},
      suffix_{std::move(suffix)},
      folded_prefix_{to_lower(prefix_)},
      folded_suffix_{to_lower(suffix_)},
      checksum_{checksum} {}

bool MatchSpec::matches_folded(std::string_view lowercase_hex) const noexcept {
    return lowercase_hex.starts_with(folded_prefix_) && lowercase_hex.ends_with(folded_suffix_);
}

bool MatchSpec::matches_hex(std::string_view hex) const noexcept {
    return hex.starts_with(prefix_) && hex.ends_with(suffix_);
}

bool MatchSpec::matches(const evmc::address& address) const noexcept {
    if (empty()) return true;

    char hex[kAddressHexLength];
    to_hex(ByteView{address.bytes}, hex);
    const std::string_view view{hex, kAddressHexLength};
    if (!checksum_) {
        return matches_hex(view);
    }
    // Checksum casing only alters letters, so a case-insensitive miss is a miss
    if (!matches_folded(view)) {
        return false;
    }
    apply_checksum_case(hex);
    return matches_hex(view);
}

double MatchSpec::expected_attempts() const noexcept {
    const auto digits{static_cast<double>(prefix_.length() + suffix_.length())};
    double attempts{std::pow(16.0, digits)};
    if (checksum_) {
        const auto letters{std::ranges::count_if(prefix_, [](unsigned char c) { return std::isalpha(c) != 0; }) +
                           std::ranges::count_if(suffix_, [](unsigned char c) { return std::isalpha(c) != 0; })};
        attempts *= std::pow(2.0, static_cast<double>(letters));
    }
    return attempts;
}

std::string MatchSpec::to_string() const {
    if (empty()) return "<any>";
    std::string out{prefix_};
    out.append("...").append(suffix_);
    if (checksum_) {
        out.append(" (checksum)");
    }
    return out;
}

}  // namespace saltmine::vanity
