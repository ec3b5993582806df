// Copyright 2025 The Saltmine Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <evmc/evmc.hpp>

#include <saltmine/vanity/errors.hpp>

namespace saltmine::vanity {

//! \brief The pattern a derived address must satisfy: an hex prefix and/or suffix, compared either against the
//! lowercase hex form of the address or (checksum mode) against its EIP-55 mixed-case form
class MatchSpec {
  public:
    //! An empty spec: every address matches
    MatchSpec() = default;

    //! \brief Validates and normalizes the patterns
    //! \details A leading 0x on the prefix is dropped. Without checksum mode patterns are lower-cased, with checksum
    //! mode their case is significant and kept verbatim. Empty patterns count as absent.
    //! \return kInvalidHexPattern if a pattern holds non-hex characters or prefix + suffix exceed an address
    static SetupResult<MatchSpec> make(std::optional<std::string_view> prefix, std::optional<std::string_view> suffix,
                                       bool checksum);

    const std::string& prefix() const noexcept { return prefix_; }
    const std::string& suffix() const noexcept { return suffix_; }
    bool checksum() const noexcept { return checksum_; }

    //! Whether neither prefix nor suffix is set
    bool empty() const noexcept { return prefix_.empty() && suffix_.empty(); }

    //! \brief Tests the address against prefix and suffix (both must hold)
    //! \remarks Allocation free, safe to call concurrently
    bool matches(const evmc::address& address) const noexcept;

    //! \brief Tests 40 hex digits (no 0x) already rendered in the form required by the checksum mode
    bool matches_hex(std::string_view hex) const noexcept;

    //! \brief Average number of candidates needed for one match
    double expected_attempts() const noexcept;

    //! \brief Human readable description, e.g. "cafe...beef (checksum)"
    std::string to_string() const;

  private:
    MatchSpec(std::string prefix, std::string suffix, bool checksum);

    bool matches_folded(std::string_view lowercase_hex) const noexcept;

    std::string prefix_;
    std::string suffix_;
    std::string folded_prefix_;  // lowercase copies used to pre-filter candidates in checksum mode
    std::string folded_suffix_;
    bool checksum_{false};
};

}  // namespace saltmine::vanity
