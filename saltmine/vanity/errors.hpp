// Copyright 2025 The Saltmine Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ostream>
#include <string>
#include <utility>

#include <tl/expected.hpp>

namespace saltmine::vanity {

//! Errors detected while validating a search request, before any worker is spawned
enum class [[nodiscard]] SetupErrorCode {
    kInvalidInputLength,     // factory/salt/init code hash byte length, or empty init code
    kInvalidHexPattern,      // prefix/suffix with non-hex characters or longer than an address
    kNoConstraintSpecified,  // neither salt nor prefix/suffix
};

struct SetupError {
    SetupErrorCode code;
    std::string detail;  // which input is invalid and why
};

std::string to_string(const SetupError& error);

std::ostream& operator<<(std::ostream& out, const SetupError& error);

// TODO(C++23) Switch to std::expected
template <class T>
using SetupResult = tl::expected<T, SetupError>;

inline tl::unexpected<SetupError> setup_error(SetupErrorCode code, std::string detail) {
    return tl::make_unexpected(SetupError{code, std::move(detail)});
}

}  // namespace saltmine::vanity
