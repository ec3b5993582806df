// Copyright 2025 The Saltmine Authors
// SPDX-License-Identifier: Apache-2.0

#include "errors.hpp"

#include <magic_enum.hpp>

namespace saltmine::vanity {

std::string to_string(const SetupError& error) {
    std::string out{magic_enum::enum_name(error.code)};
    if (!error.detail.empty()) {
        out.append(": ").append(error.detail);
    }
    return out;
}

std::ostream& operator<<(std::ostream& out, const SetupError& error) {
    return out << to_string(error);
}

}  // namespace saltmine::vanity
