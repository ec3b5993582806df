// Copyright 2025 The Saltmine Authors
// SPDX-License-Identifier: Apache-2.0

#include "evmc_bytes32.hpp"

#include <algorithm>
#include <cstring>

#include <saltmine/core/common/base.hpp>
#include <saltmine/core/common/util.hpp>

namespace saltmine {

evmc::bytes32 to_bytes32(ByteView bytes) {
    evmc::bytes32 out;
    if (!bytes.empty()) {
        size_t n{std::min(bytes.size(), kHashLength)};
        std::memcpy(out.bytes + kHashLength - n, bytes.data(), n);
    }
    return out;
}

std::string to_hex(const evmc::bytes32& value, bool with_prefix) {
    return to_hex(ByteView{value.bytes}, with_prefix);
}

}  // namespace saltmine
