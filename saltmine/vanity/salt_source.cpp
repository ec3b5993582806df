// Copyright 2025 The Saltmine Authors
// SPDX-License-Identifier: Apache-2.0

#include "salt_source.hpp"

#include <saltmine/core/common/base.hpp>
#include <saltmine/core/common/endian.hpp>
#include <saltmine/core/common/util.hpp>
#include <saltmine/core/types/evmc_bytes32.hpp>

namespace saltmine::vanity {

evmc::bytes32 derive_salt(uint64_t seed, uint64_t attempt) noexcept {
    evmc::bytes32 salt;
    uint64_t state{seed ^ attempt};
    for (size_t offset{0}; offset < kSaltLength; offset += sizeof(uint64_t)) {
        state = splitmix64(state);
        endian::store_little_u64(&salt.bytes[offset], state);
    }
    return salt;
}

SetupResult<evmc::bytes32> normalize_salt(ByteView salt) {
    if (salt.size() > kSaltLength) {
        return setup_error(SetupErrorCode::kInvalidInputLength,
                           "salt is " + std::to_string(salt.size()) + " bytes, at most " +
                               std::to_string(kSaltLength) + " expected");
    }
    return to_bytes32(salt);
}

SetupResult<evmc::bytes32> parse_salt(std::string_view hex) {
    const auto bytes{from_hex(hex)};
    if (!bytes) {
        return setup_error(SetupErrorCode::kInvalidHexPattern, "salt '" + std::string{hex} + "' is not valid hex");
    }
    return normalize_salt(*bytes);
}

}  // namespace saltmine::vanity
