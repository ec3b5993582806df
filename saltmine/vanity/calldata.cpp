// Copyright 2025 The Saltmine Authors
// SPDX-License-Identifier: Apache-2.0

#include "calldata.hpp"

#include <saltmine/core/common/base.hpp>

namespace saltmine::vanity {

SetupResult<Bytes> build_create2_calldata(const evmc::bytes32& salt, ByteView init_code) {
    if (init_code.empty()) {
        return setup_error(SetupErrorCode::kInvalidInputLength, "init code is empty");
    }
    Bytes calldata;
    calldata.reserve(kSaltLength + init_code.size());
    calldata.append(salt.bytes, kSaltLength);
    calldata.append(init_code);
    return calldata;
}

}  // namespace saltmine::vanity
