// Copyright 2025 The Saltmine Authors
// SPDX-License-Identifier: Apache-2.0

#include "address.hpp"

#include <algorithm>
#include <cstring>

#include <ethash/keccak.hpp>

#include <saltmine/core/common/base.hpp>
#include <saltmine/core/common/util.hpp>

namespace saltmine {

evmc::address create2_address(const evmc::address& deployer, const evmc::bytes32& salt,
                              const evmc::bytes32& init_code_hash) noexcept {
    uint8_t buf[kCreate2PreimageLength];

    buf[0] = 0xff;
    std::memcpy(buf + 1, deployer.bytes, kAddressLength);
    std::memcpy(buf + 1 + kAddressLength, salt.bytes, kSaltLength);
    std::memcpy(buf + 1 + kAddressLength + kSaltLength, init_code_hash.bytes, kHashLength);

    ethash::hash256 hash{ethash::keccak256(buf, kCreate2PreimageLength)};

    evmc::address address{};
    std::memcpy(address.bytes, hash.bytes + kHashLength - kAddressLength, kAddressLength);
    return address;
}

evmc::address bytes_to_address(ByteView bytes) {
    evmc::address out;
    if (!bytes.empty()) {
        size_t n{std::min(bytes.size(), kAddressLength)};
        std::memcpy(out.bytes + kAddressLength - n, bytes.data(), n);
    }
    return out;
}

std::string address_to_hex(const evmc::address& address) {
    return to_hex(ByteView{address.bytes}, true);
}

}  // namespace saltmine

namespace evmc {

std::ostream& operator<<(std::ostream& out, const evmc::address& address) {
    return out << saltmine::address_to_hex(address);
}

}  // namespace evmc
