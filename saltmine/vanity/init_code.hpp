// Copyright 2025 The Saltmine Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <string_view>

#include <saltmine/core/common/bytes.hpp>

namespace saltmine::vanity {

//! \brief Decodes creation bytecode given as hex, optional 0x prefix and surrounding whitespace allowed
//! \throws std::invalid_argument if the text is not an even number of hex digits
Bytes parse_init_code(std::string_view hex);

//! \brief Reads creation bytecode stored as hex text in a file
//! \throws std::runtime_error if the file cannot be read, std::invalid_argument if its content is not hex
Bytes read_init_code_file(const std::filesystem::path& path);

//! \brief Extracts creation bytecode from a compiler build artifact
//! \details The artifact is a JSON document whose "bytecode" field is either a hex string (Hardhat) or an object
//! holding it in "object" (Foundry).
//! \throws std::runtime_error if the file cannot be read or parsed or holds no creation bytecode
Bytes read_artifact_bytecode(const std::filesystem::path& path);

}  // namespace saltmine::vanity
