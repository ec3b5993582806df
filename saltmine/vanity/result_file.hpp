// Copyright 2025 The Saltmine Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>

#include <nlohmann/json.hpp>

namespace saltmine::vanity {

//! Default location of the result file, relative to the working directory
inline constexpr const char* kDefaultResultFile{"results/vanity-create2.json"};

//! \brief Appends a record to the JSON array stored at path, creating file and parent directories when missing
//! \details Existing entries are kept. A non-array document already present becomes the first array element.
//! \throws std::runtime_error if the existing file cannot be read or parsed, or the new content cannot be written
void append_result(const std::filesystem::path& path, const nlohmann::json& record);

}  // namespace saltmine::vanity
