// Copyright 2025 The Saltmine Authors
// SPDX-License-Identifier: Apache-2.0

#include "init_code.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <absl/strings/ascii.h>
#include <nlohmann/json.hpp>

#include <saltmine/core/common/util.hpp>

namespace saltmine::vanity {

static std::string read_text(const std::filesystem::path& path) {
    std::ifstream in{path};
    if (!in) {
        throw std::runtime_error{"cannot read " + path.string()};
    }
    std::stringstream content;
    content << in.rdbuf();
    return content.str();
}

Bytes parse_init_code(std::string_view hex) {
    const std::string_view digits{strip_hex_prefix(absl::StripAsciiWhitespace(hex))};
    if (digits.length() % 2 != 0 || !is_hex_digits(digits)) {
        throw std::invalid_argument{"init code must be full bytes of hex digits: " + abridge(hex, 16)};
    }
    return *from_hex(digits);
}

Bytes read_init_code_file(const std::filesystem::path& path) {
    return parse_init_code(read_text(path));
}

Bytes read_artifact_bytecode(const std::filesystem::path& path) {
    const auto artifact{nlohmann::json::parse(read_text(path), /*cb=*/nullptr, /*allow_exceptions=*/false)};
    if (artifact.is_discarded() || !artifact.is_object()) {
        throw std::runtime_error{"invalid artifact JSON " + path.string()};
    }
    const auto bytecode_it{artifact.find("bytecode")};
    if (bytecode_it == artifact.end()) {
        throw std::runtime_error{"artifact " + path.string() + " has no bytecode field"};
    }
    nlohmann::json bytecode = *bytecode_it;
    if (bytecode.is_object() && bytecode.contains("object")) {
        bytecode = bytecode["object"];
    }
    if (!bytecode.is_string()) {
        throw std::runtime_error{"artifact " + path.string() + " bytecode is not a hex string"};
    }
    Bytes init_code{parse_init_code(bytecode.get<std::string>())};
    if (init_code.empty()) {
        throw std::runtime_error{"artifact " + path.string() + " does not contain creation bytecode"};
    }
    return init_code;
}

}  // namespace saltmine::vanity
