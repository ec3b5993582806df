// Copyright 2025 The Saltmine Authors
// SPDX-License-Identifier: Apache-2.0

#include "result_file.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <absl/strings/ascii.h>

#include <saltmine/infra/common/log.hpp>

namespace saltmine::vanity {

static nlohmann::json read_entries(const std::filesystem::path& path) {
    auto entries{nlohmann::json::array()};
    if (!std::filesystem::exists(path)) {
        return entries;
    }
    std::ifstream in{path};
    if (!in) {
        throw std::runtime_error{"cannot read result file " + path.string()};
    }
    std::stringstream content;
    content << in.rdbuf();
    const std::string raw{content.str()};
    if (absl::StripAsciiWhitespace(raw).empty()) {
        return entries;
    }
    auto existing{nlohmann::json::parse(raw, /*cb=*/nullptr, /*allow_exceptions=*/false)};
    if (existing.is_discarded()) {
        throw std::runtime_error{"cannot parse result file " + path.string()};
    }
    if (existing.is_array()) {
        return existing;
    }
    entries.push_back(std::move(existing));
    return entries;
}

void append_result(const std::filesystem::path& path, const nlohmann::json& record) {
    auto entries{read_entries(path)};
    entries.push_back(record);

    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw std::runtime_error{"cannot create directory " + path.parent_path().string() + ": " + ec.message()};
        }
    }
    std::ofstream out{path, std::ios::trunc};
    out << entries.dump(2) << '\n';
    if (!out) {
        throw std::runtime_error{"cannot write result file " + path.string()};
    }
    SALT_DEBUG << "Result file " << path.string() << " holds " << entries.size() << " entries";
}

}  // namespace saltmine::vanity
