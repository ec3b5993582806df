// Copyright 2025 The Saltmine Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

#include <saltmine/core/common/random_number.hpp>

namespace saltmine::test_util {

//! \brief Uniquely named directory under the OS temporary path, removed with its content on destruction
class TemporaryDirectory {
  public:
    TemporaryDirectory() : path_{get_unique_temporary_path()} { std::filesystem::create_directories(path_); }
    ~TemporaryDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::filesystem::path& path() const noexcept { return path_; }

    static std::filesystem::path get_unique_temporary_path() {
        const auto base_path{std::filesystem::temp_directory_path()};
        RandomNumber random_number;
        for (int i = 0; i < 1000; ++i) {
            auto candidate{base_path / ("saltmine-" + std::to_string(random_number.generate_one()))};
            if (!std::filesystem::exists(candidate)) {
                return candidate;
            }
        }
        throw std::runtime_error("Unable to find a valid unique non-existent path");
    }

  private:
    std::filesystem::path path_;
};

}  // namespace saltmine::test_util
