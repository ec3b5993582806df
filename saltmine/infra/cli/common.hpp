// Copyright 2025 The Saltmine Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <CLI/CLI.hpp>

#include <saltmine/infra/common/log.hpp>

namespace saltmine::cmd::common {

//! \brief Set up options to populate log settings after cli.parse()
void add_logging_options(CLI::App& cli, log::Settings& log_settings);

//! \brief Set up option for the number of search workers (default: available hardware threads)
void add_option_num_workers(CLI::App& cli, uint32_t& num_workers);

//! CLI11 validator accepting hex strings (optional 0x prefix) of at most max_bytes bytes (0 = unbounded)
struct HexValidator : public CLI::Validator {
    explicit HexValidator(size_t max_bytes = 0, bool allow_empty = false);
};

}  // namespace saltmine::cmd::common
