// Copyright 2025 The Saltmine Authors
// SPDX-License-Identifier: Apache-2.0

#include "common.hpp"

#include <algorithm>
#include <map>
#include <thread>

#include <saltmine/core/common/util.hpp>

namespace saltmine::cmd::common {

void add_logging_options(CLI::App& cli, log::Settings& log_settings) {
    std::map<std::string, log::Level> level_mapping{
        {"critical", log::Level::kCritical},
        {"error", log::Level::kError},
        {"warning", log::Level::kWarning},
        {"info", log::Level::kInfo},
        {"debug", log::Level::kDebug},
        {"trace", log::Level::kTrace},
    };
    auto& log_opts = *cli.add_option_group("Log", "Logging options");
    log_opts.add_option("--log.verbosity", log_settings.log_verbosity, "Sets log verbosity")
        ->check(CLI::Range(log::Level::kCritical, log::Level::kTrace))
        ->transform(CLI::Transformer(level_mapping, CLI::ignore_case))
        ->default_val(log::Level::kInfo);
    log_opts.add_flag("--log.stdout", log_settings.log_std_out, "Outputs to std::out instead of std::err");
    log_opts.add_flag("--log.nocolor", log_settings.log_nocolor, "Disable colors on log lines");
    log_opts.add_flag("--log.utc", log_settings.log_utc, "Prints log timings in UTC");
    log_opts.add_flag("--log.threads", log_settings.log_threads, "Prints thread ids");
    log_opts.add_option("--log.file", log_settings.log_file, "Tee all log lines to given file name");
}

void add_option_num_workers(CLI::App& cli, uint32_t& num_workers) {
    const uint32_t hardware_threads{std::max(std::thread::hardware_concurrency(), 1u)};
    cli.add_option("--threads", num_workers, "The number of parallel search workers")
        ->check(CLI::Range(1u, 4096u))
        ->default_val(hardware_threads);
}

HexValidator::HexValidator(size_t max_bytes, bool allow_empty) {
    name_ = "HEX";
    func_ = [max_bytes, allow_empty](const std::string& value) -> std::string {
        const std::string_view digits{strip_hex_prefix(value)};
        if (digits.empty() && !allow_empty) {
            return "Value must not be empty: " + value;
        }
        if (!is_hex_digits(digits)) {
            return "Value is not a valid hex string: " + value;
        }
        if (max_bytes != 0 && (digits.length() + 1) / 2 > max_bytes) {
            return "Value exceeds " + std::to_string(max_bytes) + " bytes: " + value;
        }
        return {};
    };
}

}  // namespace saltmine::cmd::common
