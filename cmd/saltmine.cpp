// Copyright 2025 The Saltmine Authors
// SPDX-License-Identifier: Apache-2.0

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <saltmine/core/common/util.hpp>
#include <saltmine/core/types/address.hpp>
#include <saltmine/core/types/evmc_bytes32.hpp>
#include <saltmine/infra/cli/common.hpp>
#include <saltmine/infra/common/log.hpp>
#include <saltmine/infra/common/stopwatch.hpp>
#include <saltmine/infra/common/terminal.hpp>
#include <saltmine/vanity/calldata.hpp>
#include <saltmine/vanity/init_code.hpp>
#include <saltmine/vanity/json.hpp>
#include <saltmine/vanity/result_file.hpp>
#include <saltmine/vanity/salt_source.hpp>
#include <saltmine/vanity/search.hpp>

using namespace saltmine;
using namespace saltmine::vanity;

struct SaltmineSettings {
    log::Settings log_settings;
    std::string factory;
    std::string init_code;
    std::filesystem::path init_code_file;
    std::filesystem::path artifact;
    std::string init_code_hash;
    std::string salt;
    std::string prefix;
    std::string suffix;
    bool checksum{false};
    uint64_t max_attempts{0};
    uint32_t num_workers{1};
    std::optional<uint64_t> seed;
    std::optional<uint64_t> derive_attempt;
    uint32_t progress_interval_secs{5};
    bool progress_json{false};
    std::filesystem::path output{kDefaultResultFile};
    bool no_output{false};
    bool print_calldata{false};
    std::filesystem::path calldata_out;
};

//! Parse the command-line arguments into the saltmine settings
void parse_command_line(int argc, char* argv[], CLI::App& app, SaltmineSettings& settings) {
    cmd::common::add_logging_options(app, settings.log_settings);

    auto& target = *app.add_option_group("Target", "Contract to deploy through CREATE2");
    target.add_option("--factory", settings.factory, "Address of the CREATE2 deployer")
        ->default_val(address_to_hex(kDeterministicDeploymentProxy))
        ->check(cmd::common::HexValidator{});
    auto init_code_opt = target.add_option("--init-code", settings.init_code, "Contract creation bytecode as hex")
                             ->check(cmd::common::HexValidator{0, /*allow_empty=*/true});
    auto init_code_file_opt = target.add_option("--init-code-file", settings.init_code_file,
                                                "File holding the contract creation bytecode as hex")
                                  ->check(CLI::ExistingFile);
    auto artifact_opt = target.add_option("--artifact", settings.artifact,
                                          "Compiler build artifact (JSON) holding the creation bytecode")
                            ->check(CLI::ExistingFile);
    auto init_code_hash_opt = target.add_option("--init-code-hash", settings.init_code_hash,
                                                "Keccak256 hash of the creation bytecode")
                                  ->check(cmd::common::HexValidator{});
    init_code_opt->excludes(init_code_file_opt)->excludes(artifact_opt)->excludes(init_code_hash_opt);
    init_code_file_opt->excludes(artifact_opt)->excludes(init_code_hash_opt);
    artifact_opt->excludes(init_code_hash_opt);

    auto& pattern = *app.add_option_group("Pattern", "Vanity constraints");
    pattern.add_option("--prefix", settings.prefix, "Hex digits the address must start with");
    pattern.add_option("--suffix", settings.suffix, "Hex digits the address must end with");
    pattern.add_flag("--checksum", settings.checksum, "Match prefix and suffix against the EIP-55 mixed-case form");
    auto salt_opt = pattern.add_option("--salt", settings.salt, "Compute the address of this salt, no search")
                        ->check(cmd::common::HexValidator{});

    auto& search = *app.add_option_group("Search", "Search settings");
    search.add_option("--attempts", settings.max_attempts, "Maximum number of candidate salts, 0 = unlimited")
        ->capture_default_str();
    cmd::common::add_option_num_workers(app, settings.num_workers);
    auto seed_opt = search.add_option("--seed", settings.seed, "Base seed of the salt stream, random if omitted");
    search.add_option("--derive-attempt", settings.derive_attempt,
                      "Recompute the salt and address of this attempt of a past run")
        ->needs(seed_opt)
        ->excludes(salt_opt);
    search.add_option("--progress-interval", settings.progress_interval_secs,
                      "Seconds between progress reports, 0 = disabled")
        ->capture_default_str()
        ->check(CLI::Range(0u, 86'400u));
    search.add_flag("--progress-json", settings.progress_json, "Print progress as STATS {json} lines on stdout");

    auto& output = *app.add_option_group("Output", "Result output");
    output.add_option("--output", settings.output, "JSON file the result is appended to")->capture_default_str();
    output.add_flag("--no-output", settings.no_output, "Do not write the result file");
    output.add_flag("--calldata", settings.print_calldata, "Print the deployment calldata for the resulting salt");
    output.add_option("--calldata-out", settings.calldata_out, "Write the deployment calldata to this file");

    app.parse(argc, argv);
}

static std::optional<Bytes> load_init_code(const SaltmineSettings& settings) {
    if (!settings.init_code.empty()) return parse_init_code(settings.init_code);
    if (!settings.init_code_file.empty()) return read_init_code_file(settings.init_code_file);
    if (!settings.artifact.empty()) return read_artifact_bytecode(settings.artifact);
    return std::nullopt;
}

static SearchRequest make_search_request(const SaltmineSettings& settings) {
    SearchRequest request{.factory = *from_hex(settings.factory)};
    request.init_code = load_init_code(settings);
    if (!settings.init_code_hash.empty()) {
        request.init_code_hash = *from_hex(settings.init_code_hash);
    }
    if (settings.derive_attempt) {
        const evmc::bytes32 salt{derive_salt(*settings.seed, *settings.derive_attempt)};
        SALT_INFO_M("Derived salt", {"seed", std::to_string(*settings.seed),
                                     "attempt", std::to_string(*settings.derive_attempt)});
        request.salt = Bytes{salt.bytes, kSaltLength};
    } else if (!settings.salt.empty()) {
        request.salt = *from_hex(settings.salt);
    }
    if (!settings.prefix.empty()) request.prefix = settings.prefix;
    if (!settings.suffix.empty()) request.suffix = settings.suffix;
    request.checksum = settings.checksum;
    if (settings.max_attempts != 0) request.max_attempts = settings.max_attempts;
    request.num_workers = settings.num_workers;
    request.seed = settings.seed;
    request.progress_interval = std::chrono::seconds{settings.progress_interval_secs};
    return request;
}

static void connect_progress_output(SaltSearch& search, bool json) {
    if (json) {
        search.signal_progress.connect([](const SearchProgress& progress) {
            std::cout << "STATS " << nlohmann::json(progress).dump() << std::endl;
        });
        return;
    }
    search.signal_progress.connect([](const SearchProgress& progress) {
        std::stringstream rate;
        rate << std::fixed << std::setprecision(2) << progress.attempts_per_sec << "/s";
        SALT_INFO_M("Search progress", {"attempts", std::to_string(progress.attempts),
                                        "rate", rate.str(),
                                        "elapsed", StopWatch::format(progress.elapsed)});
    });
}

static void print_result(const SearchResult& result) {
    const std::string address{is_terminal_stdout() ? colorize(result.checksum_address, kColorLimeHigh)
                                                   : result.checksum_address};
    std::cout << "Salt             : " << to_hex(result.salt, /*with_prefix=*/true) << "\n"
              << "Address          : " << address << "\n"
              << "Attempts         : " << result.attempts << "\n";
    if (result.attempt_index) {
        std::cout << "Attempt index    : " << *result.attempt_index << " (seed " << result.seed << ")\n";
    }
    std::cout << "Elapsed          : " << StopWatch::format(result.elapsed) << std::endl;
}

static void output_calldata(const SaltmineSettings& settings, const SearchRequest& request,
                            const SearchResult& result) {
    if (!request.init_code) {
        throw std::runtime_error{"deployment calldata requires the init code, not its hash"};
    }
    const auto calldata{build_create2_calldata(result.salt, *request.init_code)};
    if (!calldata) {
        throw std::runtime_error{"cannot build deployment calldata: " + to_string(calldata.error())};
    }
    const std::string calldata_hex{to_hex(*calldata, /*with_prefix=*/true)};
    if (settings.print_calldata) {
        std::cout << "Calldata         : " << calldata_hex << std::endl;
    }
    if (!settings.calldata_out.empty()) {
        std::ofstream out{settings.calldata_out, std::ios::trunc};
        out << calldata_hex << '\n';
        if (!out) {
            throw std::runtime_error{"cannot write calldata file " + settings.calldata_out.string()};
        }
        SALT_INFO << "Calldata written to " << settings.calldata_out.string();
    }
}

int main(int argc, char* argv[]) {
    CLI::App app{"CREATE2 vanity address search"};

    try {
        SaltmineSettings settings;
        parse_command_line(argc, argv, app, settings);

        log::init(settings.log_settings);
        log::set_thread_name("main");

        const SearchRequest request{make_search_request(settings)};
        const auto plan{make_search_plan(request)};
        if (!plan) {
            SALT_ERROR << "Invalid search setup: " << plan.error();
            return 1;
        }

        SaltSearch search{*plan};
        connect_progress_output(search, settings.progress_json);
        const SearchResult result{search.run()};

        if (!result.found) {
            SALT_WARN_M("No match within the attempt limit", {"attempts", std::to_string(result.attempts),
                                                               "elapsed", StopWatch::format(result.elapsed)});
            SALT_WARN << "Increase --attempts or relax prefix/suffix";
            return 0;
        }
        if (result.deterministic) {
            SALT_INFO_M("Address computed for fixed salt", {"pattern", plan->match.to_string(),
                                                            "matched", result.pattern_matched ? "yes" : "no"});
        } else {
            SALT_INFO_M("Match found", {"attempts", std::to_string(result.attempts),
                                        "elapsed", StopWatch::format(result.elapsed)});
        }
        print_result(result);

        if (!settings.no_output) {
            append_result(settings.output, make_result_record(*plan, result));
            SALT_INFO << "Result saved to " << settings.output.string();
        }
        if (settings.print_calldata || !settings.calldata_out.empty()) {
            output_calldata(settings, request, result);
        }
        return 0;
    } catch (const CLI::ParseError& pe) {
        return app.exit(pe);
    } catch (const std::exception& e) {
        SALT_CRIT << "Saltmine exiting due to exception: " << e.what();
        return -2;
    }
}
