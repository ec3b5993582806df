// Copyright 2025 The Saltmine Authors
// SPDX-License-Identifier: Apache-2.0

#include "json.hpp"

#include <chrono>

#include <saltmine/core/types/address.hpp>
#include <saltmine/core/types/evmc_bytes32.hpp>

namespace saltmine::vanity {

static uint64_t to_milliseconds(std::chrono::nanoseconds duration) {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(duration).count());
}

static nlohmann::json optional_pattern(const std::string& pattern) {
    if (pattern.empty()) return nullptr;
    return pattern;
}

void to_json(nlohmann::json& json, const SearchProgress& progress) {
    json["attempts"] = progress.attempts;
    json["attempts_per_sec"] = progress.attempts_per_sec;
    json["elapsed_ms"] = to_milliseconds(progress.elapsed);
}

void to_json(nlohmann::json& json, const SearchPlan& plan) {
    json["factory"] = address_to_hex(plan.factory);
    json["init_code_hash"] = to_hex(plan.init_code_hash, /*with_prefix=*/true);
    if (plan.bounded()) {
        json["attempts_limit"] = plan.max_attempts;
    } else {
        json["attempts_limit"] = nullptr;
    }
    json["prefix"] = optional_pattern(plan.match.prefix());
    json["suffix"] = optional_pattern(plan.match.suffix());
    json["checksum"] = plan.match.checksum();
}

void to_json(nlohmann::json& json, const SearchResult& result) {
    json["salt"] = to_hex(result.salt, /*with_prefix=*/true);
    json["address"] = address_to_hex(result.address);
    json["checksum_address"] = result.checksum_address;
    json["attempts"] = result.attempts;
    json["seed"] = result.seed;
    json["elapsed_ms"] = to_milliseconds(result.elapsed);
    if (result.attempt_index) {
        json["attempt_index"] = *result.attempt_index;
    }
    if (result.deterministic) {
        json["pattern_matched"] = result.pattern_matched;
    }
}

nlohmann::json make_result_record(const SearchPlan& plan, const SearchResult& result) {
    nlohmann::json record = result;
    record.update(nlohmann::json(plan));
    return record;
}

}  // namespace saltmine::vanity
