// Copyright 2025 The Saltmine Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <nlohmann/json.hpp>

#include <saltmine/vanity/search.hpp>

namespace saltmine::vanity {

void to_json(nlohmann::json& json, const SearchProgress& progress);

//! Search inputs: factory, init_code_hash, attempts_limit, prefix, suffix, checksum
void to_json(nlohmann::json& json, const SearchPlan& plan);

//! Search outcome: salt, address, checksum_address, attempts, seed, elapsed_ms
void to_json(nlohmann::json& json, const SearchResult& result);

//! \brief Builds the record stored in the result file, merging plan and result fields
nlohmann::json make_result_record(const SearchPlan& plan, const SearchResult& result);

}  // namespace saltmine::vanity
