// Copyright 2025 The Saltmine Authors
// SPDX-License-Identifier: Apache-2.0

#include "search.hpp"

#include <algorithm>
#include <bit>
#include <iomanip>
#include <sstream>
#include <thread>
#include <utility>
#include <vector>

#include <saltmine/core/common/random_number.hpp>
#include <saltmine/core/common/util.hpp>
#include <saltmine/core/types/address.hpp>
#include <saltmine/core/types/checksum.hpp>
#include <saltmine/core/types/evmc_bytes32.hpp>
#include <saltmine/infra/common/ensure.hpp>
#include <saltmine/infra/common/log.hpp>
#include <saltmine/infra/common/stopwatch.hpp>
#include <saltmine/vanity/salt_source.hpp>

namespace saltmine::vanity {

static std::string format_estimate(double attempts) {
    std::ostringstream out;
    out << std::setprecision(3) << attempts;
    return out.str();
}

static SetupResult<evmc::bytes32> resolve_init_code_hash(const SearchRequest& request) {
    if (request.init_code_hash) {
        if (request.init_code_hash->size() != kHashLength) {
            return setup_error(SetupErrorCode::kInvalidInputLength,
                               "init code hash is " + std::to_string(request.init_code_hash->size()) +
                                   " bytes, " + std::to_string(kHashLength) + " expected");
        }
        const evmc::bytes32 init_code_hash{to_bytes32(*request.init_code_hash)};
        if (request.init_code && evmc::bytes32{std::bit_cast<evmc_bytes32>(keccak256(*request.init_code))} != init_code_hash) {
            SALT_WARN << "Init code hash " << to_hex(init_code_hash, true) << " does not match the init code, using it";
        }
        return init_code_hash;
    }
    if (!request.init_code) {
        return setup_error(SetupErrorCode::kInvalidInputLength, "neither init code nor init code hash given");
    }
    if (request.init_code->empty()) {
        SALT_WARN << "Init code is empty: the derived address would hold no code";
    }
    return evmc::bytes32{std::bit_cast<evmc_bytes32>(keccak256(*request.init_code))};
}

SetupResult<SearchPlan> make_search_plan(const SearchRequest& request) {
    SearchPlan plan;

    if (request.factory.size() != kAddressLength) {
        return setup_error(SetupErrorCode::kInvalidInputLength,
                           "factory is " + std::to_string(request.factory.size()) + " bytes, " +
                               std::to_string(kAddressLength) + " expected");
    }
    plan.factory = bytes_to_address(request.factory);

    const auto init_code_hash{resolve_init_code_hash(request)};
    if (!init_code_hash) {
        return tl::make_unexpected(init_code_hash.error());
    }
    plan.init_code_hash = *init_code_hash;

    auto match{MatchSpec::make(request.prefix, request.suffix, request.checksum)};
    if (!match) {
        return tl::make_unexpected(match.error());
    }
    plan.match = std::move(*match);

    if (request.salt) {
        const auto salt{normalize_salt(*request.salt)};
        if (!salt) {
            return tl::make_unexpected(salt.error());
        }
        plan.salt = *salt;
        if (!plan.match.empty()) {
            SALT_WARN << "Both salt and prefix/suffix given: computing the address of the fixed salt, pattern "
                      << plan.match.to_string() << " is only reported";
        }
    } else if (plan.match.empty()) {
        return setup_error(SetupErrorCode::kNoConstraintSpecified, "provide a salt or a prefix and/or suffix");
    }

    plan.max_attempts = request.max_attempts.value_or(kUnlimitedAttempts);
    plan.num_workers = std::max(request.num_workers.value_or(std::thread::hardware_concurrency()), 1u);
    plan.seed = request.seed ? *request.seed : RandomNumber{}.generate_one();
    plan.batch_size = std::max(request.batch_size, uint64_t{1});
    plan.progress_interval = request.progress_interval;
    return plan;
}

SaltSearch::SaltSearch(SearchPlan plan) : plan_{std::move(plan)} {}

SearchResult SaltSearch::run() {
    ensure(!started_.exchange(true), "SaltSearch::run called more than once");
    return plan_.deterministic() ? run_deterministic() : run_brute_force();
}

SearchResult SaltSearch::run_deterministic() {
    StopWatch stop_watch{StopWatch::kStart};

    SearchResult result;
    result.found = true;
    result.deterministic = true;
    result.salt = *plan_.salt;
    result.address = create2_address(plan_.factory, result.salt, plan_.init_code_hash);
    result.checksum_address = to_checksum_address(result.address);
    result.pattern_matched = plan_.match.matches(result.address);
    result.attempts = 1;
    result.seed = plan_.seed;
    result.elapsed = stop_watch.since_start();
    return result;
}

SearchResult SaltSearch::run_brute_force() {
    SALT_INFO_M("Searching CREATE2 salt",
                {"pattern", plan_.match.to_string(),
                 "workers", std::to_string(plan_.num_workers),
                 "seed", std::to_string(plan_.seed),
                 "expected_attempts", format_estimate(plan_.match.expected_attempts()),
                 "max_attempts", plan_.bounded() ? std::to_string(plan_.max_attempts) : "unlimited"});

    StopWatch stop_watch{StopWatch::kStart};
    std::vector<std::thread> workers;
    const auto join_all = [&workers] {
        for (auto& worker : workers) {
            if (worker.joinable()) worker.join();
        }
    };

    try {
        workers.reserve(plan_.num_workers);
        for (uint32_t index{0}; index < plan_.num_workers; ++index) {
            {
                std::scoped_lock lock{workers_mutex_};
                ++running_workers_;
            }
            workers.emplace_back([this, index] {
                try {
                    work(index);
                } catch (...) {
                    std::scoped_lock lock{workers_mutex_};
                    if (!exception_ptr_) exception_ptr_ = std::current_exception();
                    stop_.store(true, std::memory_order_release);
                }
                {
                    std::scoped_lock lock{workers_mutex_};
                    --running_workers_;
                }
                workers_cv_.notify_all();
            });
        }
        wait_for_workers(stop_watch);
    } catch (...) {
        stop_.store(true, std::memory_order_release);
        join_all();
        throw;
    }
    join_all();

    if (exception_ptr_) {
        std::rethrow_exception(exception_ptr_);
    }

    SearchResult result;
    result.seed = plan_.seed;
    result.attempts = attempts_done_.load(std::memory_order_relaxed);
    result.elapsed = stop_watch.since_start();
    if (winner_) {
        result.found = true;
        result.pattern_matched = true;
        result.salt = winner_->salt;
        result.address = winner_->address;
        result.checksum_address = to_checksum_address(winner_->address);
        result.attempt_index = winner_->attempt_index;
    }
    return result;
}

void SaltSearch::work(uint32_t worker_index) {
    log::set_thread_name(("vanity-" + std::to_string(worker_index)).c_str());
    SALT_TRACE << "Search worker started";

    const uint64_t max_attempts{plan_.max_attempts};
    const uint64_t batch_size{plan_.batch_size};
    uint64_t worker_attempts{0};
    while (!stop_.load(std::memory_order_acquire)) {
        const uint64_t first{next_attempt_.fetch_add(batch_size, std::memory_order_relaxed)};
        if (first >= max_attempts) {
            break;
        }
        const uint64_t last{max_attempts - first > batch_size ? first + batch_size : max_attempts};

        uint64_t processed{0};
        for (uint64_t attempt{first}; attempt < last; ++attempt) {
            if (stop_.load(std::memory_order_relaxed)) {
                break;
            }
            const evmc::bytes32 salt{derive_salt(plan_.seed, attempt)};
            const evmc::address address{create2_address(plan_.factory, salt, plan_.init_code_hash)};
            ++processed;
            if (plan_.match.matches(address)) {
                publish(salt, address, attempt);
                break;
            }
        }
        attempts_done_.fetch_add(processed, std::memory_order_relaxed);
        worker_attempts += processed;
    }

    SALT_TRACE << "Search worker stopped after " << worker_attempts << " attempts";
}

void SaltSearch::publish(const evmc::bytes32& salt, const evmc::address& address, uint64_t attempt_index) {
    std::scoped_lock lock{winner_mutex_};
    if (!winner_) {
        winner_ = Winner{salt, address, attempt_index};
    } else {
        SALT_DEBUG << "Discarding concurrent match " << address << " at attempt " << attempt_index;
    }
    stop_.store(true, std::memory_order_release);
}

void SaltSearch::wait_for_workers(const StopWatch& stop_watch) {
    std::unique_lock lock{workers_mutex_};
    const auto all_stopped = [this] { return running_workers_ == 0; };
    if (plan_.progress_interval <= 0ms) {
        workers_cv_.wait(lock, all_stopped);
        return;
    }
    while (!workers_cv_.wait_for(lock, plan_.progress_interval, all_stopped)) {
        lock.unlock();
        const auto elapsed{stop_watch.since_start()};
        const uint64_t attempts{attempts_done_.load(std::memory_order_relaxed)};
        const double seconds{std::chrono::duration<double>(elapsed).count()};
        signal_progress(SearchProgress{
            .attempts = attempts,
            .attempts_per_sec = seconds > 0 ? static_cast<double>(attempts) / seconds : 0.0,
            .elapsed = elapsed,
        });
        lock.lock();
    }
}

}  // namespace saltmine::vanity
