// Copyright 2025 The Saltmine Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <mutex>
#include <optional>
#include <string>

#include <boost/signals2/signal.hpp>
#include <evmc/evmc.hpp>

#include <saltmine/core/common/base.hpp>
#include <saltmine/core/common/bytes.hpp>
#include <saltmine/vanity/errors.hpp>
#include <saltmine/vanity/match_spec.hpp>

namespace saltmine {
class StopWatch;
}

namespace saltmine::vanity {

using namespace std::chrono_literals;

//! Attempt indices claimed by a worker at once from the shared scheduler
inline constexpr uint64_t kDefaultAttemptBatch{2048};

//! Default period of progress notifications
inline constexpr std::chrono::milliseconds kDefaultProgressInterval{5s};

//! \brief Raw caller input of a search run, validated by make_search_plan()
struct SearchRequest {
    Bytes factory;                              // deployer address, 20 bytes
    std::optional<Bytes> init_code;             // creation bytecode, hashed once
    std::optional<Bytes> init_code_hash;        // alternative to init_code, 32 bytes
    std::optional<Bytes> salt;                  // fixed salt (deterministic mode), up to 32 bytes
    std::optional<std::string> prefix;          // hex prefix pattern
    std::optional<std::string> suffix;          // hex suffix pattern
    bool checksum{false};                       // match against the EIP-55 form
    std::optional<uint64_t> max_attempts;       // global attempt cap, unbounded if absent
    std::optional<uint32_t> num_workers;        // defaults to available hardware threads
    std::optional<uint64_t> seed;               // salt stream seed, random if absent
    uint64_t batch_size{kDefaultAttemptBatch};  // attempts claimed per scheduler round trip
    std::chrono::milliseconds progress_interval{kDefaultProgressInterval};  // 0 disables progress
};

//! \brief Validated, immutable configuration of a search run
struct SearchPlan {
    evmc::address factory;
    evmc::bytes32 init_code_hash;
    std::optional<evmc::bytes32> salt;
    MatchSpec match;
    uint64_t max_attempts{kUnlimitedAttempts};
    uint32_t num_workers{1};
    uint64_t seed{0};
    uint64_t batch_size{kDefaultAttemptBatch};
    std::chrono::milliseconds progress_interval{kDefaultProgressInterval};

    bool deterministic() const noexcept { return salt.has_value(); }
    bool bounded() const noexcept { return max_attempts != kUnlimitedAttempts; }
};

//! \brief Checks every input once, hashes the init code and fixes the seed
//! \details Errors are reported before any worker exists. A fixed salt takes precedence over prefix/suffix (a
//! warning is logged).
SetupResult<SearchPlan> make_search_plan(const SearchRequest& request);

//! \brief Periodic observability signal, emitted off the hot path
struct SearchProgress {
    uint64_t attempts{0};
    double attempts_per_sec{0};
    std::chrono::nanoseconds elapsed{0};
};

//! \brief Outcome of a search run
struct SearchResult {
    //! False only when the attempt cap was reached without a match
    bool found{false};
    //! Whether the pattern of the plan holds for the address (always true for a found brute-force result)
    bool pattern_matched{false};
    bool deterministic{false};
    evmc::bytes32 salt{};
    evmc::address address{};
    std::string checksum_address;
    //! Candidate addresses derived by all workers
    uint64_t attempts{0};
    //! Attempt index of the winning salt, re-derivable with derive_salt(seed, attempt_index)
    std::optional<uint64_t> attempt_index;
    uint64_t seed{0};
    std::chrono::nanoseconds elapsed{0};
};

//! \brief Coordinates one CREATE2 vanity search run
//! \details In brute-force mode num_workers threads claim batches of attempt indices from a shared atomic
//! scheduler, derive salt and address for each and test it against the pattern. The first match stops every
//! worker. The scheduler never hands out indices at or past max_attempts, so an exhausted run consumed exactly
//! max_attempts candidates. The calling thread stays the coordinator: it emits progress and collects the result.
class SaltSearch {
  public:
    explicit SaltSearch(SearchPlan plan);

    // Not copyable nor movable
    SaltSearch(const SaltSearch&) = delete;
    SaltSearch& operator=(const SaltSearch&) = delete;

    //! \brief Runs the search to completion, may be called only once
    //! \throws any exception escaping a worker or a progress handler, after all workers have stopped
    SearchResult run();

    const SearchPlan& plan() const noexcept { return plan_; }

    //! \brief Notifies connected handlers about progress every plan().progress_interval
    boost::signals2::signal<void(const SearchProgress&)> signal_progress;

  private:
    struct Winner {
        evmc::bytes32 salt;
        evmc::address address;
        uint64_t attempt_index{0};
    };

    SearchResult run_deterministic();
    SearchResult run_brute_force();

    void work(uint32_t worker_index);
    void publish(const evmc::bytes32& salt, const evmc::address& address, uint64_t attempt_index);
    void wait_for_workers(const StopWatch& stop_watch);

    const SearchPlan plan_;
    std::atomic_bool started_{false};

    std::atomic_uint64_t next_attempt_{0};   // scheduler of attempt indices
    std::atomic_uint64_t attempts_done_{0};  // candidates derived so far
    std::atomic_bool stop_{false};

    std::mutex winner_mutex_;
    std::optional<Winner> winner_;

    std::mutex workers_mutex_;
    std::condition_variable workers_cv_;
    uint32_t running_workers_{0};
    std::exception_ptr exception_ptr_;
};

}  // namespace saltmine::vanity
