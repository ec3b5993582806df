// Copyright 2025 The Saltmine Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <string>

namespace saltmine {

//! \brief Measures elapsed time on the steady clock
class StopWatch {
  public:
    using TimePoint = std::chrono::time_point<std::chrono::steady_clock>;
    using Duration = std::chrono::nanoseconds;

    static constexpr bool kStart = true;

    explicit StopWatch(bool auto_start = false) {
        if (auto_start) start();
    }

    //! \brief Starts the clock, a running watch keeps its start time
    TimePoint start() noexcept;

    //! \brief Duration since start, zero if never started
    Duration since_start() const noexcept;

    //! \brief Human readable duration, e.g. "850us", "12.400ms", "3.250s", "1h 2m 5s"
    static std::string format(Duration duration);

    explicit operator bool() const noexcept { return start_time_ != TimePoint{}; }

  private:
    TimePoint start_time_{};
};

}  // namespace saltmine
