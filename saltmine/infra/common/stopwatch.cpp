// Copyright 2025 The Saltmine Authors
// SPDX-License-Identifier: Apache-2.0

#include "stopwatch.hpp"

#include <iomanip>
#include <sstream>

namespace saltmine {

using namespace std::chrono_literals;

StopWatch::TimePoint StopWatch::start() noexcept {
    if (start_time_ == TimePoint{}) {
        start_time_ = std::chrono::steady_clock::now();
    }
    return start_time_;
}

StopWatch::Duration StopWatch::since_start() const noexcept {
    if (start_time_ == TimePoint{}) {
        return {};
    }
    return std::chrono::steady_clock::now() - start_time_;
}

//! Prints whole units and, when non zero, the next smaller unit as three decimals
template <class Unit, class SubUnit>
static void format_fraction(std::ostream& os, StopWatch::Duration duration, const char* suffix) {
    const auto whole{std::chrono::duration_cast<Unit>(duration)};
    const auto fraction{std::chrono::duration_cast<SubUnit>(duration - whole)};
    os << whole.count();
    if (fraction.count()) {
        os << "." << std::setfill('0') << std::setw(3) << fraction.count();
    }
    os << suffix;
}

std::string StopWatch::format(Duration duration) {
    using Days = std::chrono::duration<int64_t, std::ratio<86400>>;

    std::ostringstream os;
    if (duration < 1ms) {
        os << std::chrono::duration_cast<std::chrono::microseconds>(duration).count() << "us";
    } else if (duration < 1s) {
        format_fraction<std::chrono::milliseconds, std::chrono::microseconds>(os, duration, "ms");
    } else if (duration < 60s) {
        format_fraction<std::chrono::seconds, std::chrono::milliseconds>(os, duration, "s");
    } else {
        const char* separator{""};
        const auto print_part = [&](auto unit, const char* suffix) {
            const auto part{std::chrono::duration_cast<decltype(unit)>(duration)};
            if (part.count()) {
                os << separator << part.count() << suffix;
                duration -= part;
                separator = " ";
            }
        };
        print_part(Days{}, "d");
        print_part(std::chrono::hours{}, "h");
        print_part(std::chrono::minutes{}, "m");
        print_part(std::chrono::seconds{}, "s");
    }
    return os.str();
}

}  // namespace saltmine
