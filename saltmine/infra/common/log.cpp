// Copyright 2025 The Saltmine Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <fstream>
#include <iostream>
#include <locale>
#include <mutex>
#include <stdexcept>
#include <thread>

#include <absl/time/clock.h>
#include <absl/time/time.h>

namespace saltmine::log {

//! Thread names are padded to this width so that columns line up
static constexpr size_t kThreadNameWidth = 11;

static Settings settings_{};
static std::mutex out_mtx{};
static std::ofstream file_{};
thread_local std::string thread_name_{};

void init(const Settings& settings) {
    settings_ = settings;
    if (!settings_.log_file.empty()) {
        tee_file(settings_.log_file);
        // Console lines mirror the file content
        settings_.log_nocolor = true;
    }
    const bool is_terminal{settings_.log_std_out ? is_terminal_stdout() : is_terminal_stderr()};
    settings_.log_nocolor = settings_.log_nocolor || !is_terminal;
}

void tee_file(const std::filesystem::path& path) {
    std::scoped_lock out_lck{out_mtx};
    if (file_.is_open()) file_.close();
    file_.open(path, std::ios::out | std::ios::app);
    if (!file_.is_open()) {
        throw std::runtime_error("Could not open log file " + path.string());
    }
}

Level get_verbosity() { return settings_.log_verbosity; }

void set_verbosity(Level level) { settings_.log_verbosity = level; }

bool test_verbosity(Level level) { return level <= settings_.log_verbosity; }

void set_thread_name(const char* name) {
    thread_name_ = name;
    thread_name_.resize(kThreadNameWidth, ' ');
}

std::string get_thread_name() {
    if (thread_name_.empty()) {
        std::stringstream ss;
        ss << std::this_thread::get_id();
        thread_name_ = ss.str();
    }
    return thread_name_;
}

static std::string_view level_tag(Level level) {
    switch (level) {
        case Level::kTrace:
            return "TRACE";
        case Level::kDebug:
            return "DEBUG";
        case Level::kInfo:
            return " INFO";
        case Level::kWarning:
            return " WARN";
        case Level::kError:
            return "ERROR";
        case Level::kCritical:
            return " CRIT";
        default:
            return "     ";
    }
}

static std::string_view level_color(Level level) {
    switch (level) {
        case Level::kTrace:
            return kColorCoal;
        case Level::kDebug:
            return kBackgroundPurple;
        case Level::kInfo:
            return kColorGreen;
        case Level::kWarning:
            return kColorOrangeHigh;
        case Level::kError:
            return kColorRed;
        case Level::kCritical:
            return kBackgroundRed;
        default:
            return kColorReset;
    }
}

//! Groups integer digits by three, e.g. attempt counters print as 10'000'000
struct SeparateThousands : std::numpunct<char> {
    char separator;
    explicit SeparateThousands(char sep) : separator(sep) {}
    char do_thousands_sep() const override { return separator; }
    string_type do_grouping() const override { return "\3"; }
};

BufferBase::BufferBase(Level level) : should_print_(level <= settings_.log_verbosity) {
    if (!should_print_) return;

    if (settings_.log_thousands_sep != 0) {
        ss_.imbue(std::locale(ss_.getloc(), new SeparateThousands(settings_.log_thousands_sep)));
    }

    ss_ << kColorReset << " " << colorize(level_tag(level), level_color(level)) << " ";

    static const absl::TimeZone kTz{settings_.log_utc ? absl::UTCTimeZone() : absl::LocalTimeZone()};
    ss_ << kColorWhite << "[" << absl::FormatTime("%m-%d|%H:%M:%E3S", absl::Now(), kTz) << "] " << kColorReset;

    if (settings_.log_threads) {
        ss_ << "[" << get_thread_name() << "] ";
    }
}

BufferBase::BufferBase(Level level, std::string_view msg, const Args& args) : BufferBase(level) {
    append(msg, args);
}

void BufferBase::flush() {
    if (!should_print_) return;

    const std::string line{ss_.str()};
    const std::string plain_line{strip_colors(line)};

    std::scoped_lock out_lck{out_mtx};
    auto& out = settings_.log_std_out ? std::cout : std::cerr;
    out << (settings_.log_nocolor ? plain_line : line) << '\n';
    if (file_.is_open()) {
        file_ << plain_line << '\n';
        file_.flush();
    }
}

}  // namespace saltmine::log
