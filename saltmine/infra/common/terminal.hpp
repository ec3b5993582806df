// Copyright 2025 The Saltmine Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>
#include <string_view>

namespace saltmine {

inline constexpr std::string_view kColorReset = "\x1b[0m";

inline constexpr std::string_view kColorCoal = "\x1b[90m";
inline constexpr std::string_view kColorWhite = "\x1b[97m";
inline constexpr std::string_view kColorRed = "\x1b[91m";
inline constexpr std::string_view kColorGreen = "\x1b[32m";
inline constexpr std::string_view kColorOrangeHigh = "\x1b[1;33m";
inline constexpr std::string_view kColorLimeHigh = "\x1b[1;92m";
inline constexpr std::string_view kBackgroundRed = "\x1b[101m";
inline constexpr std::string_view kBackgroundPurple = "\x1b[105m";

//! Check if specified file descriptor is a teletype (TTY) terminal
bool is_terminal(int fd);

bool is_terminal_stdout();
bool is_terminal_stderr();

//! \brief Wraps text into the given color sequence followed by a reset
std::string colorize(std::string_view text, std::string_view color);

//! \brief Removes every SGR escape sequence (ESC [ digits/semicolons m) from text
std::string strip_colors(std::string_view text);

}  // namespace saltmine
