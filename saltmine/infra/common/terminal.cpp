// Copyright 2025 The Saltmine Authors
// SPDX-License-Identifier: Apache-2.0

#include "terminal.hpp"

#include <unistd.h>

#include <cstdio>

namespace saltmine {

bool is_terminal(int fd) { return isatty(fd) != 0; }

bool is_terminal_stdout() { return is_terminal(fileno(stdout)); }

bool is_terminal_stderr() { return is_terminal(fileno(stderr)); }

std::string colorize(std::string_view text, std::string_view color) {
    std::string out;
    out.reserve(color.size() + text.size() + kColorReset.size());
    out.append(color).append(text).append(kColorReset);
    return out;
}

std::string strip_colors(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    size_t i{0};
    while (i < text.size()) {
        if (text[i] == '\x1b' && i + 1 < text.size() && text[i + 1] == '[') {
            size_t j{i + 2};
            while (j < text.size() && ((text[j] >= '0' && text[j] <= '9') || text[j] == ';')) ++j;
            if (j > i + 2 && j < text.size() && text[j] == 'm') {
                i = j + 1;
                continue;
            }
        }
        out.push_back(text[i++]);
    }
    return out;
}

}  // namespace saltmine
