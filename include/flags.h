/*
  flags.h

  This file is part of lk

  MIT License

  Copyright (c) 2026 Caden Finley

  Permission is hereby granted, free of charge, to any person obtaining a copy
  of this software and associated documentation files (the "Software"), to deal
  in the Software without restriction, including without limitation the rights
  to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
  copies of the Software, and to permit persons to whom the Software is
  furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all
  copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
  IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
  FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
  AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
  LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
  OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
  SOFTWARE.
*/

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "config/lk_config.h"

namespace flags {

struct Options {
    bool fuzzy = false;
    bool list = false;
    bool json = false;
    bool diagnostics = false;
    bool no_colors = false;
    bool show_version = false;
    bool show_help = false;
    std::optional<lk_config::Mode> set_default_mode;
    std::vector<std::string> roots;
    std::vector<std::string> ignore;
    std::optional<int> number;
    // Everything from the first non-option argument on, untouched.
    std::vector<std::string> positionals;
};

struct ParseResult {
    Options options;
    int exit_code = 0;
    bool should_exit = false;
};

enum class RunMode : std::uint8_t {
    SET_DEFAULT,
    FUZZY,
    LIST
};

ParseResult parse_arguments(int argc, char* argv[]);

RunMode select_mode(const Options& options, lk_config::Mode configured);

}  // namespace flags
