/*
  lk.h

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

#include <string>
#include <vector>

#include "catalog/catalog.h"
#include "config/lk_config.h"
#include "flags.h"

namespace lk {

inline constexpr const char* kVersion = "1.0.0";

struct Invocation {
    const lk_config::Settings& settings;
    const flags::Options& options;
    const catalog::Catalog& catalog;
};

catalog::BuildOptions make_build_options(const lk_config::Settings& settings,
                                         const flags::Options& options);

// Prints `lk: <path> -> <function>` and runs the function, returning its exit
// code or 127 when it could not be started.
int execute_function(const Invocation& invocation, const catalog::Function& function,
                     const std::vector<std::string>& args, bool record_history);

int run_list_mode(const Invocation& invocation);
int run_fuzzy_mode(const Invocation& invocation);

int run(int argc, char* argv[]);

}  // namespace lk
