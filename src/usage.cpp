/*
  usage.cpp

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

#include "usage.h"

#include <iostream>

#include "lk.h"

void print_usage() {
    std::cout << "Usage: lk [OPTIONS] [SCRIPT [FUNCTION [ARGS...]]]\n"
              << "       lk --fuzzy [QUERY [ARGS...]]\n"
              << "\n"
              << "Finds bash functions in scripts under the search roots and runs them.\n"
              << "\n"
              << "Modes:\n"
              << "  -l, --list                 List scripts, a script's functions, or run one\n"
              << "  -f, --fuzzy                Fuzzy-search every function by name and description\n"
              << "  -d, --default MODE         Save the default mode (list or fuzzy) and exit\n"
              << "\n"
              << "Discovery Options:\n"
              << "  -r, --root DIR             Search DIR instead of the configured roots\n"
              << "                             (repeatable)\n"
              << "  -i, --ignore PATH          Skip PATH, relative to each root (repeatable)\n"
              << "  -n, --number N             Candidates shown in fuzzy mode (default "
              << lk_config::kDefaultFuzzyLines << ")\n"
              << "\n"
              << "Output Options:\n"
              << "  -j, --json                 Print the catalog as JSON and exit\n"
              << "  -D, --diagnostics          Report problems found while scanning scripts\n"
              << "  -C, --no-colors            Disable color output\n"
              << "  -v, --version              Show version information\n"
              << "  -h, --help                 Show this help message\n"
              << "\n"
              << "Examples:\n"
              << "  lk                         List scripts\n"
              << "  lk deploy.sh               List functions in deploy.sh\n"
              << "  lk deploy.sh deploy prod   Run deploy from deploy.sh with 'prod'\n"
              << "  lk -f dep staging          Fuzzy-find a function and pass 'staging'\n"
              << "\n"
              << "Configuration is read from $LK_CONFIG or "
              << "$XDG_CONFIG_HOME/lk/config.json.\n";
}

void print_version() {
    std::cout << "lk v" << lk::kVersion << "\n";
}
