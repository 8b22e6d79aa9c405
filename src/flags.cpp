/*
  flags.cpp

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

#include "flags.h"

#include <getopt.h>

#include <cerrno>
#include <climits>
#include <cstdlib>

#include "error_out.h"
#include "usage.h"

namespace flags {

namespace {

constexpr int kUsageExitCode = 2;

std::optional<int> parse_count(const char* text) {
    if (text == nullptr || *text == '\0') {
        return std::nullopt;
    }
    char* end = nullptr;
    errno = 0;
    long value = std::strtol(text, &end, 10);
    if (errno != 0 || *end != '\0' || value < 1 || value > INT_MAX) {
        return std::nullopt;
    }
    return static_cast<int>(value);
}

ParseResult usage_error(ParseResult result, const std::string& option, const std::string& message,
                        const std::vector<std::string>& suggestions) {
    print_error({ErrorType::INVALID_ARGUMENT, option, message, suggestions});
    result.exit_code = kUsageExitCode;
    result.should_exit = true;
    return result;
}

}  // namespace

ParseResult parse_arguments(int argc, char* argv[]) {
    ParseResult result;
    Options& options = result.options;

    static struct option long_options[] = {{"fuzzy", no_argument, nullptr, 'f'},
                                           {"list", no_argument, nullptr, 'l'},
                                           {"default", required_argument, nullptr, 'd'},
                                           {"ignore", required_argument, nullptr, 'i'},
                                           {"root", required_argument, nullptr, 'r'},
                                           {"number", required_argument, nullptr, 'n'},
                                           {"json", no_argument, nullptr, 'j'},
                                           {"diagnostics", no_argument, nullptr, 'D'},
                                           {"no-colors", no_argument, nullptr, 'C'},
                                           {"version", no_argument, nullptr, 'v'},
                                           {"help", no_argument, nullptr, 'h'},
                                           {nullptr, 0, nullptr, 0}};

    const char* short_options = "+fld:i:r:n:jDCvh";

    int option_index = 0;
    int c;
    optind = 1;

    while ((c = getopt_long(argc, argv, short_options, long_options, &option_index)) != -1) {
        switch (c) {
            case 'f':
                options.fuzzy = true;
                break;
            case 'l':
                options.list = true;
                break;
            case 'd': {
                auto mode = lk_config::parse_mode(optarg);
                if (!mode) {
                    return usage_error(std::move(result), "--default",
                                       "unknown mode '" + std::string(optarg) + "'",
                                       {"Use 'list' or 'fuzzy'"});
                }
                options.set_default_mode = mode;
                break;
            }
            case 'i':
                options.ignore.emplace_back(optarg);
                break;
            case 'r':
                options.roots.emplace_back(optarg);
                break;
            case 'n': {
                auto count = parse_count(optarg);
                if (!count) {
                    return usage_error(std::move(result), "--number",
                                       "'" + std::string(optarg) + "' is not a positive number",
                                       {});
                }
                options.number = count;
                break;
            }
            case 'j':
                options.json = true;
                break;
            case 'D':
                options.diagnostics = true;
                break;
            case 'C':
                options.no_colors = true;
                break;
            case 'v':
                options.show_version = true;
                break;
            case 'h':
                options.show_help = true;
                break;
            case '?':
                print_usage();
                result.exit_code = kUsageExitCode;
                result.should_exit = true;
                return result;
            default:
                return usage_error(std::move(result), std::string(1, static_cast<char>(c)),
                                   "Unrecognized option", {"Run 'lk --help' for usage"});
        }
    }

    for (int i = optind; i < argc; ++i) {
        options.positionals.emplace_back(argv[i]);
    }

    return result;
}

RunMode select_mode(const Options& options, lk_config::Mode configured) {
    if (options.set_default_mode) {
        return RunMode::SET_DEFAULT;
    }
    if (options.fuzzy) {
        return RunMode::FUZZY;
    }
    if (options.list || !options.positionals.empty()) {
        return RunMode::LIST;
    }
    return configured == lk_config::Mode::FUZZY ? RunMode::FUZZY : RunMode::LIST;
}

}  // namespace flags
