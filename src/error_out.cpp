/*
  error_out.cpp

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

#include "error_out.h"

#include <iostream>
#include <string>
#include <vector>

#include "utils/colors.h"

const char* error_type_name(ErrorType type) {
    switch (type) {
        case ErrorType::CONFIGURATION_ERROR:
            return "configuration error";
        case ErrorType::SCRIPT_NOT_FOUND:
            return "script not found";
        case ErrorType::FUNCTION_NOT_FOUND:
            return "function not found";
        case ErrorType::NO_MATCH:
            return "no matching function";
        case ErrorType::WRAPPER_IO_ERROR:
            return "wrapper error";
        case ErrorType::SPAWN_ERROR:
            return "spawn error";
        case ErrorType::INVALID_ARGUMENT:
            return "invalid argument";
        case ErrorType::RUNTIME_ERROR:
            return "runtime error";
        case ErrorType::UNKNOWN_ERROR:
        default:
            return "unknown error";
    }
}

void print_error(const ErrorInfo& error) {
    const bool use_color = colors::stderr_colors_enabled();
    const char* kind_color =
        error.severity == ErrorSeverity::WARNING || error.severity == ErrorSeverity::INFO
            ? colors::YELLOW
            : colors::RED;

    std::cerr << "lk: ";

    if (!error.command_used.empty()) {
        std::cerr << error.command_used << ": ";
    }

    if (use_color) {
        std::cerr << kind_color;
    }
    std::cerr << error_type_name(error.type);
    if (use_color) {
        std::cerr << colors::RESET;
    }

    if (!error.message.empty()) {
        std::cerr << ": " << error.message;
    }

    std::cerr << '\n';

    if (!error.suggestions.empty()) {
        std::vector<std::string> names;
        bool has_name_suggestions = false;

        for (const auto& suggestion : error.suggestions) {
            if (suggestion.find("Did you mean '") != std::string::npos) {
                size_t start = suggestion.find('\'') + 1;
                size_t end = suggestion.find('\'', start);
                if (start != std::string::npos && end != std::string::npos && end > start) {
                    names.push_back(suggestion.substr(start, end - start));
                    has_name_suggestions = true;
                }
            }
        }

        if (has_name_suggestions && !names.empty()) {
            std::cerr << "Did you mean: ";
            for (size_t i = 0; i < names.size(); ++i) {
                std::cerr << names[i];
                if (i < names.size() - 1) {
                    std::cerr << ", ";
                }
            }
            std::cerr << "?" << '\n';

            for (const auto& suggestion : error.suggestions) {
                if (suggestion.find("Did you mean '") == std::string::npos) {
                    std::cerr << suggestion << '\n';
                }
            }
        } else {
            for (const auto& suggestion : error.suggestions) {
                std::cerr << suggestion << '\n';
            }
        }
    }
}

ErrorInfo::ErrorInfo()
    : type(ErrorType::UNKNOWN_ERROR),
      severity(ErrorSeverity::ERROR),
      command_used(""),
      message(""),
      suggestions() {
}

ErrorInfo::ErrorInfo(ErrorType t, ErrorSeverity s, const std::string& cmd, const std::string& msg,
                     const std::vector<std::string>& sugg)
    : type(t), severity(s), command_used(cmd), message(msg), suggestions(sugg) {
}

ErrorInfo::ErrorInfo(ErrorType t, const std::string& cmd, const std::string& msg,
                     const std::vector<std::string>& sugg)
    : type(t),
      severity(get_default_severity(t)),
      command_used(cmd),
      message(msg),
      suggestions(sugg) {
}

ErrorSeverity ErrorInfo::get_default_severity(ErrorType type) {
    switch (type) {
        case ErrorType::CONFIGURATION_ERROR:
            return ErrorSeverity::CRITICAL;
        case ErrorType::WRAPPER_IO_ERROR:
        case ErrorType::SPAWN_ERROR:
        case ErrorType::SCRIPT_NOT_FOUND:
        case ErrorType::FUNCTION_NOT_FOUND:
        case ErrorType::RUNTIME_ERROR:
            return ErrorSeverity::ERROR;
        case ErrorType::NO_MATCH:
            return ErrorSeverity::INFO;
        case ErrorType::INVALID_ARGUMENT:
            return ErrorSeverity::WARNING;
        case ErrorType::UNKNOWN_ERROR:
        default:
            return ErrorSeverity::ERROR;
    }
}
