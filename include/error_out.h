/*
  error_out.h

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
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

enum class ErrorSeverity : std::uint8_t {
    INFO = 0,
    WARNING = 1,
    ERROR = 2,
    CRITICAL = 3
};

enum class ErrorType : std::uint8_t {
    CONFIGURATION_ERROR,
    SCRIPT_NOT_FOUND,
    FUNCTION_NOT_FOUND,
    NO_MATCH,
    WRAPPER_IO_ERROR,
    SPAWN_ERROR,
    INVALID_ARGUMENT,
    RUNTIME_ERROR,
    UNKNOWN_ERROR
};

struct ErrorInfo {
    ErrorType type;
    ErrorSeverity severity;
    std::string command_used = "";
    std::string message = "";
    std::vector<std::string> suggestions = {};

    ErrorInfo();

    ErrorInfo(ErrorType t, ErrorSeverity s, const std::string& cmd = "",
              const std::string& msg = "", const std::vector<std::string>& sugg = {});

    ErrorInfo(ErrorType t, const std::string& cmd = "", const std::string& msg = "",
              const std::vector<std::string>& sugg = {});

    static ErrorSeverity get_default_severity(ErrorType type);
};

const char* error_type_name(ErrorType type);

void print_error(const ErrorInfo& error);

// Result of an operation that can fail with a reportable ErrorInfo.
template <typename T>
class ErrorOr {
   public:
    explicit ErrorOr(T value) : value_(std::move(value)), has_value_(true) {
    }
    explicit ErrorOr(ErrorInfo error) : error_(std::move(error)), has_value_(false) {
    }

    static ErrorOr<T> ok(T value) {
        return ErrorOr<T>(std::move(value));
    }
    static ErrorOr<T> error(ErrorInfo error) {
        return ErrorOr<T>(std::move(error));
    }

    bool is_ok() const {
        return has_value_;
    }
    bool is_error() const {
        return !has_value_;
    }

    const T& value() const {
        if (!has_value_)
            throw std::runtime_error("Attempted to access value of error ErrorOr");
        return value_;
    }

    T& value() {
        if (!has_value_)
            throw std::runtime_error("Attempted to access value of error ErrorOr");
        return value_;
    }

    const ErrorInfo& error() const {
        if (has_value_)
            throw std::runtime_error("Attempted to access error of ok ErrorOr");
        return error_;
    }

   private:
    T value_{};
    ErrorInfo error_;
    bool has_value_;
};
