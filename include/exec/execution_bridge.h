/*
  execution_bridge.h

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
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "catalog/catalog.h"
#include "error_out.h"

namespace execution_bridge {

enum class ExecutionState : std::uint8_t {
    IDLE,
    WRAPPER_WRITTEN,
    EXECUTING,
    CLEANED,
    // The child ran to completion; its exit code may still be nonzero.
    SUCCEEDED,
    // The wrapper could not be written or the interpreter could not be started.
    FAILED
};

struct ExecutionOptions {
    // Absolute interpreter path. Empty means `bash` resolved on PATH.
    std::string interpreter;
    // Empty means the platform temp directory.
    std::filesystem::path temp_dir;
    // Empty means the current directory.
    std::filesystem::path working_dir;
};

struct ExecutionResult {
    ExecutionState state = ExecutionState::IDLE;
    int exit_code = 0;
    std::optional<ErrorInfo> error;
    std::string wrapper_path;
    bool wrapper_removed = false;
};

const char* execution_state_name(ExecutionState state);

// Wraps `value` in single quotes, writing embedded quotes as '\''.
std::string quote_argument(const std::string& value);

std::string render_wrapper(const std::string& interpreter, const std::filesystem::path& script,
                           const std::string& function, const std::vector<std::string>& args);

// Resolves the interpreter to run, or an empty string when none is available.
std::string resolve_interpreter(const std::string& configured);

ExecutionResult run(const std::filesystem::path& script, const std::string& function,
                    const std::vector<std::string>& args, const ExecutionOptions& options);

ExecutionResult run(const catalog::ScriptFile& script, const catalog::Function& function,
                    const std::vector<std::string>& args, const ExecutionOptions& options);

}  // namespace execution_bridge
