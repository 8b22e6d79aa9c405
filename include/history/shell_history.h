/*
  shell_history.h

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
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "utils/lk_filesystem.h"

namespace shell_history {

enum class ShellKind : std::uint8_t {
    BASH,
    ZSH,
    UNKNOWN
};

// Classifies a login shell path such as $SHELL.
ShellKind detect_shell(const std::string& shell_path);

// $HISTFILE when set, otherwise the shell's default history file.
std::optional<std::filesystem::path> history_file(ShellKind kind);

// The command line that reruns a selection in list mode.
std::string format_command(const std::string& script, const std::string& function,
                           const std::vector<std::string>& args);

// One history line. zsh gets the extended `: <time>:0;<command>` form.
std::string format_entry(ShellKind kind, const std::string& command, std::time_t when);

lk_filesystem::Result<void> append_entry(const std::filesystem::path& file,
                                         const std::string& entry);

// Appends the command to the current user's shell history. Unknown shells
// and missing history files are logged and skipped.
void record(const std::string& script, const std::string& function,
            const std::vector<std::string>& args);

}  // namespace shell_history
