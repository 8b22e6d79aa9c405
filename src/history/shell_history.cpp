/*
  shell_history.cpp

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

#include "history/shell_history.h"

#include <fcntl.h>

#include <cstdlib>

#include "error_out.h"
#include "exec/execution_bridge.h"
#include "utils/debug.h"

namespace shell_history {

namespace fs = std::filesystem;

namespace {

bool needs_quoting(const std::string& word) {
    if (word.empty()) {
        return true;
    }
    for (char c : word) {
        bool safe = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                    c == '_' || c == '-' || c == '.' || c == '/' || c == ':' || c == '=' ||
                    c == '@' || c == '%' || c == '+' || c == ',';
        if (!safe) {
            return true;
        }
    }
    return false;
}

std::string shell_word(const std::string& word) {
    return needs_quoting(word) ? execution_bridge::quote_argument(word) : word;
}

}  // namespace

ShellKind detect_shell(const std::string& shell_path) {
    std::string name = fs::path(shell_path).filename().string();
    if (name == "bash" || name == "sh") {
        return ShellKind::BASH;
    }
    if (name == "zsh") {
        return ShellKind::ZSH;
    }
    return ShellKind::UNKNOWN;
}

std::optional<fs::path> history_file(ShellKind kind) {
    const char* histfile = std::getenv("HISTFILE");
    if (histfile != nullptr && histfile[0] != '\0') {
        return fs::path(histfile);
    }
    switch (kind) {
        case ShellKind::BASH:
            return lk_filesystem::g_user_home_path() / ".bash_history";
        case ShellKind::ZSH:
            return lk_filesystem::g_user_home_path() / ".zsh_history";
        case ShellKind::UNKNOWN:
            break;
    }
    return std::nullopt;
}

std::string format_command(const std::string& script, const std::string& function,
                           const std::vector<std::string>& args) {
    std::string command = "lk " + shell_word(script) + " " + shell_word(function);
    for (const auto& arg : args) {
        command += ' ';
        command += shell_word(arg);
    }
    return command;
}

std::string format_entry(ShellKind kind, const std::string& command, std::time_t when) {
    if (kind == ShellKind::ZSH) {
        return ": " + std::to_string(static_cast<long long>(when)) + ":0;" + command + "\n";
    }
    return command + "\n";
}

lk_filesystem::Result<void> append_entry(const fs::path& file, const std::string& entry) {
    auto fd = lk_filesystem::safe_open(file.string(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC,
                                       0600);
    if (fd.is_error()) {
        return lk_filesystem::Result<void>::error(fd.error());
    }
    auto written = lk_filesystem::write_all(fd.value(), entry);
    lk_filesystem::safe_close(fd.value());
    return written;
}

void record(const std::string& script, const std::string& function,
            const std::vector<std::string>& args) {
    const char* shell = std::getenv("SHELL");
    ShellKind kind = detect_shell(shell != nullptr ? shell : "");
    if (kind == ShellKind::UNKNOWN) {
        lk_debug_msg("history: unsupported shell '%s', not recording", shell ? shell : "");
        return;
    }

    auto file = history_file(kind);
    if (!file) {
        return;
    }

    std::string command = format_command(script, function, args);
    auto appended = append_entry(*file, format_entry(kind, command, std::time(nullptr)));
    if (appended.is_error()) {
        print_error(ErrorInfo(ErrorType::RUNTIME_ERROR, ErrorSeverity::WARNING, "history",
                              appended.error()));
        return;
    }
    lk_debug_msg("history: appended '%s' to %s", command.c_str(), file->c_str());
}

}  // namespace shell_history
