/*
  execution_bridge.cpp

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

#include "exec/execution_bridge.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include "exec/signal_handler.h"
#include "utils/debug.h"
#include "utils/lk_filesystem.h"

namespace execution_bridge {

namespace fs = std::filesystem;

namespace {

constexpr int kChildFailureExit = 127;

enum class ChildStage : int {
    CHDIR = 1,
    EXEC = 2
};

struct ChildFailure {
    int stage = 0;
    int error = 0;
};

// Removes the wrapper when the execution leaves scope, whatever the path.
class WrapperFileGuard {
   public:
    explicit WrapperFileGuard(ExecutionResult& result) : result_(result) {
    }

    ~WrapperFileGuard() {
        if (result_.wrapper_path.empty()) {
            return;
        }
        if (::unlink(result_.wrapper_path.c_str()) == 0 || errno == ENOENT) {
            result_.wrapper_removed = true;
            lk_debug_msg("exec: removed wrapper %s", result_.wrapper_path.c_str());
        } else {
            std::string reason = lk_filesystem::describe_errno(errno);
            print_error(ErrorInfo(ErrorType::WRAPPER_IO_ERROR, ErrorSeverity::WARNING, "unlink",
                                  "failed to remove wrapper '" + result_.wrapper_path +
                                      "': " + reason));
        }
        if (result_.state == ExecutionState::EXECUTING) {
            result_.state = ExecutionState::CLEANED;
        }
    }

    WrapperFileGuard(const WrapperFileGuard&) = delete;
    WrapperFileGuard& operator=(const WrapperFileGuard&) = delete;

   private:
    ExecutionResult& result_;
};

void fail(ExecutionResult& result, ErrorType type, const std::string& operation,
          const std::string& message) {
    result.state = ExecutionState::FAILED;
    result.exit_code = kChildFailureExit;
    result.error = ErrorInfo(type, operation, message);
}

[[noreturn]] void report_child_failure(int report_fd, ChildStage stage, int error) {
    ChildFailure failure{static_cast<int>(stage), error};
    (void)lk_filesystem::write_all(
        report_fd, std::string_view(reinterpret_cast<const char*>(&failure), sizeof(failure)));
    _exit(kChildFailureExit);
}

// Returns true and fills `failure` when the child reported an error before exec.
bool read_child_failure(int report_fd, ChildFailure& failure) {
    char* buffer = reinterpret_cast<char*>(&failure);
    std::size_t received = 0;
    while (received < sizeof(failure)) {
        ssize_t n = ::read(report_fd, buffer + received, sizeof(failure) - received);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (n == 0) {
            break;
        }
        received += static_cast<std::size_t>(n);
    }
    return received == sizeof(failure);
}

int wait_for_child(pid_t pid, int& status) {
    while (true) {
        pid_t waited = ::waitpid(pid, &status, 0);
        if (waited == pid) {
            return 0;
        }
        if (waited == -1 && errno == EINTR) {
            continue;
        }
        return errno;
    }
}

}  // namespace

const char* execution_state_name(ExecutionState state) {
    switch (state) {
        case ExecutionState::IDLE:
            return "idle";
        case ExecutionState::WRAPPER_WRITTEN:
            return "wrapper written";
        case ExecutionState::EXECUTING:
            return "executing";
        case ExecutionState::CLEANED:
            return "cleaned";
        case ExecutionState::SUCCEEDED:
            return "succeeded";
        case ExecutionState::FAILED:
            return "failed";
    }
    return "unknown";
}

std::string quote_argument(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

std::string render_wrapper(const std::string& interpreter, const fs::path& script,
                           const std::string& function, const std::vector<std::string>& args) {
    std::string body = "#!" + interpreter + "\n";
    body += "# Temporary file written by lk to run one function.\n";
    body += "# It is removed when the function returns and can be deleted safely.\n";
    body += ". " + quote_argument(script.string()) + "\n";
    body += function;
    for (const auto& arg : args) {
        body += ' ';
        body += quote_argument(arg);
    }
    body += '\n';
    return body;
}

std::string resolve_interpreter(const std::string& configured) {
    if (configured.empty()) {
        return lk_filesystem::find_executable_in_path("bash");
    }
    if (configured.find('/') != std::string::npos) {
        return configured;
    }
    return lk_filesystem::find_executable_in_path(configured);
}

namespace {

void execute(const fs::path& script, const std::string& function,
             const std::vector<std::string>& args, const ExecutionOptions& options,
             ExecutionResult& result) {
    std::string interpreter = resolve_interpreter(options.interpreter);
    if (interpreter.empty()) {
        fail(result, ErrorType::SPAWN_ERROR, "execv",
             "no interpreter found: '" +
                 (options.interpreter.empty() ? std::string("bash") : options.interpreter) +
                 "' is not on PATH");
        return;
    }

    fs::path temp_dir =
        options.temp_dir.empty() ? lk_filesystem::default_temp_directory() : options.temp_dir;

    auto wrapper = lk_filesystem::create_unique_file(temp_dir, "lk_", ".sh", 0700);
    if (wrapper.is_error()) {
        fail(result, ErrorType::WRAPPER_IO_ERROR, "open", wrapper.error());
        return;
    }

    result.wrapper_path = wrapper.value().path;
    WrapperFileGuard guard(result);

    int wrapper_fd = wrapper.value().fd;
    auto written = lk_filesystem::write_all(
        wrapper_fd, render_wrapper(interpreter, script, function, args));
    lk_filesystem::safe_close(wrapper_fd);
    if (written.is_error()) {
        fail(result, ErrorType::WRAPPER_IO_ERROR, "write",
             "cannot write wrapper '" + result.wrapper_path + "': " + written.error());
        return;
    }
    if (::chmod(result.wrapper_path.c_str(), 0700) != 0) {
        fail(result, ErrorType::WRAPPER_IO_ERROR, "chmod",
             "cannot set mode on wrapper '" + result.wrapper_path +
                 "': " + lk_filesystem::describe_errno(errno));
        return;
    }
    result.state = ExecutionState::WRAPPER_WRITTEN;
    lk_debug_msg("exec: wrote wrapper %s for %s", result.wrapper_path.c_str(), function.c_str());

    int report_pipe[2] = {-1, -1};
    auto piped = lk_filesystem::create_pipe_cloexec(report_pipe);
    if (piped.is_error()) {
        fail(result, ErrorType::SPAWN_ERROR, "pipe", piped.error());
        return;
    }

    ForwardingSignalScope signal_scope;

    pid_t pid = ::fork();
    if (pid == -1) {
        int saved_errno = errno;
        lk_filesystem::close_pipe(report_pipe);
        fail(result, ErrorType::SPAWN_ERROR, "fork",
             "cannot start " + interpreter + ": " + lk_filesystem::describe_errno(saved_errno));
        return;
    }

    if (pid == 0) {
        ::close(report_pipe[0]);
        reset_child_signals();

        if (!options.working_dir.empty() && ::chdir(options.working_dir.c_str()) != 0) {
            report_child_failure(report_pipe[1], ChildStage::CHDIR, errno);
        }

        char* const argv[] = {const_cast<char*>(interpreter.c_str()),
                              const_cast<char*>(result.wrapper_path.c_str()), nullptr};
        ::execv(interpreter.c_str(), argv);
        report_child_failure(report_pipe[1], ChildStage::EXEC, errno);
    }

    signal_scope.set_child(pid);
    result.state = ExecutionState::EXECUTING;
    lk_filesystem::safe_close(report_pipe[1]);

    ChildFailure failure;
    bool child_failed = read_child_failure(report_pipe[0], failure);
    lk_filesystem::safe_close(report_pipe[0]);

    int status = 0;
    int wait_error = wait_for_child(pid, status);

    if (child_failed) {
        std::string reason = lk_filesystem::describe_errno(failure.error);
        if (failure.stage == static_cast<int>(ChildStage::CHDIR)) {
            fail(result, ErrorType::SPAWN_ERROR, "chdir",
                 "cannot enter '" + options.working_dir.string() + "': " + reason);
        } else {
            fail(result, ErrorType::SPAWN_ERROR, "execv",
                 "cannot execute '" + interpreter + "': " + reason);
        }
        return;
    }

    if (wait_error != 0) {
        fail(result, ErrorType::SPAWN_ERROR, "waitpid",
             "lost track of child " + std::to_string(pid) + ": " +
                 lk_filesystem::describe_errno(wait_error));
        return;
    }

    result.exit_code = extract_exit_code(status);
    result.state = ExecutionState::SUCCEEDED;
    lk_debug_msg("exec: %s exited with %d", function.c_str(), result.exit_code);
}

}  // namespace

ExecutionResult run(const fs::path& script, const std::string& function,
                    const std::vector<std::string>& args, const ExecutionOptions& options) {
    PerformanceTracker tracker("execution");
    ExecutionResult result;
    execute(script, function, args, options, result);
    return result;
}

ExecutionResult run(const catalog::ScriptFile& script, const catalog::Function& function,
                    const std::vector<std::string>& args, const ExecutionOptions& options) {
    return run(script.path, function.name, args, options);
}

}  // namespace execution_bridge
